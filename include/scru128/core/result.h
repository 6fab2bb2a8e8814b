#pragma once

#include <cstddef>
#include <string_view>
#include <utility>
#include <variant>

namespace scru128::core {

// Error enumerations following E.14 (use purpose-designed types as error indicators).

// ParseError classifies why a text representation was rejected.
enum class ParseError {
  kInvalidLength,
  kInvalidDigit,
  kOutOfRange,
};

constexpr std::string_view to_string(const ParseError error) {
  switch (error) {
    case ParseError::kInvalidLength:
      return "invalid_length";
    case ParseError::kInvalidDigit:
      return "invalid_digit";
    case ParseError::kOutOfRange:
      return "out_of_range";
  }
  return "unknown";
}

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// This type encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
// The has_value() check makes error handling mandatory and visible at call sites.
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  template <std::size_t I, typename U>
  Result(std::in_place_index_t<I> tag, U&& payload) : data_(tag, std::forward<U>(payload)) {}

  std::variant<T, E> data_;
};

}  // namespace scru128::core
