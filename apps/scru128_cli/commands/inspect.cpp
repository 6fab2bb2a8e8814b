#include "inspect.h"

#include "inspect_logic.h"
#include <iostream>
#include <string>
#include <vector>

int cmd_inspect(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<std::string> ids;
  for (int i = 2; i < argc; ++i) {
    ids.emplace_back(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  }
  return execute_inspect(ids, std::cout, std::cerr);
}
