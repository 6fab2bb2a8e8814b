#pragma once

#include "scru128/id/scru128_id.h"

#include <nlohmann/json.hpp>

// id_to_json renders the canonical text, the decoded fields and the hex bytes of an
// identifier. Field order in the output is fixed by nlohmann::json's sorted keys.
[[nodiscard]] nlohmann::json id_to_json(const scru128::id::Scru128Id& id);
