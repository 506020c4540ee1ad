#pragma once
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace normalize {

// Nesting below this depth is treated as noise (keeps recursion bounded).
constexpr int kMaxCoerceDepth = 256;

// Any JSON value -> one display string. Total, never throws.
//   null -> ""            string -> itself           bool -> "true" / "false"
//   number -> "72", "3.5" array -> elements space-joined (nested arrays flatten)
//   object -> first non-null of text / value / description, else its JSON text
std::string ensure_string(const nlohmann::json& v);

// Array -> element-wise ensure_string (same order and length); anything else -> {}.
std::vector<std::string> ensure_string_array(const nlohmann::json& v);

}  // namespace normalize
