#pragma once

#include "nlohmann/json.hpp"

namespace normalize {

// Every "description" field (at any depth) holding an array becomes one string:
// one line per element, each prefixed with "• " unless it already starts with it.
// Empty lines are dropped; non-array descriptions are left alone.
// Anything nested deeper than kMaxCoerceDepth comes back as null.
nlohmann::json normalize_descriptions(const nlohmann::json& v);

// A top-level "skills" array becomes a comma separated string ("C++, Go, SQL").
nlohmann::json normalize_skills(nlohmann::json v);

}  // namespace normalize
