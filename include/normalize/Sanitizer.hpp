#pragma once

#include "nlohmann/json.hpp"
#include "normalize/Coerce.hpp"

namespace normalize {

// Runs clean_markdown() over every string leaf. Arrays/objects keep their shape,
// null/bool/number pass through. Idempotent.
// Anything nested deeper than kMaxCoerceDepth comes back as null.
nlohmann::json sanitize(const nlohmann::json& v);

}  // namespace normalize
