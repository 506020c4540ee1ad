#pragma once
#include <cstddef>

namespace records {

// Caps on best-effort enrichment lists. Extra elements are dropped, not an error.
struct ValidatorConfig {
    size_t max_sources = 10;
    size_t max_employee_voices = 5;
};

}  // namespace records
