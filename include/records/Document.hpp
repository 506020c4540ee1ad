#pragma once

#include <string>

#include "nlohmann/json.hpp"

namespace records {

// Free-text output: cover letters, interview guides, negotiation scripts.
struct DocumentRecord {
    std::string text;

    nlohmann::json to_json() const;
};

// Accepts either a JSON wrapper ({"content": ...}, {"text": ...}, {"document": ...})
// or a plain string value.
DocumentRecord validate_document(const nlohmann::json& v);

// true when `v` is an object carrying a non-null content / text / document field
bool is_document_wrapper(const nlohmann::json& v);

}  // namespace records
