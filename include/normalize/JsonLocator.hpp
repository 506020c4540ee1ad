#pragma once
#include <string>

#include "nlohmann/json.hpp"

namespace normalize {

enum class ParseError {
    None,
    Unparsable   // no {...} object found, or none of the candidates parsed
};

struct LocateResult {
    nlohmann::json value;                  // a JSON object when ok(), null otherwise
    ParseError error = ParseError::None;
    std::string detail;                    // why nothing was located (diagnostics only)

    bool ok() const { return error == ParseError::None; }
};

// Finds the JSON object inside free-form model output and parses it.
// Code fences are dropped, then balanced {...} spans are tried in order
// (string literals and escapes are respected while counting braces).
// If none parses, the first '{' .. last '}' span is tried as a last resort.
// Never throws.
LocateResult locate(const std::string& text);

const char* parse_error_str(ParseError e);

}  // namespace normalize
