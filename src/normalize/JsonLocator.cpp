#include "normalize/JsonLocator.hpp"
#include "normalize/FenceStripper.hpp"

#include <optional>
#include <utility>

using json = nlohmann::json;

namespace normalize {

// Returns the end index (inclusive) of the object opened at `start`, or npos when unclosed.
static size_t find_object_end(const std::string& s, size_t start) {
    bool in_str = false;
    bool escape = false;
    int depth = 0;

    for (size_t i = start; i < s.size(); ++i) {
        const char c = s[i];
        if (in_str) {
            if (escape) escape = false;
            else if (c == '\\') escape = true;
            else if (c == '"') in_str = false;
            continue;
        }

        if (c == '"') {
            in_str = true;
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            --depth;
            if (depth == 0) return i;
        }
    }
    return std::string::npos;
}

static std::optional<json> parse_object(const std::string& span, std::string& err) {
    try {
        json j = json::parse(span);
        if (j.is_object()) return std::move(j);
        err = "located span is not a JSON object";
    } catch (const json::exception& e) {
        err = e.what();
    }
    return std::nullopt;
}

LocateResult locate(const std::string& text) {
    LocateResult res;
    const std::string s = remove_code_fences(text);

    std::string last_err = "no JSON object found";

    size_t pos = s.find('{');
    while (pos != std::string::npos) {
        const size_t end = find_object_end(s, pos);
        if (end == std::string::npos) {
            // truncated output: whatever nests inside is a fragment, not the answer
            last_err = "unterminated JSON object";
            break;
        }

        auto obj = parse_object(s.substr(pos, end - pos + 1), last_err);
        if (obj) {
            res.value = std::move(*obj);
            return res;
        }
        pos = s.find('{', end + 1);
    }

    const size_t a = s.find('{');
    const size_t b = s.rfind('}');
    if (a != std::string::npos && b != std::string::npos && b > a) {
        std::string err;
        auto obj = parse_object(s.substr(a, b - a + 1), err);
        if (obj) {
            res.value = std::move(*obj);
            return res;
        }
    }

    res.error = ParseError::Unparsable;
    res.detail = last_err;
    return res;
}

const char* parse_error_str(ParseError e) {
    switch (e) {
        case ParseError::None: return "none";
        case ParseError::Unparsable: return "unparsable";
        default: return "unknown";
    }
}

}  // namespace normalize
