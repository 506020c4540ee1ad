#include "normalize/Coerce.hpp"

#include <cmath>
#include <cstdint>
#include <utility>
#include <vector>

using json = nlohmann::json;

namespace normalize {

static const char* kContentKeys[] = {"text", "value", "description"};

static std::string number_text(const json& v) {
    if (v.is_number_unsigned()) return std::to_string(v.get<std::uint64_t>());
    if (v.is_number_integer()) return std::to_string(v.get<std::int64_t>());

    const double d = v.get<double>();
    if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 1e15) {
        return std::to_string((long long)d);
    }
    // shortest round-trip form
    return v.dump();
}

// iterative so that the check itself cannot overflow the stack
static bool deeper_than(const json& root, int limit) {
    std::vector<std::pair<const json*, int>> stack;
    stack.emplace_back(&root, 0);
    while (!stack.empty()) {
        auto [node, depth] = stack.back();
        stack.pop_back();
        if (depth > limit) return true;
        if (node->is_array() || node->is_object()) {
            for (const auto& child : *node) stack.emplace_back(&child, depth + 1);
        }
    }
    return false;
}

static std::string to_display(const json& v, int depth) {
    if (depth > kMaxCoerceDepth) return "";

    switch (v.type()) {
        case json::value_t::null:
        case json::value_t::discarded:
            return "";
        case json::value_t::string:
            return v.get<std::string>();
        case json::value_t::boolean:
            return v.get<bool>() ? "true" : "false";
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
        case json::value_t::number_float:
            return number_text(v);
        case json::value_t::array: {
            std::string out;
            bool first = true;
            for (const auto& e : v) {
                if (!first) out += ' ';
                out += to_display(e, depth + 1);
                first = false;
            }
            return out;
        }
        case json::value_t::object: {
            for (const char* key : kContentKeys) {
                auto it = v.find(key);
                if (it != v.end() && !it->is_null()) return to_display(*it, depth + 1);
            }
            if (deeper_than(v, kMaxCoerceDepth - depth)) return "";
            return v.dump(-1, ' ', false, json::error_handler_t::replace);
        }
        default:
            return "";
    }
}

std::string ensure_string(const json& v) {
    return to_display(v, 0);
}

std::vector<std::string> ensure_string_array(const json& v) {
    std::vector<std::string> out;
    if (!v.is_array()) return out;

    out.reserve(v.size());
    for (const auto& e : v) out.push_back(ensure_string(e));
    return out;
}

}  // namespace normalize
