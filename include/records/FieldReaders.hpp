#pragma once
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace records {

// Field lookup that tolerates any input: a missing key, or a non-object `obj`,
// yields a null value.
const nlohmann::json& member(const nlohmann::json& obj, const char* key);

// string leaf, coerced with ensure_string ("" when absent)
std::string str_at(const nlohmann::json& obj, const char* key);

// numeric leaf: type-checked, never parsed from text
double num_at(const nlohmann::json& obj, const char* key, double def = 0.0);

// numeric leaf back to JSON; whole values stay integers (72, not 72.0)
nlohmann::json num_json(double d);

// string list leaf: ensure_string_array (empty unless an array)
std::vector<std::string> strs_at(const nlohmann::json& obj, const char* key);

// Sequence-of-object leaf. Each element goes through `parse_item` on its own;
// std::nullopt drops the element. At most `cap` elements are kept, in order.
template <typename T, typename Fn>
std::vector<T> list_at(const nlohmann::json& obj, const char* key, Fn parse_item,
                       size_t cap = std::numeric_limits<size_t>::max()) {
    std::vector<T> out;
    const nlohmann::json& arr = member(obj, key);
    if (!arr.is_array()) return out;

    for (const auto& e : arr) {
        if (out.size() >= cap) break;
        std::optional<T> item = parse_item(e);
        if (item) out.push_back(std::move(*item));
    }
    return out;
}

}  // namespace records
