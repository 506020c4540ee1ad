#include "normalize/Sanitizer.hpp"
#include "normalize/Coerce.hpp"
#include "normalize/FenceStripper.hpp"

using json = nlohmann::json;

namespace normalize {

static json sanitize_at(const json& v, int depth) {
    // subtrees below the guard depth are dropped; copying them would recurse without bound
    if (depth > kMaxCoerceDepth) return json();

    if (v.is_string()) return clean_markdown(v.get<std::string>());

    if (v.is_array()) {
        json out = json::array();
        for (const auto& e : v) out.push_back(sanitize_at(e, depth + 1));
        return out;
    }

    if (v.is_object()) {
        json out = json::object();
        for (auto it = v.begin(); it != v.end(); ++it) {
            out[it.key()] = sanitize_at(it.value(), depth + 1);
        }
        return out;
    }

    return v;
}

json sanitize(const json& v) {
    return sanitize_at(v, 0);
}

}  // namespace normalize
