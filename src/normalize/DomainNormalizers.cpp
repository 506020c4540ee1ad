#include "normalize/DomainNormalizers.hpp"
#include "normalize/Coerce.hpp"
#include "normalize/TextUtil.hpp"

#include <string>
#include <utility>
#include <vector>

using json = nlohmann::json;

namespace normalize {

static const std::string kBullet = "\xE2\x80\xA2";

static std::string bullet_lines(const json& arr) {
    std::vector<std::string> lines;
    lines.reserve(arr.size());

    for (const auto& e : arr) {
        const std::string line = textutil::trim(ensure_string(e));
        if (line.empty()) continue;
        if (line.compare(0, kBullet.size(), kBullet) == 0) lines.push_back(line);
        else lines.push_back(kBullet + " " + line);
    }
    return textutil::join(lines, "\n");
}

static json descriptions_at(const json& v, int depth) {
    if (depth > kMaxCoerceDepth) return json();

    if (v.is_array()) {
        json out = json::array();
        for (const auto& e : v) out.push_back(descriptions_at(e, depth + 1));
        return out;
    }

    if (v.is_object()) {
        json out = json::object();
        for (auto it = v.begin(); it != v.end(); ++it) {
            if (it.key() == "description" && it.value().is_array()) {
                out[it.key()] = bullet_lines(it.value());
            } else {
                out[it.key()] = descriptions_at(it.value(), depth + 1);
            }
        }
        return out;
    }

    return v;
}

json normalize_descriptions(const json& v) {
    return descriptions_at(v, 0);
}

json normalize_skills(json v) {
    if (!v.is_object()) return v;

    auto it = v.find("skills");
    if (it == v.end() || !it->is_array()) return v;

    std::vector<std::string> parts;
    for (const auto& s : ensure_string_array(*it)) {
        std::string t = textutil::trim(s);
        if (!t.empty()) parts.push_back(std::move(t));
    }

    *it = textutil::join(parts, ", ");
    return v;
}

}  // namespace normalize
