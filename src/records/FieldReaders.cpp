#include "records/FieldReaders.hpp"
#include "normalize/Coerce.hpp"

#include <cmath>
#include <cstdint>

using json = nlohmann::json;

namespace records {

const json& member(const json& obj, const char* key) {
    static const json kNull;
    if (!obj.is_object()) return kNull;
    auto it = obj.find(key);
    if (it == obj.end()) return kNull;
    return *it;
}

std::string str_at(const json& obj, const char* key) {
    return normalize::ensure_string(member(obj, key));
}

double num_at(const json& obj, const char* key, double def) {
    const json& v = member(obj, key);
    if (!v.is_number()) return def;
    return v.get<double>();
}

json num_json(double d) {
    if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 1e15) return json((std::int64_t)d);
    return json(d);
}

std::vector<std::string> strs_at(const json& obj, const char* key) {
    return normalize::ensure_string_array(member(obj, key));
}

}  // namespace records
