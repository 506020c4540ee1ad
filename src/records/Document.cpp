#include "records/Document.hpp"
#include "records/FieldReaders.hpp"
#include "normalize/Coerce.hpp"

using json = nlohmann::json;

namespace records {

static const char* kDocumentKeys[] = {"content", "text", "document"};

bool is_document_wrapper(const json& v) {
    for (const char* key : kDocumentKeys) {
        if (!member(v, key).is_null()) return true;
    }
    return false;
}

DocumentRecord validate_document(const json& v) {
    DocumentRecord d;
    if (v.is_string()) {
        d.text = v.get<std::string>();
        return d;
    }

    for (const char* key : kDocumentKeys) {
        const json& f = member(v, key);
        if (f.is_null()) continue;
        d.text = normalize::ensure_string(f);
        break;
    }
    return d;
}

json DocumentRecord::to_json() const {
    return {{"text", text}};
}

}  // namespace records
