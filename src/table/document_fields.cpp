#include "table/document_fields.hpp"

#include "common/errors.hpp"

namespace funtable::detail {

std::string string_field(const Document& doc, const char* field) {
    auto it = doc.find(field);
    if (it == doc.end() || !it->is_string()) {
        throw StoreError(std::string("Stored document has no string '") +
                         field + "' field");
    }
    return it->get<std::string>();
}

StoreValue value_field(const Document& doc) {
    auto it = doc.find(kValueField);
    if (it == doc.end()) {
        throw StoreError("Stored document has no 'value' field");
    }
    return it->get<StoreValue>();
}

} // namespace funtable::detail
