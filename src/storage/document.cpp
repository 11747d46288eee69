#include "storage/document.hpp"

namespace funtable {

Query Query::where(std::string field, std::string value) {
    Query q;
    q.terms_.emplace_back(std::move(field), std::move(value));
    return q;
}

Query& Query::and_where(std::string field, std::string value) {
    terms_.emplace_back(std::move(field), std::move(value));
    return *this;
}

bool Query::matches(const Document& doc) const {
    if (!doc.is_object()) {
        return false;
    }
    for (const auto& [field, value] : terms_) {
        auto it = doc.find(field);
        if (it == doc.end() || !it->is_string()) {
            return false;
        }
        if (it->get_ref<const std::string&>() != value) {
            return false;
        }
    }
    return true;
}

std::string Query::to_string() const {
    if (terms_.empty()) {
        return "<all>";
    }
    std::string out;
    for (const auto& [field, value] : terms_) {
        if (!out.empty()) {
            out += " && ";
        }
        out += field;
        out += "=='";
        out += value;
        out += '\'';
    }
    return out;
}

} // namespace funtable
