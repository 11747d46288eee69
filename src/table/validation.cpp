#include "table/validation.hpp"

#include "common/errors.hpp"

#include <string>

namespace funtable {

namespace {

bool is_ascii_letter(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool is_ascii_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

} // anonymous namespace

void validate_key(std::string_view key, std::string_view what) {
    if (key.empty()) {
        throw KeyTypeError(std::string(what) + " must be a non-empty string");
    }
}

void validate_value(const StoreValue& value) {
    if (!value.data.is_object()) {
        throw ValueTypeError(std::string("Value data must be an object, got ") +
                             value.data.type_name());
    }
}

bool is_valid_table_name(std::string_view name) noexcept {
    if (name.empty() || !is_ascii_letter(name.front())) {
        return false;
    }
    for (char c : name.substr(1)) {
        if (!is_ascii_letter(c) && !is_ascii_digit(c) && c != '_') {
            return false;
        }
    }
    return true;
}

void validate_table_name(std::string_view name) {
    if (!is_valid_table_name(name)) {
        throw TableNameError(
            "Table name '" + std::string(name) +
            "' must start with a letter and contain only letters, numbers "
            "and underscores");
    }
}

} // namespace funtable
