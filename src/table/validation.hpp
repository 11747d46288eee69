#pragma once

#include "table/store_value.hpp"

#include <string_view>

namespace funtable {

// Throws KeyTypeError unless `key` is a non-empty string.
//   what – "key", "pkey", "skey" (used in the message)
void validate_key(std::string_view key, std::string_view what = "key");

// Throws ValueTypeError unless `value.data` is a JSON object.
void validate_value(const StoreValue& value);

// True if `name` matches ^[A-Za-z][A-Za-z0-9_]*$.
[[nodiscard]] bool is_valid_table_name(std::string_view name) noexcept;

// Throws TableNameError unless is_valid_table_name(name).
void validate_table_name(std::string_view name);

} // namespace funtable
