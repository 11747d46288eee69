#pragma once

#include "storage/document.hpp"
#include "table/store_value.hpp"

#include <string>

namespace funtable::detail {

// Field names of the documents the tables store:
//   KV  : {key,  value}
//   KKV : {key1, key2, value}
inline constexpr const char* kKeyField   = "key";
inline constexpr const char* kPkeyField  = "key1";
inline constexpr const char* kSkeyField  = "key2";
inline constexpr const char* kValueField = "value";

// Returns the string stored in `field`.  Throws StoreError if it is missing or
// not a string.
[[nodiscard]] std::string string_field(const Document& doc, const char* field);

// Decodes the StoreValue stored in the document's value field.
// Throws StoreError / ValueTypeError on a malformed document.
[[nodiscard]] StoreValue value_field(const Document& doc);

} // namespace funtable::detail
