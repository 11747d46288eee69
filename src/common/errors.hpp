#pragma once

#include <stdexcept>
#include <string>

namespace funtable {

// ── Error taxonomy ───────────────────────────────────────────────────────────
//
// Every failure surfaced by the store derives from StoreError, so callers can
// catch the whole family at once or a single kind.

class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A supplied key is not a valid (non-empty) string identifier.
class KeyTypeError : public StoreError {
public:
    using StoreError::StoreError;
};

// A supplied value's data is not a JSON object, or the value is malformed.
class ValueTypeError : public StoreError {
public:
    using StoreError::StoreError;
};

// Table name fails ^[A-Za-z][A-Za-z0-9_]*$.
class TableNameError : public StoreError {
public:
    using StoreError::StoreError;
};

// create_*_table() called on a registered or reserved name.
class TableExistsError : public StoreError {
public:
    using StoreError::StoreError;
};

// Table not registered, or its backing file vanished.
class TableNotFoundError : public StoreError {
public:
    using StoreError::StoreError;
};

// Typed accessor asked for a KV table that is KKV (or vice versa).
class TableTypeError : public StoreError {
public:
    using StoreError::StoreError;
};

// The document engine could not be opened.
class ConnectionError : public StoreError {
public:
    using StoreError::StoreError;
};

} // namespace funtable
