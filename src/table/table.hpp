#pragma once

#include "table/store_value.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace funtable {

// ── TableType ────────────────────────────────────────────────────────────────
// Persisted as "kv" / "kkv".

enum class TableType : uint8_t {
    Kv  = 0,
    Kkv = 1,
};

[[nodiscard]] std::string_view to_string(TableType type) noexcept;

// Returns std::nullopt for anything other than "kv" / "kkv".
[[nodiscard]] std::optional<TableType> parse_table_type(std::string_view s) noexcept;

// ── KvTable ──────────────────────────────────────────────────────────────────
//
// Single-key document table: key → StoreValue.
//
// The backing engine offers no multi-write atomicity, so implementations
// report supports_transactions() == false and their transaction verbs are
// inert (they never throw).

class KvTable {
public:
    virtual ~KvTable() = default;

    [[nodiscard]] virtual const std::string& name() const noexcept = 0;

    // Inserts or replaces the value stored under `key`.
    // Throws KeyTypeError / ValueTypeError before touching storage.
    virtual void set(const std::string& key, const StoreValue& value) = 0;

    // Returns the value for `key`, or std::nullopt if not present.
    [[nodiscard]] virtual std::optional<StoreValue> get(const std::string& key) = 0;

    // Removes `key`.  Returns true if a value was removed.
    virtual bool remove(const std::string& key) = 0;

    // Returns all keys (order is unspecified).
    [[nodiscard]] virtual std::vector<std::string> list_keys() const = 0;

    // Returns every key → value pair.
    [[nodiscard]] virtual std::map<std::string, StoreValue> list_all() const = 0;

    [[nodiscard]] virtual bool supports_transactions() const noexcept = 0;
    virtual void begin_transaction() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;
};

// ── KkvTable ─────────────────────────────────────────────────────────────────
//
// Two-level document table: (pkey, skey) → StoreValue.
// Transaction semantics as for KvTable.

class KkvTable {
public:
    virtual ~KkvTable() = default;

    [[nodiscard]] virtual const std::string& name() const noexcept = 0;

    virtual void set(const std::string& pkey, const std::string& skey,
                     const StoreValue& value) = 0;

    [[nodiscard]] virtual std::optional<StoreValue> get(const std::string& pkey,
                                                        const std::string& skey) const = 0;

    virtual bool remove(const std::string& pkey, const std::string& skey) = 0;

    // Distinct primary keys (order is unspecified).
    [[nodiscard]] virtual std::vector<std::string> list_pkeys() const = 0;

    // Secondary keys stored under `pkey`.
    [[nodiscard]] virtual std::vector<std::string> list_skeys(const std::string& pkey) const = 0;

    // pkey → (skey → value).
    [[nodiscard]] virtual std::map<std::string, std::map<std::string, StoreValue>>
    list_all() const = 0;

    [[nodiscard]] virtual bool supports_transactions() const noexcept = 0;
    virtual void begin_transaction() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;
};

// Emits the warning every inert transaction verb logs.
void warn_transactions_unsupported(std::string_view table, std::string_view verb);

} // namespace funtable
