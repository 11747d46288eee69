#pragma once

#include "storage/document.hpp"

#include <optional>

#include <nlohmann/json.hpp>

namespace funtable {

// ── StoreValue ───────────────────────────────────────────────────────────────
//
// The value stored under a key.  `data` must be a JSON object; timestamps are
// seconds since the Unix epoch.  Tables stamp both timestamps on write:
// created_at is kept from the first write, updated_at refreshed every time.

struct StoreValue {
    double         created_at = 0.0;
    double         updated_at = 0.0;
    nlohmann::json data       = nlohmann::json::object();

    // Convenience for callers that only care about the payload.
    [[nodiscard]] static StoreValue from_data(nlohmann::json data);

    bool operator==(const StoreValue&) const = default;
};

// nlohmann::json ADL hooks.  from_json throws ValueTypeError on a malformed
// value.
void to_json(nlohmann::json& j, const StoreValue& value);
void from_json(const nlohmann::json& j, StoreValue& value);

// Returns `incoming` with timestamps stamped for a write at `now`.
//   previous – the value currently stored under the key, if any
// created_at comes from `previous`, else from `incoming` when it carries one,
// else `now`.  updated_at is always `now`.
[[nodiscard]] StoreValue stamp_for_write(const StoreValue& incoming,
                                         const std::optional<StoreValue>& previous,
                                         double now);

} // namespace funtable
