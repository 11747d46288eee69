#pragma once

#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace funtable {

// A stored document: a flat JSON object of field name → value.
using Document = nlohmann::json;

// ── Query ────────────────────────────────────────────────────────────────────
//
// Conjunction of exact string-equality terms on top-level document fields.
// An empty query matches every document.
//
//   Query::where("key1", pkey).and_where("key2", skey)

class Query {
public:
    Query() = default;

    [[nodiscard]] static Query where(std::string field, std::string value);

    Query& and_where(std::string field, std::string value);

    // True if `doc` is an object and every term's field holds a string equal
    // to the term's value.
    [[nodiscard]] bool matches(const Document& doc) const;

    [[nodiscard]] bool empty() const noexcept { return terms_.empty(); }

    // Human-readable form for log lines: key1=='a' && key2=='b'
    [[nodiscard]] std::string to_string() const;

private:
    std::vector<std::pair<std::string, std::string>> terms_;
};

} // namespace funtable
