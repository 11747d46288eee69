#pragma once

#include "storage/document.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

namespace funtable {

// ── DocumentEngine ───────────────────────────────────────────────────────────
//
// Abstract interface for an embedded document store bound to one backing
// file.  A single file holds any number of logical tables, addressed by name.
//
// Implementations must be thread-safe: every call is serialised against the
// backing file, so read-modify-write operations (upsert, update_or_insert)
// are atomic with respect to each other.
//
// Once close() has been called every data operation throws
// TableNotFoundError.

class DocumentEngine {
public:
    // Receives the current matching document (or std::nullopt) and returns the
    // document to store in its place.
    using Updater = std::function<Document(const std::optional<Document>& current)>;

    virtual ~DocumentEngine() = default;

    // Inserts `doc` if nothing matches `query`; otherwise overwrites the fields
    // of the first matching document with the fields of `doc`.
    virtual void upsert(std::string_view table, const Document& doc,
                        const Query& query) = 0;

    // Atomic read-modify-write: the first document matching `query` (if any)
    // is replaced by updater(current); with no match the result is inserted.
    // Returns the stored document.
    virtual Document update_or_insert(std::string_view table, const Query& query,
                                      const Updater& updater) = 0;

    // Returns the first document matching `query`, or std::nullopt.
    [[nodiscard]] virtual std::optional<Document> get(std::string_view table,
                                                      const Query& query) const = 0;

    // Removes every document matching `query`.  Returns the number removed.
    virtual std::size_t remove(std::string_view table, const Query& query) = 0;

    // Returns every document in `table` (order is unspecified).
    [[nodiscard]] virtual std::vector<Document> all(std::string_view table) const = 0;

    // Returns every document in `table` matching `query`.
    [[nodiscard]] virtual std::vector<Document> search(std::string_view table,
                                                       const Query& query) const = 0;

    // Releases the backing file.  Idempotent.
    virtual void close() = 0;

    [[nodiscard]] virtual bool is_open() const = 0;

    [[nodiscard]] virtual const std::filesystem::path& path() const noexcept = 0;
};

} // namespace funtable
