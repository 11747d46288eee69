#pragma once

#include "storage/document_engine.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace rocksdb {
class DB;
class Slice;
} // namespace rocksdb

namespace funtable {

// ── RocksDocumentEngine ──────────────────────────────────────────────────────
//
// DocumentEngine backed by one RocksDB database directory.
//
// Record layout (0x1F is the ASCII unit separator):
//
//   <table> 0x1F 'd' 0x1F <doc_id, 20 decimal digits>  →  compact JSON document
//   <table> 0x1F "seq"                                 →  last assigned doc_id
//
// Predicates are evaluated by scanning the table's key prefix; there are no
// secondary indexes.  All calls take mutex_, so one engine instance serialises
// every access to its directory.

class RocksDocumentEngine final : public DocumentEngine {
public:
    // Opens (or creates) a RocksDB database at `db_path`.
    // Throws ConnectionError if the database cannot be opened.
    explicit RocksDocumentEngine(std::filesystem::path db_path);

    ~RocksDocumentEngine() override;

    // Not copyable or movable – RocksDB owns internal state.
    RocksDocumentEngine(const RocksDocumentEngine&)            = delete;
    RocksDocumentEngine& operator=(const RocksDocumentEngine&) = delete;
    RocksDocumentEngine(RocksDocumentEngine&&)                 = delete;
    RocksDocumentEngine& operator=(RocksDocumentEngine&&)      = delete;

    void upsert(std::string_view table, const Document& doc,
                const Query& query) override;
    Document update_or_insert(std::string_view table, const Query& query,
                              const Updater& updater) override;
    [[nodiscard]] std::optional<Document> get(std::string_view table,
                                              const Query& query) const override;
    std::size_t remove(std::string_view table, const Query& query) override;
    [[nodiscard]] std::vector<Document> all(std::string_view table) const override;
    [[nodiscard]] std::vector<Document> search(std::string_view table,
                                               const Query& query) const override;
    void close() override;
    [[nodiscard]] bool is_open() const override;
    [[nodiscard]] const std::filesystem::path& path() const noexcept override {
        return path_;
    }

private:
    // Visits documents of `table` in doc_id order until `fn` returns false.
    // Caller must hold mutex_.
    void scan(std::string_view table,
              const std::function<bool(const rocksdb::Slice& key,
                                       Document& doc)>& fn) const;

    // Returns the record key of the first match, or an empty string.
    // Caller must hold mutex_.
    [[nodiscard]] std::string find_first(std::string_view table,
                                         const Query& query,
                                         Document* out) const;

    // Writes `doc` under `record_key`, or under a freshly allocated doc_id
    // when `record_key` is empty.  Caller must hold mutex_.
    void write_document(std::string_view table, const std::string& record_key,
                        const Document& doc);

    // Throws TableNotFoundError if close() has been called.
    void ensure_open() const;

    std::filesystem::path       path_;
    mutable std::mutex          mutex_;
    std::unique_ptr<rocksdb::DB> db_;
};

} // namespace funtable
