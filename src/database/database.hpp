#pragma once

#include "common/clock.hpp"
#include "storage/connection_manager.hpp"
#include "storage/document_engine.hpp"
#include "table/read_cache.hpp"
#include "table/table.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

#include <spdlog/spdlog.h>

namespace funtable {

// ── DatabaseOptions ──────────────────────────────────────────────────────────

struct DatabaseOptions {
    // Time-to-live of the read cache of every KV table handed out.
    std::chrono::milliseconds cache_ttl = ReadCache::kDefaultTtl;

    // Engine pool shared with other Database instances; a private one is
    // created when null.
    std::shared_ptr<ConnectionManager> connections;

    // Time source for cache expiry; SteadyClock when null.
    std::shared_ptr<const Clock> clock;
};

// ── TableInfo ────────────────────────────────────────────────────────────────
// Registry record kept for every table.

struct TableInfo {
    std::string name;
    TableType   type = TableType::Kv;
    double      created_at = 0.0;
    double      updated_at = 0.0;
};

// A table returned by Database::get_table().
using TableHandle = std::variant<std::shared_ptr<KvTable>, std::shared_ptr<KkvTable>>;

// ── Database ─────────────────────────────────────────────────────────────────
//
// Registry of the tables stored under one base directory:
//
//   <base_dir>/.table_info   registry file, logical table "_table_info"
//   <base_dir>/<name>.db     one document file per user table
//
// The registry is the only component that creates or deletes table files.
// It never reads or writes table data.
//
// Thread-safe: registry operations are serialised by one mutex, so a
// concurrent get_table() observes a table either fully present or absent.
// Table objects are built fresh by every get_table() call; tables over the
// same file share one engine through the ConnectionManager.

class Database {
public:
    static constexpr const char* kTableInfoTable     = "_table_info";
    static constexpr const char* kTableInfoFile      = ".table_info";
    static constexpr const char* kTableFileExtension = ".db";

    // Creates `base_dir` if needed and opens the registry file.
    // Throws ConnectionError if the registry file cannot be opened, StoreError
    // if the directory cannot be created.
    explicit Database(std::filesystem::path base_dir, DatabaseOptions options = {});

    Database(const Database&)            = delete;
    Database& operator=(const Database&) = delete;

    // Throws TableNameError on a malformed name, TableExistsError when the name
    // is reserved or already registered.
    void create_kv_table(const std::string& name);
    void create_kkv_table(const std::string& name);

    // Throws TableNotFoundError if the table is not registered or its file is
    // missing.
    [[nodiscard]] TableHandle get_table(const std::string& name);

    // As get_table(), additionally throwing TableTypeError on a type mismatch.
    [[nodiscard]] std::shared_ptr<KvTable>  get_kv_table(const std::string& name);
    [[nodiscard]] std::shared_ptr<KkvTable> get_kkv_table(const std::string& name);

    // name → type for every registered table.
    [[nodiscard]] std::map<std::string, TableType> list_tables() const;

    // Throws TableNotFoundError if the table is not registered.
    [[nodiscard]] TableInfo table_info(const std::string& name) const;

    [[nodiscard]] bool has_table(const std::string& name) const;

    // Closes the table's engine, deletes its file and forgets the table.
    // Throws TableNotFoundError if the table is not registered.
    void drop_table(const std::string& name);

    [[nodiscard]] const std::filesystem::path& base_dir() const noexcept { return base_dir_; }

    // Backing file path of table `name` (whether or not it exists).
    [[nodiscard]] std::filesystem::path table_path(const std::string& name) const;

private:
    void create_table(const std::string& name, TableType type);

    // Registry record helpers.  Caller must hold mutex_.
    // add_table_info() throws TableExistsError if `name` is already recorded.
    void add_table_info(const std::string& name, TableType type);
    void remove_table_info(const std::string& name);
    [[nodiscard]] std::optional<TableInfo> find_table_info(const std::string& name) const;

    // Registry record of `name`; throws TableNotFoundError if the record or
    // the backing file is missing.  Caller must hold mutex_.
    [[nodiscard]] TableInfo require_table(const std::string& name) const;

    std::filesystem::path              base_dir_;
    DatabaseOptions                    options_;
    std::shared_ptr<ConnectionManager> connections_;
    std::shared_ptr<DocumentEngine>    registry_;
    std::shared_ptr<spdlog::logger>    logger_;
    mutable std::mutex                 mutex_;
};

} // namespace funtable
