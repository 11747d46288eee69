#pragma once

#include "common/clock.hpp"
#include "storage/document_engine.hpp"
#include "table/read_cache.hpp"
#include "table/table.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace funtable {

// ── DocumentKvTable ──────────────────────────────────────────────────────────
//
// KvTable stored as {key, value} documents in a DocumentEngine, fronted by a
// ReadCache.
//
// The cache belongs to this instance.  A write through another instance over
// the same file does not invalidate it, so get() may return a value up to
// cache_ttl older than the file's contents.  Writes through this instance are
// always visible to it immediately.
//
// The engine handle is shared with every other table over the same file; the
// table never closes it.

class DocumentKvTable final : public KvTable {
public:
    DocumentKvTable(std::string name,
                    std::shared_ptr<DocumentEngine> engine,
                    std::chrono::milliseconds cache_ttl = ReadCache::kDefaultTtl,
                    std::shared_ptr<const Clock> clock = nullptr);

    [[nodiscard]] const std::string& name() const noexcept override { return name_; }

    void set(const std::string& key, const StoreValue& value) override;
    [[nodiscard]] std::optional<StoreValue> get(const std::string& key) override;
    bool remove(const std::string& key) override;
    [[nodiscard]] std::vector<std::string> list_keys() const override;
    [[nodiscard]] std::map<std::string, StoreValue> list_all() const override;

    [[nodiscard]] bool supports_transactions() const noexcept override { return false; }
    void begin_transaction() override;
    void commit() override;
    void rollback() override;

    // Drops every cached entry; the next get() of each key reads the file.
    void clear_cache() { cache_.clear(); }

    [[nodiscard]] std::size_t cache_size() const { return cache_.size(); }

private:
    std::string                     name_;
    std::shared_ptr<DocumentEngine> engine_;
    ReadCache                       cache_;
};

} // namespace funtable
