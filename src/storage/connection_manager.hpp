#pragma once

#include "storage/document_engine.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <cstdint>
#include <string>
#include <unordered_map>

namespace funtable {

// ── ConnectionManager ────────────────────────────────────────────────────────
//
// Hands out exactly one live DocumentEngine per backing path.
//
// An engine stays open while at least one handle returned by acquire() is
// alive.  Releasing the last handle closes the engine under the manager's
// lock, so a concurrent acquire() of the same path waits for the file to be
// released instead of opening it a second time.  invalidate() closes a path's
// engine immediately (used before the file is deleted); outstanding handles
// then fail with TableNotFoundError.
//
// Handles may outlive the manager; the last one then closes its engine.
//
// Thread-safe.

class ConnectionManager {
public:
    using Factory = std::function<std::shared_ptr<DocumentEngine>(
        const std::filesystem::path& path)>;

    // Opens RocksDocumentEngine instances.
    ConnectionManager();

    explicit ConnectionManager(Factory factory);

    ConnectionManager(const ConnectionManager&)            = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Returns the live engine for `path`, opening it if necessary.
    // Throws ConnectionError if the engine cannot be opened.
    [[nodiscard]] std::shared_ptr<DocumentEngine> acquire(
        const std::filesystem::path& path);

    // Closes and forgets the engine for `path`, if one is live.
    void invalidate(const std::filesystem::path& path);

    // True if a live engine exists for `path`.
    [[nodiscard]] bool is_open(const std::filesystem::path& path) const;

    // Number of live engines.
    [[nodiscard]] std::size_t open_count() const;

private:
    struct Entry {
        std::shared_ptr<DocumentEngine> engine;
        // Handle shared by all callers; expires when the last caller lets go.
        std::weak_ptr<DocumentEngine>   handle;
        std::uint64_t                   generation = 0;
    };

    struct Pool {
        std::mutex                             mutex;
        std::unordered_map<std::string, Entry> engines;
        std::uint64_t                          next_generation = 0;
    };

    [[nodiscard]] static std::string key_for(const std::filesystem::path& path);

    // Wraps entry.engine in a new handle whose release closes the engine.
    // Caller must hold pool_->mutex.
    [[nodiscard]] std::shared_ptr<DocumentEngine> make_handle(const std::string& key,
                                                              Entry& entry);

    static void release(const std::weak_ptr<Pool>& pool, const std::string& key,
                        std::uint64_t generation,
                        const std::shared_ptr<DocumentEngine>& engine);

    Factory               factory_;
    std::shared_ptr<Pool> pool_;
};

} // namespace funtable
