#include "storage/connection_manager.hpp"

#include "common/errors.hpp"
#include "storage/rocksdb_document_engine.hpp"

#include <spdlog/spdlog.h>

namespace funtable {

ConnectionManager::ConnectionManager()
    : ConnectionManager([](const std::filesystem::path& path) {
          return std::make_shared<RocksDocumentEngine>(path);
      }) {}

ConnectionManager::ConnectionManager(Factory factory)
    : factory_(std::move(factory))
    , pool_(std::make_shared<Pool>()) {}

std::string ConnectionManager::key_for(const std::filesystem::path& path) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        return path.lexically_normal().string();
    }
    return absolute.lexically_normal().string();
}

std::shared_ptr<DocumentEngine> ConnectionManager::make_handle(const std::string& key,
                                                               Entry& entry) {
    const std::uint64_t generation = ++pool_->next_generation;
    std::weak_ptr<Pool> pool = pool_;
    std::shared_ptr<DocumentEngine> engine = entry.engine;

    std::shared_ptr<DocumentEngine> handle(
        engine.get(),
        [pool, key, generation, engine](DocumentEngine*) {
            release(pool, key, generation, engine);
        });
    entry.handle     = handle;
    entry.generation = generation;
    return handle;
}

void ConnectionManager::release(const std::weak_ptr<Pool>& weak_pool,
                                const std::string& key,
                                std::uint64_t generation,
                                const std::shared_ptr<DocumentEngine>& engine) {
    auto pool = weak_pool.lock();
    if (!pool) {
        engine->close();
        return;
    }

    std::lock_guard lock(pool->mutex);
    auto it = pool->engines.find(key);
    // Invalidated, or handed out again by an acquire() that ran after the
    // last handle expired.
    if (it == pool->engines.end() || it->second.generation != generation) {
        return;
    }
    spdlog::debug("Closing document engine for {}", key);
    engine->close();
    pool->engines.erase(it);
}

std::shared_ptr<DocumentEngine> ConnectionManager::acquire(
    const std::filesystem::path& path) {
    const std::string key = key_for(path);

    std::lock_guard lock(pool_->mutex);
    auto it = pool_->engines.find(key);
    if (it != pool_->engines.end()) {
        if (auto handle = it->second.handle.lock()) {
            return handle;
        }
        // The last handle is being released but its engine is still open.
        return make_handle(key, it->second);
    }

    spdlog::debug("Opening document engine for {}", key);
    auto engine = factory_(path);
    if (!engine) {
        throw ConnectionError("No document engine available for " + key);
    }
    auto& entry = pool_->engines[key];
    entry.engine = std::move(engine);
    return make_handle(key, entry);
}

void ConnectionManager::invalidate(const std::filesystem::path& path) {
    const std::string key = key_for(path);

    std::lock_guard lock(pool_->mutex);
    auto it = pool_->engines.find(key);
    if (it == pool_->engines.end()) {
        return;
    }
    auto engine = std::move(it->second.engine);
    pool_->engines.erase(it);

    spdlog::debug("Invalidating document engine for {}", key);
    engine->close();
}

bool ConnectionManager::is_open(const std::filesystem::path& path) const {
    std::lock_guard lock(pool_->mutex);
    return pool_->engines.count(key_for(path)) > 0;
}

std::size_t ConnectionManager::open_count() const {
    std::lock_guard lock(pool_->mutex);
    return pool_->engines.size();
}

} // namespace funtable
