#include "table/document_kv_table.hpp"

#include "common/errors.hpp"
#include "table/document_fields.hpp"
#include "table/validation.hpp"

#include <spdlog/spdlog.h>

namespace funtable {

using detail::kKeyField;
using detail::kValueField;

DocumentKvTable::DocumentKvTable(std::string name,
                                 std::shared_ptr<DocumentEngine> engine,
                                 std::chrono::milliseconds cache_ttl,
                                 std::shared_ptr<const Clock> clock)
    : name_(std::move(name))
    , engine_(std::move(engine))
    , cache_(cache_ttl, std::move(clock))
{}

void DocumentKvTable::set(const std::string& key, const StoreValue& value) {
    try {
        validate_key(key);
        validate_value(value);
    } catch (const StoreError& e) {
        spdlog::error("Table '{}': failed to set KV pair: {}", name_, e.what());
        throw;
    }

    spdlog::debug("Table '{}': set key={}", name_, key);
    const double now = unix_now();
    StoreValue written;
    engine_->update_or_insert(
        name_, Query::where(kKeyField, key),
        [&](const std::optional<Document>& current) {
            std::optional<StoreValue> previous;
            if (current) {
                previous = detail::value_field(*current);
            }
            written = stamp_for_write(value, previous, now);
            return Document{{kKeyField, key}, {kValueField, written}};
        });

    cache_.put(key, std::move(written));
}

std::optional<StoreValue> DocumentKvTable::get(const std::string& key) {
    if (auto cached = cache_.lookup(key)) {
        return cached;
    }

    spdlog::debug("Table '{}': get key={}", name_, key);
    auto doc = engine_->get(name_, Query::where(kKeyField, key));
    if (!doc) {
        return std::nullopt;
    }
    StoreValue value = detail::value_field(*doc);
    cache_.put(key, value);
    return value;
}

bool DocumentKvTable::remove(const std::string& key) {
    spdlog::debug("Table '{}': delete key={}", name_, key);
    cache_.evict(key);
    return engine_->remove(name_, Query::where(kKeyField, key)) > 0;
}

std::vector<std::string> DocumentKvTable::list_keys() const {
    std::vector<std::string> keys;
    for (const auto& doc : engine_->all(name_)) {
        keys.push_back(detail::string_field(doc, kKeyField));
    }
    return keys;
}

std::map<std::string, StoreValue> DocumentKvTable::list_all() const {
    std::map<std::string, StoreValue> result;
    for (const auto& doc : engine_->all(name_)) {
        result.insert_or_assign(detail::string_field(doc, kKeyField),
                                detail::value_field(doc));
    }
    return result;
}

void DocumentKvTable::begin_transaction() {
    warn_transactions_unsupported(name_, "begin_transaction");
}

void DocumentKvTable::commit() {
    warn_transactions_unsupported(name_, "commit");
}

void DocumentKvTable::rollback() {
    warn_transactions_unsupported(name_, "rollback");
}

} // namespace funtable
