#include "table/document_kkv_table.hpp"

#include "common/clock.hpp"
#include "common/errors.hpp"
#include "table/document_fields.hpp"
#include "table/validation.hpp"

#include <spdlog/spdlog.h>

#include <set>

namespace funtable {

using detail::kPkeyField;
using detail::kSkeyField;
using detail::kValueField;

namespace {

Query composite(const std::string& pkey, const std::string& skey) {
    return Query::where(kPkeyField, pkey).and_where(kSkeyField, skey);
}

} // anonymous namespace

DocumentKkvTable::DocumentKkvTable(std::string name,
                                   std::shared_ptr<DocumentEngine> engine)
    : name_(std::move(name))
    , engine_(std::move(engine))
{}

void DocumentKkvTable::set(const std::string& pkey, const std::string& skey,
                           const StoreValue& value) {
    try {
        validate_key(pkey, "pkey");
        validate_key(skey, "skey");
        validate_value(value);
    } catch (const StoreError& e) {
        spdlog::error("Table '{}': failed to set KKV pair: {}", name_, e.what());
        throw;
    }

    spdlog::debug("Table '{}': set pkey={} skey={}", name_, pkey, skey);
    const double now = unix_now();
    engine_->update_or_insert(
        name_, composite(pkey, skey),
        [&](const std::optional<Document>& current) {
            std::optional<StoreValue> previous;
            if (current) {
                previous = detail::value_field(*current);
            }
            return Document{
                {kPkeyField,  pkey},
                {kSkeyField,  skey},
                {kValueField, stamp_for_write(value, previous, now)},
            };
        });
}

std::optional<StoreValue> DocumentKkvTable::get(const std::string& pkey,
                                                const std::string& skey) const {
    spdlog::debug("Table '{}': get pkey={} skey={}", name_, pkey, skey);
    auto doc = engine_->get(name_, composite(pkey, skey));
    if (!doc) {
        return std::nullopt;
    }
    return detail::value_field(*doc);
}

bool DocumentKkvTable::remove(const std::string& pkey, const std::string& skey) {
    spdlog::debug("Table '{}': delete pkey={} skey={}", name_, pkey, skey);
    return engine_->remove(name_, composite(pkey, skey)) > 0;
}

std::vector<std::string> DocumentKkvTable::list_pkeys() const {
    std::set<std::string> unique;
    for (const auto& doc : engine_->all(name_)) {
        unique.insert(detail::string_field(doc, kPkeyField));
    }
    return {unique.begin(), unique.end()};
}

std::vector<std::string> DocumentKkvTable::list_skeys(const std::string& pkey) const {
    std::vector<std::string> skeys;
    for (const auto& doc : engine_->search(name_, Query::where(kPkeyField, pkey))) {
        skeys.push_back(detail::string_field(doc, kSkeyField));
    }
    return skeys;
}

std::map<std::string, std::map<std::string, StoreValue>>
DocumentKkvTable::list_all() const {
    std::map<std::string, std::map<std::string, StoreValue>> result;
    for (const auto& doc : engine_->all(name_)) {
        result[detail::string_field(doc, kPkeyField)].insert_or_assign(
            detail::string_field(doc, kSkeyField), detail::value_field(doc));
    }
    return result;
}

void DocumentKkvTable::begin_transaction() {
    warn_transactions_unsupported(name_, "begin_transaction");
}

void DocumentKkvTable::commit() {
    warn_transactions_unsupported(name_, "commit");
}

void DocumentKkvTable::rollback() {
    warn_transactions_unsupported(name_, "rollback");
}

} // namespace funtable
