#pragma once

#include "storage/document_engine.hpp"
#include "table/table.hpp"

#include <memory>
#include <string>

namespace funtable {

// ── DocumentKkvTable ─────────────────────────────────────────────────────────
//
// KkvTable stored as {key1, key2, value} documents in a DocumentEngine.
// No caching: every call goes to the engine.

class DocumentKkvTable final : public KkvTable {
public:
    DocumentKkvTable(std::string name, std::shared_ptr<DocumentEngine> engine);

    [[nodiscard]] const std::string& name() const noexcept override { return name_; }

    void set(const std::string& pkey, const std::string& skey,
             const StoreValue& value) override;
    [[nodiscard]] std::optional<StoreValue> get(const std::string& pkey,
                                                const std::string& skey) const override;
    bool remove(const std::string& pkey, const std::string& skey) override;
    [[nodiscard]] std::vector<std::string> list_pkeys() const override;
    [[nodiscard]] std::vector<std::string> list_skeys(const std::string& pkey) const override;
    [[nodiscard]] std::map<std::string, std::map<std::string, StoreValue>>
    list_all() const override;

    [[nodiscard]] bool supports_transactions() const noexcept override { return false; }
    void begin_transaction() override;
    void commit() override;
    void rollback() override;

private:
    std::string                     name_;
    std::shared_ptr<DocumentEngine> engine_;
};

} // namespace funtable
