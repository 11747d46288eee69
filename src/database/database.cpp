#include "database/database.hpp"

#include "common/errors.hpp"
#include "common/logger.hpp"
#include "table/document_kkv_table.hpp"
#include "table/document_kv_table.hpp"
#include "table/validation.hpp"

#include <system_error>

namespace funtable {

namespace fs = std::filesystem;

namespace {

constexpr const char* kNameField      = "name";
constexpr const char* kTypeField      = "type";
constexpr const char* kCreatedAtField = "created_at";
constexpr const char* kUpdatedAtField = "updated_at";

// Deletes a table's backing file.  A missing file is not an error.
void remove_backing_file(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        throw StoreError("Failed to remove table file " + path.string() + ": " +
                         ec.message());
    }
}

// Missing timestamps read as 0; anything other than a number is corruption.
double timestamp_field(const Document& doc, const char* field) {
    auto it = doc.find(field);
    if (it == doc.end()) {
        return 0.0;
    }
    if (!it->is_number()) {
        throw StoreError(std::string("Corrupt ") + field +
                         " in table registry record: " + doc.dump());
    }
    return it->get<double>();
}

TableInfo decode_table_info(const Document& doc) {
    auto name = doc.find(kNameField);
    auto type = doc.find(kTypeField);
    if (name == doc.end() || !name->is_string() ||
        type == doc.end() || !type->is_string()) {
        throw StoreError("Corrupt table registry record: " + doc.dump());
    }
    auto parsed = parse_table_type(type->get<std::string>());
    if (!parsed) {
        throw StoreError("Unknown table type in registry record: " + doc.dump());
    }

    TableInfo info;
    info.name = name->get<std::string>();
    info.type = *parsed;
    info.created_at = timestamp_field(doc, kCreatedAtField);
    info.updated_at = timestamp_field(doc, kUpdatedAtField);
    return info;
}

} // anonymous namespace

Database::Database(fs::path base_dir, DatabaseOptions options)
    : base_dir_(std::move(base_dir))
    , options_(std::move(options))
    , connections_(options_.connections
                       ? options_.connections
                       : std::make_shared<ConnectionManager>())
    , logger_(make_component_logger("registry", spdlog::default_logger()->level()))
{
    std::error_code ec;
    fs::create_directories(base_dir_, ec);
    if (ec) {
        throw StoreError("Failed to create store directory " +
                         base_dir_.string() + ": " + ec.message());
    }
    registry_ = connections_->acquire(base_dir_ / kTableInfoFile);
    logger_->info("Table registry opened in {}", base_dir_.string());
}

fs::path Database::table_path(const std::string& name) const {
    return base_dir_ / (name + kTableFileExtension);
}

// ── Registry records ─────────────────────────────────────────────────────────

void Database::add_table_info(const std::string& name, TableType type) {
    const double now = unix_now();
    // Check and insert in one engine call: other Database objects may share
    // this registry file.
    registry_->update_or_insert(
        kTableInfoTable, Query::where(kNameField, name),
        [&](const std::optional<Document>& current) -> Document {
            if (current) {
                throw TableExistsError("Table '" + name + "' already exists");
            }
            return Document{
                {kNameField,      name},
                {kTypeField,      std::string(to_string(type))},
                {kCreatedAtField, now},
                {kUpdatedAtField, now},
            };
        });
}

void Database::remove_table_info(const std::string& name) {
    registry_->remove(kTableInfoTable, Query::where(kNameField, name));
}

std::optional<TableInfo> Database::find_table_info(const std::string& name) const {
    auto doc = registry_->get(kTableInfoTable, Query::where(kNameField, name));
    if (!doc) {
        return std::nullopt;
    }
    return decode_table_info(*doc);
}

TableInfo Database::require_table(const std::string& name) const {
    auto info = find_table_info(name);
    if (!info) {
        throw TableNotFoundError("Table '" + name + "' does not exist");
    }
    std::error_code ec;
    if (!fs::exists(table_path(name), ec)) {
        throw TableNotFoundError("Table '" + name + "' database file does not exist");
    }
    return *info;
}

// ── Table lifecycle ──────────────────────────────────────────────────────────

void Database::create_kv_table(const std::string& name) {
    create_table(name, TableType::Kv);
}

void Database::create_kkv_table(const std::string& name) {
    create_table(name, TableType::Kkv);
}

void Database::create_table(const std::string& name, TableType type) {
    const auto type_name = to_string(type);
    try {
        if (name == kTableInfoTable) {
            throw TableExistsError(std::string("Table name '") + kTableInfoTable +
                                   "' is reserved");
        }
        validate_table_name(name);

        std::lock_guard lock(mutex_);
        add_table_info(name, type);

        logger_->info("Creating {} table: {}", type_name, name);
        const fs::path path = table_path(name);
        try {
            // Debris of a table that was dropped or created only partially.
            std::error_code ec;
            if (fs::exists(path, ec)) {
                logger_->warn("Removing stale table file {}", path.string());
                connections_->invalidate(path);
                remove_backing_file(path);
            }

            // Opening the engine creates the empty file; the handle is
            // released straight away.
            connections_->acquire(path).reset();
        } catch (const std::exception&) {
            remove_table_info(name);
            throw;
        }
        logger_->info("Created {} table: {}", type_name, name);
    } catch (const StoreError& e) {
        logger_->error("Failed to create {} table {}: {}", type_name, name, e.what());
        throw;
    }
}

TableHandle Database::get_table(const std::string& name) {
    std::lock_guard lock(mutex_);
    const TableInfo info = require_table(name);
    auto engine = connections_->acquire(table_path(name));

    if (info.type == TableType::Kkv) {
        return std::shared_ptr<KkvTable>(
            std::make_shared<DocumentKkvTable>(name, std::move(engine)));
    }
    return std::shared_ptr<KvTable>(
        std::make_shared<DocumentKvTable>(name, std::move(engine),
                                          options_.cache_ttl, options_.clock));
}

std::shared_ptr<KvTable> Database::get_kv_table(const std::string& name) {
    auto handle = get_table(name);
    if (auto* kv = std::get_if<std::shared_ptr<KvTable>>(&handle)) {
        return *kv;
    }
    throw TableTypeError("Table '" + name + "' is a kkv table, not kv");
}

std::shared_ptr<KkvTable> Database::get_kkv_table(const std::string& name) {
    auto handle = get_table(name);
    if (auto* kkv = std::get_if<std::shared_ptr<KkvTable>>(&handle)) {
        return *kkv;
    }
    throw TableTypeError("Table '" + name + "' is a kv table, not kkv");
}

std::map<std::string, TableType> Database::list_tables() const {
    std::lock_guard lock(mutex_);
    std::map<std::string, TableType> result;
    for (const auto& doc : registry_->all(kTableInfoTable)) {
        auto info = decode_table_info(doc);
        result.insert_or_assign(std::move(info.name), info.type);
    }
    return result;
}

TableInfo Database::table_info(const std::string& name) const {
    std::lock_guard lock(mutex_);
    auto info = find_table_info(name);
    if (!info) {
        throw TableNotFoundError("Table '" + name + "' does not exist");
    }
    return *info;
}

bool Database::has_table(const std::string& name) const {
    std::lock_guard lock(mutex_);
    return find_table_info(name).has_value();
}

void Database::drop_table(const std::string& name) {
    try {
        std::lock_guard lock(mutex_);
        if (!find_table_info(name)) {
            throw TableNotFoundError("Table '" + name + "' does not exist");
        }

        logger_->info("Dropping table: {}", name);
        const fs::path path = table_path(name);
        connections_->invalidate(path);
        remove_backing_file(path);
        remove_table_info(name);
    } catch (const StoreError& e) {
        logger_->error("Failed to drop table {}: {}", name, e.what());
        throw;
    }
}

} // namespace funtable
