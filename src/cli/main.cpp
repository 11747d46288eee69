#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/store_config.hpp"
#include "database/database.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <string>
#include <vector>

namespace {

using Args = std::vector<std::string>;

constexpr const char* kUsage =
    "usage: funtable-cli [options] <command> [args...]\n"
    "commands:\n"
    "  tables\n"
    "  create-kv NAME | create-kkv NAME | drop NAME\n"
    "  set TABLE KEY JSON | set TABLE PKEY SKEY JSON\n"
    "  get TABLE KEY [SKEY]\n"
    "  del TABLE KEY [SKEY]\n"
    "  keys TABLE [PKEY]\n"
    "  dump TABLE\n";

// Thrown for malformed command lines; reported with the usage text.
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

void require_args(const Args& args, std::size_t min, std::size_t max) {
    if (args.size() < min || args.size() > max) {
        throw UsageError("wrong number of arguments for '" + args[0] + "'");
    }
}

funtable::StoreValue parse_value(const std::string& text) {
    auto data = nlohmann::json::parse(text, nullptr, false);
    if (data.is_discarded()) {
        throw funtable::ValueTypeError("value is not valid JSON: " + text);
    }
    return funtable::StoreValue::from_data(std::move(data));
}

void print_value(const funtable::StoreValue& value) {
    fprintf(stdout, "%s\n", nlohmann::json(value).dump(2).c_str());
}

void print_lines(const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
        fprintf(stdout, "%s\n", line.c_str());
    }
}

// ── Commands ──────────────────────────────────────────────────────────────────

void cmd_set(funtable::Database& db, const Args& args) {
    require_args(args, 4, 5);
    auto handle = db.get_table(args[1]);
    if (auto* kv = std::get_if<std::shared_ptr<funtable::KvTable>>(&handle)) {
        require_args(args, 4, 4);
        (*kv)->set(args[2], parse_value(args[3]));
    } else {
        require_args(args, 5, 5);
        std::get<std::shared_ptr<funtable::KkvTable>>(handle)->set(
            args[2], args[3], parse_value(args[4]));
    }
    fprintf(stdout, "OK\n");
}

void cmd_get(funtable::Database& db, const Args& args) {
    require_args(args, 3, 4);
    auto handle = db.get_table(args[1]);
    std::optional<funtable::StoreValue> value;
    if (auto* kv = std::get_if<std::shared_ptr<funtable::KvTable>>(&handle)) {
        require_args(args, 3, 3);
        value = (*kv)->get(args[2]);
    } else {
        require_args(args, 4, 4);
        value = std::get<std::shared_ptr<funtable::KkvTable>>(handle)->get(args[2], args[3]);
    }
    if (value) {
        print_value(*value);
    } else {
        fprintf(stdout, "NOT_FOUND\n");
    }
}

void cmd_del(funtable::Database& db, const Args& args) {
    require_args(args, 3, 4);
    auto handle = db.get_table(args[1]);
    bool removed = false;
    if (auto* kv = std::get_if<std::shared_ptr<funtable::KvTable>>(&handle)) {
        require_args(args, 3, 3);
        removed = (*kv)->remove(args[2]);
    } else {
        require_args(args, 4, 4);
        removed = std::get<std::shared_ptr<funtable::KkvTable>>(handle)->remove(args[2], args[3]);
    }
    fprintf(stdout, "%s\n", removed ? "DELETED" : "NOT_FOUND");
}

void cmd_keys(funtable::Database& db, const Args& args) {
    require_args(args, 2, 3);
    auto handle = db.get_table(args[1]);
    if (auto* kv = std::get_if<std::shared_ptr<funtable::KvTable>>(&handle)) {
        require_args(args, 2, 2);
        print_lines((*kv)->list_keys());
        return;
    }
    auto& kkv = std::get<std::shared_ptr<funtable::KkvTable>>(handle);
    print_lines(args.size() == 3 ? kkv->list_skeys(args[2]) : kkv->list_pkeys());
}

void cmd_dump(funtable::Database& db, const Args& args) {
    require_args(args, 2, 2);
    auto handle = db.get_table(args[1]);
    nlohmann::json out;
    if (auto* kv = std::get_if<std::shared_ptr<funtable::KvTable>>(&handle)) {
        out = (*kv)->list_all();
    } else {
        out = std::get<std::shared_ptr<funtable::KkvTable>>(handle)->list_all();
    }
    fprintf(stdout, "%s\n", out.dump(2).c_str());
}

void run(funtable::Database& db, const Args& args) {
    const std::string& verb = args[0];
    if (verb == "tables") {
        require_args(args, 1, 1);
        for (const auto& [name, type] : db.list_tables()) {
            fprintf(stdout, "%s\t%s\n", name.c_str(),
                    std::string(funtable::to_string(type)).c_str());
        }
    } else if (verb == "create-kv") {
        require_args(args, 2, 2);
        db.create_kv_table(args[1]);
        fprintf(stdout, "OK\n");
    } else if (verb == "create-kkv") {
        require_args(args, 2, 2);
        db.create_kkv_table(args[1]);
        fprintf(stdout, "OK\n");
    } else if (verb == "drop") {
        require_args(args, 2, 2);
        db.drop_table(args[1]);
        fprintf(stdout, "OK\n");
    } else if (verb == "set") {
        cmd_set(db, args);
    } else if (verb == "get") {
        cmd_get(db, args);
    } else if (verb == "del") {
        cmd_del(db, args);
    } else if (verb == "keys") {
        cmd_keys(db, args);
    } else if (verb == "dump") {
        cmd_dump(db, args);
    } else {
        throw UsageError("unknown command '" + verb + "'");
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    // ── Parse CLI arguments ──────────────────────────────────────────────────
    funtable::StoreConfig cfg;
    try {
        cfg = funtable::parse_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n%s", e.what(), kUsage);
        return 1;
    }
    if (cfg.command.empty()) {
        fprintf(stderr, "%s", kUsage);
        return 1;
    }

    // ── Logging ──────────────────────────────────────────────────────────────
    funtable::init_default_logger(funtable::parse_log_level(cfg.log_level));

    // ── Dispatch ─────────────────────────────────────────────────────────────
    try {
        funtable::DatabaseOptions options;
        options.cache_ttl = cfg.cache_ttl;
        funtable::Database db{cfg.data_dir, std::move(options)};
        run(db, cfg.command);
    } catch (const UsageError& e) {
        fprintf(stderr, "funtable-cli: %s\n%s", e.what(), kUsage);
        return 1;
    } catch (const funtable::StoreError& e) {
        fprintf(stderr, "funtable-cli: %s\n", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("funtable-cli: unexpected failure: {}", e.what());
        return 1;
    }
    return 0;
}
