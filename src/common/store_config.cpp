#include "common/store_config.hpp"

#include "common/logger.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace funtable {

namespace {

// Validate the fully populated StoreConfig.
void validate(const StoreConfig& cfg) {
    if (cfg.data_dir.empty()) {
        throw std::runtime_error("--data-dir must not be empty");
    }
    if (cfg.cache_ttl.count() <= 0) {
        throw std::runtime_error("--cache-ttl must be > 0");
    }
    if (!is_known_log_level(cfg.log_level)) {
        throw std::runtime_error(
            "--log-level must be one of trace|debug|info|warn|error|critical, got '" +
            cfg.log_level + "'");
    }
}

} // anonymous namespace

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("data-dir",
            po::value<std::string>()->default_value("./funtable_store"),
            "Directory holding the table files and the table registry")
        ("cache-ttl",
            po::value<long>()->default_value(300),
            "Seconds a KV read stays cached before it is re-read from disk")
        ("log-level",
            po::value<std::string>()->default_value("warn"),
            "Log level: trace|debug|info|warn|error|critical")
        ("command",
            po::value<std::vector<std::string>>(),
            "Command verb followed by its arguments");
}

// ── parse_config ──────────────────────────────────────────────────────────────

StoreConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("funtable options");
    add_options(desc);

    po::positional_options_description positional;
    positional.add("command", -1);

    po::variables_map vm;
    try {
        po::store(
            po::command_line_parser(argc, argv)
                .options(desc)
                .positional(positional)
                .run(),
            vm);

        // Handle --help before notify() so missing required options don't error.
        if (vm.count("help")) {
            std::ostringstream oss;
            oss << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(std::string("Argument error: ") + e.what());
    }

    StoreConfig cfg;
    cfg.data_dir  = vm["data-dir"].as<std::string>();
    cfg.cache_ttl = std::chrono::seconds{vm["cache-ttl"].as<long>()};
    cfg.log_level = vm["log-level"].as<std::string>();
    if (vm.count("command")) {
        cfg.command = vm["command"].as<std::vector<std::string>>();
    }

    validate(cfg);
    return cfg;
}

} // namespace funtable
