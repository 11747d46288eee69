#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

namespace funtable {

// ── StoreConfig ───────────────────────────────────────────────────────────────
// Configuration shared by the funtable command-line tools.
// Populated by parse_config() from CLI arguments.

struct StoreConfig {
    std::string          data_dir;   // Base directory holding table files
    std::chrono::seconds cache_ttl;  // KV read-cache time-to-live
    std::string          log_level;  // spdlog level string

    std::vector<std::string> command; // Positional: verb followed by its args
};

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into a StoreConfig.
//
// On success: returns a fully validated StoreConfig.
// On error  : throws std::runtime_error with a human-readable message
//             (--help also throws, carrying the usage text).
//
// Validates:
//   - data_dir is not empty
//   - cache_ttl > 0
//   - log_level is a known spdlog level name

[[nodiscard]] StoreConfig parse_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with funtable options.
// Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

} // namespace funtable
