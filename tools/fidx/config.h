#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fidx::cli {

// Config holds the settings of an index run, read from a JSON file and
// overridden by command-line flags.
struct Config {
    std::string root;
    std::string db;
    bool skip_delete_check = false;
    std::optional<uint64_t> duration;
    bool no_sync = false;
    std::optional<int> verbosity;
};

// load_config reads a JSON config file. Throws ConfigError if the file is
// missing, malformed, or holds a value of the wrong type.
Config load_config(const std::string& path);

// parse_index_args builds the Config of `fidx index` from its arguments:
// flags, an optional -config file and up to two positionals (ROOT_DIR,
// OUTPUT_FILE). Flags override the file. Throws ConfigError on bad usage.
Config parse_index_args(const std::vector<std::string>& args);

} // namespace fidx::cli
