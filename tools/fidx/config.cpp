#include "config.h"

#include "fidx/catalog.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>

using json = nlohmann::ordered_json;

namespace fidx::cli {

static uint64_t parse_seconds(const std::string& s) {
    if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); }))
        throw ConfigError(std::format("invalid duration '{}': expected a number of seconds", s));
    try {
        return std::stoull(s);
    } catch (const std::out_of_range&) {
        throw ConfigError(std::format("invalid duration '{}': out of range", s));
    }
}

Config load_config(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw ConfigError(std::format("reading config {}", path));

    Config cfg;
    try {
        json j = json::parse(f);
        if (!j.is_object()) throw ConfigError(std::format("config {}: expected a JSON object", path));
        if (j.contains("root")) cfg.root = j["root"].get<std::string>();
        if (j.contains("db")) cfg.db = j["db"].get<std::string>();
        if (j.contains("skip_delete_check")) cfg.skip_delete_check = j["skip_delete_check"].get<bool>();
        if (j.contains("duration") && !j["duration"].is_null()) {
            if (!j["duration"].is_number_unsigned())
                throw ConfigError(std::format("config {}: duration must be a non-negative number of seconds", path));
            cfg.duration = j["duration"].get<uint64_t>();
        }
        if (j.contains("no_sync")) cfg.no_sync = j["no_sync"].get<bool>();
        if (j.contains("verbosity")) cfg.verbosity = j["verbosity"].get<int>();
    } catch (const json::exception& e) {
        throw ConfigError(std::format("config {}: {}", path, e.what()));
    }
    return cfg;
}

Config parse_index_args(const std::vector<std::string>& args) {
    std::string config_path;
    bool skip_delete_check = false;
    bool no_sync = false;
    std::optional<uint64_t> duration;
    std::vector<std::string> positional;

    for (size_t i = 0; i < args.size(); i++) {
        const auto& a = args[i];
        if (a == "-c" || a == "--skip-delete-check") {
            skip_delete_check = true;
        } else if (a == "-s" || a == "--no-sync") {
            no_sync = true;
        } else if (a == "-d" || a == "--duration") {
            if (i + 1 >= args.size()) throw ConfigError(std::format("{} requires a value", a));
            duration = parse_seconds(args[++i]);
        } else if (a == "-config") {
            if (i + 1 >= args.size()) throw ConfigError("-config requires a value");
            config_path = args[++i];
        } else if (a.size() > 1 && a[0] == '-') {
            throw ConfigError(std::format("unknown flag for index: {}", a));
        } else {
            positional.push_back(a);
        }
    }
    if (positional.size() > 2)
        throw ConfigError(std::format("unexpected argument: {}", positional[2]));

    Config cfg;
    if (!config_path.empty()) cfg = load_config(config_path);

    if (skip_delete_check) cfg.skip_delete_check = true;
    if (no_sync) cfg.no_sync = true;
    if (duration) cfg.duration = duration;
    if (positional.size() > 0) cfg.root = positional[0];
    if (positional.size() > 1) cfg.db = positional[1];

    if (cfg.root.empty()) throw ConfigError("no root directory: give ROOT_DIR or set root in config");
    if (cfg.db.empty()) throw ConfigError("no output file: give OUTPUT_FILE or set db in config");
    return cfg;
}

} // namespace fidx::cli
