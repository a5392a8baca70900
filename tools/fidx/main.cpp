#include "config.h"

#include "fidx/indexer.h"
#include "fidx/query.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstring>
#include <format>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "../common/cli_logger.h"

using json = nlohmann::ordered_json;

namespace {

struct Output {
    bool json = false;
    bool pretty = false;
};

void write_json(std::ostream& out, const json& doc, bool pretty) {
    if (pretty)
        out << std::setw(2) << doc << '\n';
    else
        out << doc << '\n';
}

void stderr_progress(const fidx::indexer::IndexProgress& p) {
    if (p.phase == "sweep") {
        LOGI(p.message);
    } else if (p.phase == "remove") {
        LOGI("Removing entry", p.path);
    } else if (p.phase == "add" || p.phase == "update") {
        LOGI(p.phase == "add" ? "Added" : "Updated", p.path);
        // bytes per microsecond == MB/s
        LOGD(std::format("Hashed {} B in {} ms @ {:.1f} MB/s", p.size, p.elapsed_us / 1000,
                         p.elapsed_us ? static_cast<double>(p.size) / static_cast<double>(p.elapsed_us) : 0.0));
    } else if (p.phase == "warning") {
        LOGW(p.path + ":", p.message);
    } else if (p.phase == "error") {
        LOGE("Processing", p.path, "->", p.message);
    } else if (p.phase == "timeout") {
        LOGW("Time limit reached,", p.message);
    }
}

int do_index(const std::vector<std::string>& args, int verbosity_flag) {
    auto cfg = fidx::cli::parse_index_args(args);
    if (verbosity_flag < 0 && cfg.verbosity) fidx::cli::set_verbosity(*cfg.verbosity);

    fidx::indexer::IndexOptions opts{.skip_delete_check = cfg.skip_delete_check,
                                     .duration = cfg.duration,
                                     .disable_sync = cfg.no_sync};
    LOGI("Indexing", cfg.root, "into", cfg.db);
    auto r = fidx::indexer::index(cfg.db, cfg.root, opts, stderr_progress);

    if (r.status == fidx::walk::WalkStatus::Failed)
        LOGE("Indexing stopped early:", r.walk_error);

    std::cout << std::format("Added: {}, Updated: {}, Deleted: {}, Skipped: {}, Errors: {}.\n",
                             r.added, r.updated, r.deleted, r.skipped, r.errors);
    return 0;
}

json entry_json(const fidx::catalog::Entry& e) {
    return {
        {"path", e.path},
        {"abspath", e.abspath},
        {"size", e.size},
        {"timestamp", e.timestamp},
    };
}

int do_compare(const std::string& first, const std::string& second, const Output& out) {
    auto r = fidx::query::compare(first, second);

    if (out.json) {
        json differing = json::array();
        for (const auto& d : r.differing) {
            differing.push_back({
                {"path", d.path},
                {"first", {{"abspath", d.primary_abspath},
                           {"signature", d.primary_signature},
                           {"timestamp", d.primary_timestamp}}},
                {"second", {{"abspath", d.secondary_abspath},
                            {"signature", d.secondary_signature},
                            {"timestamp", d.secondary_timestamp}}},
            });
        }
        write_json(std::cout, {
            {"first", {{"file", first}, {"root", r.first_root}, {"count", r.first_count}}},
            {"second", {{"file", second}, {"root", r.second_root}, {"count", r.second_count}}},
            {"missingInFirst", r.missing.missing_in_primary},
            {"missingInSecond", r.missing.missing_in_secondary},
            {"differing", differing},
        }, out.pretty);
        return 0;
    }

    std::cout << std::format("Files in first: {}\n", r.first_count);
    std::cout << std::format("Files in second: {}\n", r.second_count);
    std::cout << std::format("Missing in first ({}): {}\n", r.first_root,
                             r.missing.missing_in_primary.size());
    for (const auto& p : r.missing.missing_in_primary) std::cout << "  " << p << '\n';
    std::cout << std::format("Missing in second ({}): {}\n", r.second_root,
                             r.missing.missing_in_secondary.size());
    for (const auto& p : r.missing.missing_in_secondary) std::cout << "  " << p << '\n';
    std::cout << std::format("Differences: {}\n", r.differing.size());
    for (const auto& d : r.differing) {
        std::cout << std::format("  {}\n    first:  {} {} {}\n    second: {} {} {}\n", d.path,
                                 d.primary_signature, d.primary_timestamp, d.primary_abspath,
                                 d.secondary_signature, d.secondary_timestamp, d.secondary_abspath);
    }
    return 0;
}

int do_dupe(const std::string& db, const Output& out) {
    auto r = fidx::query::duplicates(db);

    if (out.json) {
        json groups = json::array();
        for (const auto& g : r.groups) {
            json entries = json::array();
            for (const auto& e : g.entries) entries.push_back(entry_json(e));
            groups.push_back({{"signature", g.signature}, {"size", g.size}, {"entries", entries}});
        }
        write_json(std::cout, {
            {"groupCount", r.groups.size()},
            {"duplicateFiles", r.duplicate_files},
            {"reclaimableBytes", r.reclaimable_bytes},
            {"groups", groups},
        }, out.pretty);
        return 0;
    }

    for (const auto& g : r.groups) {
        std::cout << std::format("{} ({} x {} B)\n", g.signature, g.entries.size(), g.size);
        for (const auto& e : g.entries) std::cout << "  " << e.abspath << '\n';
    }
    std::cout << std::format("Duplicate groups: {}, files: {}, reclaimable: {} B ({:.1f} MB)\n",
                             r.groups.size(), r.duplicate_files, r.reclaimable_bytes,
                             static_cast<double>(r.reclaimable_bytes) / 1e6);
    return 0;
}

int do_stats(const std::string& db, const Output& out) {
    auto s = fidx::query::stats(db);

    if (out.json) {
        write_json(std::cout, {
            {"root", s.root},
            {"entries", s.entry_count},
            {"totalSize", s.total_size},
            {"averageSize", s.average_size},
        }, out.pretty);
        return 0;
    }

    std::cout << "Root:                    " << s.root << '\n';
    std::cout << "Entries in file:         " << s.entry_count << '\n';
    std::cout << std::format("Total indexed file size: {} B ({:.1f} MB)\n", s.total_size,
                             static_cast<double>(s.total_size) / 1e6);
    std::cout << std::format("Average file size:       {} B ({:.1f} MB)\n", s.average_size,
                             static_cast<double>(s.average_size) / 1e6);
    return 0;
}

void print_usage() {
    fidx::cli::print("Usage: fidx [flags] <command> [args]");
    fidx::cli::print("");
    fidx::cli::print("Content-addressed file catalog.");
    fidx::cli::print("");
    fidx::cli::print("Commands:");
    fidx::cli::print("  index [flags] ROOT_DIR OUTPUT_FILE  Scan ROOT_DIR and index its files");
    fidx::cli::print("  compare FIRST SECOND                Compare two catalogs");
    fidx::cli::print("  dupe DATABASE_FILE                  Find possible duplicate files");
    fidx::cli::print("  stats DATABASE_FILE                 Show catalog statistics");
    fidx::cli::print("");
    fidx::cli::print("Index flags:");
    fidx::cli::print("  -c, --skip-delete-check  Keep entries of files that no longer exist");
    fidx::cli::print("  -d, --duration <secs>    Stop processing after <secs> seconds");
    fidx::cli::print("  -s, --no-sync            Disable database sync to reduce disk I/O");
    fidx::cli::print("  -config <path>           JSON config with root, db and flags");
    fidx::cli::print("");
    fidx::cli::print("Flags:");
    fidx::cli::print("  --json         JSON output (compare, dupe, stats)");
    fidx::cli::print("  --pretty       Pretty-print JSON output");
    fidx::cli::print("  -v, --verbose  Verbose logging");
    fidx::cli::print("  -vv, --debug   Debug logging");
    fidx::cli::print("  -h, --help     Show this help");
}

bool expect_args(const std::string& command, const std::vector<std::string>& args, size_t n) {
    if (args.size() == n) return true;
    LOGE(command, "expects", n, n == 1 ? "argument," : "arguments,", "got", args.size());
    print_usage();
    return false;
}

} // namespace

int main(int argc, char* argv[]) {
    Output out;
    int verbosity = -1;
    std::string command;
    std::vector<std::string> args;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--json") == 0) {
            out.json = true;
        } else if (std::strcmp(argv[i], "--pretty") == 0) {
            out.pretty = true;
        } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0) {
            verbosity = std::min(std::max(verbosity, 0) + 1, 2);
        } else if (std::strcmp(argv[i], "-vv") == 0 || std::strcmp(argv[i], "--debug") == 0) {
            verbosity = 2;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage();
            return 0;
        } else if (command.empty()) {
            command = argv[i];
        } else {
            args.push_back(argv[i]);
        }
    }

    if (verbosity >= 0) fidx::cli::set_verbosity(verbosity);

    try {
        if (command == "index") {
            return do_index(args, verbosity);
        } else if (command == "compare") {
            if (!expect_args(command, args, 2)) return 2;
            return do_compare(args[0], args[1], out);
        } else if (command == "dupe") {
            if (!expect_args(command, args, 1)) return 2;
            return do_dupe(args[0], out);
        } else if (command == "stats") {
            if (!expect_args(command, args, 1)) return 2;
            return do_stats(args[0], out);
        } else if (command.empty()) {
            print_usage();
            return 2;
        }
        LOGE("unknown command:", command);
        print_usage();
        return 2;
    } catch (const fidx::ConfigError& e) {
        LOGE("Configuration:", e.what());
        return 1;
    } catch (const fidx::CatalogError& e) {
        LOGE("Catalog:", e.what());
        return 1;
    } catch (const std::exception& e) {
        LOGE(e.what());
        return 1;
    }
}
