#pragma once

#include "fidx/catalog.h"
#include "fidx/walk.h"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <unordered_set>

namespace fidx::indexer {

// IndexOptions controls one indexing run.
struct IndexOptions {
    bool skip_delete_check = false;
    std::optional<uint64_t> duration; // seconds before the walk stops early
    bool disable_sync = false;
};

// IndexProgress reports a single event of an indexing run.
struct IndexProgress {
    std::string phase;   // "sweep", "remove", "add", "update", "warning", "error", "timeout"
    std::string path;
    std::string message;
    uint64_t size = 0;       // bytes hashed ("add", "update")
    uint64_t elapsed_us = 0; // hashing time ("add", "update")
};

using IndexProgressFunc = std::function<void(const IndexProgress&)>;

// IndexCounters aggregates per-file outcomes. Atomic so visitors may run
// from several threads.
struct IndexCounters {
    std::atomic<uint64_t> added{0};
    std::atomic<uint64_t> updated{0};
    std::atomic<uint64_t> skipped{0};
    std::atomic<uint64_t> errors{0};
};

// IndexResult holds the outcome of an indexing run. deleted is -1 when the
// deletion sweep was skipped.
struct IndexResult {
    uint64_t added = 0;
    uint64_t updated = 0;
    int64_t deleted = -1;
    uint64_t skipped = 0;
    uint64_t errors = 0;
    walk::WalkStatus status = walk::WalkStatus::Completed;
    std::string walk_error;
};

// needs_reindex reports whether a file modified at mtime must be re-hashed
// given the time its entry was last written. Equal times count as current.
inline bool needs_reindex(uint64_t stored_updated, uint64_t mtime) {
    return stored_updated < mtime;
}

// unix_seconds converts a filesystem timestamp to seconds since the epoch.
uint64_t unix_seconds(std::filesystem::file_time_type t);

// now_seconds returns the current time as seconds since the epoch.
uint64_t now_seconds();

// verify_root returns root as an absolute, normalized path. Throws
// ConfigError if it does not exist, is not a directory or cannot be accessed.
std::filesystem::path verify_root(const std::string& root);

// PathSet holds absolute, normalized file paths.
using PathSet = std::unordered_set<std::string>;

// catalog_files returns the catalog file and its SQLite journal files, so a
// catalog kept inside the indexed tree does not index itself.
PathSet catalog_files(const std::string& catalog_path);

// IndexingVisitor adds, updates or skips the catalog entry of each visited
// file. Files in excluded are ignored without being counted.
class IndexingVisitor : public walk::FileVisitor {
public:
    IndexingVisitor(catalog::Catalog& catalog, std::filesystem::path root, uint64_t now,
                    IndexCounters& counters, IndexProgressFunc progress = nullptr,
                    PathSet excluded = {});

    void visit_file(const std::filesystem::directory_entry& entry) override;

private:
    // Hashes the file and writes its entry. Returns false on a per-file error.
    bool write_entry(const std::filesystem::directory_entry& entry, const std::string& phase);
    void report(IndexProgress p) const;

    catalog::Catalog& catalog_;
    std::filesystem::path root_;
    uint64_t now_;
    IndexCounters& counters_;
    IndexProgressFunc progress_;
    PathSet excluded_;
};

// remove_deleted_files removes the entries whose file no longer exists under
// root, or is in excluded, and returns how many were removed, or -1 if the
// disk could not be listed completely (nothing is removed then).
int64_t remove_deleted_files(catalog::Catalog& catalog, const std::filesystem::path& root,
                             const IndexProgressFunc& progress = nullptr,
                             const PathSet& excluded = {});

// index_catalog runs one indexing pass of root into an open catalog.
IndexResult index_catalog(catalog::Catalog& catalog, const std::filesystem::path& root,
                          const IndexOptions& opts, uint64_t now,
                          const IndexProgressFunc& progress = nullptr,
                          const PathSet& excluded = {});

// index opens (or creates) the catalog at catalog_path and indexes root_dir
// into it. Throws ConfigError for a bad root or a catalog built for another
// root, CatalogError on storage failures.
IndexResult index(const std::string& catalog_path, const std::string& root_dir,
                  const IndexOptions& opts = {}, const IndexProgressFunc& progress = nullptr);

} // namespace fidx::indexer
