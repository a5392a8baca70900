#include "fidx/indexer.h"
#include "fidx/hasher.h"

#include <chrono>
#include <format>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace fidx::indexer {

static void emit(const IndexProgressFunc& progress, IndexProgress p) {
    if (progress) progress(p);
}

static walk::WarningFunc warnings_to(const IndexProgressFunc& progress) {
    if (!progress) return nullptr;
    return [progress](const fs::path& p, const std::string& msg) {
        emit(progress, {.phase = "warning", .path = p.string(), .message = msg});
    };
}

// ---------------------------------------------------------------------------
// Time / root helpers
// ---------------------------------------------------------------------------

uint64_t unix_seconds(fs::file_time_type t) {
    auto sys = std::chrono::file_clock::to_sys(t);
    auto secs = std::chrono::floor<std::chrono::seconds>(sys.time_since_epoch()).count();
    return secs < 0 ? 0 : static_cast<uint64_t>(secs);
}

uint64_t now_seconds() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(std::chrono::floor<std::chrono::seconds>(now).count());
}

fs::path verify_root(const std::string& root) {
    std::error_code ec;
    auto st = fs::status(root, ec);
    if (ec && ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory)
        throw ConfigError(std::format("cannot access root directory {}: {}", root, ec.message()));
    if (!fs::exists(st))
        throw ConfigError(std::format("specified root directory does not exist: {}", root));
    if (!fs::is_directory(st))
        throw ConfigError(std::format("specified root directory is not a directory: {}", root));

    auto abs = fs::absolute(root, ec);
    if (ec)
        throw ConfigError(std::format("cannot resolve root directory {}: {}", root, ec.message()));
    abs = abs.lexically_normal();
    // "/data/root/" -> "/data/root"
    if (!abs.has_filename() && abs.has_relative_path())
        abs = abs.parent_path();
    return abs;
}

PathSet catalog_files(const std::string& catalog_path) {
    PathSet files;
    if (catalog_path.empty() || catalog_path == ":memory:") return files;

    std::error_code ec;
    auto abs = fs::absolute(catalog_path, ec);
    if (ec) return files;
    auto base = abs.lexically_normal().string();
    for (const char* suffix : {"", "-journal", "-wal", "-shm"})
        files.insert(base + suffix);
    return files;
}

// ---------------------------------------------------------------------------
// IndexingVisitor
// ---------------------------------------------------------------------------

IndexingVisitor::IndexingVisitor(catalog::Catalog& catalog, fs::path root, uint64_t now,
                                 IndexCounters& counters, IndexProgressFunc progress,
                                 PathSet excluded)
    : catalog_(catalog)
    , root_(std::move(root))
    , now_(now)
    , counters_(counters)
    , progress_(std::move(progress))
    , excluded_(std::move(excluded))
{}

void IndexingVisitor::report(IndexProgress p) const {
    emit(progress_, std::move(p));
}

void IndexingVisitor::visit_file(const fs::directory_entry& entry) {
    const auto& file = entry.path();
    if (excluded_.count(file.string())) return;
    auto key = catalog::logical_path(root_, file);

    catalog::Entry existing;
    switch (catalog_.get_entry(key, existing)) {
        case catalog::Lookup::Found: {
            std::error_code ec;
            auto mtime = entry.last_write_time(ec);
            if (ec) {
                report({.phase = "error", .path = file.string(), .message = ec.message()});
                counters_.errors.fetch_add(1, std::memory_order_relaxed);
                return;
            }
            if (!needs_reindex(existing.updated, unix_seconds(mtime))) {
                counters_.skipped.fetch_add(1, std::memory_order_relaxed);
                return;
            }
            if (write_entry(entry, "update"))
                counters_.updated.fetch_add(1, std::memory_order_relaxed);
            else
                counters_.errors.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        case catalog::Lookup::NotFound:
            if (write_entry(entry, "add"))
                counters_.added.fetch_add(1, std::memory_order_relaxed);
            else
                counters_.errors.fetch_add(1, std::memory_order_relaxed);
            return;
        case catalog::Lookup::Unexpected:
            break;
    }
    throw CatalogError(std::format("unexpected failure looking up entry '{}'", key));
}

bool IndexingVisitor::write_entry(const fs::directory_entry& entry, const std::string& phase) {
    const auto& file = entry.path();

    std::error_code ec;
    auto mtime = entry.last_write_time(ec);
    uint64_t size = 0;
    if (!ec) size = entry.file_size(ec);
    if (ec) {
        report({.phase = "error", .path = file.string(), .message = ec.message()});
        return false;
    }

    auto start = std::chrono::steady_clock::now();
    std::string signature;
    try {
        signature = hasher::hash_file(file);
    } catch (const std::runtime_error& e) {
        report({.phase = "error", .path = file.string(), .message = e.what()});
        return false;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);

    catalog_.upsert_entry(catalog::make_entry(root_, file, std::move(signature), size,
                                              unix_seconds(mtime), now_));

    report({.phase = phase, .path = file.string(), .message = {}, .size = size,
            .elapsed_us = static_cast<uint64_t>(elapsed.count())});
    return true;
}

// ---------------------------------------------------------------------------
// Deletion sweep
// ---------------------------------------------------------------------------

int64_t remove_deleted_files(catalog::Catalog& catalog, const fs::path& root,
                             const IndexProgressFunc& progress, const PathSet& excluded) {
    auto stored = catalog.list_all_paths();

    walk::PathCollector on_disk;
    auto r = walk::walk(root, on_disk, std::nullopt, warnings_to(progress));
    if (r.status != walk::WalkStatus::Completed) {
        emit(progress, {.phase = "error", .path = r.failed_dir.string(),
                        .message = std::format("deletion check aborted: {}", r.error)});
        return -1;
    }

    int64_t removed = 0;
    for (const auto& abspath : stored) {
        if (on_disk.paths().count(abspath) && !excluded.count(abspath)) continue;

        auto key = catalog::logical_path(root, abspath);
        emit(progress, {.phase = "remove", .path = key});
        catalog.remove_entry(key);
        ++removed;
    }
    return removed;
}

// ---------------------------------------------------------------------------
// index
// ---------------------------------------------------------------------------

IndexResult index_catalog(catalog::Catalog& catalog, const fs::path& root,
                          const IndexOptions& opts, uint64_t now,
                          const IndexProgressFunc& progress, const PathSet& excluded) {
    catalog.initialize(root.string(), now, opts.disable_sync);

    IndexResult result;
    if (opts.skip_delete_check) {
        emit(progress, {.phase = "sweep", .message = "skipping removal of deleted files"});
        result.deleted = -1;
    } else {
        emit(progress, {.phase = "sweep", .message = "checking for deleted files"});
        result.deleted = remove_deleted_files(catalog, root, progress, excluded);
    }

    IndexCounters counters;
    IndexingVisitor visitor(catalog, root, now, counters, progress, excluded);
    auto w = walk::walk(root, visitor, walk::deadline_after(opts.duration), warnings_to(progress));

    result.status = w.status;
    if (w.status == walk::WalkStatus::TimedOut) {
        emit(progress, {.phase = "timeout", .path = root.string(),
                        .message = std::format("stopped after {}s", opts.duration.value_or(0))});
    } else if (w.status == walk::WalkStatus::Failed) {
        result.walk_error = w.error;
        emit(progress, {.phase = "error", .path = w.failed_dir.string(), .message = w.error});
    }

    result.added = counters.added.load();
    result.updated = counters.updated.load();
    result.skipped = counters.skipped.load();
    result.errors = counters.errors.load();
    return result;
}

IndexResult index(const std::string& catalog_path, const std::string& root_dir,
                  const IndexOptions& opts, const IndexProgressFunc& progress) {
    auto root = verify_root(root_dir);
    auto now = now_seconds();

    auto catalog = catalog::Catalog::open(catalog_path);
    return index_catalog(catalog, root, opts, now, progress, catalog_files(catalog_path));
}

} // namespace fidx::indexer
