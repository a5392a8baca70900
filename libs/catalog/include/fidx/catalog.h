#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace fidx {

// ConfigError reports a configuration problem detected before any mutation:
// bad root directory, root mismatch, attach failure, not a catalog file.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// CatalogError reports a violated storage invariant (unexpected row counts,
// removal of an absent key, failed DDL). The catalog must not be used further.
class CatalogError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace fidx

namespace fidx::catalog {

// Entry is one indexed file.
struct Entry {
    std::string path;      // logical path relative to the catalog root
    std::string abspath;
    std::string basename;
    std::string dirname;
    std::string signature; // lowercase hex SHA-256 of the content
    uint64_t size = 0;
    uint64_t timestamp = 0; // source mtime, unix seconds
    uint64_t updated = 0;   // when the indexer last wrote this row, unix seconds
};

// Metadata is the singleton row describing what the catalog was built against.
struct Metadata {
    std::string path;
    uint64_t last_updated = 0;
};

enum class Which { Primary, Secondary };

enum class Lookup { Found, NotFound, Unexpected };

// MissingPaths is the symmetric anti-join of two catalogs on logical path.
struct MissingPaths {
    std::vector<std::string> missing_in_primary;
    std::vector<std::string> missing_in_secondary;
};

// DifferingEntry is a path present in both catalogs with different content.
struct DifferingEntry {
    std::string path;
    std::string primary_abspath;
    std::string primary_signature;
    uint64_t primary_timestamp = 0;
    std::string secondary_abspath;
    std::string secondary_signature;
    uint64_t secondary_timestamp = 0;
};

using DuplicateMap = std::multimap<std::string, Entry>;

// logical_path returns file relative to root.
std::string logical_path(const std::filesystem::path& root, const std::filesystem::path& file);

// make_entry fills an Entry for file found under root.
Entry make_entry(const std::filesystem::path& root, const std::filesystem::path& file,
                 std::string signature, uint64_t size, uint64_t timestamp, uint64_t updated);

// Catalog wraps one SQLite catalog file, optionally paired with a second
// catalog attached read-only for comparison queries.
class Catalog {
public:
    ~Catalog();
    Catalog(Catalog&& other) noexcept;
    Catalog& operator=(Catalog&& other) noexcept;

    // Open opens (creating if needed) a catalog file for indexing.
    // ":memory:" gives a private in-memory catalog.
    static Catalog open(const std::string& path);

    // OpenExisting opens an existing catalog read-only and checks its schema.
    static Catalog open_existing(const std::string& path);

    // Initialize creates the schema if absent and records root in the
    // metadata row. Throws ConfigError if the catalog belongs to another root.
    void initialize(const std::string& root, uint64_t now, bool disable_sync = false);

    // BindSecondary attaches the catalog at path read-only under the
    // secondary namespace. Throws ConfigError on failure.
    void bind_secondary(const std::string& path);
    bool has_secondary() const;

    Metadata metadata(Which which = Which::Primary) const;

    void upsert_entry(const Entry& entry);
    Lookup get_entry(const std::string& path, Entry& out) const;

    // RemoveEntry deletes exactly one row; throws CatalogError if path is absent.
    void remove_entry(const std::string& path);

    // ListAllPaths returns the absolute paths of all stored entries.
    std::vector<std::string> list_all_paths() const;

    uint64_t count_entries(Which which = Which::Primary) const;
    uint64_t total_size() const;

    MissingPaths find_missing() const;
    std::vector<DifferingEntry> compare_differing() const;

    // FindDuplicates groups entries whose signature occurs more than once,
    // keyed by signature in ascending order.
    DuplicateMap find_duplicates() const;

private:
    Catalog();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace fidx::catalog
