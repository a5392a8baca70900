#include "fidx/catalog.h"

#include <gtest/gtest.h>
#include <sqlite3.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <unistd.h>

using namespace fidx::catalog;
using fidx::CatalogError;
using fidx::ConfigError;

namespace fs = std::filesystem;

namespace {

fs::path unique_test_root() {
    static int counter = 0;
    const auto root = fs::temp_directory_path() / "fidx-catalog-tests" /
        (std::to_string(::getpid()) + "-" + std::to_string(counter++));
    fs::remove_all(root);
    fs::create_directories(root);
    return root;
}

Entry simple_entry(const std::string& name, const std::string& signature) {
    Entry e;
    e.path = "to/" + name;
    e.abspath = "/path/to/" + name;
    e.basename = name;
    e.dirname = "/path/to";
    e.signature = signature;
    e.size = 100;
    e.timestamp = 100;
    e.updated = 100;
    return e;
}

Catalog memory_catalog() {
    auto c = Catalog::open(":memory:");
    c.initialize("/path/to", 1000);
    return c;
}

} // namespace

// --- Duplicate grouping ---

TEST(CatalogDupes, HasDupes) {
    auto c = memory_catalog();
    auto e1 = simple_entry("file1", "00deadbeef");
    auto e2 = simple_entry("file2", "00deadbeef");
    auto e3 = simple_entry("file3", "00cafecafe");
    c.upsert_entry(e1);
    c.upsert_entry(e2);
    c.upsert_entry(e3);
    EXPECT_EQ(c.count_entries(), 3u);

    auto dupes = c.find_duplicates();
    ASSERT_EQ(dupes.size(), 2u);
    ASSERT_EQ(dupes.count("00deadbeef"), 2u);
    EXPECT_EQ(dupes.count("00cafecafe"), 0u);

    auto range = dupes.equal_range("00deadbeef");
    auto it = range.first;
    EXPECT_EQ(it->second.path, e1.path);
    ++it;
    EXPECT_EQ(it->second.path, e2.path);
}

TEST(CatalogDupes, HasTripleDupes) {
    auto c = memory_catalog();
    c.upsert_entry(simple_entry("file1", "00deadbeef"));
    c.upsert_entry(simple_entry("file2", "00deadbeef"));
    c.upsert_entry(simple_entry("file3", "00deadbeef"));

    auto dupes = c.find_duplicates();
    ASSERT_EQ(dupes.size(), 3u);
    std::vector<std::string> paths;
    for (const auto& [sig, e] : dupes) paths.push_back(e.path);
    EXPECT_EQ(paths, (std::vector<std::string>{"to/file1", "to/file2", "to/file3"}));
}

TEST(CatalogDupes, HasNoDupes) {
    auto c = memory_catalog();
    c.upsert_entry(simple_entry("file1", "00deadbeef"));
    c.upsert_entry(simple_entry("file2", "0000000000"));
    c.upsert_entry(simple_entry("file3", "00cafecafe"));
    EXPECT_EQ(c.count_entries(), 3u);
    EXPECT_TRUE(c.find_duplicates().empty());
}

TEST(CatalogDupes, GroupsOrderedBySignature) {
    auto c = memory_catalog();
    c.upsert_entry(simple_entry("a", "ff"));
    c.upsert_entry(simple_entry("b", "11"));
    c.upsert_entry(simple_entry("c", "ff"));
    c.upsert_entry(simple_entry("d", "11"));

    auto dupes = c.find_duplicates();
    ASSERT_EQ(dupes.size(), 4u);
    EXPECT_EQ(dupes.begin()->first, "11");
    EXPECT_EQ(dupes.rbegin()->first, "ff");
}

// --- CRUD ---

TEST(Catalog, UpsertOverwritesNonKeyFields) {
    auto c = memory_catalog();
    auto e = simple_entry("file1", "00deadbeef");
    c.upsert_entry(e);

    e.signature = "00cafecafe";
    e.size = 7;
    e.updated = 2000;
    c.upsert_entry(e);
    EXPECT_EQ(c.count_entries(), 1u);

    Entry got;
    ASSERT_EQ(c.get_entry("to/file1", got), Lookup::Found);
    EXPECT_EQ(got.signature, "00cafecafe");
    EXPECT_EQ(got.size, 7u);
    EXPECT_EQ(got.updated, 2000u);
    EXPECT_EQ(got.abspath, "/path/to/file1");
}

TEST(Catalog, GetEntryNotFound) {
    auto c = memory_catalog();
    Entry got;
    EXPECT_EQ(c.get_entry("to/missing", got), Lookup::NotFound);
}

TEST(Catalog, RemoveEntry) {
    auto c = memory_catalog();
    c.upsert_entry(simple_entry("file1", "00"));
    c.upsert_entry(simple_entry("file2", "01"));
    c.remove_entry("to/file1");

    Entry got;
    EXPECT_EQ(c.get_entry("to/file1", got), Lookup::NotFound);
    EXPECT_EQ(c.count_entries(), 1u);
}

TEST(Catalog, RemoveAbsentEntryThrows) {
    auto c = memory_catalog();
    EXPECT_THROW(c.remove_entry("to/never-added"), CatalogError);
}

TEST(Catalog, ListAllPathsReturnsAbsolutePaths) {
    auto c = memory_catalog();
    c.upsert_entry(simple_entry("file1", "00"));
    c.upsert_entry(simple_entry("file2", "01"));

    auto paths = c.list_all_paths();
    std::sort(paths.begin(), paths.end());
    EXPECT_EQ(paths, (std::vector<std::string>{"/path/to/file1", "/path/to/file2"}));
}

TEST(Catalog, TotalSize) {
    auto c = memory_catalog();
    EXPECT_EQ(c.total_size(), 0u);
    c.upsert_entry(simple_entry("file1", "00"));
    c.upsert_entry(simple_entry("file2", "01"));
    EXPECT_EQ(c.total_size(), 200u);
}

// --- Metadata ---

TEST(Catalog, InitializeIsIdempotent) {
    auto c = Catalog::open(":memory:");
    c.initialize("/path/to", 1000);
    c.upsert_entry(simple_entry("file1", "00"));
    c.initialize("/path/to", 2000);

    auto m = c.metadata();
    EXPECT_EQ(m.path, "/path/to");
    EXPECT_EQ(m.last_updated, 1000u);
    EXPECT_EQ(c.count_entries(), 1u);
}

TEST(Catalog, RootMismatchThrows) {
    auto c = Catalog::open(":memory:");
    c.initialize("/path/to", 1000);
    EXPECT_THROW(c.initialize("/some/other/root", 2000), ConfigError);
}

TEST(Catalog, DisableSyncStillInitializes) {
    auto c = Catalog::open(":memory:");
    c.initialize("/path/to", 1000, true);
    EXPECT_EQ(c.count_entries(), 0u);
}

TEST(Catalog, SecondMetadataRowThrows) {
    auto root = unique_test_root();
    auto path = (root / "two-roots.db").string();
    {
        auto c = Catalog::open(path);
        c.initialize("/path/to", 1000);
    }
    {
        sqlite3* db = nullptr;
        ASSERT_EQ(sqlite3_open(path.c_str(), &db), SQLITE_OK);
        char* err = nullptr;
        int rc = sqlite3_exec(db, "INSERT INTO metadata (path, last_updated) VALUES ('/elsewhere', 1)",
                              nullptr, nullptr, &err);
        sqlite3_free(err);
        sqlite3_close(db);
        ASSERT_EQ(rc, SQLITE_OK);
    }

    auto c = Catalog::open(path);
    EXPECT_THROW(c.initialize("/path/to", 2000), CatalogError);
}

TEST(Catalog, OpenExistingRejectsForeignFile) {
    auto root = unique_test_root();
    auto path = (root / "notes.txt").string();
    {
        std::ofstream out(path);
        out << "this is not a catalog\n";
    }
    EXPECT_THROW(Catalog::open_existing(path), ConfigError);
    EXPECT_THROW(Catalog::open_existing((root / "missing.db").string()), ConfigError);
}

// --- Secondary catalog ---

namespace {

void write_catalog(const std::string& path, const std::string& root,
                   const std::vector<Entry>& entries) {
    auto c = Catalog::open(path);
    c.initialize(root, 1000);
    for (const auto& e : entries) c.upsert_entry(e);
}

} // namespace

TEST(CatalogSecondary, FindMissingIsSymmetric) {
    auto root = unique_test_root();
    auto first = (root / "first.db").string();
    auto second = (root / "second.db").string();

    write_catalog(first, "/a", {simple_entry("both", "00"), simple_entry("only-first", "01")});
    write_catalog(second, "/b", {simple_entry("both", "00"), simple_entry("only-second", "02")});

    auto c = Catalog::open_existing(first);
    c.bind_secondary(second);
    ASSERT_TRUE(c.has_secondary());

    EXPECT_EQ(c.count_entries(Which::Primary), 2u);
    EXPECT_EQ(c.count_entries(Which::Secondary), 2u);
    EXPECT_EQ(c.metadata(Which::Primary).path, "/a");
    EXPECT_EQ(c.metadata(Which::Secondary).path, "/b");

    auto missing = c.find_missing();
    EXPECT_EQ(missing.missing_in_primary, std::vector<std::string>{"to/only-second"});
    EXPECT_EQ(missing.missing_in_secondary, std::vector<std::string>{"to/only-first"});
}

TEST(CatalogSecondary, CompareDifferingReportsBothSides) {
    auto root = unique_test_root();
    auto first = (root / "first.db").string();
    auto second = (root / "second.db").string();

    auto a_same = simple_entry("same", "00");
    auto a_diff = simple_entry("diff", "01");
    auto b_same = simple_entry("same", "00");
    auto b_diff = simple_entry("diff", "02");
    b_diff.abspath = "/other/to/diff";
    b_diff.timestamp = 555;

    write_catalog(first, "/a", {a_same, a_diff});
    write_catalog(second, "/b", {b_same, b_diff});

    auto c = Catalog::open_existing(first);
    c.bind_secondary(second);

    auto rows = c.compare_differing();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].path, "to/diff");
    EXPECT_EQ(rows[0].primary_abspath, "/path/to/diff");
    EXPECT_EQ(rows[0].primary_signature, "01");
    EXPECT_EQ(rows[0].primary_timestamp, 100u);
    EXPECT_EQ(rows[0].secondary_abspath, "/other/to/diff");
    EXPECT_EQ(rows[0].secondary_signature, "02");
    EXPECT_EQ(rows[0].secondary_timestamp, 555u);
}

TEST(CatalogSecondary, AttachFailureThrows) {
    auto root = unique_test_root();
    auto first = (root / "first.db").string();
    write_catalog(first, "/a", {});

    auto c = Catalog::open_existing(first);
    EXPECT_THROW(c.bind_secondary((root / "no-such.db").string()), ConfigError);
    EXPECT_FALSE(c.has_secondary());
}

TEST(CatalogSecondary, QueriesRequireBinding) {
    auto c = memory_catalog();
    EXPECT_THROW(c.find_missing(), ConfigError);
    EXPECT_THROW(c.count_entries(Which::Secondary), ConfigError);
}

// --- Entry helpers ---

TEST(CatalogEntry, MakeEntrySplitsPath) {
    auto e = make_entry("/data/root", "/data/root/sub/file.txt", "abcd", 12, 34, 56);
    EXPECT_EQ(e.path, "sub/file.txt");
    EXPECT_EQ(e.abspath, "/data/root/sub/file.txt");
    EXPECT_EQ(e.basename, "file.txt");
    EXPECT_EQ(e.dirname, "/data/root/sub");
    EXPECT_EQ(e.signature, "abcd");
    EXPECT_EQ(e.size, 12u);
    EXPECT_EQ(e.timestamp, 34u);
    EXPECT_EQ(e.updated, 56u);
}
