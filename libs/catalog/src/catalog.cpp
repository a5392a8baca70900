#include "fidx/catalog.h"

#include <sqlite3.h>

#include <format>
#include <utility>

namespace fs = std::filesystem;

namespace fidx::catalog {

// ---------------------------------------------------------------------------
// Schema
// ---------------------------------------------------------------------------

static constexpr const char* metadata_schema_sql = R"SQL(
CREATE TABLE IF NOT EXISTS metadata (
    path         TEXT PRIMARY KEY,
    last_updated INTEGER
);
)SQL";

static constexpr const char* entries_schema_sql = R"SQL(
CREATE TABLE IF NOT EXISTS entries (
    path      TEXT PRIMARY KEY,
    abspath   TEXT NOT NULL,
    basename  TEXT NOT NULL,
    dirname   TEXT NOT NULL,
    signature TEXT NOT NULL,
    size      INTEGER NOT NULL,
    timestamp INTEGER NOT NULL,
    updated   INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_entries_signature ON entries (signature);
)SQL";

// Namespace the secondary catalog is attached under.
static constexpr const char* secondary_schema = "second";

// ---------------------------------------------------------------------------
// SQLite helpers
// ---------------------------------------------------------------------------

class SqliteStmt {
public:
    SqliteStmt(sqlite3* db, const std::string& sql) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK)
            throw CatalogError(std::format("sqlite3_prepare_v2: {}", sqlite3_errmsg(db)));
    }
    ~SqliteStmt() { if (stmt_) sqlite3_finalize(stmt_); }
    SqliteStmt(const SqliteStmt&) = delete;
    SqliteStmt& operator=(const SqliteStmt&) = delete;

    void reset() { sqlite3_reset(stmt_); sqlite3_clear_bindings(stmt_); }

    void bind_text(int idx, const std::string& v) {
        sqlite3_bind_text(stmt_, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
    }
    void bind_int64(int idx, int64_t v) { sqlite3_bind_int64(stmt_, idx, v); }

    int step() { return sqlite3_step(stmt_); }

    void exec() {
        int rc = step();
        if (rc != SQLITE_DONE && rc != SQLITE_ROW)
            throw CatalogError(std::format("sqlite3_step: {}", sqlite3_errmsg(sqlite3_db_handle(stmt_))));
    }

    std::string column_text(int col) const {
        const char* v = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
        return v ? v : "";
    }
    uint64_t column_u64(int col) const {
        return static_cast<uint64_t>(sqlite3_column_int64(stmt_, col));
    }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

static void exec_sql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw CatalogError(std::format("sqlite3_exec: {}", msg));
    }
}

static sqlite3* open_db_handle(const std::string& path, int flags) {
    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &db, flags | SQLITE_OPEN_URI, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        if (db) sqlite3_close(db);
        throw ConfigError(std::format("cannot open catalog {}: {}", path, msg));
    }
    return db;
}

static bool table_exists(sqlite3* db, const std::string& schema, const char* table) {
    SqliteStmt stmt(db,
        std::format("SELECT 1 FROM {}.sqlite_master WHERE type='table' AND name=?1", schema));
    stmt.bind_text(1, table);
    return stmt.step() == SQLITE_ROW;
}

// Percent-encode the characters that would end the path part of a URI filename.
static std::string uri_path(const std::string& path) {
    std::string out;
    out.reserve(path.size());
    for (char c : path) {
        switch (c) {
            case '%': out += "%25"; break;
            case '?': out += "%3f"; break;
            case '#': out += "%23"; break;
            default: out.push_back(c); break;
        }
    }
    return out;
}

static std::string schema_name(Which which) {
    return which == Which::Secondary ? secondary_schema : "main";
}

static const char* entry_columns =
    "path, abspath, basename, dirname, signature, size, timestamp, updated";

static Entry row_to_entry(const SqliteStmt& stmt) {
    Entry e;
    e.path = stmt.column_text(0);
    e.abspath = stmt.column_text(1);
    e.basename = stmt.column_text(2);
    e.dirname = stmt.column_text(3);
    e.signature = stmt.column_text(4);
    e.size = stmt.column_u64(5);
    e.timestamp = stmt.column_u64(6);
    e.updated = stmt.column_u64(7);
    return e;
}

// ---------------------------------------------------------------------------
// Entry helpers
// ---------------------------------------------------------------------------

std::string logical_path(const fs::path& root, const fs::path& file) {
    return file.lexically_relative(root).string();
}

Entry make_entry(const fs::path& root, const fs::path& file,
                 std::string signature, uint64_t size, uint64_t timestamp, uint64_t updated) {
    Entry e;
    e.path = logical_path(root, file);
    e.abspath = file.string();
    e.basename = file.filename().string();
    e.dirname = file.parent_path().string();
    e.signature = std::move(signature);
    e.size = size;
    e.timestamp = timestamp;
    e.updated = updated;
    return e;
}

// ---------------------------------------------------------------------------
// Catalog::Impl
// ---------------------------------------------------------------------------

struct Catalog::Impl {
    sqlite3* db = nullptr;
    bool secondary = false;
    // Hot-path statements, prepared on first use.
    std::unique_ptr<SqliteStmt> lookup_stmt;
    std::unique_ptr<SqliteStmt> upsert_stmt;

    ~Impl() {
        lookup_stmt.reset();
        upsert_stmt.reset();
        if (db) sqlite3_close(db);
    }

    void require_secondary() const {
        if (!secondary)
            throw ConfigError("no secondary catalog bound");
    }
};

Catalog::Catalog() : impl_(std::make_unique<Impl>()) {}

Catalog::~Catalog() = default;

Catalog::Catalog(Catalog&& other) noexcept = default;
Catalog& Catalog::operator=(Catalog&& other) noexcept = default;

// ---------------------------------------------------------------------------
// Catalog::open / open_existing / initialize
// ---------------------------------------------------------------------------

Catalog Catalog::open(const std::string& path) {
    Catalog c;
    c.impl_->db = open_db_handle(path, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    return c;
}

Catalog Catalog::open_existing(const std::string& path) {
    Catalog c;
    c.impl_->db = open_db_handle(path, SQLITE_OPEN_READONLY);

    for (const char* tbl : {"metadata", "entries"}) {
        bool found = false;
        try {
            found = table_exists(c.impl_->db, "main", tbl);
        } catch (const CatalogError& e) {
            throw ConfigError(std::format("not a catalog: {}: {}", path, e.what()));
        }
        if (!found)
            throw ConfigError(std::format("not a catalog (missing table '{}'): {}", tbl, path));
    }
    return c;
}

void Catalog::initialize(const std::string& root, uint64_t now, bool disable_sync) {
    sqlite3* db = impl_->db;

    if (disable_sync)
        exec_sql(db, "PRAGMA main.synchronous = OFF");

    exec_sql(db, metadata_schema_sql);

    uint64_t rows = 0;
    {
        SqliteStmt stmt(db, "SELECT COUNT(1) FROM main.metadata");
        if (stmt.step() != SQLITE_ROW)
            throw CatalogError(std::format("counting metadata rows: {}", sqlite3_errmsg(db)));
        rows = stmt.column_u64(0);
    }

    if (rows == 0) {
        SqliteStmt stmt(db, "INSERT INTO main.metadata (path, last_updated) VALUES (?1, ?2)");
        stmt.bind_text(1, root);
        stmt.bind_int64(2, static_cast<int64_t>(now));
        stmt.exec();
        if (sqlite3_changes(db) != 1)
            throw CatalogError(std::format("unexpected number of changes inserting metadata: {}",
                                           sqlite3_changes(db)));
    } else if (rows == 1) {
        auto existing = metadata(Which::Primary);
        if (existing.path != root)
            throw ConfigError(std::format("existing catalog is for '{}', not '{}'", existing.path, root));
    } else {
        throw CatalogError(std::format("metadata table holds {} rows", rows));
    }

    exec_sql(db, entries_schema_sql);
}

// ---------------------------------------------------------------------------
// Catalog::bind_secondary / metadata
// ---------------------------------------------------------------------------

void Catalog::bind_secondary(const std::string& path) {
    if (impl_->secondary)
        throw ConfigError("a secondary catalog is already bound");

    sqlite3* db = impl_->db;
    {
        SqliteStmt stmt(db, std::format("ATTACH DATABASE ?1 AS {}", secondary_schema));
        stmt.bind_text(1, std::format("file:{}?mode=ro", uri_path(path)));
        if (stmt.step() != SQLITE_DONE)
            throw ConfigError(std::format("could not attach catalog {}: {}", path, sqlite3_errmsg(db)));
    }

    for (const char* tbl : {"metadata", "entries"}) {
        std::string problem;
        try {
            if (!table_exists(db, secondary_schema, tbl))
                problem = std::format("missing table '{}'", tbl);
        } catch (const CatalogError& e) {
            problem = e.what();
        }
        if (!problem.empty()) {
            exec_sql(db, "DETACH DATABASE second");
            throw ConfigError(std::format("not a catalog ({}): {}", problem, path));
        }
    }
    impl_->secondary = true;
}

bool Catalog::has_secondary() const {
    return impl_->secondary;
}

Metadata Catalog::metadata(Which which) const {
    if (which == Which::Secondary) impl_->require_secondary();

    SqliteStmt stmt(impl_->db,
        std::format("SELECT path, last_updated FROM {}.metadata", schema_name(which)));
    if (stmt.step() != SQLITE_ROW)
        throw CatalogError("catalog has no metadata row");
    Metadata m;
    m.path = stmt.column_text(0);
    m.last_updated = stmt.column_u64(1);
    return m;
}

// ---------------------------------------------------------------------------
// Entry CRUD
// ---------------------------------------------------------------------------

void Catalog::upsert_entry(const Entry& entry) {
    if (!impl_->upsert_stmt) {
        impl_->upsert_stmt = std::make_unique<SqliteStmt>(impl_->db,
            "INSERT INTO main.entries"
            " (path, abspath, basename, dirname, signature, size, timestamp, updated)"
            " VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)"
            " ON CONFLICT(path) DO UPDATE SET"
            " abspath = ?2, basename = ?3, dirname = ?4, signature = ?5,"
            " size = ?6, timestamp = ?7, updated = ?8");
    }
    auto& stmt = *impl_->upsert_stmt;
    stmt.reset();
    stmt.bind_text(1, entry.path);
    stmt.bind_text(2, entry.abspath);
    stmt.bind_text(3, entry.basename);
    stmt.bind_text(4, entry.dirname);
    stmt.bind_text(5, entry.signature);
    stmt.bind_int64(6, static_cast<int64_t>(entry.size));
    stmt.bind_int64(7, static_cast<int64_t>(entry.timestamp));
    stmt.bind_int64(8, static_cast<int64_t>(entry.updated));
    stmt.exec();

    int changes = sqlite3_changes(impl_->db);
    if (changes != 1)
        throw CatalogError(std::format("unexpected number of changes upserting '{}': {}",
                                       entry.path, changes));
}

Lookup Catalog::get_entry(const std::string& path, Entry& out) const {
    if (!impl_->lookup_stmt) {
        try {
            impl_->lookup_stmt = std::make_unique<SqliteStmt>(impl_->db,
                std::format("SELECT {} FROM main.entries WHERE path = ?1", entry_columns));
        } catch (const CatalogError&) {
            return Lookup::Unexpected;
        }
    }
    auto& stmt = *impl_->lookup_stmt;
    stmt.reset();
    stmt.bind_text(1, path);

    int rc = stmt.step();
    Lookup result = Lookup::Unexpected;
    if (rc == SQLITE_ROW) {
        out = row_to_entry(stmt);
        result = Lookup::Found;
    } else if (rc == SQLITE_DONE) {
        result = Lookup::NotFound;
    }
    stmt.reset(); // release the read lock before the caller writes
    return result;
}

void Catalog::remove_entry(const std::string& path) {
    SqliteStmt stmt(impl_->db, "DELETE FROM main.entries WHERE path = ?1");
    stmt.bind_text(1, path);
    stmt.exec();

    int changes = sqlite3_changes(impl_->db);
    if (changes != 1)
        throw CatalogError(std::format("unexpected number of changes removing '{}': {}",
                                       path, changes));
}

std::vector<std::string> Catalog::list_all_paths() const {
    SqliteStmt stmt(impl_->db, "SELECT abspath FROM main.entries");
    std::vector<std::string> paths;
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW)
        paths.push_back(stmt.column_text(0));
    if (rc != SQLITE_DONE)
        throw CatalogError(std::format("listing paths: {}", sqlite3_errmsg(impl_->db)));
    return paths;
}

// ---------------------------------------------------------------------------
// Aggregates
// ---------------------------------------------------------------------------

uint64_t Catalog::count_entries(Which which) const {
    if (which == Which::Secondary) impl_->require_secondary();

    SqliteStmt stmt(impl_->db, std::format("SELECT COUNT(1) FROM {}.entries", schema_name(which)));
    if (stmt.step() != SQLITE_ROW)
        throw CatalogError(std::format("counting entries: {}", sqlite3_errmsg(impl_->db)));
    return stmt.column_u64(0);
}

uint64_t Catalog::total_size() const {
    SqliteStmt stmt(impl_->db, "SELECT COALESCE(SUM(size), 0) FROM main.entries");
    if (stmt.step() != SQLITE_ROW)
        throw CatalogError(std::format("summing sizes: {}", sqlite3_errmsg(impl_->db)));
    return stmt.column_u64(0);
}

// ---------------------------------------------------------------------------
// Cross-catalog queries
// ---------------------------------------------------------------------------

static std::vector<std::string> anti_join(sqlite3* db, const std::string& from,
                                          const std::string& other) {
    SqliteStmt stmt(db,
        std::format("SELECT a.path FROM {}.entries a"
                    " LEFT JOIN {}.entries b ON a.path = b.path"
                    " WHERE b.path IS NULL"
                    " ORDER BY a.path", from, other));
    std::vector<std::string> paths;
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW)
        paths.push_back(stmt.column_text(0));
    if (rc != SQLITE_DONE)
        throw CatalogError(std::format("finding missing paths: {}", sqlite3_errmsg(db)));
    return paths;
}

MissingPaths Catalog::find_missing() const {
    impl_->require_secondary();

    MissingPaths m;
    m.missing_in_primary = anti_join(impl_->db, secondary_schema, "main");
    m.missing_in_secondary = anti_join(impl_->db, "main", secondary_schema);
    return m;
}

std::vector<DifferingEntry> Catalog::compare_differing() const {
    impl_->require_secondary();

    SqliteStmt stmt(impl_->db,
        "SELECT a.path, a.abspath, a.signature, a.timestamp,"
        "       b.abspath, b.signature, b.timestamp"
        " FROM main.entries a"
        " JOIN second.entries b ON a.path = b.path"
        " WHERE a.signature != b.signature"
        " ORDER BY a.path");

    std::vector<DifferingEntry> rows;
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        DifferingEntry d;
        d.path = stmt.column_text(0);
        d.primary_abspath = stmt.column_text(1);
        d.primary_signature = stmt.column_text(2);
        d.primary_timestamp = stmt.column_u64(3);
        d.secondary_abspath = stmt.column_text(4);
        d.secondary_signature = stmt.column_text(5);
        d.secondary_timestamp = stmt.column_u64(6);
        rows.push_back(std::move(d));
    }
    if (rc != SQLITE_DONE)
        throw CatalogError(std::format("comparing catalogs: {}", sqlite3_errmsg(impl_->db)));
    return rows;
}

DuplicateMap Catalog::find_duplicates() const {
    SqliteStmt stmt(impl_->db,
        std::format("SELECT {} FROM main.entries"
                    " WHERE signature IN ("
                    "   SELECT signature FROM main.entries"
                    "   GROUP BY signature HAVING COUNT(*) > 1)"
                    " ORDER BY signature, rowid", entry_columns));

    DuplicateMap dupes;
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        auto e = row_to_entry(stmt);
        auto sig = e.signature;
        // multimap keeps equal keys in insertion order
        dupes.emplace(std::move(sig), std::move(e));
    }
    if (rc != SQLITE_DONE)
        throw CatalogError(std::format("finding duplicates: {}", sqlite3_errmsg(impl_->db)));
    return dupes;
}

} // namespace fidx::catalog
