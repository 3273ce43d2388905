#include <zb/database.hpp>
#include <zb/log.hpp>
#include <sqlite3.h>

#include <ctime>
#include <filesystem>

namespace fs = std::filesystem;

namespace zb {

static const std::string SCHEMA_VERSION = "1";

static ZbError db_error(sqlite3* db, int rc, const std::string& what) {
    std::string msg = what + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
    int primary = rc & 0xff;
    if (primary == SQLITE_CORRUPT || primary == SQLITE_NOTADB) {
        return ZbError{ZbError::DatabaseCorrupt, msg,
            "the package database is damaged; the store was not modified"};
    }
    return ZbError{ZbError::DatabaseIO, msg};
}

static std::string column_string(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------

struct Database::Impl {
    sqlite3* db = nullptr;

    // Prepared statements (lazily initialized, cached)
    sqlite3_stmt* stmt_upsert = nullptr;
    sqlite3_stmt* stmt_delete = nullptr;
    sqlite3_stmt* stmt_delete_deps = nullptr;
    sqlite3_stmt* stmt_insert_dep = nullptr;
    sqlite3_stmt* stmt_get = nullptr;
    sqlite3_stmt* stmt_get_deps = nullptr;
    sqlite3_stmt* stmt_list = nullptr;
    sqlite3_stmt* stmt_using = nullptr;
    sqlite3_stmt* stmt_dependents = nullptr;
    sqlite3_stmt* stmt_ref_get = nullptr;
    sqlite3_stmt* stmt_ref_set = nullptr;
    sqlite3_stmt* stmt_ref_all = nullptr;
    sqlite3_stmt* stmt_ref_delete = nullptr;

    ~Impl() {
        finalize_all();
        if (db) sqlite3_close(db);
    }

    void finalize_all() {
        auto fin = [](sqlite3_stmt*& s) {
            if (s) { sqlite3_finalize(s); s = nullptr; }
        };
        fin(stmt_upsert);
        fin(stmt_delete);
        fin(stmt_delete_deps);
        fin(stmt_insert_dep);
        fin(stmt_get);
        fin(stmt_get_deps);
        fin(stmt_list);
        fin(stmt_using);
        fin(stmt_dependents);
        fin(stmt_ref_get);
        fin(stmt_ref_set);
        fin(stmt_ref_all);
        fin(stmt_ref_delete);
    }

    Status require_open() const {
        if (!db) return ZbError{ZbError::DatabaseIO, "database is not open"};
        return ok_status();
    }

    Status prepare(const char* sql, sqlite3_stmt*& out) {
        ZB_TRY(require_open());
        if (out) {
            sqlite3_reset(out);
            sqlite3_clear_bindings(out);
            return ok_status();
        }
        int rc = sqlite3_prepare_v2(db, sql, -1, &out, nullptr);
        if (rc != SQLITE_OK) {
            return db_error(db, rc, "SQLite prepare failed");
        }
        return ok_status();
    }

    Status exec(const char* sql) {
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string msg = errmsg ? errmsg : "unknown error";
            sqlite3_free(errmsg);
            return db_error(nullptr, rc, "SQLite exec failed: " + msg);
        }
        return ok_status();
    }

    // Runs `body` inside BEGIN IMMEDIATE / COMMIT, rolling back on error
    template<typename F>
    Status transaction(F&& body) {
        ZB_TRY(require_open());
        ZB_TRY(exec("BEGIN IMMEDIATE;"));
        Status result = body();
        if (result.is_err()) {
            auto rb = exec("ROLLBACK;");
            if (rb.is_err()) {
                log::warn("rollback failed: %s", rb.error().message.c_str());
            }
            return result;
        }
        auto commit = exec("COMMIT;");
        if (commit.is_err()) {
            auto rb = exec("ROLLBACK;");
            if (rb.is_err()) {
                log::warn("rollback failed: %s", rb.error().message.c_str());
            }
            return commit;
        }
        return ok_status();
    }

    Status step_done(sqlite3_stmt* stmt, const std::string& what) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_DONE) return db_error(db, rc, what);
        return ok_status();
    }

    Result<std::vector<std::string>> names_from(sqlite3_stmt* stmt, const std::string& what) {
        std::vector<std::string> out;
        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            out.push_back(column_string(stmt, 0));
        }
        if (rc != SQLITE_DONE) return db_error(db, rc, what);
        return Result<std::vector<std::string>>::ok(std::move(out));
    }

    Result<std::vector<std::string>> deps_of(const std::string& name) {
        ZB_TRY(prepare(
            "SELECT dep FROM installed_deps WHERE name=? ORDER BY dep",
            stmt_get_deps));
        sqlite3_bind_text(stmt_get_deps, 1, name.c_str(), -1, SQLITE_TRANSIENT);
        return names_from(stmt_get_deps, "cannot read dependencies of " + name);
    }

    InstalledRecord read_row(sqlite3_stmt* stmt) {
        InstalledRecord r;
        r.name = column_string(stmt, 0);
        r.version = column_string(stmt, 1);
        r.store_key = column_string(stmt, 2);
        r.installed_at = sqlite3_column_int64(stmt, 3);
        r.linked = sqlite3_column_int(stmt, 4) != 0;
        r.tree_hash = column_string(stmt, 5);
        r.requested = sqlite3_column_int(stmt, 6) != 0;
        return r;
    }

    Result<int64_t> get_ref(const std::string& key) {
        ZB_TRY(prepare("SELECT refcount FROM store_refs WHERE store_key=?", stmt_ref_get));
        sqlite3_bind_text(stmt_ref_get, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        int rc = sqlite3_step(stmt_ref_get);
        int64_t count = rc == SQLITE_ROW ? sqlite3_column_int64(stmt_ref_get, 0) : 0;
        if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
            return db_error(db, rc, "cannot read refcount");
        }
        sqlite3_reset(stmt_ref_get);
        return Result<int64_t>::ok(count);
    }

    Status set_ref(const std::string& key, int64_t count) {
        ZB_TRY(prepare(
            "INSERT OR REPLACE INTO store_refs (store_key, refcount) VALUES (?, ?)",
            stmt_ref_set));
        sqlite3_bind_text(stmt_ref_set, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt_ref_set, 2, count);
        return step_done(stmt_ref_set, "cannot update refcount of " + key);
    }

    Status init_schema() {
        ZB_TRY(exec(
            "CREATE TABLE IF NOT EXISTS schema_info ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT"
            ");"
            "CREATE TABLE IF NOT EXISTS installed ("
            "  name TEXT PRIMARY KEY,"
            "  version TEXT NOT NULL,"
            "  store_key TEXT NOT NULL,"
            "  installed_at INTEGER NOT NULL,"
            "  linked INTEGER NOT NULL DEFAULT 1,"
            "  tree_hash TEXT,"
            "  requested INTEGER NOT NULL DEFAULT 0"
            ");"
            "CREATE INDEX IF NOT EXISTS installed_store_key ON installed (store_key);"
            "CREATE TABLE IF NOT EXISTS installed_deps ("
            "  name TEXT NOT NULL,"
            "  dep TEXT NOT NULL,"
            "  PRIMARY KEY (name, dep)"
            ");"
            "CREATE INDEX IF NOT EXISTS installed_deps_dep ON installed_deps (dep);"
            "CREATE TABLE IF NOT EXISTS store_refs ("
            "  store_key TEXT PRIMARY KEY,"
            "  refcount INTEGER NOT NULL"
            ");"
        ));

        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db,
            "SELECT value FROM schema_info WHERE key='version'", -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            if (stmt) sqlite3_finalize(stmt);
            return db_error(db, rc, "cannot read schema version");
        }

        rc = sqlite3_step(stmt);
        std::string found = rc == SQLITE_ROW ? column_string(stmt, 0) : "";
        sqlite3_finalize(stmt);

        if (rc == SQLITE_ROW) {
            if (found != SCHEMA_VERSION) {
                return ZbError{ZbError::DatabaseIO,
                    "unsupported database schema version " + found,
                    "this database was written by a different zb release"};
            }
            return ok_status();
        }
        if (rc != SQLITE_DONE) return db_error(db, rc, "cannot read schema version");

        std::string ver_sql = "INSERT OR REPLACE INTO schema_info (key, value) "
            "VALUES ('version', '" + SCHEMA_VERSION + "');";
        return exec(ver_sql.c_str());
    }
};

// ---------------------------------------------------------------------------
// Database public interface
// ---------------------------------------------------------------------------

Database::Database() : impl_(std::make_unique<Impl>()) {}
Database::~Database() = default;
Database::Database(Database&&) noexcept = default;
Database& Database::operator=(Database&&) noexcept = default;

Status Database::open(const std::string& db_path) {
    close();

    fs::path parent = fs::path(db_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            return ZbError{ZbError::DatabaseIO,
                "cannot create database directory " + parent.string() + ": " + ec.message()};
        }
    }

    int rc = sqlite3_open_v2(db_path.c_str(), &impl_->db,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        ZbError err = db_error(impl_->db, rc, "cannot open database " + db_path);
        close();
        return err;
    }

    sqlite3_busy_timeout(impl_->db, 10000);

    auto setup = [&]() -> Status {
        ZB_TRY(impl_->exec(
            "PRAGMA journal_mode=WAL;"
            "PRAGMA synchronous=NORMAL;"
        ));
        ZB_TRY(impl_->init_schema());
        return ok_status();
    };

    auto result = setup();
    if (result.is_err()) {
        close();
        if (result.code() == ZbError::DatabaseCorrupt) {
            log::error("database %s is corrupt", db_path.c_str());
        }
        return result;
    }
    return ok_status();
}

void Database::close() {
    if (impl_ && impl_->db) {
        impl_->finalize_all();
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
    }
}

bool Database::is_open() const {
    return impl_ && impl_->db != nullptr;
}

// ---------------------------------------------------------------------------
// Installed packages
// ---------------------------------------------------------------------------

Status Database::upsert(const InstalledRecord& record) {
    if (record.name.empty() || record.store_key.empty()) {
        return ZbError{ZbError::InvalidArg, "installed record needs a name and a store key"};
    }

    return impl_->transaction([&]() -> Status {
        ZB_TRY(impl_->prepare(
            "INSERT OR REPLACE INTO installed "
            "(name, version, store_key, installed_at, linked, tree_hash, requested) "
            "VALUES (?, ?, ?, ?, ?, ?, ?)",
            impl_->stmt_upsert));

        int64_t when = record.installed_at ? record.installed_at
                                           : static_cast<int64_t>(std::time(nullptr));
        sqlite3_stmt* s = impl_->stmt_upsert;
        sqlite3_bind_text(s, 1, record.name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(s, 2, record.version.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(s, 3, record.store_key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(s, 4, when);
        sqlite3_bind_int(s, 5, record.linked ? 1 : 0);
        sqlite3_bind_text(s, 6, record.tree_hash.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(s, 7, record.requested ? 1 : 0);
        ZB_TRY(impl_->step_done(s, "cannot record " + record.name));

        ZB_TRY(impl_->prepare("DELETE FROM installed_deps WHERE name=?",
                              impl_->stmt_delete_deps));
        sqlite3_bind_text(impl_->stmt_delete_deps, 1, record.name.c_str(), -1, SQLITE_TRANSIENT);
        ZB_TRY(impl_->step_done(impl_->stmt_delete_deps,
                                "cannot clear dependencies of " + record.name));

        for (auto& dep : record.dependencies) {
            ZB_TRY(impl_->prepare(
                "INSERT OR IGNORE INTO installed_deps (name, dep) VALUES (?, ?)",
                impl_->stmt_insert_dep));
            sqlite3_bind_text(impl_->stmt_insert_dep, 1, record.name.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(impl_->stmt_insert_dep, 2, dep.c_str(), -1, SQLITE_TRANSIENT);
            ZB_TRY(impl_->step_done(impl_->stmt_insert_dep,
                                    "cannot record dependency " + dep));
        }
        return ok_status();
    });
}

Status Database::remove(const std::string& name) {
    return impl_->transaction([&]() -> Status {
        ZB_TRY(impl_->prepare("DELETE FROM installed WHERE name=?", impl_->stmt_delete));
        sqlite3_bind_text(impl_->stmt_delete, 1, name.c_str(), -1, SQLITE_TRANSIENT);
        ZB_TRY(impl_->step_done(impl_->stmt_delete, "cannot remove " + name));
        if (sqlite3_changes(impl_->db) == 0) {
            return ZbError{ZbError::NotInstalled, "'" + name + "' is not installed"};
        }

        ZB_TRY(impl_->prepare("DELETE FROM installed_deps WHERE name=?",
                              impl_->stmt_delete_deps));
        sqlite3_bind_text(impl_->stmt_delete_deps, 1, name.c_str(), -1, SQLITE_TRANSIENT);
        return impl_->step_done(impl_->stmt_delete_deps,
                                "cannot clear dependencies of " + name);
    });
}

Result<InstalledRecord> Database::get(const std::string& name) {
    ZB_TRY(impl_->prepare(
        "SELECT name, version, store_key, installed_at, linked, tree_hash, requested "
        "FROM installed WHERE name=?",
        impl_->stmt_get));
    sqlite3_bind_text(impl_->stmt_get, 1, name.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(impl_->stmt_get);
    if (rc == SQLITE_DONE) {
        return ZbError{ZbError::NotInstalled, "'" + name + "' is not installed"};
    }
    if (rc != SQLITE_ROW) {
        return db_error(impl_->db, rc, "cannot read " + name);
    }

    InstalledRecord r = impl_->read_row(impl_->stmt_get);
    sqlite3_reset(impl_->stmt_get);

    auto deps = impl_->deps_of(name);
    if (deps.is_err()) return std::move(deps).error();
    r.dependencies = std::move(deps).value();
    return Result<InstalledRecord>::ok(std::move(r));
}

Result<std::vector<InstalledRecord>> Database::list() {
    ZB_TRY(impl_->prepare(
        "SELECT name, version, store_key, installed_at, linked, tree_hash, requested "
        "FROM installed ORDER BY name",
        impl_->stmt_list));

    std::vector<InstalledRecord> out;
    int rc;
    while ((rc = sqlite3_step(impl_->stmt_list)) == SQLITE_ROW) {
        out.push_back(impl_->read_row(impl_->stmt_list));
    }
    if (rc != SQLITE_DONE) {
        return db_error(impl_->db, rc, "cannot list installed packages");
    }

    for (auto& r : out) {
        auto deps = impl_->deps_of(r.name);
        if (deps.is_err()) return std::move(deps).error();
        r.dependencies = std::move(deps).value();
    }
    return Result<std::vector<InstalledRecord>>::ok(std::move(out));
}

Result<std::vector<std::string>> Database::packages_using(const std::string& store_key) {
    ZB_TRY(impl_->prepare(
        "SELECT name FROM installed WHERE store_key=? ORDER BY name",
        impl_->stmt_using));
    sqlite3_bind_text(impl_->stmt_using, 1, store_key.c_str(), -1, SQLITE_TRANSIENT);
    return impl_->names_from(impl_->stmt_using, "cannot look up store key " + store_key);
}

Result<std::vector<std::string>> Database::dependents_of(const std::string& name) {
    ZB_TRY(impl_->prepare(
        "SELECT d.name FROM installed_deps d JOIN installed i ON i.name = d.name "
        "WHERE d.dep=? ORDER BY d.name",
        impl_->stmt_dependents));
    sqlite3_bind_text(impl_->stmt_dependents, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    return impl_->names_from(impl_->stmt_dependents, "cannot look up dependents of " + name);
}

// ---------------------------------------------------------------------------
// Store reference counters
// ---------------------------------------------------------------------------

Result<int64_t> Database::retain(const std::string& store_key) {
    int64_t count = 0;
    auto st = impl_->transaction([&]() -> Status {
        auto cur = impl_->get_ref(store_key);
        if (cur.is_err()) return std::move(cur).error();
        count = cur.value() + 1;
        return impl_->set_ref(store_key, count);
    });
    if (st.is_err()) return std::move(st).error();
    return Result<int64_t>::ok(count);
}

Result<int64_t> Database::release(const std::string& store_key) {
    int64_t count = 0;
    auto st = impl_->transaction([&]() -> Status {
        auto cur = impl_->get_ref(store_key);
        if (cur.is_err()) return std::move(cur).error();
        count = cur.value() > 0 ? cur.value() - 1 : 0;
        if (cur.value() == 0) {
            log::warn("release of unreferenced store entry %s", store_key.c_str());
        }
        return impl_->set_ref(store_key, count);
    });
    if (st.is_err()) return std::move(st).error();
    return Result<int64_t>::ok(count);
}

Result<int64_t> Database::refcount(const std::string& store_key) {
    return impl_->get_ref(store_key);
}

Result<std::map<std::string, int64_t>> Database::refcounts() {
    ZB_TRY(impl_->prepare("SELECT store_key, refcount FROM store_refs", impl_->stmt_ref_all));
    std::map<std::string, int64_t> out;
    int rc;
    while ((rc = sqlite3_step(impl_->stmt_ref_all)) == SQLITE_ROW) {
        out[column_string(impl_->stmt_ref_all, 0)] = sqlite3_column_int64(impl_->stmt_ref_all, 1);
    }
    if (rc != SQLITE_DONE) {
        return db_error(impl_->db, rc, "cannot read store references");
    }
    return Result<std::map<std::string, int64_t>>::ok(std::move(out));
}

Status Database::set_refcount(const std::string& store_key, int64_t count) {
    return impl_->transaction([&]() -> Status {
        return impl_->set_ref(store_key, count < 0 ? 0 : count);
    });
}

Status Database::forget_store_key(const std::string& store_key) {
    return impl_->transaction([&]() -> Status {
        ZB_TRY(impl_->prepare("DELETE FROM store_refs WHERE store_key=?",
                              impl_->stmt_ref_delete));
        sqlite3_bind_text(impl_->stmt_ref_delete, 1, store_key.c_str(), -1, SQLITE_TRANSIENT);
        return impl_->step_done(impl_->stmt_ref_delete, "cannot forget " + store_key);
    });
}

} // namespace zb
