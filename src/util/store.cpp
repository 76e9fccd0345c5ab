#include <ulid/store.hpp>
#include <ulid/field.hpp>
#include <ulid/log.hpp>
#include <sqlite3.h>
#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace ulid {

// ---------------------------------------------------------------------------
// pImpl
// ---------------------------------------------------------------------------

static const std::string SCHEMA_VERSION = "1";

struct IdStore::Impl {
    sqlite3* db = nullptr;

    // Prepared statements (lazily initialized, cached)
    sqlite3_stmt* stmt_insert = nullptr;
    sqlite3_stmt* stmt_lookup = nullptr;
    sqlite3_stmt* stmt_remove = nullptr;
    sqlite3_stmt* stmt_list = nullptr;
    sqlite3_stmt* stmt_count = nullptr;

    ~Impl() {
        finalize_all();
        if (db) sqlite3_close(db);
    }

    void finalize_all() {
        auto fin = [](sqlite3_stmt*& s) {
            if (s) { sqlite3_finalize(s); s = nullptr; }
        };
        fin(stmt_insert);
        fin(stmt_lookup);
        fin(stmt_remove);
        fin(stmt_list);
        fin(stmt_count);
    }

    Status check_open() const {
        if (!db) {
            return UlidError(UlidError::IO, "id store is not open",
                "call IdStore::open() first");
        }
        return ok_status();
    }

    Status prepare(const char* sql, sqlite3_stmt*& out) {
        ULID_TRY(check_open());
        if (out) return ok_status();
        int rc = sqlite3_prepare_v2(db, sql, -1, &out, nullptr);
        if (rc != SQLITE_OK) {
            return UlidError(UlidError::IO,
                std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }
        return ok_status();
    }

    Status exec(const char* sql) {
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string msg = errmsg ? errmsg : "unknown error";
            sqlite3_free(errmsg);
            return UlidError(UlidError::IO, "SQLite exec failed: " + msg);
        }
        return ok_status();
    }

    Status step_done(sqlite3_stmt* stmt) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_DONE) {
            return UlidError(UlidError::IO,
                std::string("SQLite step failed: ") + sqlite3_errmsg(db));
        }
        return ok_status();
    }

    Status init_schema() {
        ULID_TRY(exec(
            "CREATE TABLE IF NOT EXISTS schema_info ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT"
            ");"
            "CREATE TABLE IF NOT EXISTS ids ("
            "  id BLOB PRIMARY KEY CHECK (length(id) = 16),"
            "  label TEXT NOT NULL"
            ");"
        ));
        std::string ver_sql = "INSERT OR IGNORE INTO schema_info (key, value) "
            "VALUES ('version', '" + SCHEMA_VERSION + "');";
        return exec(ver_sql.c_str());
    }

    Result<IdEntry> read_row(sqlite3_stmt* stmt) {
        const void* blob = sqlite3_column_blob(stmt, 0);
        int len = sqlite3_column_bytes(stmt, 0);
        std::string raw = blob ? std::string(static_cast<const char*>(blob), len) : std::string();
        auto text = field::load(raw);
        if (text.is_err()) {
            return std::move(text).error();
        }
        IdEntry e;
        e.id = std::move(text).value();
        const unsigned char* label = sqlite3_column_text(stmt, 1);
        e.label = label ? reinterpret_cast<const char*>(label) : "";
        return Result<IdEntry>::ok(std::move(e));
    }
};

// ---------------------------------------------------------------------------
// IdStore public interface
// ---------------------------------------------------------------------------

IdStore::IdStore() : impl_(std::make_unique<Impl>()) {}
IdStore::~IdStore() = default;
IdStore::IdStore(IdStore&&) noexcept = default;
IdStore& IdStore::operator=(IdStore&&) noexcept = default;

std::string IdStore::default_store_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = "/tmp";
    return std::string(home) + "/.ulid/ids.db";
}

Status IdStore::open(const std::string& db_path) {
    close();

    fs::path parent = fs::path(db_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            return UlidError(UlidError::IO,
                "Failed to create store directory: " + parent.string());
        }
    }

    int rc = sqlite3_open(db_path.c_str(), &impl_->db);
    if (rc != SQLITE_OK) {
        std::string err_msg = impl_->db ? sqlite3_errmsg(impl_->db) : "unknown";
        close();
        return UlidError(UlidError::IO,
            "Failed to open id store: " + err_msg, "", db_path, 0);
    }

    auto setup = impl_->exec(
        "PRAGMA journal_mode=WAL;"
        "PRAGMA synchronous=NORMAL;"
    ).and_then([&](std::monostate&) { return impl_->init_schema(); });
    if (setup.is_err()) {
        close();
        auto err = std::move(setup).error();
        err.file = db_path;
        return err;
    }

    log::debug("opened id store %s", db_path.c_str());
    return ok_status();
}

void IdStore::close() {
    if (impl_->db) {
        impl_->finalize_all();
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
    }
}

bool IdStore::is_open() const {
    return impl_->db != nullptr;
}

// ---------------------------------------------------------------------------
// Records
// ---------------------------------------------------------------------------

Result<std::string> IdStore::insert(const std::string& label) {
    std::string id = field::autogenerate();
    ULID_TRY(insert(id, label));
    return Result<std::string>::ok(id);
}

Status IdStore::insert(const std::string& id, const std::string& label) {
    auto cast = field::cast(id);
    if (cast.is_err()) return std::move(cast).error();
    auto raw = field::dump(cast.value());
    if (raw.is_err()) return std::move(raw).error();

    ULID_TRY(impl_->prepare(
        "INSERT INTO ids (id, label) VALUES (?, ?)",
        impl_->stmt_insert));

    sqlite3_stmt* stmt = impl_->stmt_insert;
    sqlite3_reset(stmt);
    sqlite3_bind_blob(stmt, 1, raw.value().data(),
                      static_cast<int>(raw.value().size()), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, label.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_CONSTRAINT) {
        return UlidError(UlidError::Duplicate, "id already stored: " + id);
    }
    if (rc != SQLITE_DONE) {
        return UlidError(UlidError::IO,
            std::string("SQLite insert failed: ") + sqlite3_errmsg(impl_->db));
    }
    log::trace("stored %s (%s)", id.c_str(), label.c_str());
    return ok_status();
}

Result<IdEntry> IdStore::lookup(const std::string& id) {
    auto raw = field::dump(id);
    if (raw.is_err()) return std::move(raw).error();

    ULID_TRY(impl_->prepare(
        "SELECT id, label FROM ids WHERE id=?",
        impl_->stmt_lookup));

    sqlite3_stmt* stmt = impl_->stmt_lookup;
    sqlite3_reset(stmt);
    sqlite3_bind_blob(stmt, 1, raw.value().data(),
                      static_cast<int>(raw.value().size()), SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        auto e = impl_->read_row(stmt);
        sqlite3_reset(stmt);
        return e;
    }
    if (rc != SQLITE_DONE) {
        std::string msg = sqlite3_errmsg(impl_->db);
        sqlite3_reset(stmt);
        return UlidError(UlidError::IO, "SQLite lookup failed: " + msg);
    }
    sqlite3_reset(stmt);
    return UlidError(UlidError::NotFound, "No entry for id: " + id);
}

Status IdStore::remove(const std::string& id) {
    auto raw = field::dump(id);
    if (raw.is_err()) return std::move(raw).error();

    ULID_TRY(impl_->prepare("DELETE FROM ids WHERE id=?", impl_->stmt_remove));

    sqlite3_stmt* stmt = impl_->stmt_remove;
    sqlite3_reset(stmt);
    sqlite3_bind_blob(stmt, 1, raw.value().data(),
                      static_cast<int>(raw.value().size()), SQLITE_TRANSIENT);
    ULID_TRY(impl_->step_done(stmt));

    if (sqlite3_changes(impl_->db) == 0) {
        return UlidError(UlidError::NotFound, "No entry for id: " + id);
    }
    return ok_status();
}

Result<std::vector<IdEntry>> IdStore::list() {
    ULID_TRY(impl_->prepare(
        "SELECT id, label FROM ids ORDER BY id ASC",
        impl_->stmt_list));

    sqlite3_stmt* stmt = impl_->stmt_list;
    sqlite3_reset(stmt);

    std::vector<IdEntry> out;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        auto e = impl_->read_row(stmt);
        if (e.is_err()) {
            sqlite3_reset(stmt);
            return std::move(e).error();
        }
        out.push_back(std::move(e).value());
    }
    if (rc != SQLITE_DONE) {
        return UlidError(UlidError::IO,
            std::string("SQLite list failed: ") + sqlite3_errmsg(impl_->db));
    }
    return Result<std::vector<IdEntry>>::ok(std::move(out));
}

Result<int64_t> IdStore::count() {
    ULID_TRY(impl_->prepare("SELECT COUNT(*) FROM ids", impl_->stmt_count));

    sqlite3_stmt* stmt = impl_->stmt_count;
    sqlite3_reset(stmt);
    if (sqlite3_step(stmt) != SQLITE_ROW) {
        std::string msg = sqlite3_errmsg(impl_->db);
        sqlite3_reset(stmt);
        return UlidError(UlidError::IO, "SQLite count failed: " + msg);
    }
    int64_t n = sqlite3_column_int64(stmt, 0);
    sqlite3_reset(stmt);
    return Result<int64_t>::ok(n);
}

} // namespace ulid
