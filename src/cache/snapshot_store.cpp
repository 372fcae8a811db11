#include <aarc/snapshot_store.hpp>
#include <aarc/log.hpp>
#include <sqlite3.h>

#include <filesystem>

namespace fs = std::filesystem;

namespace aarc {

static constexpr int SCHEMA_VERSION = 1;

struct SnapshotStore::Impl {
    sqlite3* db = nullptr;

    sqlite3_stmt* stmt_load = nullptr;
    sqlite3_stmt* stmt_delete = nullptr;
    sqlite3_stmt* stmt_insert = nullptr;

    ~Impl() {
        finalize_all();
        if (db) sqlite3_close(db);
    }

    void finalize_all() {
        auto fin = [](sqlite3_stmt*& s) {
            if (s) { sqlite3_finalize(s); s = nullptr; }
        };
        fin(stmt_load);
        fin(stmt_delete);
        fin(stmt_insert);
    }

    Status prepare(const char* sql, sqlite3_stmt*& out) {
        if (out) return ok_status();
        int rc = sqlite3_prepare_v2(db, sql, -1, &out, nullptr);
        if (rc != SQLITE_OK) {
            return AarcError(AarcError::IO,
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
            return AarcError(AarcError::IO, "SQLite exec failed: " + msg);
        }
        return ok_status();
    }

    Status init_schema() {
        AARC_TRY(exec(
            "CREATE TABLE IF NOT EXISTS schema_info ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT"
            ");"
            "CREATE TABLE IF NOT EXISTS remote_outputs ("
            "  project TEXT NOT NULL,"
            "  output_key TEXT NOT NULL,"
            "  digest TEXT NOT NULL,"
            "  PRIMARY KEY (project, output_key)"
            ");"));
        std::string sql = "INSERT OR REPLACE INTO schema_info (key, value) "
                          "VALUES ('version', '" + std::to_string(SCHEMA_VERSION) + "');";
        return exec(sql.c_str());
    }

    Status check_open() const {
        if (!db) return AarcError(AarcError::IO, "snapshot store is not open");
        return ok_status();
    }
};

SnapshotStore::SnapshotStore() : impl_(std::make_unique<Impl>()) {}
SnapshotStore::~SnapshotStore() = default;
SnapshotStore::SnapshotStore(SnapshotStore&&) noexcept = default;
SnapshotStore& SnapshotStore::operator=(SnapshotStore&&) noexcept = default;

Status SnapshotStore::open(const std::string& db_path) {
    close();

    fs::path parent = fs::path(db_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            return AarcError(AarcError::IO,
                "Failed to create state directory: " + parent.string());
        }
    }

    int rc = sqlite3_open(db_path.c_str(), &impl_->db);
    if (rc != SQLITE_OK) {
        std::string err_msg = impl_->db ? sqlite3_errmsg(impl_->db) : "unknown";
        if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }
        return AarcError(AarcError::IO, "Failed to open state database: " + err_msg);
    }

    auto setup = [&]() -> Status {
        AARC_TRY(impl_->exec(
            "PRAGMA journal_mode=WAL;"
            "PRAGMA synchronous=NORMAL;"));
        AARC_TRY(impl_->init_schema());
        return ok_status();
    };

    auto s = setup();
    if (s.is_err()) {
        // A corrupt state file only costs one round of re-fetching
        log::warn("state database unusable, recreating: %s", s.error().message.c_str());
        close();
        std::error_code ec;
        fs::remove(db_path, ec);
        fs::remove(db_path + "-wal", ec);
        fs::remove(db_path + "-shm", ec);
        rc = sqlite3_open(db_path.c_str(), &impl_->db);
        if (rc != SQLITE_OK) {
            if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }
            return AarcError(AarcError::IO, "Failed to open state database: " + db_path);
        }
        s = setup();
        if (s.is_err()) {
            close();
            return s;
        }
    }
    return ok_status();
}

void SnapshotStore::close() {
    impl_->finalize_all();
    if (impl_->db) {
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
    }
}

bool SnapshotStore::is_open() const {
    return impl_->db != nullptr;
}

Result<RemoteSnapshot> SnapshotStore::load(const std::string& project) {
    AARC_TRY(impl_->check_open());
    AARC_TRY(impl_->prepare(
        "SELECT output_key, digest FROM remote_outputs WHERE project=?",
        impl_->stmt_load));

    sqlite3_reset(impl_->stmt_load);
    sqlite3_bind_text(impl_->stmt_load, 1, project.c_str(), -1, SQLITE_TRANSIENT);

    std::map<std::string, std::string> digests;
    int rc;
    while ((rc = sqlite3_step(impl_->stmt_load)) == SQLITE_ROW) {
        std::string key = reinterpret_cast<const char*>(sqlite3_column_text(impl_->stmt_load, 0));
        std::string digest = reinterpret_cast<const char*>(sqlite3_column_text(impl_->stmt_load, 1));
        digests[std::move(key)] = std::move(digest);
    }
    if (rc != SQLITE_DONE) {
        return AarcError(AarcError::IO,
            std::string("SQLite step failed: ") + sqlite3_errmsg(impl_->db));
    }
    return Result<RemoteSnapshot>::ok(RemoteSnapshot(std::move(digests)));
}

Status SnapshotStore::save(const std::string& project, const RemoteSnapshot& snapshot) {
    AARC_TRY(impl_->check_open());
    AARC_TRY(impl_->prepare("DELETE FROM remote_outputs WHERE project=?",
                            impl_->stmt_delete));
    AARC_TRY(impl_->prepare(
        "INSERT INTO remote_outputs (project, output_key, digest) VALUES (?, ?, ?)",
        impl_->stmt_insert));

    AARC_TRY(impl_->exec("BEGIN TRANSACTION;"));

    auto write_all = [&]() -> Status {
        sqlite3_reset(impl_->stmt_delete);
        sqlite3_bind_text(impl_->stmt_delete, 1, project.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(impl_->stmt_delete) != SQLITE_DONE) {
            return AarcError(AarcError::IO,
                std::string("SQLite delete failed: ") + sqlite3_errmsg(impl_->db));
        }
        for (const auto& [key, digest] : snapshot.digests()) {
            sqlite3_reset(impl_->stmt_insert);
            sqlite3_bind_text(impl_->stmt_insert, 1, project.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(impl_->stmt_insert, 2, key.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(impl_->stmt_insert, 3, digest.c_str(), -1, SQLITE_TRANSIENT);
            if (sqlite3_step(impl_->stmt_insert) != SQLITE_DONE) {
                return AarcError(AarcError::IO,
                    std::string("SQLite insert failed: ") + sqlite3_errmsg(impl_->db));
            }
        }
        return ok_status();
    };

    auto s = write_all();
    if (s.is_err()) {
        auto rb = impl_->exec("ROLLBACK;");
        if (rb.is_err()) log::warn("%s", rb.error().message.c_str());
        return s;
    }
    return impl_->exec("COMMIT;");
}

Status SnapshotStore::clear(const std::string& project) {
    return save(project, RemoteSnapshot());
}

} // namespace aarc
