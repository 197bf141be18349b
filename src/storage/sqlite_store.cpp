#include <fundit/common/error.hpp>
#include <fundit/storage/sqlite_store.hpp>
#include <sqlite3.h>

namespace fundit::storage {

    SqliteStore::SqliteStore() : db_(nullptr), is_open_(false) {}

    SqliteStore::~SqliteStore() { close(); }

    dp::Result<void, dp::Error> SqliteStore::open(const std::string &path, const OpenOptions &opts) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (is_open_)
            close();

        int rc = sqlite3_open(path.c_str(), &db_);
        if (rc != SQLITE_OK) {
            auto error = lastError("open " + path);
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            is_open_ = false;
            return dp::Result<void, dp::Error>::err(error);
        }

        db_path_ = path;
        is_open_ = true;
        applyPragmas(opts);

        auto schema = initializeSchema();
        if (schema.is_err()) {
            close();
            return schema;
        }
        return dp::Result<void, dp::Error>::ok();
    }

    void SqliteStore::close() {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        is_open_ = false;
    }

    bool SqliteStore::isOpen() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return is_open_;
    }

    void SqliteStore::applyPragmas(const OpenOptions &opts) {
        if (!db_)
            return;

        if (opts.enable_wal) {
            sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
        }

        std::string busy_timeout = "PRAGMA busy_timeout=" + std::to_string(opts.busy_timeout_ms) + ";";
        sqlite3_exec(db_, busy_timeout.c_str(), nullptr, nullptr, nullptr);

        std::string sync_mode;
        switch (opts.sync_mode) {
        case OpenOptions::Synchronous::OFF:
            sync_mode = "PRAGMA synchronous=OFF;";
            break;
        case OpenOptions::Synchronous::NORMAL:
            sync_mode = "PRAGMA synchronous=NORMAL;";
            break;
        case OpenOptions::Synchronous::FULL:
            sync_mode = "PRAGMA synchronous=FULL;";
            break;
        }
        sqlite3_exec(db_, sync_mode.c_str(), nullptr, nullptr, nullptr);
    }

    dp::Result<void, dp::Error> SqliteStore::initializeSchema() {
        auto tx = beginTransaction();

        auto migrations = executeSql(SCHEMA_MIGRATIONS_TABLE);
        if (migrations.is_err())
            return migrations;

        if (schemaVersion() < 1) {
            auto kv = executeSql(KV_TABLE);
            if (kv.is_err())
                return kv;
            auto idx = executeSql(IDX_KV_UPDATED);
            if (idx.is_err())
                return idx;
            if (!setSchemaVersion(1))
                return dp::Result<void, dp::Error>::err(lastError("set schema version"));
        }

        return tx->commit();
    }

    dp::i32 SqliteStore::schemaVersion() {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!db_)
            return 0;

        sqlite3_stmt *stmt;
        const char *sql = "SELECT MAX(version) FROM schema_migrations";
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return 0;
        }

        dp::i32 version = 0;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            version = sqlite3_column_int(stmt, 0);
        }

        sqlite3_finalize(stmt);
        return version;
    }

    bool SqliteStore::setSchemaVersion(dp::i32 version) {
        sqlite3_stmt *stmt;
        const char *sql = "INSERT OR REPLACE INTO schema_migrations (version, applied_at) VALUES (?, ?)";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        sqlite3_bind_int(stmt, 1, version);
        sqlite3_bind_int64(stmt, 2, currentTimestamp());

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);

        return success;
    }

    // ===========================================
    // Transaction Guard
    // ===========================================

    SqliteStore::TxGuard::TxGuard(SqliteStore &store) : store_(store), active_(false), committed_(false) {
        store_.mutex_.lock();
        if (store_.db_) {
            active_ = (sqlite3_exec(store_.db_, "BEGIN TRANSACTION", nullptr, nullptr, nullptr) == SQLITE_OK);
        }
    }

    SqliteStore::TxGuard::~TxGuard() {
        if (active_ && !committed_) {
            sqlite3_exec(store_.db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
        store_.mutex_.unlock();
    }

    dp::Result<void, dp::Error> SqliteStore::TxGuard::commit() {
        if (!active_ || committed_)
            return dp::Result<void, dp::Error>::ok();

        if (sqlite3_exec(store_.db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
            auto error = store_.lastError("commit");
            sqlite3_exec(store_.db_, "ROLLBACK", nullptr, nullptr, nullptr);
            committed_ = true;
            active_ = false;
            return dp::Result<void, dp::Error>::err(error);
        }
        committed_ = true;
        active_ = false;
        return dp::Result<void, dp::Error>::ok();
    }

    void SqliteStore::TxGuard::rollback() {
        if (active_ && !committed_) {
            sqlite3_exec(store_.db_, "ROLLBACK", nullptr, nullptr, nullptr);
            committed_ = true;
            active_ = false;
        }
    }

    std::unique_ptr<SqliteStore::TxGuard> SqliteStore::beginTransaction() { return std::make_unique<TxGuard>(*this); }

    // ===========================================
    // KvStore
    // ===========================================

    dp::Result<void, dp::Error> SqliteStore::put(const std::string &ns, const std::string &key,
                                                 const dp::ByteBuf &value) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return dp::Result<void, dp::Error>::err(storage_failure("Store not open"));

        sqlite3_stmt *stmt;
        const char *sql = "INSERT OR REPLACE INTO kv (ns, key, value, updated_at) VALUES (?, ?, ?, ?)";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<void, dp::Error>::err(lastError("prepare put"));
        }

        sqlite3_bind_text(stmt, 1, ns.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_blob(stmt, 3, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 4, currentTimestamp());

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);

        if (!success)
            return dp::Result<void, dp::Error>::err(lastError("put " + ns + "/" + key));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> SqliteStore::erase(const std::string &ns, const std::string &key) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return dp::Result<void, dp::Error>::err(storage_failure("Store not open"));

        sqlite3_stmt *stmt;
        const char *sql = "DELETE FROM kv WHERE ns = ? AND key = ?";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<void, dp::Error>::err(lastError("prepare erase"));
        }

        sqlite3_bind_text(stmt, 1, ns.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, key.c_str(), -1, SQLITE_TRANSIENT);

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);

        if (!success)
            return dp::Result<void, dp::Error>::err(lastError("erase " + ns + "/" + key));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<dp::Optional<dp::ByteBuf>, dp::Error> SqliteStore::get(const std::string &ns, const std::string &key) {
        using GetResult = dp::Result<dp::Optional<dp::ByteBuf>, dp::Error>;
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return GetResult::err(storage_failure("Store not open"));

        sqlite3_stmt *stmt;
        const char *sql = "SELECT value FROM kv WHERE ns = ? AND key = ?";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return GetResult::err(lastError("prepare get"));
        }

        sqlite3_bind_text(stmt, 1, ns.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, key.c_str(), -1, SQLITE_TRANSIENT);

        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            const auto *blob = static_cast<const dp::u8 *>(sqlite3_column_blob(stmt, 0));
            int size = sqlite3_column_bytes(stmt, 0);
            dp::ByteBuf value(blob, blob + size);
            sqlite3_finalize(stmt);
            return GetResult::ok(dp::Optional<dp::ByteBuf>(std::move(value)));
        }

        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
            return GetResult::err(lastError("get " + ns + "/" + key));
        return GetResult::ok(dp::Optional<dp::ByteBuf>());
    }

    dp::Result<std::vector<Entry>, dp::Error> SqliteStore::scan(const std::string &ns) {
        using ScanResult = dp::Result<std::vector<Entry>, dp::Error>;
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return ScanResult::err(storage_failure("Store not open"));

        sqlite3_stmt *stmt;
        const char *sql = "SELECT key, value FROM kv WHERE ns = ? ORDER BY key";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return ScanResult::err(lastError("prepare scan"));
        }

        sqlite3_bind_text(stmt, 1, ns.c_str(), -1, SQLITE_TRANSIENT);

        std::vector<Entry> entries;
        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            Entry entry;
            entry.key = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0));
            const auto *blob = static_cast<const dp::u8 *>(sqlite3_column_blob(stmt, 1));
            int size = sqlite3_column_bytes(stmt, 1);
            entry.value = dp::ByteBuf(blob, blob + size);
            entries.push_back(std::move(entry));
        }

        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
            return ScanResult::err(lastError("scan " + ns));
        return ScanResult::ok(std::move(entries));
    }

    dp::Result<void, dp::Error> SqliteStore::flush() {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return dp::Result<void, dp::Error>::err(storage_failure("Store not open"));
        // Autocommit has already made every statement durable; fold the WAL back into the main file
        sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_PASSIVE, nullptr, nullptr);
        return dp::Result<void, dp::Error>::ok();
    }

    // ===========================================
    // Diagnostics
    // ===========================================

    dp::i64 SqliteStore::count(const std::string &ns) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return 0;

        sqlite3_stmt *stmt;
        const char *sql = "SELECT COUNT(*) FROM kv WHERE ns = ?";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return 0;
        }

        sqlite3_bind_text(stmt, 1, ns.c_str(), -1, SQLITE_TRANSIENT);

        dp::i64 count = 0;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            count = sqlite3_column_int64(stmt, 0);
        }

        sqlite3_finalize(stmt);
        return count;
    }

    bool SqliteStore::quickCheck() {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return false;

        sqlite3_stmt *stmt;
        const char *sql = "PRAGMA quick_check";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        bool ok = false;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            std::string result = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0));
            ok = (result == "ok");
        }

        sqlite3_finalize(stmt);
        return ok;
    }

    // ===========================================
    // Helpers
    // ===========================================

    dp::Result<void, dp::Error> SqliteStore::executeSql(const char *sql) {
        if (!db_)
            return dp::Result<void, dp::Error>::err(storage_failure("Store not open"));

        char *errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);

        if (rc != SQLITE_OK) {
            std::string message = errmsg ? errmsg : "sqlite3_exec failed";
            if (errmsg) {
                sqlite3_free(errmsg);
            }
            return dp::Result<void, dp::Error>::err(storage_failure(dp::String(message.c_str())));
        }

        return dp::Result<void, dp::Error>::ok();
    }

    dp::Error SqliteStore::lastError(const std::string &context) const {
        std::string message = context + ": " + (db_ ? sqlite3_errmsg(db_) : "no database handle");
        return storage_failure(dp::String(message.c_str()));
    }

} // namespace fundit::storage
