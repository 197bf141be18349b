#pragma once

#include <fundit/storage/kv_store.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Forward declaration for sqlite3 C API
struct sqlite3;
struct sqlite3_stmt;

namespace fundit::storage {

    // ===========================================
    // SqliteStore - key/value storage in one SQLite file
    // ===========================================

    class SqliteStore : public KvStore {
      public:
        SqliteStore();
        ~SqliteStore() override;

        // Non-copyable, non-movable (the mutex pins it)
        SqliteStore(const SqliteStore &) = delete;
        SqliteStore &operator=(const SqliteStore &) = delete;

        /// Open or create database at given path and apply the schema
        /// @param path Database file path (e.g. "data/fundit.db")
        /// @param opts Configuration options
        dp::Result<void, dp::Error> open(const std::string &path, const OpenOptions &opts = OpenOptions{});

        /// Close database connection
        void close();

        /// Check if database is open
        bool isOpen() const;

        // ===========================================
        // Transaction management (RAII)
        // ===========================================

        /// Groups several puts into one SQLite transaction; rolls back unless committed
        class TxGuard {
          public:
            explicit TxGuard(SqliteStore &store);
            ~TxGuard();

            TxGuard(const TxGuard &) = delete;
            TxGuard &operator=(const TxGuard &) = delete;

            dp::Result<void, dp::Error> commit();
            void rollback();

          private:
            SqliteStore &store_;
            bool active_;
            bool committed_;
        };

        std::unique_ptr<TxGuard> beginTransaction();

        // ===========================================
        // KvStore
        // ===========================================

        dp::Result<void, dp::Error> put(const std::string &ns, const std::string &key,
                                        const dp::ByteBuf &value) override;
        dp::Result<void, dp::Error> erase(const std::string &ns, const std::string &key) override;
        dp::Result<dp::Optional<dp::ByteBuf>, dp::Error> get(const std::string &ns, const std::string &key) override;
        dp::Result<std::vector<Entry>, dp::Error> scan(const std::string &ns) override;
        dp::Result<void, dp::Error> flush() override;

        // ===========================================
        // Diagnostics
        // ===========================================

        /// Number of keys in a namespace
        dp::i64 count(const std::string &ns);

        /// Run SQLite integrity check
        /// @return true if database is healthy, false on corruption
        bool quickCheck();

        /// Current schema version (0 when uninitialized)
        dp::i32 schemaVersion();

      private:
        sqlite3 *db_;
        std::string db_path_;
        bool is_open_;
        mutable std::recursive_mutex mutex_;

        void applyPragmas(const OpenOptions &opts);
        dp::Result<void, dp::Error> initializeSchema();
        dp::Result<void, dp::Error> executeSql(const char *sql);
        dp::Error lastError(const std::string &context) const;
        bool setSchemaVersion(dp::i32 version);

        static constexpr const char *SCHEMA_MIGRATIONS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS schema_migrations (
                version INTEGER PRIMARY KEY,
                applied_at INTEGER NOT NULL
            )
        )";

        static constexpr const char *KV_TABLE = R"(
            CREATE TABLE IF NOT EXISTS kv (
                ns TEXT NOT NULL,
                key TEXT NOT NULL,
                value BLOB NOT NULL,
                updated_at INTEGER NOT NULL,
                PRIMARY KEY (ns, key)
            )
        )";

        static constexpr const char *IDX_KV_UPDATED = "CREATE INDEX IF NOT EXISTS idx_kv_updated ON kv(updated_at)";
    };

} // namespace fundit::storage
