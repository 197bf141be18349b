#pragma once

#include <chrono>
#include <datapod/datapod.hpp>
#include <string>
#include <vector>

namespace fundit::storage {

    // ===========================================
    // Core Types
    // ===========================================

    /// One key/value pair read back from a namespace
    struct Entry {
        std::string key;
        dp::ByteBuf value;
    };

    /// Storage configuration options
    struct OpenOptions {
        bool enable_wal = true;        // SqliteStore only
        dp::i32 busy_timeout_ms = 5000; // SqliteStore only
        enum class Synchronous { OFF = 0, NORMAL = 1, FULL = 2 };
        Synchronous sync_mode = Synchronous::NORMAL;
    };

    inline dp::i64 currentTimestamp() {
        return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    // ===========================================
    // KvStore - durable namespaced key/value store
    // ===========================================

    /// Interface the balance ledger and earnings registry persist through.
    /// Each put/erase is a single durable step: it either lands completely or reports an error.
    class KvStore {
      public:
        virtual ~KvStore() = default;

        /// Insert or replace a value
        virtual dp::Result<void, dp::Error> put(const std::string &ns, const std::string &key,
                                                const dp::ByteBuf &value) = 0;

        /// Remove a value (no-op if absent)
        virtual dp::Result<void, dp::Error> erase(const std::string &ns, const std::string &key) = 0;

        /// Read a value, empty optional when absent
        virtual dp::Result<dp::Optional<dp::ByteBuf>, dp::Error> get(const std::string &ns,
                                                                     const std::string &key) = 0;

        /// All entries of a namespace ordered by key
        virtual dp::Result<std::vector<Entry>, dp::Error> scan(const std::string &ns) = 0;

        /// Make every write so far durable (snapshot point)
        virtual dp::Result<void, dp::Error> flush() = 0;
    };

} // namespace fundit::storage
