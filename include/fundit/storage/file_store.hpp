#pragma once

#include <algorithm>
#include <cstdio>
#include <datapod/datapod.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <fundit/common/error.hpp>
#include <fundit/storage/kv_store.hpp>
#include <keylock/keylock.hpp>
#include <map>
#include <mutex>
#include <unordered_map>

namespace fundit::storage {

    using namespace datapod;

    // ===========================================
    // Utility functions
    // ===========================================

    inline Vector<u8> computeSHA256(const Vector<u8> &data) {
        keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
        std::vector<uint8_t> input(data.begin(), data.end());
        auto result = crypto.hash(input);
        if (!result.success) {
            return Vector<u8>{};
        }
        return Vector<u8>(result.data.begin(), result.data.end());
    }

    /// One entry of a namespace log
    struct LogRecord {
        String key;
        u8 tombstone = 0;
        Vector<u8> value;
        Vector<u8> checksum; // SHA-256 of value
        i64 written_at = 0;

        auto members() { return std::tie(key, tombstone, value, checksum, written_at); }
        auto members() const { return std::tie(key, tombstone, value, checksum, written_at); }
    };

    // ===========================================
    // FileStore - append-log key/value storage
    // ===========================================

    /// Directory with one append-only log per namespace (`<ns>.dat`).
    /// Logs are replayed into an offset index on open; compact() rewrites them with live entries only.
    class FileStore : public KvStore {
      public:
        inline FileStore() : is_open_(false), sync_mode_(OpenOptions::Synchronous::NORMAL) {}

        inline ~FileStore() override { close(); }

        // Non-copyable, non-movable (the mutex pins it)
        FileStore(const FileStore &) = delete;
        FileStore &operator=(const FileStore &) = delete;

        /// Open or create storage at given path (directory)
        inline Result<void, Error> open(const std::string &path, const OpenOptions &opts = OpenOptions{}) {
            std::lock_guard<std::mutex> lock(mutex_);
            try {
                base_path_ = path;
                sync_mode_ = opts.sync_mode;

                std::filesystem::create_directories(base_path_);
                index_.clear();
                for (const auto &dir_entry : std::filesystem::directory_iterator(base_path_)) {
                    if (dir_entry.path().extension() == ".dat") {
                        loadIndex(dir_entry.path().stem().string());
                    }
                }

                is_open_ = true;
                return Result<void, Error>::ok();
            } catch (const std::exception &e) {
                is_open_ = false;
                return Result<void, Error>::err(storage_failure(String(e.what())));
            }
        }

        /// Close storage
        inline void close() {
            std::lock_guard<std::mutex> lock(mutex_);
            is_open_ = false;
        }

        /// Check if storage is open
        inline bool isOpen() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return is_open_;
        }

        // ===========================================
        // KvStore
        // ===========================================

        inline Result<void, Error> put(const std::string &ns, const std::string &key,
                                       const ByteBuf &value) override {
            std::lock_guard<std::mutex> lock(mutex_);
            auto check = checkNamespace(ns);
            if (check.is_err())
                return check;

            LogRecord record;
            record.key = String(key.c_str());
            record.value = Vector<u8>(value.begin(), value.end());
            record.checksum = computeSHA256(record.value);
            record.written_at = currentTimestamp();
            if (record.checksum.empty())
                return Result<void, Error>::err(storage_failure("Hash computation failed"));

            try {
                u64 offset;
                appendRecord(logPath(ns), record, offset);
                index_[ns][key] = offset;
                return Result<void, Error>::ok();
            } catch (const std::exception &e) {
                return Result<void, Error>::err(storage_failure(String(e.what())));
            }
        }

        inline Result<void, Error> erase(const std::string &ns, const std::string &key) override {
            std::lock_guard<std::mutex> lock(mutex_);
            auto check = checkNamespace(ns);
            if (check.is_err())
                return check;

            auto ns_it = index_.find(ns);
            if (ns_it == index_.end() || ns_it->second.find(key) == ns_it->second.end())
                return Result<void, Error>::ok();

            LogRecord record;
            record.key = String(key.c_str());
            record.tombstone = 1;
            record.written_at = currentTimestamp();

            try {
                u64 offset;
                appendRecord(logPath(ns), record, offset);
                ns_it->second.erase(key);
                return Result<void, Error>::ok();
            } catch (const std::exception &e) {
                return Result<void, Error>::err(storage_failure(String(e.what())));
            }
        }

        inline Result<Optional<ByteBuf>, Error> get(const std::string &ns, const std::string &key) override {
            std::lock_guard<std::mutex> lock(mutex_);
            auto check = checkNamespace(ns);
            if (check.is_err())
                return Result<Optional<ByteBuf>, Error>::err(check.error());

            auto ns_it = index_.find(ns);
            if (ns_it == index_.end())
                return Result<Optional<ByteBuf>, Error>::ok(Optional<ByteBuf>());
            auto it = ns_it->second.find(key);
            if (it == ns_it->second.end())
                return Result<Optional<ByteBuf>, Error>::ok(Optional<ByteBuf>());

            auto record = readVerified(ns, it->second);
            if (record.is_err())
                return Result<Optional<ByteBuf>, Error>::err(record.error());
            const auto &value = record.value().value;
            return Result<Optional<ByteBuf>, Error>::ok(Optional<ByteBuf>(ByteBuf(value.begin(), value.end())));
        }

        inline Result<std::vector<Entry>, Error> scan(const std::string &ns) override {
            std::lock_guard<std::mutex> lock(mutex_);
            auto check = checkNamespace(ns);
            if (check.is_err())
                return Result<std::vector<Entry>, Error>::err(check.error());

            std::vector<Entry> entries;
            auto ns_it = index_.find(ns);
            if (ns_it == index_.end())
                return Result<std::vector<Entry>, Error>::ok(std::move(entries));

            for (const auto &[key, offset] : ns_it->second) {
                auto record = readVerified(ns, offset);
                if (record.is_err())
                    return Result<std::vector<Entry>, Error>::err(record.error());
                const auto &value = record.value().value;
                entries.push_back(Entry{key, ByteBuf(value.begin(), value.end())});
            }
            return Result<std::vector<Entry>, Error>::ok(std::move(entries));
        }

        inline Result<void, Error> flush() override {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!is_open_)
                return Result<void, Error>::err(storage_failure("Store not open"));
            // Every append closes its stream, so the logs are already on disk
            return Result<void, Error>::ok();
        }

        // ===========================================
        // Maintenance
        // ===========================================

        /// Rewrite every namespace log with only its live entries
        inline Result<void, Error> compact() {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!is_open_)
                return Result<void, Error>::err(storage_failure("Store not open"));

            try {
                for (auto &[ns, keys] : index_) {
                    auto path = logPath(ns);
                    auto tmp_path = path;
                    tmp_path += ".tmp";
                    std::filesystem::remove(tmp_path);

                    std::map<std::string, u64> new_offsets;
                    for (const auto &[key, offset] : keys) {
                        auto record = readRecordAt(path, offset);
                        if (!record.has_value())
                            return Result<void, Error>::err(storage_failure("Unreadable record during compaction"));
                        u64 new_offset;
                        appendRecord(tmp_path, *record, new_offset);
                        new_offsets[key] = new_offset;
                    }

                    if (keys.empty()) {
                        std::ofstream(tmp_path, std::ios::binary | std::ios::trunc).close();
                    }
                    std::filesystem::rename(tmp_path, path);
                    keys = std::move(new_offsets);
                }
                return Result<void, Error>::ok();
            } catch (const std::exception &e) {
                return Result<void, Error>::err(storage_failure(String(e.what())));
            }
        }

        /// Verify every indexed record against its checksum
        inline Result<bool, Error> quickCheck() {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!is_open_)
                return Result<bool, Error>::err(storage_failure("Store not open"));

            for (const auto &[ns, keys] : index_) {
                for (const auto &[key, offset] : keys) {
                    if (readVerified(ns, offset).is_err())
                        return Result<bool, Error>::ok(false);
                }
            }
            return Result<bool, Error>::ok(true);
        }

        /// Number of live keys in a namespace
        inline usize size(const std::string &ns) const {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = index_.find(ns);
            return it == index_.end() ? 0 : it->second.size();
        }

      private:
        inline Result<void, Error> checkNamespace(const std::string &ns) const {
            if (!is_open_)
                return Result<void, Error>::err(storage_failure("Store not open"));
            if (ns.empty())
                return Result<void, Error>::err(Error::invalid_argument("Empty namespace"));
            for (char c : ns) {
                bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
                if (!ok)
                    return Result<void, Error>::err(Error::invalid_argument("Invalid namespace name"));
            }
            return Result<void, Error>::ok();
        }

        inline std::filesystem::path logPath(const std::string &ns) const { return base_path_ / (ns + ".dat"); }

        // ===========================================
        // File I/O with datapod serialization
        // ===========================================

        inline void appendRecord(const std::filesystem::path &file, const LogRecord &record, u64 &offset) {
            std::ofstream out(file, std::ios::binary | std::ios::app);
            if (!out)
                throw std::runtime_error("Failed to open file for writing");

            out.seekp(0, std::ios::end);
            offset = out.tellp();

            LogRecord mutable_record = record;
            auto buffer = datapod::serialize(mutable_record);
            u32 len = static_cast<u32>(buffer.size());

            out.write(reinterpret_cast<const char *>(&len), sizeof(len));
            out.write(reinterpret_cast<const char *>(buffer.data()), buffer.size());

            if (sync_mode_ == OpenOptions::Synchronous::FULL) {
                out.flush();
            }
            if (!out)
                throw std::runtime_error("Failed to write record");
        }

        inline Optional<LogRecord> readRecordAt(const std::filesystem::path &file, u64 offset) const {
            std::ifstream in(file, std::ios::binary);
            if (!in)
                return Optional<LogRecord>();

            in.seekg(offset);

            u32 len;
            in.read(reinterpret_cast<char *>(&len), sizeof(len));
            if (!in)
                return Optional<LogRecord>();

            ByteBuf data(len);
            in.read(reinterpret_cast<char *>(data.data()), len);
            if (!in)
                return Optional<LogRecord>();

            try {
                return Optional<LogRecord>(datapod::deserialize<Mode::NONE, LogRecord>(data));
            } catch (const std::exception &) {
                return Optional<LogRecord>();
            }
        }

        inline Result<LogRecord, Error> readVerified(const std::string &ns, u64 offset) const {
            auto record = readRecordAt(logPath(ns), offset);
            if (!record.has_value())
                return Result<LogRecord, Error>::err(storage_failure(String(("Unreadable record in " + ns).c_str())));

            auto computed = computeSHA256(record->value);
            bool matches = computed.size() == record->checksum.size() &&
                           std::equal(computed.begin(), computed.end(), record->checksum.begin());
            if (!matches)
                return Result<LogRecord, Error>::err(storage_failure(String(("Checksum mismatch in " + ns).c_str())));
            return Result<LogRecord, Error>::ok(std::move(*record));
        }

        // ===========================================
        // Index management
        // ===========================================

        /// Replays a namespace log into the index. A torn or undecodable tail left by an
        /// interrupted append is cut off so later appends start on a record boundary.
        inline void loadIndex(const std::string &ns) {
            auto &keys = index_[ns];
            auto path = logPath(ns);
            if (!std::filesystem::exists(path))
                return;

            const u64 file_size = std::filesystem::file_size(path);
            u64 good_end = 0;
            {
                std::ifstream in(path, std::ios::binary);
                if (!in)
                    throw std::runtime_error("Failed to open log " + path.string());

                while (good_end + sizeof(u32) <= file_size) {
                    in.seekg(good_end);
                    u32 len;
                    in.read(reinterpret_cast<char *>(&len), sizeof(len));
                    if (!in || good_end + sizeof(u32) + len > file_size)
                        break;

                    ByteBuf data(len);
                    in.read(reinterpret_cast<char *>(data.data()), len);
                    if (!in)
                        break;

                    LogRecord record;
                    try {
                        record = datapod::deserialize<Mode::NONE, LogRecord>(data);
                    } catch (const std::exception &e) {
                        std::cerr << "[file_store] Undecodable record in " << ns << " at " << good_end << ": "
                                  << e.what() << std::endl;
                        break;
                    }

                    std::string key(record.key.c_str());
                    if (record.tombstone) {
                        keys.erase(key);
                    } else {
                        keys[key] = good_end;
                    }
                    good_end += sizeof(u32) + len;
                }
            }

            if (good_end < file_size) {
                std::cerr << "[file_store] Truncating torn tail of " << ns << " from " << file_size << " to "
                          << good_end << " bytes" << std::endl;
                std::filesystem::resize_file(path, good_end);
            }
        }

        // ===========================================
        // Member variables
        // ===========================================

        std::filesystem::path base_path_;
        bool is_open_;
        OpenOptions::Synchronous sync_mode_;

        // namespace -> key -> offset of the latest live record
        std::unordered_map<std::string, std::map<std::string, u64>> index_;
        mutable std::mutex mutex_;
    };

} // namespace fundit::storage
