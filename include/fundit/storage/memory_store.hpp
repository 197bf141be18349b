#pragma once

#include <fundit/storage/kv_store.hpp>
#include <map>
#include <mutex>

namespace fundit::storage {

    /// Process-local store. Nothing survives the process; flush() is a no-op.
    class MemoryStore : public KvStore {
      public:
        MemoryStore() = default;

        inline dp::Result<void, dp::Error> put(const std::string &ns, const std::string &key,
                                               const dp::ByteBuf &value) override {
            std::lock_guard<std::mutex> lock(mutex_);
            data_[ns][key] = value;
            return dp::Result<void, dp::Error>::ok();
        }

        inline dp::Result<void, dp::Error> erase(const std::string &ns, const std::string &key) override {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = data_.find(ns);
            if (it != data_.end())
                it->second.erase(key);
            return dp::Result<void, dp::Error>::ok();
        }

        inline dp::Result<dp::Optional<dp::ByteBuf>, dp::Error> get(const std::string &ns,
                                                                    const std::string &key) override {
            std::lock_guard<std::mutex> lock(mutex_);
            auto ns_it = data_.find(ns);
            if (ns_it == data_.end())
                return dp::Result<dp::Optional<dp::ByteBuf>, dp::Error>::ok(dp::Optional<dp::ByteBuf>());
            auto it = ns_it->second.find(key);
            if (it == ns_it->second.end())
                return dp::Result<dp::Optional<dp::ByteBuf>, dp::Error>::ok(dp::Optional<dp::ByteBuf>());
            return dp::Result<dp::Optional<dp::ByteBuf>, dp::Error>::ok(dp::Optional<dp::ByteBuf>(it->second));
        }

        inline dp::Result<std::vector<Entry>, dp::Error> scan(const std::string &ns) override {
            std::lock_guard<std::mutex> lock(mutex_);
            std::vector<Entry> entries;
            auto ns_it = data_.find(ns);
            if (ns_it != data_.end()) {
                for (const auto &[key, value] : ns_it->second) {
                    entries.push_back(Entry{key, value});
                }
            }
            return dp::Result<std::vector<Entry>, dp::Error>::ok(std::move(entries));
        }

        inline dp::Result<void, dp::Error> flush() override { return dp::Result<void, dp::Error>::ok(); }

        /// Number of keys in a namespace
        inline dp::usize size(const std::string &ns) const {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = data_.find(ns);
            return it == data_.end() ? 0 : it->second.size();
        }

      private:
        std::map<std::string, std::map<std::string, dp::ByteBuf>> data_;
        mutable std::mutex mutex_;
    };

} // namespace fundit::storage
