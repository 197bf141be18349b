#pragma once

#include <chrono>
#include <datapod/datapod.hpp>
#include <functional>
#include <string>

namespace fundit {

    /// Amount in the smallest indivisible unit of the external currency (e8s)
    using Amount = dp::u64;

    /// Receipt returned by the rail for an executed transfer
    using BlockIndex = dp::u64;

    /// Verified caller identity (principal text)
    using Identity = std::string;

    /// Completion handler for operations that may suspend on the rail
    template <typename T> using Completion = std::function<void(dp::Result<T, dp::Error>)>;

    /// External account: owner identity plus optional 32-byte subaccount
    struct Account {
        dp::String owner;
        dp::Optional<dp::Array<dp::u8, 32>> subaccount;

        Account() = default;
        explicit Account(const std::string &owner_id) : owner(dp::String(owner_id.c_str())) {}

        inline std::string getOwner() const { return std::string(owner.c_str()); }

        inline std::string toString() const {
            std::string result(owner.c_str());
            if (subaccount.has_value()) {
                static const char *digits = "0123456789abcdef";
                result += ".";
                for (auto byte : *subaccount) {
                    result += digits[byte >> 4];
                    result += digits[byte & 0x0f];
                }
            }
            return result;
        }

        inline bool operator==(const Account &other) const { return toString() == other.toString(); }
        inline bool operator!=(const Account &other) const { return !(*this == other); }

        auto members() { return std::tie(owner, subaccount); }
        auto members() const { return std::tie(owner, subaccount); }
    };

    /// Entities that can carry a balance and be locked
    enum class EntityKind : dp::u8 {
        Campaign = 0,
        Provider = 1,
    };

    inline std::string entityKindToString(EntityKind kind) {
        switch (kind) {
        case EntityKind::Campaign:
            return "campaign";
        case EntityKind::Provider:
            return "provider";
        default:
            return "unknown";
        }
    }

    /// Lock-table key, namespaced so campaign and provider ids cannot collide
    inline std::string entityKey(EntityKind kind, const std::string &id) { return entityKindToString(kind) + ":" + id; }

    inline dp::i64 nowMillis() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    inline dp::u64 nowNanos() {
        return static_cast<dp::u64>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                        std::chrono::system_clock::now().time_since_epoch())
                                        .count());
    }

} // namespace fundit
