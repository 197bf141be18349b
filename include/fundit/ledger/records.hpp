#pragma once

#include <fundit/common/error.hpp>
#include <fundit/common/types.hpp>
#include <string>
#include <vector>

namespace fundit::ledger {

    // ===========================================
    // Persistent records - POD structs with members()
    // ===========================================

    /// Campaign budget held in custody
    struct Campaign {
        dp::String id;
        dp::String owner;
        Amount budget{0};

        Campaign() = default;
        Campaign(const std::string &campaign_id, const std::string &owner_id, Amount initial_budget = 0)
            : id(dp::String(campaign_id.c_str())), owner(dp::String(owner_id.c_str())), budget(initial_budget) {}

        inline std::string getId() const { return std::string(id.c_str()); }
        inline std::string getOwner() const { return std::string(owner.c_str()); }

        auto members() { return std::tie(id, owner, budget); }
        auto members() const { return std::tie(id, owner, budget); }
    };

    /// Provider earnings held in custody
    struct Provider {
        dp::String id;
        dp::String owner;
        Amount total_earnings{0};

        Provider() = default;
        Provider(const std::string &provider_id, const std::string &owner_id, Amount earnings = 0)
            : id(dp::String(provider_id.c_str())), owner(dp::String(owner_id.c_str())), total_earnings(earnings) {}

        inline std::string getId() const { return std::string(id.c_str()); }
        inline std::string getOwner() const { return std::string(owner.c_str()); }

        auto members() { return std::tie(id, owner, total_earnings); }
        auto members() const { return std::tie(id, owner, total_earnings); }
    };

    /// Accumulated earnings of one provider from one campaign
    struct ProviderEarnings {
        dp::String provider_id;
        dp::String campaign_id;
        Amount total_earned{0};
        dp::Optional<dp::i64> last_withdrawal; // Unix timestamp in milliseconds

        ProviderEarnings() = default;
        ProviderEarnings(const std::string &provider, const std::string &campaign, Amount earned = 0)
            : provider_id(dp::String(provider.c_str())), campaign_id(dp::String(campaign.c_str())),
              total_earned(earned) {}

        inline std::string getProviderId() const { return std::string(provider_id.c_str()); }
        inline std::string getCampaignId() const { return std::string(campaign_id.c_str()); }

        auto members() { return std::tie(provider_id, campaign_id, total_earned, last_withdrawal); }
        auto members() const { return std::tie(provider_id, campaign_id, total_earned, last_withdrawal); }
    };

    /// Direction of an external transfer relative to custody
    enum class TransferDirection : dp::u8 {
        Incoming = 0, // Funding: wallet -> custody
        Outgoing = 1, // Withdrawal: custody -> wallet
    };

    inline std::string transferDirectionToString(TransferDirection direction) {
        switch (direction) {
        case TransferDirection::Incoming:
            return "incoming";
        case TransferDirection::Outgoing:
            return "outgoing";
        default:
            return "unknown";
        }
    }

    /// External transfer whose local effect is awaiting manual reconciliation
    struct UnreconciledTransfer {
        dp::String ticket_id;
        dp::u8 entity_kind{0}; // EntityKind
        dp::String entity_id;
        dp::u8 direction{0}; // TransferDirection
        Amount amount{0};    // Gross amount requested
        Amount fee{0};
        dp::Vector<dp::u8> memo;
        dp::u64 created_at_time{0}; // Token sent to the rail, 0 when not stamped
        dp::String reason;
        dp::i64 recorded_at{0};

        inline std::string getTicketId() const { return std::string(ticket_id.c_str()); }
        inline std::string getEntityId() const { return std::string(entity_id.c_str()); }
        inline EntityKind getEntityKind() const { return static_cast<EntityKind>(entity_kind); }
        inline TransferDirection getDirection() const { return static_cast<TransferDirection>(direction); }
        inline std::string getReason() const { return std::string(reason.c_str()); }

        /// Amount that lands in custody for an incoming transfer
        inline Amount netAmount() const { return amount > fee ? amount - fee : 0; }

        auto members() {
            return std::tie(ticket_id, entity_kind, entity_id, direction, amount, fee, memo, created_at_time, reason,
                            recorded_at);
        }
        auto members() const {
            return std::tie(ticket_id, entity_kind, entity_id, direction, amount, fee, memo, created_at_time, reason,
                            recorded_at);
        }
    };

    // ===========================================
    // Byte encoding
    // ===========================================

    template <typename T> inline dp::ByteBuf encodeRecord(const T &record) {
        auto &self = const_cast<T &>(record);
        return dp::serialize<dp::Mode::WITH_VERSION>(self);
    }

    template <typename T> inline dp::Result<T, dp::Error> decodeRecord(const dp::ByteBuf &data) {
        try {
            auto result = dp::deserialize<dp::Mode::WITH_VERSION, T>(data);
            return dp::Result<T, dp::Error>::ok(std::move(result));
        } catch (const std::exception &e) {
            return dp::Result<T, dp::Error>::err(storage_failure(dp::String(e.what())));
        }
    }

} // namespace fundit::ledger
