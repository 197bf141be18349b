#pragma once

#include <fundit/ledger/records.hpp>
#include <fundit/storage/kv_store.hpp>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace fundit::ledger {

    inline constexpr const char *EARNINGS_NS = "earnings";

    /// Store key of the (provider, campaign) earnings record
    inline std::string earningsKey(const std::string &provider_id, const std::string &campaign_id) {
        return provider_id + ":" + campaign_id;
    }

    // ===========================================
    // EarningsRegistry - audit trail of internal payments
    // ===========================================

    /// One record per (provider, campaign) pair. Records are created on first payment,
    /// accumulate in place, and are never deleted or decreased.
    class EarningsRegistry {
      public:
        /// State of a record before a payment, used to undo it
        struct Undo {
            std::string provider_id;
            std::string campaign_id;
            dp::Optional<ProviderEarnings> prior;
        };

        explicit EarningsRegistry(storage::KvStore &store);

        dp::Result<void, dp::Error> load();
        dp::Result<void, dp::Error> snapshot();

        /// Add a payment to the (provider, campaign) record, creating it if needed
        dp::Result<Undo, dp::Error> record(const std::string &provider_id, const std::string &campaign_id,
                                           Amount amount);

        /// Put a record back the way it was before record()
        dp::Result<void, dp::Error> restore(const Undo &undo);

        /// Set last_withdrawal on every record of a provider
        /// @return Number of records stamped
        dp::Result<dp::usize, dp::Error> stampWithdrawal(const std::string &provider_id, dp::i64 timestamp);

        dp::Optional<ProviderEarnings> get(const std::string &provider_id, const std::string &campaign_id) const;

        /// Every record of a provider, ordered by campaign id
        std::vector<ProviderEarnings> breakdown(const std::string &provider_id) const;

        dp::usize size() const { return records_.size(); }

      private:
        using RecordKey = std::pair<std::string, std::string>; // (provider_id, campaign_id)

        storage::KvStore &store_;
        std::map<RecordKey, ProviderEarnings> records_;

        dp::Result<void, dp::Error> persist(const ProviderEarnings &earnings);
    };

} // namespace fundit::ledger
