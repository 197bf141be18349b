#pragma once

#include <fundit/ledger/ledger.hpp>
#include <shared_mutex>
#include <string>
#include <vector>

namespace fundit {

    /// Owner-gated reads. Never waits on entity locks, only on the shared side of the state latch,
    /// so an internal payment is seen either entirely or not at all.
    class QueryService {
      public:
        QueryService(const ledger::BalanceLedger &ledger, const ledger::EarningsRegistry &earnings,
                     std::shared_mutex &latch);

        dp::Result<Amount, dp::Error> getProviderEarnings(const Identity &caller, const std::string &provider_id) const;

        /// Per-campaign earnings of a provider, ordered by campaign id
        dp::Result<std::vector<ledger::ProviderEarnings>, dp::Error>
        getProviderEarningsBreakdown(const Identity &caller, const std::string &provider_id) const;

        dp::Result<Amount, dp::Error> getCampaignBalance(const Identity &caller, const std::string &campaign_id) const;

      private:
        const ledger::BalanceLedger &ledger_;
        const ledger::EarningsRegistry &earnings_;
        std::shared_mutex &latch_;
    };

} // namespace fundit
