#include <fundit/coordinator/query_service.hpp>

namespace fundit {

    QueryService::QueryService(const ledger::BalanceLedger &ledger, const ledger::EarningsRegistry &earnings,
                               std::shared_mutex &latch)
        : ledger_(ledger), earnings_(earnings), latch_(latch) {}

    dp::Result<Amount, dp::Error> QueryService::getProviderEarnings(const Identity &caller,
                                                                    const std::string &provider_id) const {
        std::shared_lock<std::shared_mutex> latch(latch_);
        auto provider = ledger_.getProvider(provider_id);
        if (provider.is_err())
            return dp::Result<Amount, dp::Error>::err(provider.error());

        auto authorized = ledger::OwnershipGuard::requireOwner(provider.value().getOwner(), caller);
        if (authorized.is_err())
            return dp::Result<Amount, dp::Error>::err(authorized.error());

        return dp::Result<Amount, dp::Error>::ok(provider.value().total_earnings);
    }

    dp::Result<std::vector<ledger::ProviderEarnings>, dp::Error>
    QueryService::getProviderEarningsBreakdown(const Identity &caller, const std::string &provider_id) const {
        using BreakdownResult = dp::Result<std::vector<ledger::ProviderEarnings>, dp::Error>;
        std::shared_lock<std::shared_mutex> latch(latch_);
        auto owner = ledger_.ownerOf(EntityKind::Provider, provider_id);
        if (owner.is_err())
            return BreakdownResult::err(owner.error());

        auto authorized = ledger::OwnershipGuard::requireOwner(owner.value(), caller);
        if (authorized.is_err())
            return BreakdownResult::err(authorized.error());

        return BreakdownResult::ok(earnings_.breakdown(provider_id));
    }

    dp::Result<Amount, dp::Error> QueryService::getCampaignBalance(const Identity &caller,
                                                                   const std::string &campaign_id) const {
        std::shared_lock<std::shared_mutex> latch(latch_);
        auto campaign = ledger_.getCampaign(campaign_id);
        if (campaign.is_err())
            return dp::Result<Amount, dp::Error>::err(campaign.error());

        auto authorized = ledger::OwnershipGuard::requireOwner(campaign.value().getOwner(), caller);
        if (authorized.is_err())
            return dp::Result<Amount, dp::Error>::err(authorized.error());

        return dp::Result<Amount, dp::Error>::ok(campaign.value().budget);
    }

} // namespace fundit
