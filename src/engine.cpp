#include <fundit/engine.hpp>
#include <iostream>

namespace fundit {

    Engine::Engine(storage::KvStore &store, rail::Rail &rail, FunditConfig config)
        : config_(std::move(config)), ledger_(store), earnings_(store),
          locks_(config_.lock_policy, config_.max_queue_depth), guard_(config_.operators), gateway_(rail, config_),
          coordinator_(ledger_, earnings_, locks_, guard_, gateway_, config_, latch_),
          queries_(ledger_, earnings_, latch_) {}

    // ===========================================
    // Lifecycle
    // ===========================================

    dp::Result<void, dp::Error> Engine::load() {
        std::unique_lock<std::shared_mutex> latch(latch_);
        auto balances = ledger_.load();
        if (balances.is_err())
            return balances;
        auto earnings = earnings_.load();
        if (earnings.is_err())
            return earnings;
        std::cout << "[engine] Loaded " << ledger_.campaignCount() << " campaigns, " << ledger_.providerCount()
                  << " providers, " << earnings_.size() << " earnings records, " << ledger_.unreconciledCount()
                  << " unreconciled transfers" << std::endl;
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> Engine::snapshot() {
        std::unique_lock<std::shared_mutex> latch(latch_);
        auto balances = ledger_.snapshot();
        if (balances.is_err())
            return balances;
        return earnings_.snapshot();
    }

    // ===========================================
    // Record ingestion
    // ===========================================

    dp::Result<void, dp::Error> Engine::registerCampaign(const ledger::Campaign &campaign) {
        std::unique_lock<std::shared_mutex> latch(latch_);
        return ledger_.registerCampaign(campaign);
    }

    dp::Result<void, dp::Error> Engine::registerProvider(const ledger::Provider &provider) {
        std::unique_lock<std::shared_mutex> latch(latch_);
        return ledger_.registerProvider(provider);
    }

    dp::Result<void, dp::Error> Engine::removeCampaign(const std::string &campaign_id) {
        std::unique_lock<std::shared_mutex> latch(latch_);
        auto removable = ensureRemovable(EntityKind::Campaign, campaign_id);
        if (removable.is_err())
            return removable;
        return ledger_.removeCampaign(campaign_id);
    }

    dp::Result<void, dp::Error> Engine::removeProvider(const std::string &provider_id) {
        std::unique_lock<std::shared_mutex> latch(latch_);
        auto removable = ensureRemovable(EntityKind::Provider, provider_id);
        if (removable.is_err())
            return removable;
        return ledger_.removeProvider(provider_id);
    }

    dp::Result<void, dp::Error> Engine::ensureRemovable(EntityKind kind, const std::string &id) const {
        auto key = entityKey(kind, id);
        if (locks_.isLocked(key)) {
            return dp::Result<void, dp::Error>::err(busy(dp::String((key + " has a transfer in flight").c_str())));
        }
        for (const auto &ticket : ledger_.listUnreconciled()) {
            if (ticket.getEntityKind() == kind && ticket.getEntityId() == id) {
                return dp::Result<void, dp::Error>::err(
                    busy(dp::String((key + " has unreconciled transfer " + ticket.getTicketId()).c_str())));
            }
        }
        return dp::Result<void, dp::Error>::ok();
    }

    // ===========================================
    // Transfers
    // ===========================================

    void Engine::fundCampaign(const Identity &caller, const std::string &campaign_id, Amount amount,
                              Completion<BlockIndex> done) {
        coordinator_.fundCampaign(caller, campaign_id, amount, std::move(done));
    }

    void Engine::withdrawCampaignFunds(const Identity &caller, const std::string &campaign_id, Amount amount,
                                       Completion<BlockIndex> done) {
        coordinator_.withdrawCampaignFunds(caller, campaign_id, amount, std::move(done));
    }

    void Engine::withdrawProviderEarnings(const Identity &caller, const std::string &provider_id, Amount amount,
                                          Completion<BlockIndex> done) {
        coordinator_.withdrawProviderEarnings(caller, provider_id, amount, std::move(done));
    }

    void Engine::payProvider(const Identity &caller, const std::string &campaign_id, const std::string &provider_id,
                             Amount amount, Completion<PaymentReceipt> done) {
        coordinator_.payProvider(caller, campaign_id, provider_id, amount, std::move(done));
    }

    // ===========================================
    // Queries
    // ===========================================

    dp::Result<Amount, dp::Error> Engine::getProviderEarnings(const Identity &caller,
                                                              const std::string &provider_id) const {
        return queries_.getProviderEarnings(caller, provider_id);
    }

    dp::Result<std::vector<ledger::ProviderEarnings>, dp::Error>
    Engine::getProviderEarningsBreakdown(const Identity &caller, const std::string &provider_id) const {
        return queries_.getProviderEarningsBreakdown(caller, provider_id);
    }

    dp::Result<Amount, dp::Error> Engine::getCampaignBalance(const Identity &caller,
                                                             const std::string &campaign_id) const {
        return queries_.getCampaignBalance(caller, campaign_id);
    }

    // ===========================================
    // Reconciliation
    // ===========================================

    dp::Result<std::vector<ledger::UnreconciledTransfer>, dp::Error>
    Engine::listUnreconciled(const Identity &operator_id) const {
        return coordinator_.listUnreconciled(operator_id);
    }

    void Engine::resolveIndeterminate(const Identity &operator_id, const std::string &ticket_id, Verdict verdict,
                                      Completion<void> done) {
        coordinator_.resolveIndeterminate(operator_id, ticket_id, verdict, std::move(done));
    }

    void Engine::registerOperator(const Identity &operator_id) {
        std::unique_lock<std::shared_mutex> latch(latch_);
        guard_.registerOperator(operator_id);
    }

    dp::Result<void, dp::Error> Engine::revokeOperator(const Identity &operator_id) {
        std::unique_lock<std::shared_mutex> latch(latch_);
        return guard_.revokeOperator(operator_id);
    }

    std::vector<std::string> Engine::operators() const {
        std::shared_lock<std::shared_mutex> latch(latch_);
        return guard_.getOperators();
    }

    void Engine::printSummary() const {
        std::shared_lock<std::shared_mutex> latch(latch_);
        std::cout << "=== Fundit Engine Summary ===" << std::endl;
        std::cout << "Transfer fee: " << config_.transfer_fee << std::endl;
        std::cout << "Custody account: " << config_.custody_account.toString() << std::endl;
        std::cout << "Lock policy: " << (config_.lock_policy == LockPolicy::Reject ? "reject" : "queue") << std::endl;
        ledger_.printSummary();
        std::cout << "Earnings records: " << earnings_.size() << std::endl;

        auto locked = locks_.lockedKeys();
        std::cout << "Locked entities (" << locked.size() << "):";
        for (const auto &key : locked) {
            std::cout << " " << key;
        }
        std::cout << std::endl;

        for (const auto &transfer : coordinator_.inFlight()) {
            std::cout << "  in flight: " << transfer.transfer_id << " "
                      << entityKey(transfer.entity_kind, transfer.entity_id) << " "
                      << transferStateToString(transfer.state) << std::endl;
        }
        std::cout << "Rail dispatches: " << gateway_.dispatchedCount()
                  << ", duplicate replies ignored: " << gateway_.duplicateReplyCount() << std::endl;
        guard_.printSummary();
    }

} // namespace fundit
