#pragma once

#include <fundit/common/config.hpp>
#include <fundit/coordinator/query_service.hpp>
#include <fundit/coordinator/transfer_coordinator.hpp>
#include <fundit/ledger/ledger.hpp>
#include <fundit/rail/gateway.hpp>
#include <fundit/storage/kv_store.hpp>
#include <shared_mutex>
#include <string>
#include <vector>

namespace fundit {

    // ===========================================
    // Engine - custody and transfer coordination facade
    // ===========================================

    /// Wires the ledger components to an injected store and rail.
    /// Call load() once before use and snapshot() at shutdown or checkpoints.
    class Engine {
      public:
        Engine(storage::KvStore &store, rail::Rail &rail, FunditConfig config = FunditConfig{});

        Engine(const Engine &) = delete;
        Engine &operator=(const Engine &) = delete;

        // ===========================================
        // Lifecycle
        // ===========================================

        dp::Result<void, dp::Error> load();
        dp::Result<void, dp::Error> snapshot();

        // ===========================================
        // Record ingestion
        // ===========================================

        dp::Result<void, dp::Error> registerCampaign(const ledger::Campaign &campaign);
        dp::Result<void, dp::Error> registerProvider(const ledger::Provider &provider);

        /// Fails with busy while a transfer is in flight or a ticket is open for the record
        dp::Result<void, dp::Error> removeCampaign(const std::string &campaign_id);
        dp::Result<void, dp::Error> removeProvider(const std::string &provider_id);

        // ===========================================
        // Transfers
        // ===========================================

        void fundCampaign(const Identity &caller, const std::string &campaign_id, Amount amount,
                          Completion<BlockIndex> done);
        void withdrawCampaignFunds(const Identity &caller, const std::string &campaign_id, Amount amount,
                                   Completion<BlockIndex> done);
        void withdrawProviderEarnings(const Identity &caller, const std::string &provider_id, Amount amount,
                                      Completion<BlockIndex> done);
        void payProvider(const Identity &caller, const std::string &campaign_id, const std::string &provider_id,
                         Amount amount, Completion<PaymentReceipt> done);

        // ===========================================
        // Queries
        // ===========================================

        dp::Result<Amount, dp::Error> getProviderEarnings(const Identity &caller, const std::string &provider_id) const;
        dp::Result<std::vector<ledger::ProviderEarnings>, dp::Error>
        getProviderEarningsBreakdown(const Identity &caller, const std::string &provider_id) const;
        dp::Result<Amount, dp::Error> getCampaignBalance(const Identity &caller, const std::string &campaign_id) const;

        // ===========================================
        // Reconciliation
        // ===========================================

        dp::Result<std::vector<ledger::UnreconciledTransfer>, dp::Error>
        listUnreconciled(const Identity &operator_id) const;
        void resolveIndeterminate(const Identity &operator_id, const std::string &ticket_id, Verdict verdict,
                                  Completion<void> done);

        /// Operator set starts from FunditConfig::operators and can change at runtime
        void registerOperator(const Identity &operator_id);
        dp::Result<void, dp::Error> revokeOperator(const Identity &operator_id);
        std::vector<std::string> operators() const;

        // ===========================================
        // Introspection
        // ===========================================

        const FunditConfig &config() const { return config_; }
        const ledger::EntityLockTable &locks() const { return locks_; }
        const rail::LedgerGateway &gateway() const { return gateway_; }
        std::vector<InFlightTransfer> inFlight() const { return coordinator_.inFlight(); }

        void printSummary() const;

      private:
        FunditConfig config_;
        mutable std::shared_mutex latch_;
        ledger::BalanceLedger ledger_;
        ledger::EarningsRegistry earnings_;
        ledger::EntityLockTable locks_;
        ledger::OwnershipGuard guard_;
        rail::LedgerGateway gateway_;
        TransferCoordinator coordinator_;
        QueryService queries_;

        dp::Result<void, dp::Error> ensureRemovable(EntityKind kind, const std::string &id) const;
    };

} // namespace fundit
