#pragma once

#include <atomic>
#include <fundit/common/config.hpp>
#include <fundit/ledger/ledger.hpp>
#include <fundit/rail/gateway.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace fundit {

    /// Lifecycle of one external transfer
    enum class TransferState : dp::u8 {
        Idle = 0,
        Locked = 1,
        OptimisticMutationApplied = 2,
        AwaitingRail = 3,
        Committed = 4,
        RolledBack = 5,
        Stuck = 6,
    };

    inline std::string transferStateToString(TransferState state) {
        switch (state) {
        case TransferState::Idle:
            return "idle";
        case TransferState::Locked:
            return "locked";
        case TransferState::OptimisticMutationApplied:
            return "optimistic_mutation_applied";
        case TransferState::AwaitingRail:
            return "awaiting_rail";
        case TransferState::Committed:
            return "committed";
        case TransferState::RolledBack:
            return "rolled_back";
        case TransferState::Stuck:
            return "stuck";
        default:
            return "unknown";
        }
    }

    /// Balances after an internal payment
    struct PaymentReceipt {
        Amount campaign_budget{0};
        Amount provider_total_earnings{0};
        Amount earned_from_campaign{0}; // total_earned of the (provider, campaign) record
    };

    /// Operator finding about an unreconciled transfer, taken from the rail's own history
    struct Verdict {
        enum class Kind : dp::u8 {
            ExecutedOnRail = 0,
            NotExecutedOnRail = 1,
        };

        Kind kind{Kind::NotExecutedOnRail};
        BlockIndex block_index{0};

        static inline Verdict executedOnRail(BlockIndex block) { return Verdict{Kind::ExecutedOnRail, block}; }
        static inline Verdict notExecutedOnRail() { return Verdict{Kind::NotExecutedOnRail, 0}; }
    };

    /// Snapshot of a transfer between dispatch and resolution
    struct InFlightTransfer {
        std::string transfer_id;
        EntityKind entity_kind{EntityKind::Campaign};
        std::string entity_id;
        ledger::TransferDirection direction{ledger::TransferDirection::Incoming};
        Amount amount{0};
        TransferState state{TransferState::Idle};
    };

    // ===========================================
    // TransferCoordinator
    // ===========================================

    /// Sequences guard, lock, local mutation and rail call for external transfers, and the
    /// debit/credit/earnings unit for internal payments.
    ///
    /// Check order: record existence, ownership, amount, the entity lock, then the local balance.
    /// Outgoing transfers debit before dispatch; incoming ones credit only once confirmed.
    /// The state latch is held for every ledger access but never across the rail call.
    /// Rail replies arriving after the coordinator is destroyed are reported but not applied.
    class TransferCoordinator {
      public:
        TransferCoordinator(ledger::BalanceLedger &ledger, ledger::EarningsRegistry &earnings,
                            ledger::EntityLockTable &locks, const ledger::OwnershipGuard &guard,
                            rail::LedgerGateway &gateway, const FunditConfig &config, std::shared_mutex &latch);
        ~TransferCoordinator();

        TransferCoordinator(const TransferCoordinator &) = delete;
        TransferCoordinator &operator=(const TransferCoordinator &) = delete;

        // ===========================================
        // External transfers
        // ===========================================

        /// Owner's wallet -> custody. Credits amount - fee after the rail confirms.
        void fundCampaign(const Identity &caller, const std::string &campaign_id, Amount amount,
                          Completion<BlockIndex> done);

        /// Custody -> campaign owner's wallet
        void withdrawCampaignFunds(const Identity &caller, const std::string &campaign_id, Amount amount,
                                   Completion<BlockIndex> done);

        /// Custody -> provider owner's wallet
        void withdrawProviderEarnings(const Identity &caller, const std::string &provider_id, Amount amount,
                                      Completion<BlockIndex> done);

        // ===========================================
        // Internal transfer
        // ===========================================

        void payProvider(const Identity &caller, const std::string &campaign_id, const std::string &provider_id,
                         Amount amount, Completion<PaymentReceipt> done);

        // ===========================================
        // Reconciliation
        // ===========================================

        dp::Result<std::vector<ledger::UnreconciledTransfer>, dp::Error> listUnreconciled(
            const Identity &operator_id) const;

        /// Apply an operator verdict to a ticket and close it
        void resolveIndeterminate(const Identity &operator_id, const std::string &ticket_id, Verdict verdict,
                                  Completion<void> done);

        std::vector<InFlightTransfer> inFlight() const;

      private:
        struct Context {
            std::string transfer_id;
            EntityKind kind{EntityKind::Campaign};
            std::string entity_id;
            ledger::TransferDirection direction{ledger::TransferDirection::Incoming};
            Amount amount{0};
            rail::TransferRequest request;
            ledger::Lease lease;
            Completion<BlockIndex> done;
        };

        ledger::BalanceLedger &ledger_;
        ledger::EarningsRegistry &earnings_;
        ledger::EntityLockTable &locks_;
        const ledger::OwnershipGuard &guard_;
        rail::LedgerGateway &gateway_;
        const FunditConfig &config_;
        std::shared_mutex &latch_;

        std::map<std::string, InFlightTransfer> in_flight_;
        mutable std::mutex in_flight_mutex_;
        std::atomic<dp::u64> transfer_seq_{0};
        std::shared_ptr<int> lifetime_; // Rail callbacks hold a weak_ptr to detect a late reply

        void withdraw(EntityKind kind, const Identity &caller, const std::string &id, Amount amount,
                      Completion<BlockIndex> done);
        void resolveOutgoing(const std::shared_ptr<Context> &ctx, const rail::TransferOutcome &outcome);
        void resolveIncoming(const std::shared_ptr<Context> &ctx, const rail::TransferOutcome &outcome);
        dp::Result<BlockIndex, dp::Error> applyOutgoing(Context &ctx, const rail::TransferOutcome &outcome);
        dp::Result<BlockIndex, dp::Error> applyIncoming(Context &ctx, const rail::TransferOutcome &outcome);
        dp::Result<PaymentReceipt, dp::Error> applyPayment(const std::string &campaign_id,
                                                           const std::string &provider_id, Amount amount);
        dp::Result<void, dp::Error> applyVerdict(const ledger::UnreconciledTransfer &ticket, Verdict verdict);

        /// Completes a transfer whose reply outlived the coordinator
        static void orphaned(Context &ctx, const rail::TransferOutcome &outcome);

        /// Persist a ticket for the context; the returned error names it
        dp::Error markStuck(Context &ctx, const std::string &reason, bool rail_outcome_unknown);

        std::string nextTransferId();
        void track(const Context &ctx, TransferState state);
        void untrack(const std::string &transfer_id);

        /// Release the lease, report the result, then let parked requests re-run.
        /// Must be called without the state latch held.
        template <typename T>
        static void finish(ledger::Lease &lease, const Completion<T> &done, dp::Result<T, dp::Error> result) {
            auto waiters = lease.release();
            done(std::move(result));
            for (auto &waiter : waiters) {
                waiter();
            }
        }
    };

} // namespace fundit
