#include <fundit/coordinator/transfer_coordinator.hpp>
#include <iostream>

namespace fundit {

    namespace {

        using Latch = std::unique_lock<std::shared_mutex>;

        /// Report a failure detected before anything was locked or mutated
        template <typename T> void fail(Latch &latch, const Completion<T> &done, const dp::Error &error) {
            latch.unlock();
            done(dp::Result<T, dp::Error>::err(error));
        }

        dp::String text(const std::string &s) { return dp::String(s.c_str()); }

        std::string message(const dp::Error &error) { return std::string(error.message.c_str()); }

    } // namespace

    TransferCoordinator::TransferCoordinator(ledger::BalanceLedger &ledger, ledger::EarningsRegistry &earnings,
                                             ledger::EntityLockTable &locks, const ledger::OwnershipGuard &guard,
                                             rail::LedgerGateway &gateway, const FunditConfig &config,
                                             std::shared_mutex &latch)
        : ledger_(ledger), earnings_(earnings), locks_(locks), guard_(guard), gateway_(gateway), config_(config),
          latch_(latch), lifetime_(std::make_shared<int>(0)) {}

    TransferCoordinator::~TransferCoordinator() {
        auto pending = inFlight();
        if (!pending.empty()) {
            std::cerr << "[coordinator] Shutting down with " << pending.size()
                      << " transfer(s) awaiting the rail; late replies will not be applied" << std::endl;
        }
    }

    // ===========================================
    // Funding (incoming)
    // ===========================================

    void TransferCoordinator::fundCampaign(const Identity &caller, const std::string &campaign_id, Amount amount,
                                           Completion<BlockIndex> done) {
        Latch latch(latch_);

        auto owner = ledger_.ownerOf(EntityKind::Campaign, campaign_id);
        if (owner.is_err()) {
            fail(latch, done, owner.error());
            return;
        }
        auto authorized = ledger::OwnershipGuard::requireOwner(owner.value(), caller);
        if (authorized.is_err()) {
            fail(latch, done, authorized.error());
            return;
        }
        if (amount <= config_.transfer_fee) {
            fail(latch, done, invalid_amount(text("Amount must exceed the transfer fee of " +
                                                  std::to_string(config_.transfer_fee))));
            return;
        }

        auto ctx = std::make_shared<Context>();
        auto retry = [this, caller, campaign_id, amount, done]() { fundCampaign(caller, campaign_id, amount, done); };
        auto status = locks_.acquire(entityKey(EntityKind::Campaign, campaign_id), retry, ctx->lease);
        if (status == ledger::AcquireStatus::Busy) {
            fail(latch, done, busy(text("Campaign " + campaign_id + " has a transfer in flight")));
            return;
        }
        if (status == ledger::AcquireStatus::Queued) {
            std::cout << "[coordinator] Funding of " << campaign_id << " queued" << std::endl;
            return;
        }

        if (!ledger_.canCredit(EntityKind::Campaign, campaign_id, amount - config_.transfer_fee)) {
            latch.unlock();
            finish(ctx->lease, done,
                   dp::Result<BlockIndex, dp::Error>::err(invalid_amount("Funding would overflow the campaign budget")));
            return;
        }

        ctx->transfer_id = nextTransferId();
        ctx->kind = EntityKind::Campaign;
        ctx->entity_id = campaign_id;
        ctx->direction = ledger::TransferDirection::Incoming;
        ctx->amount = amount;
        ctx->done = std::move(done);
        track(*ctx, TransferState::Locked);

        // Nothing to apply yet: the credit waits for confirmation
        ctx->request =
            gateway_.makeRequest(Account(caller), config_.custody_account, amount, "Fund campaign: " + campaign_id);
        track(*ctx, TransferState::AwaitingRail);
        latch.unlock();

        std::weak_ptr<int> alive = lifetime_;
        gateway_.transfer(ctx->request, [this, alive, ctx](rail::TransferOutcome outcome) {
            if (alive.expired()) {
                orphaned(*ctx, outcome);
                return;
            }
            resolveIncoming(ctx, outcome);
        });
    }

    void TransferCoordinator::resolveIncoming(const std::shared_ptr<Context> &ctx,
                                              const rail::TransferOutcome &outcome) {
        Latch latch(latch_);
        auto result = applyIncoming(*ctx, outcome);
        untrack(ctx->transfer_id);
        latch.unlock();
        finish(ctx->lease, ctx->done, std::move(result));
    }

    dp::Result<BlockIndex, dp::Error> TransferCoordinator::applyIncoming(Context &ctx,
                                                                         const rail::TransferOutcome &outcome) {
        switch (outcome.kind) {
        case rail::TransferOutcome::Kind::Confirmed: {
            auto credited = ledger_.credit(ctx.kind, ctx.entity_id, ctx.amount - ctx.request.fee);
            if (credited.is_err()) {
                // The money arrived on the rail; the ticket carries the credit forward
                return dp::Result<BlockIndex, dp::Error>::err(
                    markStuck(ctx, "credit not persisted: " + message(credited.error()), false));
            }
            track(ctx, TransferState::Committed);
            std::cout << "[coordinator] " << ctx.transfer_id << " funded " << ctx.entity_id << " at block "
                      << outcome.block_index << std::endl;
            return dp::Result<BlockIndex, dp::Error>::ok(outcome.block_index);
        }
        case rail::TransferOutcome::Kind::Rejected:
            track(ctx, TransferState::RolledBack);
            std::cout << "[coordinator] " << ctx.transfer_id << " rejected: " << outcome.reason << std::endl;
            return dp::Result<BlockIndex, dp::Error>::err(transfer_rejected(text(outcome.reason)));
        default:
            return dp::Result<BlockIndex, dp::Error>::err(markStuck(ctx, outcome.reason, true));
        }
    }

    // ===========================================
    // Withdrawals (outgoing)
    // ===========================================

    void TransferCoordinator::withdrawCampaignFunds(const Identity &caller, const std::string &campaign_id,
                                                    Amount amount, Completion<BlockIndex> done) {
        withdraw(EntityKind::Campaign, caller, campaign_id, amount, std::move(done));
    }

    void TransferCoordinator::withdrawProviderEarnings(const Identity &caller, const std::string &provider_id,
                                                       Amount amount, Completion<BlockIndex> done) {
        withdraw(EntityKind::Provider, caller, provider_id, amount, std::move(done));
    }

    void TransferCoordinator::withdraw(EntityKind kind, const Identity &caller, const std::string &id, Amount amount,
                                       Completion<BlockIndex> done) {
        Latch latch(latch_);

        auto owner = ledger_.ownerOf(kind, id);
        if (owner.is_err()) {
            fail(latch, done, owner.error());
            return;
        }
        auto authorized = ledger::OwnershipGuard::requireOwner(owner.value(), caller);
        if (authorized.is_err()) {
            fail(latch, done, authorized.error());
            return;
        }
        if (amount <= config_.transfer_fee) {
            fail(latch, done, invalid_amount(text("Amount must exceed the transfer fee of " +
                                                  std::to_string(config_.transfer_fee))));
            return;
        }

        auto ctx = std::make_shared<Context>();
        auto retry = [this, kind, caller, id, amount, done]() { withdraw(kind, caller, id, amount, done); };
        auto status = locks_.acquire(entityKey(kind, id), retry, ctx->lease);
        if (status == ledger::AcquireStatus::Busy) {
            fail(latch, done, busy(text(entityKey(kind, id) + " has a transfer in flight")));
            return;
        }
        if (status == ledger::AcquireStatus::Queued) {
            std::cout << "[coordinator] Withdrawal from " << entityKey(kind, id) << " queued" << std::endl;
            return;
        }

        // Judged only once no other transfer can still move this balance
        auto balance = ledger_.balanceOf(kind, id);
        if (balance.is_err() || balance.value() < amount) {
            auto error = balance.is_err()
                             ? balance.error()
                             : insufficient_funds(text("Balance of " + entityKey(kind, id) + " is " +
                                                       std::to_string(balance.value()) + ", requested " +
                                                       std::to_string(amount)));
            latch.unlock();
            finish(ctx->lease, done, dp::Result<BlockIndex, dp::Error>::err(error));
            return;
        }

        ctx->transfer_id = nextTransferId();
        ctx->kind = kind;
        ctx->entity_id = id;
        ctx->direction = ledger::TransferDirection::Outgoing;
        ctx->amount = amount;
        ctx->done = std::move(done);
        track(*ctx, TransferState::Locked);

        auto debited = ledger_.debit(kind, id, amount);
        if (debited.is_err()) {
            untrack(ctx->transfer_id);
            latch.unlock();
            finish(ctx->lease, ctx->done, dp::Result<BlockIndex, dp::Error>::err(debited.error()));
            return;
        }
        track(*ctx, TransferState::OptimisticMutationApplied);

        std::string memo = (kind == EntityKind::Campaign ? "Campaign withdrawal: " : "Provider withdrawal: ") + id;
        ctx->request = gateway_.makeRequest(config_.custody_account, Account(owner.value()), amount, memo);
        track(*ctx, TransferState::AwaitingRail);
        latch.unlock();

        std::weak_ptr<int> alive = lifetime_;
        gateway_.transfer(ctx->request, [this, alive, ctx](rail::TransferOutcome outcome) {
            if (alive.expired()) {
                orphaned(*ctx, outcome);
                return;
            }
            resolveOutgoing(ctx, outcome);
        });
    }

    void TransferCoordinator::resolveOutgoing(const std::shared_ptr<Context> &ctx,
                                              const rail::TransferOutcome &outcome) {
        Latch latch(latch_);
        auto result = applyOutgoing(*ctx, outcome);
        untrack(ctx->transfer_id);
        latch.unlock();
        finish(ctx->lease, ctx->done, std::move(result));
    }

    dp::Result<BlockIndex, dp::Error> TransferCoordinator::applyOutgoing(Context &ctx,
                                                                         const rail::TransferOutcome &outcome) {
        switch (outcome.kind) {
        case rail::TransferOutcome::Kind::Confirmed: {
            track(ctx, TransferState::Committed);
            if (ctx.kind == EntityKind::Provider) {
                auto stamped = earnings_.stampWithdrawal(ctx.entity_id, nowMillis());
                if (stamped.is_err()) {
                    // The withdrawal itself stands; only the audit timestamp is missing
                    std::cerr << "[coordinator] " << ctx.transfer_id << " could not stamp last_withdrawal: "
                              << stamped.error().message.c_str() << std::endl;
                }
            }
            std::cout << "[coordinator] " << ctx.transfer_id << " withdrew " << ctx.amount << " from "
                      << entityKey(ctx.kind, ctx.entity_id) << " at block " << outcome.block_index << std::endl;
            return dp::Result<BlockIndex, dp::Error>::ok(outcome.block_index);
        }
        case rail::TransferOutcome::Kind::Rejected: {
            auto restored = ledger_.credit(ctx.kind, ctx.entity_id, ctx.amount);
            if (restored.is_err()) {
                return dp::Result<BlockIndex, dp::Error>::err(markStuck(
                    ctx, "rejected (" + outcome.reason + ") but rollback failed: " + message(restored.error()),
                    false));
            }
            track(ctx, TransferState::RolledBack);
            std::cout << "[coordinator] " << ctx.transfer_id << " rejected, debit rolled back: " << outcome.reason
                      << std::endl;
            return dp::Result<BlockIndex, dp::Error>::err(transfer_rejected(text(outcome.reason)));
        }
        default:
            return dp::Result<BlockIndex, dp::Error>::err(markStuck(ctx, outcome.reason, true));
        }
    }

    // ===========================================
    // Internal payment
    // ===========================================

    void TransferCoordinator::payProvider(const Identity &caller, const std::string &campaign_id,
                                          const std::string &provider_id, Amount amount,
                                          Completion<PaymentReceipt> done) {
        Latch latch(latch_);

        // Ownership of the campaign is settled before anything about the provider is revealed
        auto owner = ledger_.ownerOf(EntityKind::Campaign, campaign_id);
        if (owner.is_err()) {
            fail(latch, done, owner.error());
            return;
        }
        auto authorized = ledger::OwnershipGuard::requireOwner(owner.value(), caller);
        if (authorized.is_err()) {
            fail(latch, done, authorized.error());
            return;
        }
        if (amount == 0) {
            fail(latch, done, invalid_amount("Payment amount must be positive"));
            return;
        }
        if (!ledger_.hasProvider(provider_id)) {
            fail(latch, done, not_found(text("Unknown provider: " + provider_id)));
            return;
        }

        ledger::Lease lease;
        auto retry = [this, caller, campaign_id, provider_id, amount, done]() {
            payProvider(caller, campaign_id, provider_id, amount, done);
        };
        std::vector<std::string> keys{entityKey(EntityKind::Campaign, campaign_id),
                                      entityKey(EntityKind::Provider, provider_id)};
        auto status = locks_.acquire(keys, retry, lease);
        if (status == ledger::AcquireStatus::Busy) {
            fail(latch, done, busy("Campaign or provider has a transfer in flight"));
            return;
        }
        if (status == ledger::AcquireStatus::Queued) {
            std::cout << "[coordinator] Payment " << campaign_id << " -> " << provider_id << " queued" << std::endl;
            return;
        }

        auto receipt = applyPayment(campaign_id, provider_id, amount);
        latch.unlock();
        finish(lease, done, std::move(receipt));
    }

    dp::Result<PaymentReceipt, dp::Error> TransferCoordinator::applyPayment(const std::string &campaign_id,
                                                                            const std::string &provider_id,
                                                                            Amount amount) {
        using PaymentResult = dp::Result<PaymentReceipt, dp::Error>;

        auto budget = ledger_.balanceOf(EntityKind::Campaign, campaign_id);
        if (budget.is_err())
            return PaymentResult::err(budget.error());
        if (budget.value() < amount) {
            return PaymentResult::err(insufficient_funds(text("Campaign " + campaign_id + " budget is " +
                                                              std::to_string(budget.value()) + ", requested " +
                                                              std::to_string(amount))));
        }
        if (!ledger_.canCredit(EntityKind::Provider, provider_id, amount))
            return PaymentResult::err(invalid_amount("Payment would overflow the provider earnings"));

        auto undoDebit = [&]() {
            auto undone = ledger_.credit(EntityKind::Campaign, campaign_id, amount);
            if (undone.is_err()) {
                std::cerr << "[coordinator] Compensation failed, campaign " << campaign_id << " is short by "
                          << amount << ": " << undone.error().message.c_str() << std::endl;
            }
        };

        auto debited = ledger_.debit(EntityKind::Campaign, campaign_id, amount);
        if (debited.is_err()) {
            return PaymentResult::err(asStorageError(debited.error()));
        }

        auto recorded = earnings_.record(provider_id, campaign_id, amount);
        if (recorded.is_err()) {
            undoDebit();
            return PaymentResult::err(storage_failure(text("Payment aborted: " + message(recorded.error()))));
        }

        auto credited = ledger_.credit(EntityKind::Provider, provider_id, amount);
        if (credited.is_err()) {
            auto restored = earnings_.restore(recorded.value());
            if (restored.is_err()) {
                std::cerr << "[coordinator] Compensation failed, earnings " << provider_id << ":" << campaign_id
                          << " overstated by " << amount << ": " << restored.error().message.c_str() << std::endl;
            }
            undoDebit();
            return PaymentResult::err(storage_failure(text("Payment aborted: " + message(credited.error()))));
        }

        PaymentReceipt receipt;
        receipt.campaign_budget = debited.value();
        receipt.provider_total_earnings = credited.value();
        auto earned = earnings_.get(provider_id, campaign_id);
        receipt.earned_from_campaign = earned.has_value() ? (*earned).total_earned : amount;

        std::cout << "[coordinator] Paid " << amount << " from " << campaign_id << " to " << provider_id << std::endl;
        return PaymentResult::ok(receipt);
    }

    // ===========================================
    // Reconciliation
    // ===========================================

    dp::Result<std::vector<ledger::UnreconciledTransfer>, dp::Error>
    TransferCoordinator::listUnreconciled(const Identity &operator_id) const {
        using ListResult = dp::Result<std::vector<ledger::UnreconciledTransfer>, dp::Error>;
        std::shared_lock<std::shared_mutex> latch(latch_);
        auto authorized = guard_.requireOperator(operator_id);
        if (authorized.is_err())
            return ListResult::err(authorized.error());

        return ListResult::ok(ledger_.listUnreconciled());
    }

    void TransferCoordinator::resolveIndeterminate(const Identity &operator_id, const std::string &ticket_id,
                                                   Verdict verdict, Completion<void> done) {
        Latch latch(latch_);

        auto authorized = guard_.requireOperator(operator_id);
        if (authorized.is_err()) {
            fail(latch, done, authorized.error());
            return;
        }
        auto ticket = ledger_.getUnreconciled(ticket_id);
        if (ticket.is_err()) {
            fail(latch, done, ticket.error());
            return;
        }

        const auto &record = ticket.value();
        ledger::Lease lease;
        auto retry = [this, operator_id, ticket_id, verdict, done]() {
            resolveIndeterminate(operator_id, ticket_id, verdict, done);
        };
        auto key = entityKey(record.getEntityKind(), record.getEntityId());
        auto status = locks_.acquire(key, retry, lease);
        if (status == ledger::AcquireStatus::Busy) {
            fail(latch, done, busy(text(key + " has a transfer in flight")));
            return;
        }
        if (status == ledger::AcquireStatus::Queued) {
            return;
        }

        auto applied = applyVerdict(record, verdict);
        latch.unlock();
        finish(lease, done, std::move(applied));
    }

    dp::Result<void, dp::Error> TransferCoordinator::applyVerdict(const ledger::UnreconciledTransfer &ticket,
                                                                  Verdict verdict) {
        bool executed = verdict.kind == Verdict::Kind::ExecutedOnRail;
        Amount credit = 0;
        if (ticket.getDirection() == ledger::TransferDirection::Outgoing && !executed) {
            credit = ticket.amount;
        } else if (ticket.getDirection() == ledger::TransferDirection::Incoming && executed) {
            credit = ticket.netAmount();
        }

        if (credit > 0) {
            auto credited = ledger_.credit(ticket.getEntityKind(), ticket.getEntityId(), credit);
            if (credited.is_err())
                return dp::Result<void, dp::Error>::err(credited.error());
        }

        auto cleared = ledger_.clearUnreconciled(ticket.getTicketId());
        if (cleared.is_err()) {
            if (credit > 0) {
                auto undone = ledger_.debit(ticket.getEntityKind(), ticket.getEntityId(), credit);
                if (undone.is_err()) {
                    std::cerr << "[coordinator] Ticket " << ticket.getTicketId()
                              << " credited but neither cleared nor undone" << std::endl;
                }
            }
            return cleared;
        }

        if (executed && ticket.getDirection() == ledger::TransferDirection::Outgoing &&
            ticket.getEntityKind() == EntityKind::Provider) {
            auto stamped = earnings_.stampWithdrawal(ticket.getEntityId(), nowMillis());
            if (stamped.is_err()) {
                std::cerr << "[coordinator] Ticket " << ticket.getTicketId() << " could not stamp last_withdrawal: "
                          << stamped.error().message.c_str() << std::endl;
            }
        }

        std::cout << "[coordinator] Ticket " << ticket.getTicketId() << " resolved as "
                  << (executed ? "executed at block " + std::to_string(verdict.block_index) : "not executed")
                  << ", credited " << credit << std::endl;
        return dp::Result<void, dp::Error>::ok();
    }

    void TransferCoordinator::orphaned(Context &ctx, const rail::TransferOutcome &outcome) {
        // The lock table and ledger went away with the engine
        ctx.lease.abandon();
        std::cerr << "[coordinator] " << ctx.transfer_id << " on " << entityKey(ctx.kind, ctx.entity_id)
                  << " resolved after shutdown, nothing recorded: " << outcome.reason << std::endl;
        ctx.done(dp::Result<BlockIndex, dp::Error>::err(
            transfer_indeterminate(text("Engine stopped before transfer " + ctx.transfer_id + " was resolved"))));
    }

    dp::Error TransferCoordinator::markStuck(Context &ctx, const std::string &reason, bool rail_outcome_unknown) {
        track(ctx, TransferState::Stuck);

        ledger::UnreconciledTransfer ticket;
        ticket.ticket_id = text(ctx.transfer_id);
        ticket.entity_kind = static_cast<dp::u8>(ctx.kind);
        ticket.entity_id = text(ctx.entity_id);
        ticket.direction = static_cast<dp::u8>(ctx.direction);
        ticket.amount = ctx.amount;
        ticket.fee = ctx.request.fee;
        if (ctx.request.memo.has_value())
            ticket.memo = *ctx.request.memo;
        ticket.created_at_time = ctx.request.created_at_time.has_value() ? *ctx.request.created_at_time : 0;
        ticket.reason = text(reason);
        ticket.recorded_at = nowMillis();

        std::string summary = "reconcile ticket " + ctx.transfer_id + ": " + reason;
        auto saved = ledger_.recordUnreconciled(ticket);
        if (saved.is_err()) {
            summary += " (ticket not persisted: " + message(saved.error()) + ")";
        }
        std::cerr << "[coordinator] " << ctx.transfer_id << " stuck on " << entityKey(ctx.kind, ctx.entity_id) << ", "
                  << summary << std::endl;

        if (rail_outcome_unknown)
            return transfer_indeterminate(text("Transfer outcome unknown, " + summary));
        return storage_failure(text("Local update not persisted, " + summary));
    }

    // ===========================================
    // Bookkeeping
    // ===========================================

    std::vector<InFlightTransfer> TransferCoordinator::inFlight() const {
        std::lock_guard<std::mutex> lock(in_flight_mutex_);
        std::vector<InFlightTransfer> result;
        for (const auto &[id, transfer] : in_flight_)
            result.push_back(transfer);
        return result;
    }

    std::string TransferCoordinator::nextTransferId() {
        return "transfer_" + std::to_string(nowNanos()) + "_" + std::to_string(transfer_seq_.fetch_add(1));
    }

    void TransferCoordinator::track(const Context &ctx, TransferState state) {
        std::lock_guard<std::mutex> lock(in_flight_mutex_);
        in_flight_[ctx.transfer_id] = InFlightTransfer{ctx.transfer_id, ctx.kind,   ctx.entity_id,
                                                       ctx.direction,   ctx.amount, state};
    }

    void TransferCoordinator::untrack(const std::string &transfer_id) {
        std::lock_guard<std::mutex> lock(in_flight_mutex_);
        in_flight_.erase(transfer_id);
    }

} // namespace fundit
