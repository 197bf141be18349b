#pragma once

#include <deque>
#include <fundit/rail/rail.hpp>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace fundit::rail {

    // ===========================================
    // SimulatedRail - in-process ledger with the rail's contract
    // ===========================================

    /// Keeps account balances, enforces the fixed fee, the created_at_time window and
    /// de-duplication, and hands out monotonically increasing block indices.
    /// Replies can be deferred and settled later, and transport failures can be scripted.
    class SimulatedRail : public Rail {
      public:
        static constexpr dp::u64 DEDUP_WINDOW_NANOS = 24ull * 60 * 60 * 1000000000ull;
        static constexpr dp::u64 PERMITTED_DRIFT_NANOS = 60ull * 1000000000ull;

        /// A scripted transport failure for the next settled request
        struct ScriptedFailure {
            TransportStatus status{TransportStatus::Timeout};
            bool executed{false}; // Whether the transfer lands before the transport fails
            std::string detail;
        };

        explicit SimulatedRail(Amount fee = 10000) : fee_(fee) {}

        // ===========================================
        // Accounts
        // ===========================================

        inline void mint(const Account &account, Amount amount) {
            std::lock_guard<std::mutex> lock(mutex_);
            balances_[account.toString()] += amount;
        }

        inline Amount balanceOf(const Account &account) const {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = balances_.find(account.toString());
            return it == balances_.end() ? 0 : it->second;
        }

        /// Total fees burned by executed transfers
        inline Amount burned() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return burned_;
        }

        // ===========================================
        // Scripting
        // ===========================================

        /// Hold replies until settleNext()/settleAll()
        inline void setDeferred(bool deferred) {
            std::lock_guard<std::mutex> lock(mutex_);
            deferred_ = deferred;
        }

        inline void failNext(TransportStatus status, bool executed = false, const std::string &detail = "") {
            std::lock_guard<std::mutex> lock(mutex_);
            failures_.push_back(ScriptedFailure{status, executed, detail});
        }

        inline void rejectNext(RejectCode code, dp::u64 detail = 0, const std::string &message = "") {
            std::lock_guard<std::mutex> lock(mutex_);
            rejections_.push_back(RejectReason{code, detail, message});
        }

        /// Deliver every reply twice (misbehaving transport)
        inline void setReplyTwice(bool twice) {
            std::lock_guard<std::mutex> lock(mutex_);
            reply_twice_ = twice;
        }

        /// Pin the rail clock, 0 follows the system clock
        inline void setLedgerTime(dp::u64 nanos) {
            std::lock_guard<std::mutex> lock(mutex_);
            ledger_time_ = nanos;
        }

        // ===========================================
        // Rail
        // ===========================================

        inline void submit(const TransferRequest &request, ReplyHandler on_reply) override {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++submitted_;
                if (deferred_) {
                    pending_.push_back(Pending{request, std::move(on_reply)});
                    return;
                }
            }
            settle(Pending{request, std::move(on_reply)});
        }

        /// Process the oldest deferred request
        /// @return false when nothing was pending
        inline bool settleNext() {
            Pending next;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (pending_.empty())
                    return false;
                next = std::move(pending_.front());
                pending_.pop_front();
            }
            settle(std::move(next));
            return true;
        }

        /// Process deferred requests until none are left, including ones submitted while settling
        inline dp::usize settleAll() {
            dp::usize settled = 0;
            while (settleNext())
                ++settled;
            return settled;
        }

        inline dp::usize pendingCount() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return pending_.size();
        }

        inline dp::usize submittedCount() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return submitted_;
        }

        /// Executed transfers in block order
        inline std::vector<TransferRequest> blocks() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return blocks_;
        }

        inline dp::usize blockCount() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return blocks_.size();
        }

      private:
        struct Pending {
            TransferRequest request;
            ReplyHandler on_reply;
        };

        Amount fee_;
        bool deferred_{false};
        bool reply_twice_{false};
        dp::u64 ledger_time_{0};
        dp::usize submitted_{0};
        Amount burned_{0};
        std::unordered_map<std::string, Amount> balances_;
        std::map<std::string, BlockIndex> seen_;
        std::vector<TransferRequest> blocks_;
        std::deque<Pending> pending_;
        std::deque<ScriptedFailure> failures_;
        std::deque<RejectReason> rejections_;
        mutable std::mutex mutex_;

        inline void settle(Pending pending) {
            RailReply reply;
            bool twice;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                reply = process(pending.request);
                twice = reply_twice_;
            }
            pending.on_reply(reply);
            if (twice)
                pending.on_reply(reply);
        }

        /// Caller holds mutex_
        inline RailReply process(const TransferRequest &request) {
            if (!failures_.empty()) {
                auto failure = failures_.front();
                failures_.pop_front();
                if (failure.executed) {
                    auto landed = execute(request);
                    if (landed.error.has_value())
                        return landed;
                }
                return RailReply::transportFailure(failure.status, failure.detail);
            }
            return execute(request);
        }

        /// Caller holds mutex_
        inline RailReply execute(const TransferRequest &request) {
            if (!rejections_.empty()) {
                auto reason = rejections_.front();
                rejections_.pop_front();
                return RailReply::rejected(reason);
            }

            if (request.fee != fee_)
                return RailReply::rejected(RejectReason{RejectCode::BadFee, fee_, ""});

            dp::u64 now = ledger_time_ != 0 ? ledger_time_ : nowNanos();
            std::string dedup_key;
            if (request.created_at_time.has_value()) {
                auto created = *request.created_at_time;
                if (created + DEDUP_WINDOW_NANOS + PERMITTED_DRIFT_NANOS < now)
                    return RailReply::rejected(RejectReason{RejectCode::TooOld, 0, ""});
                if (created > now + PERMITTED_DRIFT_NANOS)
                    return RailReply::rejected(RejectReason{RejectCode::CreatedInFuture, now, ""});

                dedup_key = fingerprint(request);
                auto seen = seen_.find(dedup_key);
                if (seen != seen_.end())
                    return RailReply::rejected(RejectReason{RejectCode::Duplicate, seen->second, ""});
            }

            auto source = request.source.toString();
            Amount available = balances_.count(source) ? balances_[source] : 0;
            if (available < request.amount)
                return RailReply::rejected(RejectReason{RejectCode::InsufficientFunds, available, ""});
            if (request.amount < request.fee)
                return RailReply::rejected(RejectReason{RejectCode::BadBurn, request.fee, "amount below fee"});

            balances_[source] -= request.amount;
            balances_[request.destination.toString()] += request.amount - request.fee;
            burned_ += request.fee;

            BlockIndex block = blocks_.size();
            blocks_.push_back(request);
            if (!dedup_key.empty())
                seen_[dedup_key] = block;
            return RailReply::ok(block);
        }

        static inline std::string fingerprint(const TransferRequest &request) {
            std::string key = request.source.toString() + "|" + request.destination.toString() + "|" +
                              std::to_string(request.amount) + "|" + std::to_string(request.fee) + "|" +
                              std::to_string(*request.created_at_time) + "|";
            if (request.memo.has_value()) {
                for (auto byte : *request.memo)
                    key += std::to_string(byte) + ",";
            }
            return key;
        }
    };

} // namespace fundit::rail
