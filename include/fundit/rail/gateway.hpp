#pragma once

#include <atomic>
#include <fundit/common/config.hpp>
#include <fundit/rail/rail.hpp>
#include <functional>
#include <memory>
#include <string>

namespace fundit::rail {

    using OutcomeHandler = std::function<void(TransferOutcome)>;

    // ===========================================
    // LedgerGateway - typed adapter over the rail
    // ===========================================

    /// Builds rail requests and classifies every reply into exactly one TransferOutcome.
    /// A transport failure after dispatch is always Indeterminate, never Rejected.
    class LedgerGateway {
      public:
        LedgerGateway(Rail &rail, const FunditConfig &config);

        /// Request carrying the configured fee, an encoded memo and a fresh created_at_time
        TransferRequest makeRequest(const Account &source, const Account &destination, Amount amount,
                                    const std::string &memo);

        /// Dispatch to the rail. on_outcome is called exactly once, possibly before this returns.
        /// A rail that discards the request without replying yields Indeterminate.
        void transfer(const TransferRequest &request, OutcomeHandler on_outcome);

        /// Map a raw rail reply onto Confirmed, Rejected or Indeterminate
        static TransferOutcome classify(const RailReply &reply);

        /// Memo bytes, replaced by their SHA-256 digest when longer than the rail allows
        dp::Vector<dp::u8> encodeMemo(const std::string &memo) const;

        Amount fee() const { return fee_; }
        dp::u64 dispatchedCount() const { return dispatched_.load(); }
        dp::u64 duplicateReplyCount() const { return duplicate_replies_->load(); }

      private:
        Rail &rail_;
        Amount fee_;
        dp::usize max_memo_bytes_;
        bool stamp_created_at_time_;
        std::atomic<dp::u64> dispatched_{0};
        std::shared_ptr<std::atomic<dp::u64>> duplicate_replies_;
        std::atomic<dp::u64> last_created_at_{0};

        dp::u64 nextCreatedAt();
    };

} // namespace fundit::rail
