#include <fundit/rail/gateway.hpp>
#include <iostream>
#include <keylock/keylock.hpp>
#include <memory>

namespace fundit::rail {

    namespace {

        /// Owns the outcome handler of one dispatched request. Delivers at most once, and
        /// delivers Indeterminate if the rail lets go of the request without replying.
        class ReplyGuard {
          public:
            ReplyGuard(OutcomeHandler handler, std::shared_ptr<std::atomic<dp::u64>> duplicates)
                : handler_(std::move(handler)), duplicates_(std::move(duplicates)) {}

            ~ReplyGuard() {
                if (delivered_.load())
                    return;
                std::cerr << "[gateway] Rail dropped a request without replying" << std::endl;
                try {
                    deliver(TransferOutcome::indeterminate("rail dropped reply"));
                } catch (const std::exception &e) {
                    std::cerr << "[gateway] Outcome handler failed: " << e.what() << std::endl;
                }
            }

            ReplyGuard(const ReplyGuard &) = delete;
            ReplyGuard &operator=(const ReplyGuard &) = delete;

            void deliver(const TransferOutcome &outcome) {
                if (delivered_.exchange(true)) {
                    duplicates_->fetch_add(1);
                    std::cerr << "[gateway] Ignoring duplicate rail reply" << std::endl;
                    return;
                }
                handler_(outcome);
            }

            bool delivered() const { return delivered_.load(); }

          private:
            OutcomeHandler handler_;
            std::shared_ptr<std::atomic<dp::u64>> duplicates_;
            std::atomic<bool> delivered_{false};
        };

    } // namespace

    LedgerGateway::LedgerGateway(Rail &rail, const FunditConfig &config)
        : rail_(rail), fee_(config.transfer_fee), max_memo_bytes_(config.max_memo_bytes),
          stamp_created_at_time_(config.stamp_created_at_time),
          duplicate_replies_(std::make_shared<std::atomic<dp::u64>>(0)) {}

    TransferRequest LedgerGateway::makeRequest(const Account &source, const Account &destination, Amount amount,
                                               const std::string &memo) {
        TransferRequest request;
        request.source = source;
        request.destination = destination;
        request.amount = amount;
        request.fee = fee_;
        if (!memo.empty()) {
            request.memo = dp::Optional<dp::Vector<dp::u8>>(encodeMemo(memo));
        }
        if (stamp_created_at_time_) {
            request.created_at_time = dp::Optional<dp::u64>(nextCreatedAt());
        }
        return request;
    }

    void LedgerGateway::transfer(const TransferRequest &request, OutcomeHandler on_outcome) {
        // The guard outlives this gateway when the rail keeps the request longer
        auto guard = std::make_shared<ReplyGuard>(std::move(on_outcome), duplicate_replies_);

        dispatched_.fetch_add(1);
        try {
            rail_.submit(request, [guard](RailReply reply) { guard->deliver(classify(reply)); });
        } catch (const std::exception &e) {
            // The rail may have accepted the request before throwing
            if (!guard->delivered()) {
                std::cerr << "[gateway] Rail submit failed: " << e.what() << std::endl;
                guard->deliver(TransferOutcome::indeterminate(std::string("submit failed: ") + e.what()));
            }
        }
    }

    TransferOutcome LedgerGateway::classify(const RailReply &reply) {
        switch (reply.transport) {
        case TransportStatus::Delivered:
            if (reply.block_index.has_value())
                return TransferOutcome::confirmed(*reply.block_index);
            if (reply.error.has_value())
                return TransferOutcome::rejected((*reply.error).toString());
            return TransferOutcome::indeterminate("malformed rail reply");
        case TransportStatus::NotDispatched:
            return TransferOutcome::rejected("not dispatched: " + reply.detail);
        default:
            return TransferOutcome::indeterminate(transportStatusToString(reply.transport) +
                                                  (reply.detail.empty() ? "" : ": " + reply.detail));
        }
    }

    dp::Vector<dp::u8> LedgerGateway::encodeMemo(const std::string &memo) const {
        if (memo.size() <= max_memo_bytes_) {
            return dp::Vector<dp::u8>(memo.begin(), memo.end());
        }

        keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
        std::vector<uint8_t> input(memo.begin(), memo.end());
        auto digest = crypto.hash(input);
        if (!digest.success) {
            // Truncation still fits the rail limit
            return dp::Vector<dp::u8>(memo.begin(), memo.begin() + max_memo_bytes_);
        }
        return dp::Vector<dp::u8>(digest.data.begin(), digest.data.end());
    }

    dp::u64 LedgerGateway::nextCreatedAt() {
        auto now = nowNanos();
        auto last = last_created_at_.load();
        dp::u64 next;
        do {
            next = now > last ? now : last + 1;
        } while (!last_created_at_.compare_exchange_weak(last, next));
        return next;
    }

} // namespace fundit::rail
