#pragma once

#include <fundit/common/types.hpp>
#include <string>

namespace fundit::rail {

    // ===========================================
    // Request
    // ===========================================

    /// One transfer on the external rail. The rail subtracts fee from amount:
    /// source loses amount, destination receives amount - fee.
    struct TransferRequest {
        Account source;
        Account destination;
        Amount amount{0};
        Amount fee{0};
        dp::Optional<dp::Vector<dp::u8>> memo;
        dp::Optional<dp::u64> created_at_time; // Nanoseconds since epoch, used for de-duplication
    };

    // ===========================================
    // Rail reply
    // ===========================================

    /// Errors the rail itself defines. All of them mean the transfer was not executed.
    enum class RejectCode : dp::u8 {
        BadFee = 0,                 // detail: expected fee
        BadBurn = 1,                // detail: minimum burn amount
        InsufficientFunds = 2,      // detail: source balance
        TooOld = 3,                 // created_at_time outside the de-duplication window
        CreatedInFuture = 4,        // detail: rail time
        TemporarilyUnavailable = 5,
        Duplicate = 6,              // detail: block index of the original
        GenericError = 7,           // detail: rail error code
    };

    inline std::string rejectCodeToString(RejectCode code) {
        switch (code) {
        case RejectCode::BadFee:
            return "BadFee";
        case RejectCode::BadBurn:
            return "BadBurn";
        case RejectCode::InsufficientFunds:
            return "InsufficientFunds";
        case RejectCode::TooOld:
            return "TooOld";
        case RejectCode::CreatedInFuture:
            return "CreatedInFuture";
        case RejectCode::TemporarilyUnavailable:
            return "TemporarilyUnavailable";
        case RejectCode::Duplicate:
            return "Duplicate";
        case RejectCode::GenericError:
            return "GenericError";
        default:
            return "Unknown";
        }
    }

    struct RejectReason {
        RejectCode code{RejectCode::GenericError};
        dp::u64 detail{0};
        std::string message;

        inline std::string toString() const {
            std::string result = rejectCodeToString(code);
            switch (code) {
            case RejectCode::BadFee:
                result += " (expected_fee: " + std::to_string(detail) + ")";
                break;
            case RejectCode::BadBurn:
                result += " (min_burn_amount: " + std::to_string(detail) + ")";
                break;
            case RejectCode::InsufficientFunds:
                result += " (balance: " + std::to_string(detail) + ")";
                break;
            case RejectCode::CreatedInFuture:
                result += " (ledger_time: " + std::to_string(detail) + ")";
                break;
            case RejectCode::Duplicate:
                result += " (duplicate_of: " + std::to_string(detail) + ")";
                break;
            case RejectCode::GenericError:
                result += " (error_code: " + std::to_string(detail) + ")";
                break;
            default:
                break;
            }
            if (!message.empty())
                result += ": " + message;
            return result;
        }
    };

    /// How the call itself went, independent of what the rail decided
    enum class TransportStatus : dp::u8 {
        Delivered = 0,     // A reply from the rail arrived
        NotDispatched = 1, // Refused locally before anything was sent
        Timeout = 2,
        Unreachable = 3,
        SystemError = 4,
        Unknown = 5,
    };

    inline std::string transportStatusToString(TransportStatus status) {
        switch (status) {
        case TransportStatus::Delivered:
            return "delivered";
        case TransportStatus::NotDispatched:
            return "not_dispatched";
        case TransportStatus::Timeout:
            return "timeout";
        case TransportStatus::Unreachable:
            return "unreachable";
        case TransportStatus::SystemError:
            return "system_error";
        default:
            return "unknown";
        }
    }

    struct RailReply {
        TransportStatus transport{TransportStatus::Unknown};
        dp::Optional<BlockIndex> block_index; // Set on success
        dp::Optional<RejectReason> error;     // Set when the rail declined
        std::string detail;                   // Transport diagnostics

        static inline RailReply ok(BlockIndex block) {
            RailReply reply;
            reply.transport = TransportStatus::Delivered;
            reply.block_index = dp::Optional<BlockIndex>(block);
            return reply;
        }

        static inline RailReply rejected(RejectReason reason) {
            RailReply reply;
            reply.transport = TransportStatus::Delivered;
            reply.error = dp::Optional<RejectReason>(std::move(reason));
            return reply;
        }

        static inline RailReply transportFailure(TransportStatus status, std::string detail) {
            RailReply reply;
            reply.transport = status;
            reply.detail = std::move(detail);
            return reply;
        }
    };

    // ===========================================
    // Classified outcome
    // ===========================================

    struct TransferOutcome {
        enum class Kind : dp::u8 {
            Confirmed = 0,
            Rejected = 1,
            Indeterminate = 2,
        };

        Kind kind{Kind::Indeterminate};
        BlockIndex block_index{0};
        std::string reason;

        static inline TransferOutcome confirmed(BlockIndex block) { return TransferOutcome{Kind::Confirmed, block, ""}; }
        static inline TransferOutcome rejected(std::string why) {
            return TransferOutcome{Kind::Rejected, 0, std::move(why)};
        }
        static inline TransferOutcome indeterminate(std::string why) {
            return TransferOutcome{Kind::Indeterminate, 0, std::move(why)};
        }

        inline bool isConfirmed() const { return kind == Kind::Confirmed; }
        inline bool isRejected() const { return kind == Kind::Rejected; }
        inline bool isIndeterminate() const { return kind == Kind::Indeterminate; }
    };

} // namespace fundit::rail
