#pragma once

#include <datapod/datapod.hpp>
#include <string>

namespace fundit {

    // ===========================================
    // Fundit-specific error codes (100+)
    // ===========================================

    constexpr dp::u32 ERR_UNAUTHORIZED = 100;
    constexpr dp::u32 ERR_NOT_FOUND = 101;
    constexpr dp::u32 ERR_INSUFFICIENT_FUNDS = 102;
    constexpr dp::u32 ERR_TRANSFER_REJECTED = 103;
    constexpr dp::u32 ERR_TRANSFER_INDETERMINATE = 104;
    constexpr dp::u32 ERR_STORAGE = 105;
    constexpr dp::u32 ERR_BUSY = 106;
    constexpr dp::u32 ERR_INVALID_AMOUNT = 107;
    constexpr dp::u32 ERR_ALREADY_EXISTS = 108;

    /// Closed set of failure kinds a caller can branch on
    enum class ErrorKind : dp::u8 {
        Authorization = 0,
        NotFound = 1,
        InsufficientFunds = 2,
        TransferRejected = 3,
        TransferIndeterminate = 4,
        Storage = 5,
        Busy = 6,
        InvalidAmount = 7,
        AlreadyExists = 8,
        Unknown = 255,
    };

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error unauthorized(const dp::String &msg = "Unauthorized caller") {
        return dp::Error{ERR_UNAUTHORIZED, msg};
    }

    inline dp::Error not_found(const dp::String &msg = "Record not found") { return dp::Error{ERR_NOT_FOUND, msg}; }

    inline dp::Error insufficient_funds(const dp::String &msg = "Insufficient funds") {
        return dp::Error{ERR_INSUFFICIENT_FUNDS, msg};
    }

    inline dp::Error transfer_rejected(const dp::String &msg = "Transfer rejected by the ledger") {
        return dp::Error{ERR_TRANSFER_REJECTED, msg};
    }

    inline dp::Error transfer_indeterminate(const dp::String &msg = "Transfer outcome unknown") {
        return dp::Error{ERR_TRANSFER_INDETERMINATE, msg};
    }

    inline dp::Error storage_failure(const dp::String &msg = "Storage operation failed") {
        return dp::Error{ERR_STORAGE, msg};
    }

    inline dp::Error busy(const dp::String &msg = "Entity busy, retry later") { return dp::Error{ERR_BUSY, msg}; }

    inline dp::Error invalid_amount(const dp::String &msg = "Invalid amount") {
        return dp::Error{ERR_INVALID_AMOUNT, msg};
    }

    inline dp::Error already_exists(const dp::String &msg = "Record already exists") {
        return dp::Error{ERR_ALREADY_EXISTS, msg};
    }

    // ===========================================
    // Classification
    // ===========================================

    inline ErrorKind errorKind(const dp::Error &error) {
        switch (error.code) {
        case ERR_UNAUTHORIZED:
            return ErrorKind::Authorization;
        case ERR_NOT_FOUND:
            return ErrorKind::NotFound;
        case ERR_INSUFFICIENT_FUNDS:
            return ErrorKind::InsufficientFunds;
        case ERR_TRANSFER_REJECTED:
            return ErrorKind::TransferRejected;
        case ERR_TRANSFER_INDETERMINATE:
            return ErrorKind::TransferIndeterminate;
        case ERR_STORAGE:
            return ErrorKind::Storage;
        case ERR_BUSY:
            return ErrorKind::Busy;
        case ERR_INVALID_AMOUNT:
            return ErrorKind::InvalidAmount;
        case ERR_ALREADY_EXISTS:
            return ErrorKind::AlreadyExists;
        default:
            return ErrorKind::Unknown;
        }
    }

    inline std::string errorKindToString(ErrorKind kind) {
        switch (kind) {
        case ErrorKind::Authorization:
            return "authorization";
        case ErrorKind::NotFound:
            return "not_found";
        case ErrorKind::InsufficientFunds:
            return "insufficient_funds";
        case ErrorKind::TransferRejected:
            return "transfer_rejected";
        case ErrorKind::TransferIndeterminate:
            return "transfer_indeterminate";
        case ErrorKind::Storage:
            return "storage";
        case ErrorKind::Busy:
            return "busy";
        case ErrorKind::InvalidAmount:
            return "invalid_amount";
        case ErrorKind::AlreadyExists:
            return "already_exists";
        default:
            return "unknown";
        }
    }

    /// Rejected transfers can be retried once the cause is fixed, busy entities once the lock clears.
    /// Indeterminate transfers must be reconciled first and are never retryable.
    inline bool isRetryable(ErrorKind kind) { return kind == ErrorKind::TransferRejected || kind == ErrorKind::Busy; }

    /// Convert a generic datapod error (I/O, decode) into a storage failure, keeping fundit errors as they are
    inline dp::Error asStorageError(const dp::Error &error) {
        if (errorKind(error) != ErrorKind::Unknown)
            return error;
        return storage_failure(error.message);
    }

} // namespace fundit
