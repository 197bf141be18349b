#pragma once

#include <fundit/common/types.hpp>
#include <string>
#include <unordered_set>

namespace fundit {

    /// What happens to a request that targets an entity with a transfer in flight
    enum class LockPolicy : dp::u8 {
        Reject = 0, // Fail immediately with a busy error
        Queue = 1,  // Park FIFO and re-run once the entity is released
    };

    /// Engine configuration
    struct FunditConfig {
        // Rail settings
        Amount transfer_fee = 10000;         // Fixed rail fee, netted out of the moved amount
        dp::usize max_memo_bytes = 32;       // Longer memos are replaced by their SHA-256 digest
        bool stamp_created_at_time = true;   // Send created_at_time so the rail can de-duplicate
        Account custody_account{"fundit"};   // Account holding all campaign funds on the rail

        // Contention
        LockPolicy lock_policy = LockPolicy::Reject;
        dp::usize max_queue_depth = 16; // Per entity, only used with LockPolicy::Queue

        // Identities allowed to list and resolve unreconciled transfers
        std::unordered_set<std::string> operators;
    };

} // namespace fundit
