#pragma once

#include <deque>
#include <fundit/common/config.hpp>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace fundit::ledger {

    class EntityLockTable;

    /// Work parked behind a held entity lock; re-runs the whole operation when its turn comes
    using Waiter = std::function<void()>;

    enum class AcquireStatus : dp::u8 {
        Acquired = 0,
        Queued = 1, // Parked FIFO, the waiter runs after the current holder releases
        Busy = 2,   // Rejected by policy or queue full
    };

    // ===========================================
    // Lease - ownership of one or more entity locks
    // ===========================================

    /// Holds entity locks until release(). release() hands back the waiters that became
    /// runnable so the holder can report its own result before they run. A lease destroyed
    /// while still held releases and runs its waiters itself, logging any that throw.
    class Lease {
      public:
        Lease() = default;
        Lease(EntityLockTable *table, std::vector<std::string> keys);
        ~Lease();

        Lease(const Lease &) = delete;
        Lease &operator=(const Lease &) = delete;
        Lease(Lease &&other) noexcept;
        Lease &operator=(Lease &&other);

        bool held() const { return table_ != nullptr; }
        const std::vector<std::string> &keys() const { return keys_; }

        /// Unlock every key; the returned waiters must be run by the caller
        std::vector<Waiter> release();

        /// Forget the keys without touching the table, for when the table is already gone
        void abandon();

      private:
        EntityLockTable *table_ = nullptr;
        std::vector<std::string> keys_;
    };

    // ===========================================
    // EntityLockTable - exclusive per-entity locks
    // ===========================================

    class EntityLockTable {
      public:
        explicit EntityLockTable(LockPolicy policy = LockPolicy::Reject, dp::usize max_queue_depth = 16);

        /// Lock every key or none. When a key is held the whole request either fails (Reject)
        /// or parks on_turn behind the first held key (Queue).
        AcquireStatus acquire(const std::vector<std::string> &keys, Waiter on_turn, Lease &lease);

        AcquireStatus acquire(const std::string &key, Waiter on_turn, Lease &lease) {
            return acquire(std::vector<std::string>{key}, std::move(on_turn), lease);
        }

        bool isLocked(const std::string &key) const;
        dp::usize queueDepth(const std::string &key) const;
        std::vector<std::string> lockedKeys() const;

        LockPolicy policy() const { return policy_; }
        dp::usize maxQueueDepth() const { return max_queue_depth_; }

      private:
        friend class Lease;

        std::vector<Waiter> unlock(const std::vector<std::string> &keys);

        LockPolicy policy_;
        dp::usize max_queue_depth_;
        std::set<std::string> locked_;
        std::map<std::string, std::deque<Waiter>> waiters_;
        mutable std::mutex mutex_;
    };

} // namespace fundit::ledger
