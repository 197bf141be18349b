#include <fundit/ledger/lock_table.hpp>
#include <exception>
#include <iostream>

namespace fundit::ledger {

    // ===========================================
    // Lease
    // ===========================================

    Lease::Lease(EntityLockTable *table, std::vector<std::string> keys) : table_(table), keys_(std::move(keys)) {}

    namespace {

        /// Waiters of a lease that went out of scope still held. Nobody is left to hand them to,
        /// so they run here and a failure is reported rather than escaping the destructor.
        void runOrphaned(std::vector<Waiter> waiters) {
            for (auto &waiter : waiters) {
                try {
                    waiter();
                } catch (const std::exception &e) {
                    std::cerr << "[locks] Parked request failed after release: " << e.what() << std::endl;
                }
            }
        }

    } // namespace

    Lease::~Lease() {
        if (table_) {
            std::cerr << "[locks] Lease on " << keys_.size() << " key(s) dropped without release" << std::endl;
            runOrphaned(release());
        }
    }

    Lease::Lease(Lease &&other) noexcept : table_(other.table_), keys_(std::move(other.keys_)) {
        other.table_ = nullptr;
    }

    Lease &Lease::operator=(Lease &&other) {
        if (this != &other) {
            auto waiters = release();
            table_ = other.table_;
            keys_ = std::move(other.keys_);
            other.table_ = nullptr;
            runOrphaned(std::move(waiters));
        }
        return *this;
    }

    void Lease::abandon() {
        table_ = nullptr;
        keys_.clear();
    }

    std::vector<Waiter> Lease::release() {
        if (!table_)
            return {};
        auto waiters = table_->unlock(keys_);
        table_ = nullptr;
        keys_.clear();
        return waiters;
    }

    // ===========================================
    // EntityLockTable
    // ===========================================

    EntityLockTable::EntityLockTable(LockPolicy policy, dp::usize max_queue_depth)
        : policy_(policy), max_queue_depth_(max_queue_depth) {}

    AcquireStatus EntityLockTable::acquire(const std::vector<std::string> &keys, Waiter on_turn, Lease &lease) {
        std::lock_guard<std::mutex> lock(mutex_);

        for (const auto &key : keys) {
            if (!locked_.count(key))
                continue;

            if (policy_ == LockPolicy::Reject)
                return AcquireStatus::Busy;

            auto &queue = waiters_[key];
            if (queue.size() >= max_queue_depth_) {
                std::cout << "[locks] Queue full for " << key << " (" << queue.size() << ")" << std::endl;
                return AcquireStatus::Busy;
            }
            queue.push_back(std::move(on_turn));
            return AcquireStatus::Queued;
        }

        for (const auto &key : keys) {
            locked_.insert(key);
        }
        lease = Lease(this, keys);
        return AcquireStatus::Acquired;
    }

    std::vector<Waiter> EntityLockTable::unlock(const std::vector<std::string> &keys) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Waiter> runnable;
        for (const auto &key : keys) {
            locked_.erase(key);
            auto it = waiters_.find(key);
            if (it == waiters_.end())
                continue;
            // Waiters re-run from scratch, so releasing the whole queue keeps FIFO order
            while (!it->second.empty()) {
                runnable.push_back(std::move(it->second.front()));
                it->second.pop_front();
            }
            waiters_.erase(it);
        }
        return runnable;
    }

    bool EntityLockTable::isLocked(const std::string &key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return locked_.count(key) > 0;
    }

    dp::usize EntityLockTable::queueDepth(const std::string &key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = waiters_.find(key);
        return it == waiters_.end() ? 0 : it->second.size();
    }

    std::vector<std::string> EntityLockTable::lockedKeys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::vector<std::string>(locked_.begin(), locked_.end());
    }

} // namespace fundit::ledger
