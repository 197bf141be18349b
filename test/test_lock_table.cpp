#include <doctest/doctest.h>

#include <fundit/ledger/lock_table.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using namespace fundit;
using namespace fundit::ledger;

TEST_SUITE("EntityLockTable") {
    TEST_CASE("Reject policy") {
        EntityLockTable locks(LockPolicy::Reject);
        Lease first;
        CHECK(locks.acquire("campaign:c1", [] {}, first) == AcquireStatus::Acquired);
        CHECK(first.held());
        CHECK(locks.isLocked("campaign:c1"));

        Lease second;
        CHECK(locks.acquire("campaign:c1", [] {}, second) == AcquireStatus::Busy);
        CHECK_FALSE(second.held());
        CHECK(locks.queueDepth("campaign:c1") == 0);

        // Same id under another kind is a different entity
        Lease other;
        CHECK(locks.acquire("provider:c1", [] {}, other) == AcquireStatus::Acquired);

        CHECK(first.release().empty());
        CHECK_FALSE(locks.isLocked("campaign:c1"));
        CHECK(locks.acquire("campaign:c1", [] {}, second) == AcquireStatus::Acquired);
    }

    TEST_CASE("Multi-key acquisition is all or nothing") {
        EntityLockTable locks(LockPolicy::Reject);
        Lease provider;
        REQUIRE(locks.acquire("provider:p1", [] {}, provider) == AcquireStatus::Acquired);

        Lease both;
        CHECK(locks.acquire(std::vector<std::string>{"campaign:c1", "provider:p1"}, [] {}, both) ==
              AcquireStatus::Busy);
        CHECK_FALSE(locks.isLocked("campaign:c1"));

        provider.release();
        CHECK(locks.acquire(std::vector<std::string>{"campaign:c1", "provider:p1"}, [] {}, both) ==
              AcquireStatus::Acquired);
        CHECK(locks.lockedKeys().size() == 2);
        both.release();
        CHECK(locks.lockedKeys().empty());
    }

    TEST_CASE("Queue policy parks waiters in FIFO order") {
        EntityLockTable locks(LockPolicy::Queue, 2);
        std::vector<int> order;

        Lease holder;
        REQUIRE(locks.acquire("campaign:c1", [] {}, holder) == AcquireStatus::Acquired);

        Lease unused;
        CHECK(locks.acquire("campaign:c1", [&] { order.push_back(1); }, unused) == AcquireStatus::Queued);
        CHECK(locks.acquire("campaign:c1", [&] { order.push_back(2); }, unused) == AcquireStatus::Queued);
        CHECK(locks.queueDepth("campaign:c1") == 2);

        SUBCASE("Queue is bounded") {
            CHECK(locks.acquire("campaign:c1", [&] { order.push_back(3); }, unused) == AcquireStatus::Busy);
        }

        auto waiters = holder.release();
        REQUIRE(waiters.size() == 2);
        CHECK(order.empty());
        for (auto &waiter : waiters)
            waiter();
        CHECK(order == std::vector<int>{1, 2});
        CHECK(locks.queueDepth("campaign:c1") == 0);
    }

    TEST_CASE("Dropping a lease releases it and runs waiters") {
        EntityLockTable locks(LockPolicy::Queue);
        bool ran = false;
        {
            Lease holder;
            REQUIRE(locks.acquire("provider:p1", [] {}, holder) == AcquireStatus::Acquired);
            Lease unused;
            REQUIRE(locks.acquire("provider:p1", [&] { ran = true; }, unused) == AcquireStatus::Queued);
        }
        CHECK(ran);
        CHECK_FALSE(locks.isLocked("provider:p1"));
    }

    TEST_CASE("Moved lease keeps ownership") {
        EntityLockTable locks;
        Lease a;
        REQUIRE(locks.acquire("campaign:c1", [] {}, a) == AcquireStatus::Acquired);
        Lease b(std::move(a));
        CHECK_FALSE(a.held());
        CHECK(b.held());
        CHECK(locks.isLocked("campaign:c1"));
        b.release();
        CHECK_FALSE(locks.isLocked("campaign:c1"));
    }

    TEST_CASE("A failing waiter run from a dropped lease does not stop the others") {
        EntityLockTable locks(LockPolicy::Queue);
        bool later_ran = false;
        {
            Lease holder;
            REQUIRE(locks.acquire("campaign:c1", [] {}, holder) == AcquireStatus::Acquired);
            Lease unused;
            REQUIRE(locks.acquire("campaign:c1", [] { throw std::runtime_error("store offline"); }, unused) ==
                    AcquireStatus::Queued);
            REQUIRE(locks.acquire("campaign:c1", [&] { later_ran = true; }, unused) == AcquireStatus::Queued);
        }
        CHECK(later_ran);
        CHECK_FALSE(locks.isLocked("campaign:c1"));
    }

    TEST_CASE("Move assignment releases the lease it replaces") {
        EntityLockTable locks(LockPolicy::Queue);
        bool ran = false;
        Lease a;
        Lease b;
        REQUIRE(locks.acquire("campaign:c1", [] {}, a) == AcquireStatus::Acquired);
        REQUIRE(locks.acquire("provider:p1", [] {}, b) == AcquireStatus::Acquired);
        Lease unused;
        REQUIRE(locks.acquire("campaign:c1", [&] { ran = true; }, unused) == AcquireStatus::Queued);

        CHECK_NOTHROW(a = std::move(b));
        CHECK(ran);
        CHECK_FALSE(locks.isLocked("campaign:c1"));
        CHECK(locks.isLocked("provider:p1"));
        CHECK(a.held());
        a.release();
        CHECK(locks.lockedKeys().empty());
    }

    TEST_CASE("Abandoned lease leaves the table alone") {
        EntityLockTable locks;
        {
            Lease lease;
            REQUIRE(locks.acquire("campaign:c1", [] {}, lease) == AcquireStatus::Acquired);
            lease.abandon();
            CHECK_FALSE(lease.held());
        }
        CHECK(locks.isLocked("campaign:c1"));
    }
}
