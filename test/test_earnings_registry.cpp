#include <doctest/doctest.h>

#include "support/test_support.hpp"
#include <fundit/ledger/earnings_registry.hpp>
#include <fundit/storage/memory_store.hpp>

using namespace fundit;
using namespace fundit::ledger;

TEST_SUITE("EarningsRegistry") {
    TEST_CASE("Payments accumulate per provider and campaign") {
        storage::MemoryStore store;
        EarningsRegistry registry(store);

        auto first = registry.record("p1", "c1", 100);
        REQUIRE(first.is_ok());
        CHECK_FALSE(first.value().prior.has_value());

        auto second = registry.record("p1", "c1", 50);
        REQUIRE(second.is_ok());
        REQUIRE(second.value().prior.has_value());
        CHECK((*second.value().prior).total_earned == 100);

        REQUIRE(registry.record("p1", "c2", 7).is_ok());
        REQUIRE(registry.record("p2", "c1", 9).is_ok());

        auto record = registry.get("p1", "c1");
        REQUIRE(record.has_value());
        CHECK((*record).total_earned == 150);
        CHECK_FALSE((*record).last_withdrawal.has_value());
        CHECK(registry.size() == 3);
        CHECK(store.size(EARNINGS_NS) == 3);
    }

    TEST_CASE("Breakdown is ordered by campaign and scoped to the provider") {
        storage::MemoryStore store;
        EarningsRegistry registry(store);
        REQUIRE(registry.record("p1", "zeta", 1).is_ok());
        REQUIRE(registry.record("p1", "alpha", 2).is_ok());
        REQUIRE(registry.record("p1", "mid", 3).is_ok());
        REQUIRE(registry.record("p10", "alpha", 4).is_ok());
        REQUIRE(registry.record("p", "alpha", 5).is_ok());

        auto rows = registry.breakdown("p1");
        REQUIRE(rows.size() == 3);
        CHECK(rows[0].getCampaignId() == "alpha");
        CHECK(rows[1].getCampaignId() == "mid");
        CHECK(rows[2].getCampaignId() == "zeta");
        CHECK(registry.breakdown("nobody").empty());
    }

    TEST_CASE("Restore undoes a payment") {
        storage::MemoryStore store;
        EarningsRegistry registry(store);

        SUBCASE("New record is removed") {
            auto undo = registry.record("p1", "c1", 10);
            REQUIRE(undo.is_ok());
            REQUIRE(registry.restore(undo.value()).is_ok());
            CHECK_FALSE(registry.get("p1", "c1").has_value());
            CHECK(store.size(EARNINGS_NS) == 0);
        }

        SUBCASE("Existing record gets its prior total back") {
            REQUIRE(registry.record("p1", "c1", 10).is_ok());
            auto undo = registry.record("p1", "c1", 5);
            REQUIRE(undo.is_ok());
            REQUIRE(registry.restore(undo.value()).is_ok());
            CHECK((*registry.get("p1", "c1")).total_earned == 10);
        }
    }

    TEST_CASE("Withdrawal stamping touches every record of the provider") {
        storage::MemoryStore store;
        EarningsRegistry registry(store);
        REQUIRE(registry.record("p1", "c1", 1).is_ok());
        REQUIRE(registry.record("p1", "c2", 1).is_ok());
        REQUIRE(registry.record("p2", "c1", 1).is_ok());

        auto stamped = registry.stampWithdrawal("p1", 1700000000000);
        REQUIRE(stamped.is_ok());
        CHECK(stamped.value() == 2);
        CHECK(*(*registry.get("p1", "c2")).last_withdrawal == 1700000000000);
        CHECK_FALSE((*registry.get("p2", "c1")).last_withdrawal.has_value());
        // Totals never decrease
        CHECK((*registry.get("p1", "c1")).total_earned == 1);
    }

    TEST_CASE("Failed write keeps the previous state") {
        test::FaultyStore store;
        EarningsRegistry registry(store);
        REQUIRE(registry.record("p1", "c1", 10).is_ok());

        store.failWritesTo(EARNINGS_NS);
        auto res = registry.record("p1", "c1", 5);
        REQUIRE(res.is_err());
        CHECK(errorKind(res.error()) == ErrorKind::Storage);
        CHECK((*registry.get("p1", "c1")).total_earned == 10);
    }

    TEST_CASE("Load and snapshot") {
        storage::MemoryStore store;
        {
            EarningsRegistry registry(store);
            REQUIRE(registry.record("p1", "c1", 10).is_ok());
            REQUIRE(registry.record("p1", "c2", 20).is_ok());
            REQUIRE(registry.stampWithdrawal("p1", 42).is_ok());
            REQUIRE(registry.snapshot().is_ok());
        }

        EarningsRegistry reloaded(store);
        REQUIRE(reloaded.load().is_ok());
        auto rows = reloaded.breakdown("p1");
        REQUIRE(rows.size() == 2);
        CHECK(rows[1].total_earned == 20);
        CHECK(*rows[0].last_withdrawal == 42);
    }
}
