#include <doctest/doctest.h>

#include "support/test_support.hpp"
#include <fundit/ledger/balance_ledger.hpp>
#include <fundit/storage/memory_store.hpp>
#include <limits>

using namespace fundit;
using namespace fundit::ledger;

TEST_SUITE("BalanceLedger") {
    TEST_CASE("Registration") {
        storage::MemoryStore store;
        BalanceLedger ledger(store);

        REQUIRE(ledger.registerCampaign(Campaign("c1", "alice", 500)).is_ok());
        REQUIRE(ledger.registerProvider(Provider("p1", "bob")).is_ok());
        CHECK(ledger.hasCampaign("c1"));
        CHECK(ledger.hasProvider("p1"));
        CHECK(store.size(CAMPAIGNS_NS) == 1);
        CHECK(store.size(PROVIDERS_NS) == 1);

        auto dup = ledger.registerCampaign(Campaign("c1", "mallory"));
        REQUIRE(dup.is_err());
        CHECK(errorKind(dup.error()) == ErrorKind::AlreadyExists);
        CHECK(ledger.ownerOf(EntityKind::Campaign, "c1").value() == "alice");

        SUBCASE("Lookup of unknown records") {
            auto missing = ledger.getCampaign("nope");
            REQUIRE(missing.is_err());
            CHECK(errorKind(missing.error()) == ErrorKind::NotFound);
            CHECK(errorKind(ledger.balanceOf(EntityKind::Provider, "nope").error()) == ErrorKind::NotFound);
        }

        SUBCASE("Removal") {
            REQUIRE(ledger.removeCampaign("c1").is_ok());
            CHECK_FALSE(ledger.hasCampaign("c1"));
            CHECK(store.size(CAMPAIGNS_NS) == 0);
            CHECK(errorKind(ledger.removeCampaign("c1").error()) == ErrorKind::NotFound);
        }
    }

    TEST_CASE("Debit and credit are bounds checked") {
        storage::MemoryStore store;
        BalanceLedger ledger(store);
        REQUIRE(ledger.registerCampaign(Campaign("c1", "alice", 1000)).is_ok());

        auto debited = ledger.debit(EntityKind::Campaign, "c1", 400);
        REQUIRE(debited.is_ok());
        CHECK(debited.value() == 600);

        auto over = ledger.debit(EntityKind::Campaign, "c1", 601);
        REQUIRE(over.is_err());
        CHECK(errorKind(over.error()) == ErrorKind::InsufficientFunds);
        CHECK(ledger.balanceOf(EntityKind::Campaign, "c1").value() == 600);

        CHECK(ledger.debit(EntityKind::Campaign, "c1", 600).value() == 0);

        REQUIRE(ledger.credit(EntityKind::Campaign, "c1", std::numeric_limits<Amount>::max()).is_ok());
        auto overflow = ledger.credit(EntityKind::Campaign, "c1", 1);
        REQUIRE(overflow.is_err());
        CHECK(errorKind(overflow.error()) == ErrorKind::InvalidAmount);
        CHECK_FALSE(ledger.canCredit(EntityKind::Campaign, "c1", 1));
    }

    TEST_CASE("Failed writes leave memory untouched") {
        test::FaultyStore store;
        BalanceLedger ledger(store);
        REQUIRE(ledger.registerProvider(Provider("p1", "bob", 50)).is_ok());

        store.failWritesTo(PROVIDERS_NS);
        auto res = ledger.credit(EntityKind::Provider, "p1", 25);
        REQUIRE(res.is_err());
        CHECK(errorKind(res.error()) == ErrorKind::Storage);
        CHECK(ledger.balanceOf(EntityKind::Provider, "p1").value() == 50);

        auto reg = ledger.registerProvider(Provider("p2", "carol"));
        REQUIRE(reg.is_err());
        CHECK_FALSE(ledger.hasProvider("p2"));

        store.heal();
        CHECK(ledger.credit(EntityKind::Provider, "p1", 25).value() == 75);
    }

    TEST_CASE("Load restores what was written through") {
        storage::MemoryStore store;
        {
            BalanceLedger ledger(store);
            REQUIRE(ledger.registerCampaign(Campaign("c1", "alice", 10)).is_ok());
            REQUIRE(ledger.registerProvider(Provider("p1", "bob")).is_ok());
            REQUIRE(ledger.credit(EntityKind::Campaign, "c1", 90).is_ok());
            REQUIRE(ledger.credit(EntityKind::Provider, "p1", 7).is_ok());

            UnreconciledTransfer ticket;
            ticket.ticket_id = "transfer_1_0";
            ticket.entity_id = "c1";
            ticket.amount = 5;
            REQUIRE(ledger.recordUnreconciled(ticket).is_ok());
        }

        BalanceLedger reloaded(store);
        REQUIRE(reloaded.load().is_ok());
        CHECK(reloaded.balanceOf(EntityKind::Campaign, "c1").value() == 100);
        CHECK(reloaded.balanceOf(EntityKind::Provider, "p1").value() == 7);
        CHECK(reloaded.getCampaign("c1").value().getOwner() == "alice");
        REQUIRE(reloaded.unreconciledCount() == 1);
        CHECK(reloaded.getUnreconciled("transfer_1_0").value().amount == 5);
    }

    TEST_CASE("Snapshot rewrites every record") {
        storage::MemoryStore store;
        BalanceLedger ledger(store);
        REQUIRE(ledger.registerCampaign(Campaign("c1", "alice", 10)).is_ok());
        REQUIRE(ledger.registerCampaign(Campaign("c2", "alice", 20)).is_ok());

        // Lose one record behind the ledger's back
        REQUIRE(store.erase(CAMPAIGNS_NS, "c2").is_ok());
        CHECK(store.size(CAMPAIGNS_NS) == 1);

        REQUIRE(ledger.snapshot().is_ok());
        CHECK(store.size(CAMPAIGNS_NS) == 2);
    }

    TEST_CASE("Unreconciled tickets") {
        storage::MemoryStore store;
        BalanceLedger ledger(store);

        UnreconciledTransfer b;
        b.ticket_id = "transfer_2_1";
        UnreconciledTransfer a;
        a.ticket_id = "transfer_1_0";
        REQUIRE(ledger.recordUnreconciled(b).is_ok());
        REQUIRE(ledger.recordUnreconciled(a).is_ok());

        auto open = ledger.listUnreconciled();
        REQUIRE(open.size() == 2);
        CHECK(open[0].getTicketId() == "transfer_1_0");

        REQUIRE(ledger.clearUnreconciled("transfer_1_0").is_ok());
        CHECK(ledger.unreconciledCount() == 1);
        CHECK(store.size(UNRECONCILED_NS) == 1);
        CHECK(errorKind(ledger.clearUnreconciled("transfer_1_0").error()) == ErrorKind::NotFound);
        CHECK(errorKind(ledger.getUnreconciled("missing").error()) == ErrorKind::NotFound);
    }
}
