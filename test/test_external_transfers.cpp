#include "support/test_support.hpp"

using namespace fundit;
using namespace fundit::test;

TEST_SUITE("Funding") {
    TEST_CASE("Confirmed funding credits the amount net of the fee") {
        EngineFixture f;
        auto funded = f.fund(10'000'000);
        REQUIRE(funded.ok());
        CHECK(funded.calls() == 1);
        CHECK(f.budget() == 10'000'000 - FEE);
        CHECK(f.rail.balanceOf(f.config.custody_account) == 10'000'000 - FEE);
        CHECK(f.rail.balanceOf(Account(ALICE)) == 90'000'000);
        CHECK(f.engine->inFlight().empty());
        CHECK_FALSE(f.engine->locks().isLocked("campaign:c1"));
    }

    TEST_CASE("Funding is sent from the owner's wallet with a memo") {
        EngineFixture f;
        REQUIRE(f.fund(1'000'000).ok());
        auto blocks = f.rail.blocks();
        REQUIRE(blocks.size() == 1);
        CHECK(blocks[0].source == Account(ALICE));
        CHECK(blocks[0].destination == f.config.custody_account);
        REQUIRE(blocks[0].memo.has_value());
        std::string memo((*blocks[0].memo).begin(), (*blocks[0].memo).end());
        CHECK(memo == "Fund campaign: c1");
    }

    TEST_CASE("Rejected funding leaves the budget untouched") {
        EngineFixture f;
        f.rail.rejectNext(rail::RejectCode::InsufficientFunds, 0);
        auto funded = f.fund(10'000'000);
        CHECK(funded.kind() == ErrorKind::TransferRejected);
        CHECK(f.budget() == 0);
        CHECK(f.engine->listUnreconciled(OPS).value().empty());
    }

    TEST_CASE("Funding with an unknown outcome records a ticket and credits nothing") {
        EngineFixture f;
        f.rail.failNext(rail::TransportStatus::Timeout, true, "deadline exceeded");
        auto funded = f.fund(10'000'000);
        CHECK(funded.kind() == ErrorKind::TransferIndeterminate);
        CHECK(f.budget() == 0);

        auto tickets = f.engine->listUnreconciled(OPS);
        REQUIRE(tickets.is_ok());
        REQUIRE(tickets.value().size() == 1);
        const auto &ticket = tickets.value()[0];
        CHECK(ticket.getTicketId().rfind("transfer_", 0) == 0);
        CHECK(ticket.getEntityKind() == EntityKind::Campaign);
        CHECK(ticket.getEntityId() == "c1");
        CHECK(ticket.getDirection() == ledger::TransferDirection::Incoming);
        CHECK(ticket.amount == 10'000'000);
        CHECK(ticket.fee == FEE);
        CHECK(ticket.netAmount() == 10'000'000 - FEE);
        CHECK_FALSE(f.engine->locks().isLocked("campaign:c1"));
    }

    TEST_CASE("Credit failure after confirmation opens a ticket") {
        EngineFixture f;
        f.store.failWritesTo(ledger::CAMPAIGNS_NS);
        auto funded = f.fund(10'000'000);
        CHECK(funded.kind() == ErrorKind::Storage);
        CHECK(f.budget() == 0);
        CHECK(f.rail.balanceOf(f.config.custody_account) == 10'000'000 - FEE);

        auto tickets = f.engine->listUnreconciled(OPS).value();
        REQUIRE(tickets.size() == 1);
        CHECK(tickets[0].getDirection() == ledger::TransferDirection::Incoming);
    }

    TEST_CASE("Funding validation") {
        EngineFixture f;
        CHECK(f.fund(FEE).kind() == ErrorKind::InvalidAmount);
        CHECK(f.fund(0).kind() == ErrorKind::InvalidAmount);
        CHECK(f.fund(1'000'000, ALICE, "missing").kind() == ErrorKind::NotFound);
        CHECK(f.fund(1'000'000, MALLORY).kind() == ErrorKind::Authorization);
        CHECK(f.fund(1'000'000, "").kind() == ErrorKind::Authorization);
        // A non-owner learns nothing about the amount rules
        CHECK(f.fund(FEE, MALLORY).kind() == ErrorKind::Authorization);
        CHECK(f.rail.submittedCount() == 0);
    }
}

TEST_SUITE("Withdrawals") {
    TEST_CASE("Overdrawn withdrawal never reaches the rail") {
        EngineFixture f(5'000'000);
        auto withdrawn = f.withdrawCampaign(999'999'999'999);
        CHECK(withdrawn.kind() == ErrorKind::InsufficientFunds);
        CHECK(withdrawn.calls() == 1);
        CHECK(f.budget() == 5'000'000);
        CHECK(f.engine->gateway().dispatchedCount() == 0);
        CHECK(f.rail.submittedCount() == 0);
        CHECK_FALSE(f.engine->locks().isLocked("campaign:c1"));
    }

    TEST_CASE("Confirmed campaign withdrawal pays the owner") {
        EngineFixture f(5'000'000);
        auto withdrawn = f.withdrawCampaign(1'000'000);
        REQUIRE(withdrawn.ok());
        CHECK(withdrawn.result().value() == 0);
        CHECK(f.budget() == 4'000'000);
        CHECK(f.rail.balanceOf(Account(ALICE)) == 100'000'000 + 1'000'000 - FEE);

        auto blocks = f.rail.blocks();
        REQUIRE(blocks.size() == 1);
        CHECK(blocks[0].source == f.config.custody_account);
        CHECK(blocks[0].amount == 1'000'000);
    }

    TEST_CASE("Whole budget can be withdrawn") {
        EngineFixture f(5'000'000);
        REQUIRE(f.withdrawCampaign(5'000'000).ok());
        CHECK(f.budget() == 0);
    }

    TEST_CASE("Rejected withdrawal restores the balance") {
        EngineFixture f(5'000'000);

        SUBCASE("Rail error") { f.rail.rejectNext(rail::RejectCode::TemporarilyUnavailable); }
        SUBCASE("Refused before dispatch") { f.rail.failNext(rail::TransportStatus::NotDispatched); }
        SUBCASE("Wrong fee") { f.rail.rejectNext(rail::RejectCode::BadFee, FEE); }

        auto withdrawn = f.withdrawCampaign(1'000'000);
        CHECK(withdrawn.kind() == ErrorKind::TransferRejected);
        CHECK(f.budget() == 5'000'000);
        CHECK(f.engine->listUnreconciled(OPS).value().empty());
        CHECK(f.engine->inFlight().empty());
    }

    TEST_CASE("Failed rollback after rejection is recorded for reconciliation") {
        EngineFixture f(5'000'000);
        // The debit goes through, the restoring credit does not
        f.store.failWritesTo(ledger::CAMPAIGNS_NS, 1);
        f.rail.rejectNext(rail::RejectCode::GenericError, 3, "ledger busy");

        auto withdrawn = f.withdrawCampaign(1'000'000);
        CHECK(withdrawn.kind() == ErrorKind::Storage);
        f.store.heal();
        CHECK(f.budget() == 4'000'000);

        auto tickets = f.engine->listUnreconciled(OPS).value();
        REQUIRE(tickets.size() == 1);
        CHECK(tickets[0].getDirection() == ledger::TransferDirection::Outgoing);
        CHECK(tickets[0].amount == 1'000'000);
    }

    TEST_CASE("Withdrawal validation") {
        EngineFixture f(5'000'000);
        CHECK(f.withdrawCampaign(FEE).kind() == ErrorKind::InvalidAmount);
        CHECK(f.withdrawCampaign(5, ALICE, "missing").kind() == ErrorKind::NotFound);
        // Ownership is decided before the amount
        CHECK(f.withdrawCampaign(FEE, MALLORY).kind() == ErrorKind::Authorization);
        CHECK(f.withdrawProvider(5, ALICE).kind() == ErrorKind::Authorization);
        CHECK(f.withdrawCampaign(1'000'000, ALICE, "missing").kind() == ErrorKind::NotFound);
        CHECK(f.withdrawCampaign(1'000'000, MALLORY).kind() == ErrorKind::Authorization);
        CHECK(f.withdrawCampaign(1'000'000, BOB).kind() == ErrorKind::Authorization);
        CHECK(f.withdrawProvider(1'000'000, ALICE).kind() == ErrorKind::Authorization);
        CHECK(f.budget() == 5'000'000);
        CHECK(f.rail.submittedCount() == 0);
    }

    TEST_CASE("Duplicate rail replies complete the withdrawal once") {
        EngineFixture f(5'000'000);
        f.rail.setReplyTwice(true);
        auto withdrawn = f.withdrawCampaign(1'000'000);
        CHECK(withdrawn.ok());
        CHECK(withdrawn.calls() == 1);
        CHECK(f.budget() == 4'000'000);
        CHECK(f.engine->gateway().duplicateReplyCount() == 1);
    }
}

TEST_SUITE("Provider withdrawals") {
    TEST_CASE("Timed out provider withdrawal keeps the debit and opens a ticket") {
        EngineFixture f(5'000'000);
        REQUIRE(f.pay(2'000'000).ok());
        f.rail.failNext(rail::TransportStatus::Timeout, false, "no reply");

        auto withdrawn = f.withdrawProvider(500'000);
        CHECK(withdrawn.kind() == ErrorKind::TransferIndeterminate);
        CHECK(f.earnings() == 1'500'000);

        auto tickets = f.engine->listUnreconciled(OPS).value();
        REQUIRE(tickets.size() == 1);
        CHECK(tickets[0].getEntityKind() == EntityKind::Provider);
        CHECK(tickets[0].getEntityId() == "p1");
        CHECK(tickets[0].getDirection() == ledger::TransferDirection::Outgoing);
        CHECK(tickets[0].amount == 500'000);
        CHECK_FALSE(f.engine->locks().isLocked("provider:p1"));
    }

    TEST_CASE("Confirmed provider withdrawal stamps the earnings records") {
        EngineFixture f(5'000'000);
        REQUIRE(f.engine->registerCampaign(ledger::Campaign("c2", ALICE, 1'000'000)).is_ok());
        REQUIRE(f.pay(2'000'000).ok());
        REQUIRE(f.pay(300'000, ALICE, "c2").ok());

        auto before = f.engine->getProviderEarningsBreakdown(BOB, "p1").value();
        REQUIRE(before.size() == 2);
        CHECK_FALSE(before[0].last_withdrawal.has_value());

        auto withdrawn = f.withdrawProvider(500'000);
        REQUIRE(withdrawn.ok());
        CHECK(f.earnings() == 1'800'000);
        CHECK(f.rail.balanceOf(Account(BOB)) == 500'000 - FEE);

        auto after = f.engine->getProviderEarningsBreakdown(BOB, "p1").value();
        REQUIRE(after.size() == 2);
        for (const auto &entry : after) {
            REQUIRE(entry.last_withdrawal.has_value());
            CHECK(*entry.last_withdrawal > 0);
        }
        // Lifetime totals are not reduced by withdrawals
        CHECK(after[0].total_earned == 2'000'000);
        CHECK(after[1].total_earned == 300'000);
    }

    TEST_CASE("Stamp failure does not fail the withdrawal") {
        EngineFixture f(5'000'000);
        REQUIRE(f.pay(2'000'000).ok());
        f.store.failWritesTo(ledger::EARNINGS_NS);
        CHECK(f.withdrawProvider(500'000).ok());
        CHECK(f.earnings() == 1'500'000);
    }

    TEST_CASE("Rejected provider withdrawal restores earnings") {
        EngineFixture f(5'000'000);
        REQUIRE(f.pay(2'000'000).ok());
        f.rail.rejectNext(rail::RejectCode::InsufficientFunds, 0);
        CHECK(f.withdrawProvider(500'000).kind() == ErrorKind::TransferRejected);
        CHECK(f.earnings() == 2'000'000);
        CHECK_FALSE(f.engine->getProviderEarningsBreakdown(BOB, "p1").value()[0].last_withdrawal.has_value());
    }
}

TEST_SUITE("Unanswered transfers") {
    TEST_CASE("Withdrawal the rail never answers is recorded for reconciliation") {
        FaultyStore store;
        FunditConfig config;
        config.transfer_fee = FEE;
        config.operators.insert(OPS);
        auto ledger_rail = std::make_unique<rail::SimulatedRail>(FEE);
        ledger_rail->mint(config.custody_account, 5'000'000);

        Engine engine(store, *ledger_rail, config);
        REQUIRE(engine.load().is_ok());
        REQUIRE(engine.registerCampaign(ledger::Campaign("c1", ALICE, 5'000'000)).is_ok());

        ledger_rail->setDeferred(true);
        Capture<BlockIndex> withdrawn;
        engine.withdrawCampaignFunds(ALICE, "c1", 1'000'000, withdrawn.callback());
        REQUIRE_FALSE(withdrawn.ready());

        // Pending requests are discarded with the rail
        ledger_rail.reset();

        CHECK(withdrawn.kind() == ErrorKind::TransferIndeterminate);
        CHECK(withdrawn.calls() == 1);
        CHECK(engine.getCampaignBalance(ALICE, "c1").value() == 4'000'000);
        CHECK_FALSE(engine.locks().isLocked("campaign:c1"));
        CHECK(engine.inFlight().empty());

        auto tickets = engine.listUnreconciled(OPS).value();
        REQUIRE(tickets.size() == 1);
        CHECK(tickets[0].getDirection() == ledger::TransferDirection::Outgoing);
        CHECK(tickets[0].getReason() == "rail dropped reply");
    }
}
