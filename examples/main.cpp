#include "fundit.hpp"
#include <filesystem>
#include <iostream>
#include <string>

using namespace fundit;

void printSeparator(const std::string &title) {
    std::cout << "\n" << std::string(60, '=') << std::endl;
    std::cout << "  " << title << std::endl;
    std::cout << std::string(60, '=') << std::endl;
}

/// Prints the outcome of a transfer the way a client would see it
template <typename T> Completion<T> report(const std::string &label) {
    return [label](dp::Result<T, dp::Error> result) {
        if (result.is_ok()) {
            std::cout << "  " << label << ": ok" << std::endl;
        } else {
            auto kind = errorKind(result.error());
            std::cout << "  " << label << ": " << errorKindToString(kind) << " (" << result.error().message.c_str()
                      << ")" << (isRetryable(kind) ? " [retryable]" : "") << std::endl;
        }
    };
}

bool check(const dp::Result<void, dp::Error> &result, const std::string &step) {
    if (result.is_err()) {
        std::cerr << "  " << step << " failed: " << result.error().message.c_str() << std::endl;
        return false;
    }
    return true;
}

void printBalance(const Engine &engine, const Identity &caller, const std::string &campaign_id) {
    auto balance = engine.getCampaignBalance(caller, campaign_id);
    if (balance.is_ok()) {
        std::cout << "  Balance of " << campaign_id << ": " << balance.value() << std::endl;
    }
}

int main() {
    std::cout << "Fundit - campaign custody and transfer coordination demo" << std::endl;

    const std::string db_path = "fundit_demo.db";
    std::filesystem::remove(db_path);

    const Identity alice = "alice-principal";
    const Identity bob = "bob-principal";
    const Identity ops = "ops-principal";

    FunditConfig config;
    config.operators.insert(ops);

    rail::SimulatedRail ledger_rail(config.transfer_fee);
    ledger_rail.mint(Account(alice), 50'000'000);

    {
        storage::SqliteStore store;
        if (!check(store.open(db_path), "open store"))
            return 1;

        Engine engine(store, ledger_rail, config);
        if (!check(engine.load(), "load"))
            return 1;

        printSeparator("REGISTER RECORDS");
        if (!check(engine.registerCampaign(ledger::Campaign("c1", alice)), "register c1") ||
            !check(engine.registerProvider(ledger::Provider("p1", bob)), "register p1"))
            return 1;
        std::cout << "  Registered campaign c1 (alice) and provider p1 (bob)" << std::endl;

        printSeparator("FUND CAMPAIGN");
        engine.fundCampaign(alice, "c1", 10'000'000, [](dp::Result<BlockIndex, dp::Error> result) {
            if (result.is_ok())
                std::cout << "  Funded at block " << result.value() << std::endl;
        });
        printBalance(engine, alice, "c1");
        std::cout << "  Alice wallet: " << ledger_rail.balanceOf(Account(alice)) << std::endl;

        printSeparator("OVERDRAWN WITHDRAWAL");
        engine.withdrawCampaignFunds(alice, "c1", 999'999'999'999, report<BlockIndex>("withdraw 999999999999"));
        std::cout << "  Rail dispatches so far: " << engine.gateway().dispatchedCount() << std::endl;

        printSeparator("PAY PROVIDER");
        engine.payProvider(alice, "c1", "p1", 2'000'000, [](dp::Result<PaymentReceipt, dp::Error> result) {
            if (result.is_ok()) {
                std::cout << "  Campaign budget: " << result.value().campaign_budget << std::endl;
                std::cout << "  Provider earnings: " << result.value().provider_total_earnings << std::endl;
                std::cout << "  Earned from c1: " << result.value().earned_from_campaign << std::endl;
            }
        });

        printSeparator("NON-OWNER ACCESS");
        auto denied = engine.getCampaignBalance(bob, "c1");
        if (denied.is_err())
            std::cout << "  bob reads c1: " << errorKindToString(errorKind(denied.error())) << std::endl;
        engine.withdrawCampaignFunds(bob, "c1", 1'000'000, report<BlockIndex>("bob withdraws from c1"));

        printSeparator("CONTENTION");
        ledger_rail.setDeferred(true);
        engine.withdrawCampaignFunds(alice, "c1", 5'000'000, report<BlockIndex>("first withdrawal"));
        engine.withdrawCampaignFunds(alice, "c1", 5'000'000, report<BlockIndex>("second withdrawal"));
        engine.withdrawCampaignFunds(alice, "c1", 1'000'000, report<BlockIndex>("third withdrawal"));
        ledger_rail.settleAll();
        ledger_rail.setDeferred(false);
        printBalance(engine, alice, "c1");

        printSeparator("RAIL TIMEOUT");
        ledger_rail.failNext(rail::TransportStatus::Timeout, true, "no reply within deadline");
        engine.withdrawProviderEarnings(bob, "p1", 500'000, report<BlockIndex>("provider withdrawal"));
        auto earnings = engine.getProviderEarnings(bob, "p1");
        if (earnings.is_ok())
            std::cout << "  Provider earnings after timeout: " << earnings.value() << std::endl;

        printSeparator("RECONCILIATION");
        auto tickets = engine.listUnreconciled(ops);
        if (!tickets.is_ok())
            return 1;
        for (const auto &ticket : tickets.value()) {
            std::cout << "  Ticket " << ticket.getTicketId() << " "
                      << ledger::transferDirectionToString(ticket.getDirection()) << " " << ticket.getEntityId()
                      << " amount=" << ticket.amount << std::endl;
            // The simulated rail did execute the transfer, so the debit stands
            engine.resolveIndeterminate(ops, ticket.getTicketId(),
                                        Verdict::executedOnRail(ledger_rail.blockCount() - 1),
                                        report<void>("resolve " + ticket.getTicketId()));
        }

        if (!check(engine.snapshot(), "snapshot"))
            return 1;
        engine.printSummary();
    }

    printSeparator("RELOAD");
    {
        storage::SqliteStore store;
        if (!check(store.open(db_path), "reopen"))
            return 1;
        Engine engine(store, ledger_rail, config);
        if (!check(engine.load(), "reload"))
            return 1;
        printBalance(engine, alice, "c1");
        auto breakdown = engine.getProviderEarningsBreakdown(bob, "p1");
        if (!breakdown.is_ok())
            return 1;
        for (const auto &entry : breakdown.value()) {
            std::cout << "  p1 earned " << entry.total_earned << " from " << entry.getCampaignId()
                      << (entry.last_withdrawal.has_value() ? " (withdrawn since)" : "") << std::endl;
        }
    }

    std::filesystem::remove(db_path);
    std::cout << "\nDemo complete" << std::endl;
    return 0;
}
