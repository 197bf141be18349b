#include <doctest/doctest.h>

#include <fundit/rail/gateway.hpp>
#include <fundit/rail/simulated_rail.hpp>
#include <algorithm>
#include <stdexcept>
#include <vector>

using namespace fundit;
using namespace fundit::rail;

namespace {

    /// Rail that answers with whatever reply it is given
    class ScriptedRail : public Rail {
      public:
        std::vector<RailReply> replies;
        bool throw_on_submit = false;
        bool drop_handler = false;
        std::vector<TransferRequest> seen;

        void submit(const TransferRequest &request, ReplyHandler on_reply) override {
            seen.push_back(request);
            if (throw_on_submit)
                throw std::runtime_error("socket closed");
            if (drop_handler)
                return;
            for (const auto &reply : replies)
                on_reply(reply);
        }
    };

    RejectReason reason(RejectCode code, dp::u64 detail = 0) { return RejectReason{code, detail, ""}; }

} // namespace

TEST_SUITE("LedgerGateway") {
    TEST_CASE("Classification") {
        SUBCASE("Block index confirms") {
            auto outcome = LedgerGateway::classify(RailReply::ok(42));
            CHECK(outcome.isConfirmed());
            CHECK(outcome.block_index == 42);
        }

        SUBCASE("Every rail-defined error is a rejection") {
            for (auto code : {RejectCode::BadFee, RejectCode::BadBurn, RejectCode::InsufficientFunds,
                              RejectCode::TooOld, RejectCode::CreatedInFuture, RejectCode::TemporarilyUnavailable,
                              RejectCode::Duplicate, RejectCode::GenericError}) {
                auto outcome = LedgerGateway::classify(RailReply::rejected(reason(code)));
                CHECK(outcome.isRejected());
                CHECK(outcome.reason.find(rejectCodeToString(code)) == 0);
            }
        }

        SUBCASE("Reject reason keeps the rail detail") {
            auto outcome = LedgerGateway::classify(RailReply::rejected(reason(RejectCode::BadFee, 10000)));
            CHECK(outcome.reason == "BadFee (expected_fee: 10000)");
        }

        SUBCASE("Transport failures are never rejections") {
            for (auto status : {TransportStatus::Timeout, TransportStatus::Unreachable, TransportStatus::SystemError,
                                TransportStatus::Unknown}) {
                auto outcome = LedgerGateway::classify(RailReply::transportFailure(status, "lost"));
                CHECK(outcome.isIndeterminate());
            }
        }

        SUBCASE("A call refused before dispatch did not execute") {
            auto outcome = LedgerGateway::classify(RailReply::transportFailure(TransportStatus::NotDispatched, "queue full"));
            CHECK(outcome.isRejected());
        }

        SUBCASE("A delivered reply with neither result is indeterminate") {
            RailReply empty;
            empty.transport = TransportStatus::Delivered;
            CHECK(LedgerGateway::classify(empty).isIndeterminate());
        }
    }

    TEST_CASE("Requests carry fee, memo and creation time") {
        ScriptedRail rail;
        FunditConfig config;
        LedgerGateway gateway(rail, config);

        auto request = gateway.makeRequest(Account("alice"), config.custody_account, 1'000'000, "Fund campaign: c1");
        CHECK(request.fee == config.transfer_fee);
        CHECK(request.amount == 1'000'000);
        REQUIRE(request.memo.has_value());
        std::string memo((*request.memo).begin(), (*request.memo).end());
        CHECK(memo == "Fund campaign: c1");
        REQUIRE(request.created_at_time.has_value());

        auto next = gateway.makeRequest(Account("alice"), config.custody_account, 1'000'000, "Fund campaign: c1");
        CHECK(*next.created_at_time > *request.created_at_time);

        SUBCASE("Creation time can be left out") {
            config.stamp_created_at_time = false;
            LedgerGateway plain(rail, config);
            CHECK_FALSE(plain.makeRequest(Account("a"), Account("b"), 20000, "").created_at_time.has_value());
            CHECK_FALSE(plain.makeRequest(Account("a"), Account("b"), 20000, "").memo.has_value());
        }
    }

    TEST_CASE("Long memos are replaced by their digest") {
        ScriptedRail rail;
        FunditConfig config;
        LedgerGateway gateway(rail, config);

        std::string long_memo = "Provider withdrawal: a-provider-id-that-is-rather-long";
        auto encoded = gateway.encodeMemo(long_memo);
        CHECK(encoded.size() == 32);
        CHECK(std::string(encoded.begin(), encoded.end()) != long_memo.substr(0, 32));

        auto again = gateway.encodeMemo(long_memo);
        CHECK(std::equal(encoded.begin(), encoded.end(), again.begin()));

        std::string exact(32, 'm');
        auto kept = gateway.encodeMemo(exact);
        CHECK(std::string(kept.begin(), kept.end()) == exact);
    }

    TEST_CASE("Exactly one outcome per transfer") {
        ScriptedRail rail;
        FunditConfig config;
        LedgerGateway gateway(rail, config);

        SUBCASE("Second reply is ignored") {
            rail.replies = {RailReply::ok(1), RailReply::rejected(reason(RejectCode::GenericError))};
            int calls = 0;
            TransferOutcome seen;
            gateway.transfer(gateway.makeRequest(Account("a"), Account("b"), 20000, "m"),
                             [&](TransferOutcome outcome) {
                                 ++calls;
                                 seen = outcome;
                             });
            CHECK(calls == 1);
            CHECK(seen.isConfirmed());
            CHECK(gateway.duplicateReplyCount() == 1);
        }

        SUBCASE("A throwing transport yields an indeterminate outcome") {
            rail.throw_on_submit = true;
            int calls = 0;
            TransferOutcome seen;
            gateway.transfer(gateway.makeRequest(Account("a"), Account("b"), 20000, "m"),
                             [&](TransferOutcome outcome) {
                                 ++calls;
                                 seen = outcome;
                             });
            CHECK(calls == 1);
            CHECK(seen.isIndeterminate());
        }

        SUBCASE("A request the rail discards unanswered is indeterminate") {
            rail.drop_handler = true;
            int calls = 0;
            TransferOutcome seen;
            gateway.transfer(gateway.makeRequest(Account("a"), Account("b"), 20000, "m"),
                             [&](TransferOutcome outcome) {
                                 ++calls;
                                 seen = outcome;
                             });
            CHECK(calls == 1);
            CHECK(seen.isIndeterminate());
            CHECK(seen.reason == "rail dropped reply");
            CHECK(gateway.duplicateReplyCount() == 0);
        }

        CHECK(gateway.dispatchedCount() == 1);
    }
}

TEST_SUITE("SimulatedRail") {
    TEST_CASE("Moves funds net of the fee") {
        SimulatedRail rail(10000);
        rail.mint(Account("alice"), 1'000'000);

        RailReply reply;
        TransferRequest request{Account("alice"), Account("custody"), 500'000, 10000, {}, {}};
        rail.submit(request, [&](RailReply r) { reply = r; });
        REQUIRE(reply.block_index.has_value());
        CHECK(*reply.block_index == 0);
        CHECK(rail.balanceOf(Account("alice")) == 500'000);
        CHECK(rail.balanceOf(Account("custody")) == 490'000);
        CHECK(rail.burned() == 10000);
    }

    TEST_CASE("Rail-side rejections") {
        SimulatedRail rail(10000);
        rail.mint(Account("alice"), 100'000);
        auto submit = [&](TransferRequest request) {
            RailReply reply;
            rail.submit(request, [&](RailReply r) { reply = r; });
            REQUIRE(reply.error.has_value());
            return (*reply.error).code;
        };

        CHECK(submit(TransferRequest{Account("alice"), Account("b"), 50'000, 1, {}, {}}) == RejectCode::BadFee);
        CHECK(submit(TransferRequest{Account("alice"), Account("b"), 500'000, 10000, {}, {}}) ==
              RejectCode::InsufficientFunds);

        rail.setLedgerTime(SimulatedRail::DEDUP_WINDOW_NANOS * 3);
        CHECK(submit(TransferRequest{Account("alice"), Account("b"), 50'000, 10000, {},
                                     dp::Optional<dp::u64>(SimulatedRail::DEDUP_WINDOW_NANOS)}) == RejectCode::TooOld);
        CHECK(submit(TransferRequest{Account("alice"), Account("b"), 50'000, 10000, {},
                                     dp::Optional<dp::u64>(SimulatedRail::DEDUP_WINDOW_NANOS * 4)}) ==
              RejectCode::CreatedInFuture);

        TransferRequest stamped{Account("alice"), Account("b"), 20'000, 10000, {},
                                dp::Optional<dp::u64>(SimulatedRail::DEDUP_WINDOW_NANOS * 3)};
        RailReply first;
        rail.submit(stamped, [&](RailReply r) { first = r; });
        REQUIRE(first.block_index.has_value());
        CHECK(submit(stamped) == RejectCode::Duplicate);
        CHECK(rail.blockCount() == 1);
    }

    TEST_CASE("Deferred replies and scripted failures") {
        SimulatedRail rail(10000);
        rail.mint(Account("alice"), 100'000);
        rail.setDeferred(true);

        int replies = 0;
        TransferRequest request{Account("alice"), Account("b"), 30'000, 10000, {}, {}};
        rail.submit(request, [&](RailReply) { ++replies; });
        CHECK(replies == 0);
        CHECK(rail.pendingCount() == 1);

        rail.failNext(TransportStatus::Timeout, true);
        CHECK(rail.settleAll() == 1);
        CHECK(replies == 1);
        // Executed even though the caller only saw a timeout
        CHECK(rail.balanceOf(Account("b")) == 20'000);
        CHECK_FALSE(rail.settleNext());
    }
}
