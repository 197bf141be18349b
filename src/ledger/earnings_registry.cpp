#include <fundit/ledger/earnings_registry.hpp>
#include <limits>

namespace fundit::ledger {

    EarningsRegistry::EarningsRegistry(storage::KvStore &store) : store_(store) {}

    dp::Result<void, dp::Error> EarningsRegistry::load() {
        auto scanned = store_.scan(EARNINGS_NS);
        if (scanned.is_err())
            return dp::Result<void, dp::Error>::err(asStorageError(scanned.error()));

        std::map<RecordKey, ProviderEarnings> loaded;
        for (const auto &entry : scanned.value()) {
            auto decoded = decodeRecord<ProviderEarnings>(entry.value);
            if (decoded.is_err()) {
                return dp::Result<void, dp::Error>::err(
                    storage_failure(dp::String(("Corrupt earnings record " + entry.key).c_str())));
            }
            const auto &earnings = decoded.value();
            loaded[{earnings.getProviderId(), earnings.getCampaignId()}] = earnings;
        }
        records_ = std::move(loaded);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> EarningsRegistry::snapshot() {
        for (const auto &[key, earnings] : records_) {
            auto res = persist(earnings);
            if (res.is_err())
                return res;
        }
        auto flushed = store_.flush();
        if (flushed.is_err())
            return dp::Result<void, dp::Error>::err(asStorageError(flushed.error()));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<EarningsRegistry::Undo, dp::Error> EarningsRegistry::record(const std::string &provider_id,
                                                                          const std::string &campaign_id,
                                                                          Amount amount) {
        Undo undo{provider_id, campaign_id, dp::Optional<ProviderEarnings>()};

        ProviderEarnings updated(provider_id, campaign_id, 0);
        auto it = records_.find({provider_id, campaign_id});
        if (it != records_.end()) {
            undo.prior = it->second;
            updated = it->second;
        }

        if (amount > std::numeric_limits<Amount>::max() - updated.total_earned) {
            return dp::Result<Undo, dp::Error>::err(invalid_amount("Earnings record would overflow"));
        }
        updated.total_earned += amount;

        auto res = persist(updated);
        if (res.is_err())
            return dp::Result<Undo, dp::Error>::err(res.error());
        records_[{provider_id, campaign_id}] = updated;
        return dp::Result<Undo, dp::Error>::ok(std::move(undo));
    }

    dp::Result<void, dp::Error> EarningsRegistry::restore(const Undo &undo) {
        RecordKey key{undo.provider_id, undo.campaign_id};
        if (undo.prior.has_value()) {
            auto res = persist(*undo.prior);
            if (res.is_err())
                return res;
            records_[key] = *undo.prior;
        } else {
            auto res = store_.erase(EARNINGS_NS, earningsKey(undo.provider_id, undo.campaign_id));
            if (res.is_err())
                return dp::Result<void, dp::Error>::err(asStorageError(res.error()));
            records_.erase(key);
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<dp::usize, dp::Error> EarningsRegistry::stampWithdrawal(const std::string &provider_id,
                                                                      dp::i64 timestamp) {
        dp::usize stamped = 0;
        for (auto it = records_.lower_bound({provider_id, ""}); it != records_.end() && it->first.first == provider_id;
             ++it) {
            ProviderEarnings updated = it->second;
            updated.last_withdrawal = dp::Optional<dp::i64>(timestamp);
            auto res = persist(updated);
            if (res.is_err())
                return dp::Result<dp::usize, dp::Error>::err(res.error());
            it->second = updated;
            ++stamped;
        }
        return dp::Result<dp::usize, dp::Error>::ok(stamped);
    }

    dp::Optional<ProviderEarnings> EarningsRegistry::get(const std::string &provider_id,
                                                         const std::string &campaign_id) const {
        auto it = records_.find({provider_id, campaign_id});
        if (it == records_.end())
            return dp::Optional<ProviderEarnings>();
        return dp::Optional<ProviderEarnings>(it->second);
    }

    std::vector<ProviderEarnings> EarningsRegistry::breakdown(const std::string &provider_id) const {
        std::vector<ProviderEarnings> result;
        for (auto it = records_.lower_bound({provider_id, ""}); it != records_.end() && it->first.first == provider_id;
             ++it) {
            result.push_back(it->second);
        }
        return result;
    }

    dp::Result<void, dp::Error> EarningsRegistry::persist(const ProviderEarnings &earnings) {
        auto res = store_.put(EARNINGS_NS, earningsKey(earnings.getProviderId(), earnings.getCampaignId()),
                              encodeRecord(earnings));
        if (res.is_err())
            return dp::Result<void, dp::Error>::err(asStorageError(res.error()));
        return dp::Result<void, dp::Error>::ok();
    }

} // namespace fundit::ledger
