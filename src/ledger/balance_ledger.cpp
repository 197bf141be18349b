#include <fundit/ledger/balance_ledger.hpp>
#include <iostream>
#include <limits>

namespace fundit::ledger {

    namespace {

        dp::Error unknownEntity(EntityKind kind, const std::string &id) {
            return not_found(dp::String(("Unknown " + entityKindToString(kind) + ": " + id).c_str()));
        }

        template <typename T>
        dp::Result<std::map<std::string, T>, dp::Error> loadNamespace(storage::KvStore &store, const char *ns) {
            using LoadResult = dp::Result<std::map<std::string, T>, dp::Error>;
            auto scanned = store.scan(ns);
            if (scanned.is_err())
                return LoadResult::err(asStorageError(scanned.error()));

            std::map<std::string, T> records;
            for (const auto &entry : scanned.value()) {
                auto decoded = decodeRecord<T>(entry.value);
                if (decoded.is_err()) {
                    return LoadResult::err(storage_failure(
                        dp::String(("Corrupt record " + std::string(ns) + "/" + entry.key).c_str())));
                }
                records.emplace(entry.key, std::move(decoded.value()));
            }
            return LoadResult::ok(std::move(records));
        }

    } // namespace

    BalanceLedger::BalanceLedger(storage::KvStore &store) : store_(store) {}

    dp::Result<void, dp::Error> BalanceLedger::load() {
        auto campaigns = loadNamespace<Campaign>(store_, CAMPAIGNS_NS);
        if (campaigns.is_err())
            return dp::Result<void, dp::Error>::err(campaigns.error());
        auto providers = loadNamespace<Provider>(store_, PROVIDERS_NS);
        if (providers.is_err())
            return dp::Result<void, dp::Error>::err(providers.error());
        auto tickets = loadNamespace<UnreconciledTransfer>(store_, UNRECONCILED_NS);
        if (tickets.is_err())
            return dp::Result<void, dp::Error>::err(tickets.error());

        campaigns_ = std::move(campaigns.value());
        providers_ = std::move(providers.value());
        unreconciled_ = std::move(tickets.value());
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> BalanceLedger::snapshot() {
        for (const auto &[id, campaign] : campaigns_) {
            auto res = persistCampaign(campaign);
            if (res.is_err())
                return res;
        }
        for (const auto &[id, provider] : providers_) {
            auto res = persistProvider(provider);
            if (res.is_err())
                return res;
        }
        for (const auto &[id, ticket] : unreconciled_) {
            auto res = store_.put(UNRECONCILED_NS, id, encodeRecord(ticket));
            if (res.is_err())
                return dp::Result<void, dp::Error>::err(asStorageError(res.error()));
        }
        auto flushed = store_.flush();
        if (flushed.is_err())
            return dp::Result<void, dp::Error>::err(asStorageError(flushed.error()));
        return dp::Result<void, dp::Error>::ok();
    }

    // ===========================================
    // Record ingestion
    // ===========================================

    dp::Result<void, dp::Error> BalanceLedger::registerCampaign(const Campaign &campaign) {
        auto id = campaign.getId();
        if (campaigns_.count(id)) {
            return dp::Result<void, dp::Error>::err(already_exists(dp::String(("Campaign exists: " + id).c_str())));
        }
        auto res = persistCampaign(campaign);
        if (res.is_err())
            return res;
        campaigns_.emplace(id, campaign);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> BalanceLedger::registerProvider(const Provider &provider) {
        auto id = provider.getId();
        if (providers_.count(id)) {
            return dp::Result<void, dp::Error>::err(already_exists(dp::String(("Provider exists: " + id).c_str())));
        }
        auto res = persistProvider(provider);
        if (res.is_err())
            return res;
        providers_.emplace(id, provider);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> BalanceLedger::removeCampaign(const std::string &campaign_id) {
        if (!campaigns_.count(campaign_id))
            return dp::Result<void, dp::Error>::err(unknownEntity(EntityKind::Campaign, campaign_id));
        auto res = store_.erase(CAMPAIGNS_NS, campaign_id);
        if (res.is_err())
            return dp::Result<void, dp::Error>::err(asStorageError(res.error()));
        campaigns_.erase(campaign_id);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> BalanceLedger::removeProvider(const std::string &provider_id) {
        if (!providers_.count(provider_id))
            return dp::Result<void, dp::Error>::err(unknownEntity(EntityKind::Provider, provider_id));
        auto res = store_.erase(PROVIDERS_NS, provider_id);
        if (res.is_err())
            return dp::Result<void, dp::Error>::err(asStorageError(res.error()));
        providers_.erase(provider_id);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<Campaign, dp::Error> BalanceLedger::getCampaign(const std::string &campaign_id) const {
        auto it = campaigns_.find(campaign_id);
        if (it == campaigns_.end())
            return dp::Result<Campaign, dp::Error>::err(unknownEntity(EntityKind::Campaign, campaign_id));
        return dp::Result<Campaign, dp::Error>::ok(it->second);
    }

    dp::Result<Provider, dp::Error> BalanceLedger::getProvider(const std::string &provider_id) const {
        auto it = providers_.find(provider_id);
        if (it == providers_.end())
            return dp::Result<Provider, dp::Error>::err(unknownEntity(EntityKind::Provider, provider_id));
        return dp::Result<Provider, dp::Error>::ok(it->second);
    }

    bool BalanceLedger::hasCampaign(const std::string &campaign_id) const { return campaigns_.count(campaign_id) > 0; }

    bool BalanceLedger::hasProvider(const std::string &provider_id) const { return providers_.count(provider_id) > 0; }

    std::vector<std::string> BalanceLedger::getCampaignIds() const {
        std::vector<std::string> ids;
        for (const auto &[id, campaign] : campaigns_)
            ids.push_back(id);
        return ids;
    }

    std::vector<std::string> BalanceLedger::getProviderIds() const {
        std::vector<std::string> ids;
        for (const auto &[id, provider] : providers_)
            ids.push_back(id);
        return ids;
    }

    // ===========================================
    // Balance primitives
    // ===========================================

    dp::Result<std::string, dp::Error> BalanceLedger::ownerOf(EntityKind kind, const std::string &id) const {
        if (kind == EntityKind::Campaign) {
            auto it = campaigns_.find(id);
            if (it != campaigns_.end())
                return dp::Result<std::string, dp::Error>::ok(it->second.getOwner());
        } else {
            auto it = providers_.find(id);
            if (it != providers_.end())
                return dp::Result<std::string, dp::Error>::ok(it->second.getOwner());
        }
        return dp::Result<std::string, dp::Error>::err(unknownEntity(kind, id));
    }

    dp::Result<Amount, dp::Error> BalanceLedger::balanceOf(EntityKind kind, const std::string &id) const {
        if (kind == EntityKind::Campaign) {
            auto it = campaigns_.find(id);
            if (it != campaigns_.end())
                return dp::Result<Amount, dp::Error>::ok(it->second.budget);
        } else {
            auto it = providers_.find(id);
            if (it != providers_.end())
                return dp::Result<Amount, dp::Error>::ok(it->second.total_earnings);
        }
        return dp::Result<Amount, dp::Error>::err(unknownEntity(kind, id));
    }

    dp::Result<Amount, dp::Error> BalanceLedger::debit(EntityKind kind, const std::string &id, Amount amount) {
        auto balance = balanceOf(kind, id);
        if (balance.is_err())
            return balance;
        if (balance.value() < amount) {
            return dp::Result<Amount, dp::Error>::err(insufficient_funds(
                dp::String(("Balance " + std::to_string(balance.value()) + " below " + std::to_string(amount)).c_str())));
        }
        return applyBalance(kind, id, balance.value() - amount);
    }

    dp::Result<Amount, dp::Error> BalanceLedger::credit(EntityKind kind, const std::string &id, Amount amount) {
        auto balance = balanceOf(kind, id);
        if (balance.is_err())
            return balance;
        if (amount > std::numeric_limits<Amount>::max() - balance.value()) {
            return dp::Result<Amount, dp::Error>::err(invalid_amount("Credit would overflow the balance"));
        }
        return applyBalance(kind, id, balance.value() + amount);
    }

    bool BalanceLedger::canCredit(EntityKind kind, const std::string &id, Amount amount) const {
        auto balance = balanceOf(kind, id);
        return balance.is_ok() && amount <= std::numeric_limits<Amount>::max() - balance.value();
    }

    dp::Result<Amount, dp::Error> BalanceLedger::applyBalance(EntityKind kind, const std::string &id, Amount balance) {
        if (kind == EntityKind::Campaign) {
            Campaign updated = campaigns_.at(id);
            updated.budget = balance;
            auto res = persistCampaign(updated);
            if (res.is_err())
                return dp::Result<Amount, dp::Error>::err(res.error());
            campaigns_[id] = updated;
        } else {
            Provider updated = providers_.at(id);
            updated.total_earnings = balance;
            auto res = persistProvider(updated);
            if (res.is_err())
                return dp::Result<Amount, dp::Error>::err(res.error());
            providers_[id] = updated;
        }
        return dp::Result<Amount, dp::Error>::ok(balance);
    }

    // ===========================================
    // Unreconciled transfers
    // ===========================================

    dp::Result<void, dp::Error> BalanceLedger::recordUnreconciled(const UnreconciledTransfer &ticket) {
        auto id = ticket.getTicketId();
        auto res = store_.put(UNRECONCILED_NS, id, encodeRecord(ticket));
        if (res.is_err())
            return dp::Result<void, dp::Error>::err(asStorageError(res.error()));
        unreconciled_[id] = ticket;
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<UnreconciledTransfer, dp::Error> BalanceLedger::getUnreconciled(const std::string &ticket_id) const {
        auto it = unreconciled_.find(ticket_id);
        if (it == unreconciled_.end()) {
            return dp::Result<UnreconciledTransfer, dp::Error>::err(
                not_found(dp::String(("Unknown ticket: " + ticket_id).c_str())));
        }
        return dp::Result<UnreconciledTransfer, dp::Error>::ok(it->second);
    }

    dp::Result<void, dp::Error> BalanceLedger::clearUnreconciled(const std::string &ticket_id) {
        if (!unreconciled_.count(ticket_id)) {
            return dp::Result<void, dp::Error>::err(not_found(dp::String(("Unknown ticket: " + ticket_id).c_str())));
        }
        auto res = store_.erase(UNRECONCILED_NS, ticket_id);
        if (res.is_err())
            return dp::Result<void, dp::Error>::err(asStorageError(res.error()));
        unreconciled_.erase(ticket_id);
        return dp::Result<void, dp::Error>::ok();
    }

    std::vector<UnreconciledTransfer> BalanceLedger::listUnreconciled() const {
        std::vector<UnreconciledTransfer> tickets;
        for (const auto &[id, ticket] : unreconciled_)
            tickets.push_back(ticket);
        return tickets;
    }

    void BalanceLedger::printSummary() const {
        std::cout << "=== Balance Ledger ===" << std::endl;
        std::cout << "Campaigns (" << campaigns_.size() << "):" << std::endl;
        for (const auto &[id, campaign] : campaigns_) {
            std::cout << "  " << id << " owner=" << campaign.getOwner() << " budget=" << campaign.budget << std::endl;
        }
        std::cout << "Providers (" << providers_.size() << "):" << std::endl;
        for (const auto &[id, provider] : providers_) {
            std::cout << "  " << id << " owner=" << provider.getOwner() << " earnings=" << provider.total_earnings
                      << std::endl;
        }
        std::cout << "Unreconciled transfers: " << unreconciled_.size() << std::endl;
        for (const auto &[id, ticket] : unreconciled_) {
            std::cout << "  " << id << " " << transferDirectionToString(ticket.getDirection()) << " "
                      << entityKey(ticket.getEntityKind(), ticket.getEntityId()) << " amount=" << ticket.amount
                      << " reason=" << ticket.getReason() << std::endl;
        }
    }

    // ===========================================
    // Persistence helpers
    // ===========================================

    dp::Result<void, dp::Error> BalanceLedger::persistCampaign(const Campaign &campaign) {
        auto res = store_.put(CAMPAIGNS_NS, campaign.getId(), encodeRecord(campaign));
        if (res.is_err())
            return dp::Result<void, dp::Error>::err(asStorageError(res.error()));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> BalanceLedger::persistProvider(const Provider &provider) {
        auto res = store_.put(PROVIDERS_NS, provider.getId(), encodeRecord(provider));
        if (res.is_err())
            return dp::Result<void, dp::Error>::err(asStorageError(res.error()));
        return dp::Result<void, dp::Error>::ok();
    }

} // namespace fundit::ledger
