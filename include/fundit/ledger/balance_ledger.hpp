#pragma once

#include <fundit/ledger/records.hpp>
#include <fundit/storage/kv_store.hpp>
#include <map>
#include <string>
#include <vector>

namespace fundit::ledger {

    // Store namespaces
    inline constexpr const char *CAMPAIGNS_NS = "campaigns";
    inline constexpr const char *PROVIDERS_NS = "providers";
    inline constexpr const char *UNRECONCILED_NS = "unreconciled";

    // ===========================================
    // BalanceLedger - canonical owner of campaign budgets and provider earnings
    // ===========================================

    /// Every mutation is a single write-through step: the updated record is persisted
    /// first and only then replaces the in-memory copy, so a failed write changes nothing.
    /// Not internally synchronized; the engine's state latch serializes access.
    class BalanceLedger {
      public:
        explicit BalanceLedger(storage::KvStore &store);

        /// Replace the in-memory state with what the store holds
        dp::Result<void, dp::Error> load();

        /// Rewrite every record to the store and flush it
        dp::Result<void, dp::Error> snapshot();

        // ===========================================
        // Record ingestion (CRUD collaborator seam)
        // ===========================================

        dp::Result<void, dp::Error> registerCampaign(const Campaign &campaign);
        dp::Result<void, dp::Error> registerProvider(const Provider &provider);
        dp::Result<void, dp::Error> removeCampaign(const std::string &campaign_id);
        dp::Result<void, dp::Error> removeProvider(const std::string &provider_id);

        dp::Result<Campaign, dp::Error> getCampaign(const std::string &campaign_id) const;
        dp::Result<Provider, dp::Error> getProvider(const std::string &provider_id) const;

        bool hasCampaign(const std::string &campaign_id) const;
        bool hasProvider(const std::string &provider_id) const;

        std::vector<std::string> getCampaignIds() const;
        std::vector<std::string> getProviderIds() const;

        // ===========================================
        // Balance primitives
        // ===========================================

        /// Owner identity of a campaign or provider
        dp::Result<std::string, dp::Error> ownerOf(EntityKind kind, const std::string &id) const;

        /// Campaign budget or provider total earnings
        dp::Result<Amount, dp::Error> balanceOf(EntityKind kind, const std::string &id) const;

        /// Subtract from a balance, failing with insufficient funds rather than going below zero
        /// @return The balance after the debit
        dp::Result<Amount, dp::Error> debit(EntityKind kind, const std::string &id, Amount amount);

        /// Add to a balance, failing with invalid amount on overflow
        /// @return The balance after the credit
        dp::Result<Amount, dp::Error> credit(EntityKind kind, const std::string &id, Amount amount);

        /// True when crediting amount would not overflow the balance
        bool canCredit(EntityKind kind, const std::string &id, Amount amount) const;

        // ===========================================
        // Unreconciled transfers
        // ===========================================

        dp::Result<void, dp::Error> recordUnreconciled(const UnreconciledTransfer &ticket);
        dp::Result<UnreconciledTransfer, dp::Error> getUnreconciled(const std::string &ticket_id) const;
        dp::Result<void, dp::Error> clearUnreconciled(const std::string &ticket_id);

        /// Open tickets ordered by ticket id
        std::vector<UnreconciledTransfer> listUnreconciled() const;

        dp::usize campaignCount() const { return campaigns_.size(); }
        dp::usize providerCount() const { return providers_.size(); }
        dp::usize unreconciledCount() const { return unreconciled_.size(); }

        void printSummary() const;

      private:
        storage::KvStore &store_;
        std::map<std::string, Campaign> campaigns_;
        std::map<std::string, Provider> providers_;
        std::map<std::string, UnreconciledTransfer> unreconciled_;

        dp::Result<void, dp::Error> persistCampaign(const Campaign &campaign);
        dp::Result<void, dp::Error> persistProvider(const Provider &provider);
        dp::Result<Amount, dp::Error> applyBalance(EntityKind kind, const std::string &id, Amount balance);
    };

} // namespace fundit::ledger
