#pragma once

#include <fundit/common/error.hpp>
#include <fundit/common/types.hpp>
#include <string>
#include <unordered_set>
#include <vector>

namespace fundit::ledger {

    /// Verifies caller identities before anything is mutated or dispatched.
    /// Ownership checks are pure; the operator set gates the reconciliation surface.
    class OwnershipGuard {
      private:
        std::unordered_set<std::string> operators_;

      public:
        OwnershipGuard() = default;
        explicit OwnershipGuard(const std::unordered_set<std::string> &operators);

        /// Fails with an authorization error unless caller is the record owner
        static dp::Result<void, dp::Error> requireOwner(const std::string &record_owner, const Identity &caller);

        /// Fails with an authorization error unless caller is a configured operator
        dp::Result<void, dp::Error> requireOperator(const Identity &caller) const;

        void registerOperator(const std::string &operator_id);

        dp::Result<void, dp::Error> revokeOperator(const std::string &operator_id);

        bool isOperator(const std::string &operator_id) const;

        std::vector<std::string> getOperators() const;

        void printSummary() const;
    };

} // namespace fundit::ledger
