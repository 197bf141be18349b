#include <algorithm>
#include <fundit/ledger/guard.hpp>
#include <iostream>

namespace fundit::ledger {

    OwnershipGuard::OwnershipGuard(const std::unordered_set<std::string> &operators) : operators_(operators) {}

    dp::Result<void, dp::Error> OwnershipGuard::requireOwner(const std::string &record_owner, const Identity &caller) {
        if (caller.empty()) {
            return dp::Result<void, dp::Error>::err(unauthorized("Anonymous caller"));
        }
        if (record_owner != caller) {
            return dp::Result<void, dp::Error>::err(
                unauthorized(dp::String(("Caller " + caller + " is not the owner").c_str())));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> OwnershipGuard::requireOperator(const Identity &caller) const {
        if (caller.empty() || !isOperator(caller)) {
            std::cout << "[guard] Unauthorized operator: " << (caller.empty() ? "<anonymous>" : caller) << std::endl;
            return dp::Result<void, dp::Error>::err(
                unauthorized(dp::String(("Caller " + caller + " is not an operator").c_str())));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    void OwnershipGuard::registerOperator(const std::string &operator_id) {
        operators_.insert(operator_id);
        std::cout << "[guard] Operator " << operator_id << " registered" << std::endl;
    }

    dp::Result<void, dp::Error> OwnershipGuard::revokeOperator(const std::string &operator_id) {
        if (operators_.erase(operator_id) == 0) {
            return dp::Result<void, dp::Error>::err(
                not_found(dp::String(("Operator not found: " + operator_id).c_str())));
        }
        std::cout << "[guard] Operator " << operator_id << " revoked" << std::endl;
        return dp::Result<void, dp::Error>::ok();
    }

    bool OwnershipGuard::isOperator(const std::string &operator_id) const {
        return operators_.find(operator_id) != operators_.end();
    }

    std::vector<std::string> OwnershipGuard::getOperators() const {
        std::vector<std::string> result(operators_.begin(), operators_.end());
        std::sort(result.begin(), result.end());
        return result;
    }

    void OwnershipGuard::printSummary() const {
        std::cout << "=== Ownership Guard ===" << std::endl;
        std::cout << "Operators (" << operators_.size() << "):";
        for (const auto &op : getOperators()) {
            std::cout << " " << op;
        }
        std::cout << std::endl;
    }

} // namespace fundit::ledger
