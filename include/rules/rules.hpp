#ifndef RULES_HPP_
#define RULES_HPP_

#include "model/account.hpp"
#include "model/transaction.hpp"
#include "rules/rule_error.hpp"

namespace payments {
namespace rules {

/**
 * Switches for the two cases the base rules leave open.
 */
struct RulePolicy {
  // Refuse a deposit whose tx_id is already in the account's deposit index.
  // When false the later deposit overwrites the recorded amount.
  bool reject_duplicate_deposits = true;
  // Refuse a dispute on a deposit that is still under dispute.
  // A deposit whose dispute was resolved or charged back can always be disputed again.
  bool reject_active_redispute = true;
};

/**
 * Applies `transaction` to `account`.
 *
 * Runs validate() and then the handler for the transaction kind. On failure
 * the account is left exactly as it was.
 */
RuleResult process(model::Account& account, const model::Transaction& transaction,
                   const RulePolicy& policy = RulePolicy{});

/**
 * Checks shared by every kind: the transaction must name the account's client
 * and the account must not be frozen.
 */
RuleResult validate(const model::Account& account, const model::Transaction& transaction);

// Per-kind handlers. They assume validate() has already passed and each one
// evaluates all of its own checks before touching the account.

RuleResult deposit(model::Account& account, const model::Transaction& transaction,
                   const RulePolicy& policy = RulePolicy{});
RuleResult withdrawal(model::Account& account, const model::Transaction& transaction);
RuleResult dispute(model::Account& account, const model::Transaction& transaction,
                   const RulePolicy& policy = RulePolicy{});
RuleResult resolve(model::Account& account, const model::Transaction& transaction);
RuleResult chargeback(model::Account& account, const model::Transaction& transaction);

}  // namespace rules
}  // namespace payments

#endif  // RULES_HPP_
