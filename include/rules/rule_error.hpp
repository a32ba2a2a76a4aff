#ifndef RULE_ERROR_HPP_
#define RULE_ERROR_HPP_

#include "model/transaction.hpp"

#include <optional>
#include <string>

namespace payments {
namespace rules {

enum class RuleErrorCode {
  MISMATCHED_ACCOUNT,
  ACCOUNT_FROZEN,
  MISSING_AMOUNT,
  NEGATIVE_AMOUNT,
  INSUFFICIENT_FUNDS,
  DEPOSIT_NOT_FOUND,
  TRANSACTION_NOT_DISPUTED,
  DUPLICATE_TRANSACTION,
  ALREADY_DISPUTED,
  BALANCE_OVERFLOW
};

/**
 * Reason a transaction was refused. Only the fields relevant to the code are
 * meaningful: tx_id for the per-transaction failures, expected/actual client
 * for MISMATCHED_ACCOUNT.
 */
struct RuleError {
  RuleErrorCode code;
  model::TransactionId tx_id = 0;
  model::ClientId expected_client = 0;
  model::ClientId actual_client = 0;

  static RuleError mismatchedAccount(model::ClientId expected, model::ClientId actual);
  static RuleError accountFrozen();
  static RuleError missingAmount(model::TransactionId tx_id);
  static RuleError negativeAmount(model::TransactionId tx_id);
  static RuleError insufficientFunds(model::TransactionId tx_id);
  static RuleError depositNotFound(model::TransactionId tx_id);
  static RuleError transactionNotDisputed(model::TransactionId tx_id);
  static RuleError duplicateTransaction(model::TransactionId tx_id);
  static RuleError alreadyDisputed(model::TransactionId tx_id);
  static RuleError balanceOverflow(model::TransactionId tx_id);

  // Stable snake_case tag, used for log fields and metric labels.
  std::string codeName() const;

  std::string message() const;

  bool operator==(const RuleError& other) const;
  bool operator!=(const RuleError& other) const { return !(*this == other); }
};

// nullopt means the transaction was applied.
using RuleResult = std::optional<RuleError>;

}  // namespace rules
}  // namespace payments

#endif  // RULE_ERROR_HPP_
