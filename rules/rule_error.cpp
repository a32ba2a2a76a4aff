#include "rules/rule_error.hpp"

namespace payments {
namespace rules {

namespace {

RuleError withTx(RuleErrorCode code, model::TransactionId tx_id) {
  RuleError error{code};
  error.tx_id = tx_id;
  return error;
}

}  // namespace

RuleError RuleError::mismatchedAccount(model::ClientId expected, model::ClientId actual) {
  RuleError error{RuleErrorCode::MISMATCHED_ACCOUNT};
  error.expected_client = expected;
  error.actual_client = actual;
  return error;
}

RuleError RuleError::accountFrozen() {
  return RuleError{RuleErrorCode::ACCOUNT_FROZEN};
}

RuleError RuleError::missingAmount(model::TransactionId tx_id) {
  return withTx(RuleErrorCode::MISSING_AMOUNT, tx_id);
}

RuleError RuleError::negativeAmount(model::TransactionId tx_id) {
  return withTx(RuleErrorCode::NEGATIVE_AMOUNT, tx_id);
}

RuleError RuleError::insufficientFunds(model::TransactionId tx_id) {
  return withTx(RuleErrorCode::INSUFFICIENT_FUNDS, tx_id);
}

RuleError RuleError::depositNotFound(model::TransactionId tx_id) {
  return withTx(RuleErrorCode::DEPOSIT_NOT_FOUND, tx_id);
}

RuleError RuleError::transactionNotDisputed(model::TransactionId tx_id) {
  return withTx(RuleErrorCode::TRANSACTION_NOT_DISPUTED, tx_id);
}

RuleError RuleError::duplicateTransaction(model::TransactionId tx_id) {
  return withTx(RuleErrorCode::DUPLICATE_TRANSACTION, tx_id);
}

RuleError RuleError::alreadyDisputed(model::TransactionId tx_id) {
  return withTx(RuleErrorCode::ALREADY_DISPUTED, tx_id);
}

RuleError RuleError::balanceOverflow(model::TransactionId tx_id) {
  return withTx(RuleErrorCode::BALANCE_OVERFLOW, tx_id);
}

std::string RuleError::codeName() const {
  switch (code) {
    case RuleErrorCode::MISMATCHED_ACCOUNT: return "mismatched_account";
    case RuleErrorCode::ACCOUNT_FROZEN: return "account_frozen";
    case RuleErrorCode::MISSING_AMOUNT: return "missing_amount";
    case RuleErrorCode::NEGATIVE_AMOUNT: return "negative_amount";
    case RuleErrorCode::INSUFFICIENT_FUNDS: return "insufficient_funds";
    case RuleErrorCode::DEPOSIT_NOT_FOUND: return "deposit_not_found";
    case RuleErrorCode::TRANSACTION_NOT_DISPUTED: return "transaction_not_disputed";
    case RuleErrorCode::DUPLICATE_TRANSACTION: return "duplicate_transaction";
    case RuleErrorCode::ALREADY_DISPUTED: return "already_disputed";
    case RuleErrorCode::BALANCE_OVERFLOW: return "balance_overflow";
    default: return "unknown";
  }
}

std::string RuleError::message() const {
  const std::string tx = std::to_string(tx_id);
  switch (code) {
    case RuleErrorCode::MISMATCHED_ACCOUNT:
      return "account does not match: expected client " + std::to_string(expected_client) +
             ", transaction names client " + std::to_string(actual_client);
    case RuleErrorCode::ACCOUNT_FROZEN: return "account is frozen";
    case RuleErrorCode::MISSING_AMOUNT: return "amount missing for transaction " + tx;
    case RuleErrorCode::NEGATIVE_AMOUNT: return "negative amount for transaction " + tx;
    case RuleErrorCode::INSUFFICIENT_FUNDS: return "insufficient funds for transaction " + tx;
    case RuleErrorCode::DEPOSIT_NOT_FOUND: return "deposit not found: " + tx;
    case RuleErrorCode::TRANSACTION_NOT_DISPUTED: return "transaction not under dispute: " + tx;
    case RuleErrorCode::DUPLICATE_TRANSACTION: return "transaction id already used: " + tx;
    case RuleErrorCode::ALREADY_DISPUTED: return "transaction already under dispute: " + tx;
    case RuleErrorCode::BALANCE_OVERFLOW: return "balance out of range for transaction " + tx;
    default: return "unknown rule error";
  }
}

bool RuleError::operator==(const RuleError& other) const {
  return code == other.code && tx_id == other.tx_id &&
         expected_client == other.expected_client &&
         actual_client == other.actual_client;
}

}  // namespace rules
}  // namespace payments
