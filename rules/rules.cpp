#include "rules/rules.hpp"

namespace payments {
namespace rules {

namespace {

// Deposits and withdrawals must carry a non-negative amount.
RuleResult checkAmount(const model::Transaction& transaction) {
  if (!transaction.amount().has_value()) {
    return RuleError::missingAmount(transaction.txId());
  }
  if (transaction.amount()->isNegative()) {
    return RuleError::negativeAmount(transaction.txId());
  }
  return std::nullopt;
}

// Resolve and chargeback both need a recorded deposit that is under dispute.
RuleResult findDisputedDeposit(const model::Account& account, model::TransactionId tx_id,
                               model::Money& amount) {
  auto deposited = account.depositAmount(tx_id);
  if (!deposited.has_value()) {
    return RuleError::depositNotFound(tx_id);
  }
  if (!account.isDisputed(tx_id)) {
    return RuleError::transactionNotDisputed(tx_id);
  }
  amount = *deposited;
  return std::nullopt;
}

// Both balances and their sum must stay representable after the deltas are applied.
bool balancesFit(const model::Account& account, model::Money to_available, model::Money to_held) {
  auto available = account.available().checkedAdd(to_available);
  auto held = account.held().checkedAdd(to_held);
  return available && held && available->checkedAdd(*held).has_value();
}

}  // namespace

RuleResult validate(const model::Account& account, const model::Transaction& transaction) {
  if (transaction.clientId() != account.clientId()) {
    return RuleError::mismatchedAccount(account.clientId(), transaction.clientId());
  }
  if (account.frozen()) {
    return RuleError::accountFrozen();
  }
  return std::nullopt;
}

RuleResult process(model::Account& account, const model::Transaction& transaction,
                   const RulePolicy& policy) {
  if (auto error = validate(account, transaction)) {
    return error;
  }

  switch (transaction.kind()) {
    case model::TransactionKind::DEPOSIT:
      return deposit(account, transaction, policy);
    case model::TransactionKind::WITHDRAWAL:
      return withdrawal(account, transaction);
    case model::TransactionKind::DISPUTE:
      return dispute(account, transaction, policy);
    case model::TransactionKind::RESOLVE:
      return resolve(account, transaction);
    case model::TransactionKind::CHARGEBACK:
      return chargeback(account, transaction);
  }
  return std::nullopt;
}

RuleResult deposit(model::Account& account, const model::Transaction& transaction,
                   const RulePolicy& policy) {
  if (auto error = checkAmount(transaction)) {
    return error;
  }
  if (policy.reject_duplicate_deposits &&
      account.depositAmount(transaction.txId()).has_value()) {
    return RuleError::duplicateTransaction(transaction.txId());
  }

  const model::Money amount = *transaction.amount();
  if (!balancesFit(account, amount, model::Money::zero())) {
    return RuleError::balanceOverflow(transaction.txId());
  }

  account.credit(amount);
  account.recordDeposit(transaction.txId(), amount);
  return std::nullopt;
}

RuleResult withdrawal(model::Account& account, const model::Transaction& transaction) {
  if (auto error = checkAmount(transaction)) {
    return error;
  }

  const model::Money amount = *transaction.amount();
  if (account.available() < amount) {
    return RuleError::insufficientFunds(transaction.txId());
  }

  account.debit(amount);
  return std::nullopt;
}

RuleResult dispute(model::Account& account, const model::Transaction& transaction,
                   const RulePolicy& policy) {
  auto amount = account.depositAmount(transaction.txId());
  if (!amount.has_value()) {
    return RuleError::depositNotFound(transaction.txId());
  }
  if (policy.reject_active_redispute && account.isDisputed(transaction.txId())) {
    return RuleError::alreadyDisputed(transaction.txId());
  }
  if (!balancesFit(account, -*amount, *amount)) {
    return RuleError::balanceOverflow(transaction.txId());
  }

  account.hold(*amount);
  account.markDisputed(transaction.txId());
  return std::nullopt;
}

RuleResult resolve(model::Account& account, const model::Transaction& transaction) {
  model::Money amount;
  if (auto error = findDisputedDeposit(account, transaction.txId(), amount)) {
    return error;
  }
  if (!balancesFit(account, amount, -amount)) {
    return RuleError::balanceOverflow(transaction.txId());
  }

  account.release(amount);
  account.clearDispute(transaction.txId());
  return std::nullopt;
}

RuleResult chargeback(model::Account& account, const model::Transaction& transaction) {
  model::Money amount;
  if (auto error = findDisputedDeposit(account, transaction.txId(), amount)) {
    return error;
  }

  account.removeHeld(amount);
  account.freeze();
  account.clearDispute(transaction.txId());
  return std::nullopt;
}

}  // namespace rules
}  // namespace payments
