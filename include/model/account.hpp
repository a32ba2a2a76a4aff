#ifndef ACCOUNT_HPP_
#define ACCOUNT_HPP_

#include "model/money.hpp"
#include "model/transaction.hpp"

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace payments {
namespace model {

/**
 * Balance state of a single client.
 *
 * Besides the balances the account keeps the amounts of its accepted deposits
 * and the deposit ids currently under dispute, which is all the history the
 * dispute rules need.
 *
 * The mutators below perform no validation; callers go through
 * rules::process(), which checks every precondition first.
 */
class Account {
 public:
  explicit Account(ClientId client_id);

  ClientId clientId() const { return client_id_; }
  Money available() const { return available_; }
  Money held() const { return held_; }
  bool frozen() const { return frozen_; }

  // available + held
  Money total() const;

  // Amount of an accepted deposit, nullopt if tx_id was never deposited here.
  std::optional<Money> depositAmount(TransactionId tx_id) const;

  bool isDisputed(TransactionId tx_id) const;

  std::size_t depositCount() const { return deposits_.size(); }
  std::size_t activeDisputeCount() const { return active_disputes_.size(); }

  void credit(Money amount);
  void debit(Money amount);

  // Moves amount from available to held.
  void hold(Money amount);
  // Moves amount from held back to available.
  void release(Money amount);
  // Removes amount from held entirely.
  void removeHeld(Money amount);

  void freeze();

  void recordDeposit(TransactionId tx_id, Money amount);
  void markDisputed(TransactionId tx_id);
  void clearDispute(TransactionId tx_id);

  bool operator==(const Account& other) const;
  bool operator!=(const Account& other) const { return !(*this == other); }

 private:
  ClientId client_id_;
  Money available_;
  Money held_;
  bool frozen_ = false;

  std::unordered_map<TransactionId, Money> deposits_;
  std::unordered_set<TransactionId> active_disputes_;
};

}  // namespace model
}  // namespace payments

#endif  // ACCOUNT_HPP_
