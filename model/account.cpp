#include "model/account.hpp"

namespace payments {
namespace model {

Account::Account(ClientId client_id) : client_id_(client_id) {}

Money Account::total() const {
  return available_ + held_;
}

std::optional<Money> Account::depositAmount(TransactionId tx_id) const {
  auto it = deposits_.find(tx_id);
  if (it == deposits_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool Account::isDisputed(TransactionId tx_id) const {
  return active_disputes_.count(tx_id) > 0;
}

void Account::credit(Money amount) {
  available_ += amount;
}

void Account::debit(Money amount) {
  available_ -= amount;
}

void Account::hold(Money amount) {
  available_ -= amount;
  held_ += amount;
}

void Account::release(Money amount) {
  held_ -= amount;
  available_ += amount;
}

void Account::removeHeld(Money amount) {
  held_ -= amount;
}

void Account::freeze() {
  frozen_ = true;
}

void Account::recordDeposit(TransactionId tx_id, Money amount) {
  deposits_[tx_id] = amount;
}

void Account::markDisputed(TransactionId tx_id) {
  active_disputes_.insert(tx_id);
}

void Account::clearDispute(TransactionId tx_id) {
  active_disputes_.erase(tx_id);
}

bool Account::operator==(const Account& other) const {
  return client_id_ == other.client_id_ &&
         available_ == other.available_ &&
         held_ == other.held_ &&
         frozen_ == other.frozen_ &&
         deposits_ == other.deposits_ &&
         active_disputes_ == other.active_disputes_;
}

}  // namespace model
}  // namespace payments
