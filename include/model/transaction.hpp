#ifndef TRANSACTION_HPP_
#define TRANSACTION_HPP_

#include "model/money.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace payments {
namespace model {

using ClientId = std::uint16_t;
using TransactionId = std::uint32_t;

enum class TransactionKind {
  DEPOSIT,
  WITHDRAWAL,
  DISPUTE,
  RESOLVE,
  CHARGEBACK
};

// Lowercase name as it appears in input files ("deposit", "chargeback", ...).
std::string kindToString(TransactionKind kind);

// Case-insensitive, surrounding whitespace ignored.
std::optional<TransactionKind> kindFromString(std::string_view name);

// True for the kinds that carry their own amount.
bool kindCarriesAmount(TransactionKind kind);

/**
 * One input record. Deposits and withdrawals carry an amount; disputes,
 * resolves and chargebacks point at an earlier deposit through tx_id.
 */
class Transaction {
 public:
  Transaction(TransactionKind kind, ClientId client_id, TransactionId tx_id,
              std::optional<Money> amount = std::nullopt);

  static Transaction deposit(ClientId client_id, TransactionId tx_id, Money amount);
  static Transaction withdrawal(ClientId client_id, TransactionId tx_id, Money amount);
  static Transaction dispute(ClientId client_id, TransactionId tx_id);
  static Transaction resolve(ClientId client_id, TransactionId tx_id);
  static Transaction chargeback(ClientId client_id, TransactionId tx_id);

  TransactionKind kind() const { return kind_; }
  ClientId clientId() const { return client_id_; }
  TransactionId txId() const { return tx_id_; }
  const std::optional<Money>& amount() const { return amount_; }

 private:
  TransactionKind kind_;
  ClientId client_id_;
  TransactionId tx_id_;
  std::optional<Money> amount_;
};

}  // namespace model
}  // namespace payments

#endif  // TRANSACTION_HPP_
