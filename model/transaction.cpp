#include "model/transaction.hpp"

#include <cctype>

namespace payments {
namespace model {

std::string kindToString(TransactionKind kind) {
  switch (kind) {
    case TransactionKind::DEPOSIT: return "deposit";
    case TransactionKind::WITHDRAWAL: return "withdrawal";
    case TransactionKind::DISPUTE: return "dispute";
    case TransactionKind::RESOLVE: return "resolve";
    case TransactionKind::CHARGEBACK: return "chargeback";
    default: return "unknown";
  }
}

std::optional<TransactionKind> kindFromString(std::string_view name) {
  while (!name.empty() && std::isspace(static_cast<unsigned char>(name.front()))) {
    name.remove_prefix(1);
  }
  while (!name.empty() && std::isspace(static_cast<unsigned char>(name.back()))) {
    name.remove_suffix(1);
  }

  std::string normalized;
  normalized.reserve(name.size());
  for (char c : name) {
    normalized += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }

  if (normalized == "deposit") return TransactionKind::DEPOSIT;
  if (normalized == "withdrawal") return TransactionKind::WITHDRAWAL;
  if (normalized == "dispute") return TransactionKind::DISPUTE;
  if (normalized == "resolve") return TransactionKind::RESOLVE;
  if (normalized == "chargeback") return TransactionKind::CHARGEBACK;
  return std::nullopt;
}

bool kindCarriesAmount(TransactionKind kind) {
  return kind == TransactionKind::DEPOSIT || kind == TransactionKind::WITHDRAWAL;
}

Transaction::Transaction(TransactionKind kind, ClientId client_id, TransactionId tx_id,
                         std::optional<Money> amount)
    : kind_(kind), client_id_(client_id), tx_id_(tx_id), amount_(amount) {}

Transaction Transaction::deposit(ClientId client_id, TransactionId tx_id, Money amount) {
  return Transaction(TransactionKind::DEPOSIT, client_id, tx_id, amount);
}

Transaction Transaction::withdrawal(ClientId client_id, TransactionId tx_id, Money amount) {
  return Transaction(TransactionKind::WITHDRAWAL, client_id, tx_id, amount);
}

Transaction Transaction::dispute(ClientId client_id, TransactionId tx_id) {
  return Transaction(TransactionKind::DISPUTE, client_id, tx_id);
}

Transaction Transaction::resolve(ClientId client_id, TransactionId tx_id) {
  return Transaction(TransactionKind::RESOLVE, client_id, tx_id);
}

Transaction Transaction::chargeback(ClientId client_id, TransactionId tx_id) {
  return Transaction(TransactionKind::CHARGEBACK, client_id, tx_id);
}

}  // namespace model
}  // namespace payments
