#include "payments_engine_impl.hpp"

#include "observability/logger.hpp"

namespace payments {

namespace {

constexpr char kRecordsTotal[] = "payments_records_total";
constexpr char kAppliedTotal[] = "payments_transactions_applied_total";
constexpr char kRejectedTotal[] = "payments_transactions_rejected_total";
constexpr char kMalformedTotal[] = "payments_records_malformed_total";
constexpr char kLockedTotal[] = "payments_accounts_locked_total";
constexpr char kAccountsGauge[] = "payments_accounts";
constexpr char kProcessSeconds[] = "payments_transaction_seconds";

}  // namespace

PaymentsEngineImpl::PaymentsEngineImpl(const rules::RulePolicy& policy) : policy_(policy) {}

model::Account& PaymentsEngineImpl::accountFor(model::ClientId client_id) {
  auto it = accounts_.find(client_id);
  if (it == accounts_.end()) {
    it = accounts_.emplace(client_id, model::Account(client_id)).first;
    metrics_.setGauge(kAccountsGauge, static_cast<double>(accounts_.size()));
    PAYMENTS_LOG_BUILDER(observability::LogLevel::DEBUG, "account opened")
        .field("client", static_cast<unsigned>(client_id));
  }
  return it->second;
}

// Applies one transaction; the account is created even if the transaction is then refused.
rules::RuleResult PaymentsEngineImpl::Process(const model::Transaction& transaction) {
  observability::MetricsCollector::Timer timer(metrics_, kProcessSeconds);

  model::Account& account = accountFor(transaction.clientId());
  const bool was_frozen = account.frozen();

  auto result = rules::process(account, transaction, policy_);
  if (result) {
    reportRejection(transaction, *result);
    return result;
  }

  metrics_.incrementCounter(kAppliedTotal, "kind", model::kindToString(transaction.kind()));
  if (!was_frozen && account.frozen()) {
    metrics_.incrementCounter(kLockedTotal);
    PAYMENTS_LOG_BUILDER(observability::LogLevel::INFO, "account locked by chargeback")
        .field("client", static_cast<unsigned>(transaction.clientId()))
        .field("tx", transaction.txId());
  }
  return std::nullopt;
}

RunStats PaymentsEngineImpl::ProcessAll(io::TransactionSource& source) {
  RunStats stats;

  while (auto record = source.next()) {
    ++stats.records;
    metrics_.incrementCounter(kRecordsTotal);

    if (!record->transaction) {
      ++stats.malformed;
      metrics_.incrementCounter(kMalformedTotal);
      PAYMENTS_LOG_BUILDER(observability::LogLevel::WARN, "skipping malformed record")
          .field("line", static_cast<std::uint64_t>(record->line))
          .field("error", record->error);
      continue;
    }

    if (Process(*record->transaction)) {
      ++stats.rejected;
    } else {
      ++stats.applied;
    }
  }

  PAYMENTS_LOG_BUILDER(observability::LogLevel::INFO, "run complete")
      .field("records", static_cast<std::uint64_t>(stats.records))
      .field("applied", static_cast<std::uint64_t>(stats.applied))
      .field("rejected", static_cast<std::uint64_t>(stats.rejected))
      .field("malformed", static_cast<std::uint64_t>(stats.malformed))
      .field("accounts", static_cast<std::uint64_t>(accounts_.size()));
  return stats;
}

const model::Account* PaymentsEngineImpl::FindAccount(model::ClientId client_id) const {
  auto it = accounts_.find(client_id);
  if (it == accounts_.end()) {
    return nullptr;
  }
  return &it->second;
}

std::vector<model::Account> PaymentsEngineImpl::Snapshot() const {
  std::vector<model::Account> result;
  result.reserve(accounts_.size());
  for (const auto& [client_id, account] : accounts_) {
    result.push_back(account);
  }
  return result;
}

void PaymentsEngineImpl::reportRejection(const model::Transaction& transaction,
                                         const rules::RuleError& error) {
  metrics_.incrementCounter(kRejectedTotal, "reason", error.codeName());
  PAYMENTS_LOG_BUILDER(observability::LogLevel::WARN, "transaction rejected")
      .field("reason", error.codeName())
      .field("detail", error.message())
      .field("type", model::kindToString(transaction.kind()))
      .field("client", static_cast<unsigned>(transaction.clientId()))
      .field("tx", transaction.txId());
}

}  // namespace payments
