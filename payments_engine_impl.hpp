#ifndef PAYMENTS_ENGINE_IMPL_HPP_
#define PAYMENTS_ENGINE_IMPL_HPP_

#include "payments_engine.hpp"
#include "observability/metrics.hpp"
#include "rules/rules.hpp"

#include <map>
#include <vector>

namespace payments {

// Implementation notes:
// - Accounts live in memory for the duration of one run, keyed by client id.
// - Records are applied strictly in input order on the calling thread.
// - Rule failures and malformed records are logged at WARN and counted.

/**
 * In-memory implementation of the PaymentsEngine interface.
 *
 * Responsibilities:
 * - Route each transaction to the account of the client it names
 * - Apply it through rules::process() with the configured policy
 * - Report failures and keep going
 */
class PaymentsEngineImpl : public PaymentsEngine {
 public:
  explicit PaymentsEngineImpl(const rules::RulePolicy& policy = rules::RulePolicy{});

  rules::RuleResult Process(const model::Transaction& transaction) override;

  RunStats ProcessAll(io::TransactionSource& source) override;

  const model::Account* FindAccount(model::ClientId client_id) const override;

  std::vector<model::Account> Snapshot() const override;

  const rules::RulePolicy& policy() const { return policy_; }

  observability::MetricsCollector& metrics() { return metrics_; }
  const observability::MetricsCollector& metrics() const { return metrics_; }

 private:
  // Existing account for client_id, or a fresh zero-balance one.
  model::Account& accountFor(model::ClientId client_id);

  void reportRejection(const model::Transaction& transaction, const rules::RuleError& error);

  rules::RulePolicy policy_;
  // Ordered so the snapshot comes out sorted by client id.
  std::map<model::ClientId, model::Account> accounts_;
  observability::MetricsCollector metrics_;
};

}  // namespace payments

#endif  // PAYMENTS_ENGINE_IMPL_HPP_
