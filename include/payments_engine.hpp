#ifndef PAYMENTS_ENGINE_HPP_
#define PAYMENTS_ENGINE_HPP_

#include "io/transaction_source.hpp"
#include "model/account.hpp"
#include "model/transaction.hpp"
#include "rules/rule_error.hpp"

#include <cstddef>
#include <vector>

namespace payments {

/**
 * Counts for one run over a transaction source.
 */
struct RunStats {
  std::size_t records = 0;
  std::size_t applied = 0;
  std::size_t rejected = 0;
  std::size_t malformed = 0;
};

/**
 * Abstract base class for the transaction ledger.
 * This provides the interface that implementations must follow.
 */
class PaymentsEngine {
 public:
  virtual ~PaymentsEngine() = default;

  /**
   * Applies one transaction to the account of the client it names, creating
   * that account if the client is new. Returns the rule failure, if any.
   */
  virtual rules::RuleResult Process(const model::Transaction& transaction) = 0;

  /**
   * Drains `source`, applying every record in order. Malformed records and
   * rule failures are reported and skipped; they never stop the run.
   */
  virtual RunStats ProcessAll(io::TransactionSource& source) = 0;

  /**
   * Returns the account for `client_id`, or nullptr if no transaction named it.
   */
  virtual const model::Account* FindAccount(model::ClientId client_id) const = 0;

  /**
   * Returns every account ordered by client id.
   */
  virtual std::vector<model::Account> Snapshot() const = 0;
};

}  // namespace payments

#endif  // PAYMENTS_ENGINE_HPP_
