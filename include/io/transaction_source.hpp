#ifndef TRANSACTION_SOURCE_HPP_
#define TRANSACTION_SOURCE_HPP_

#include "model/transaction.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace payments {
namespace io {

/**
 * One record pulled from a source. Either `transaction` is set or `error`
 * explains why the record could not be turned into one.
 */
struct SourceRecord {
  std::size_t line = 0;
  std::optional<model::Transaction> transaction;
  std::string error;
};

/**
 * Ordered stream of transaction records.
 */
class TransactionSource {
 public:
  virtual ~TransactionSource() = default;

  // Next record in input order, nullopt once the source is exhausted.
  virtual std::optional<SourceRecord> next() = 0;
};

/**
 * Source backed by an in-memory list, mostly for tests and embedding.
 */
class VectorTransactionSource : public TransactionSource {
 public:
  explicit VectorTransactionSource(std::vector<model::Transaction> transactions)
      : transactions_(std::move(transactions)) {}

  std::optional<SourceRecord> next() override {
    if (position_ >= transactions_.size()) {
      return std::nullopt;
    }
    SourceRecord record;
    record.line = position_ + 1;
    record.transaction = transactions_[position_++];
    return record;
  }

 private:
  std::vector<model::Transaction> transactions_;
  std::size_t position_ = 0;
};

}  // namespace io
}  // namespace payments

#endif  // TRANSACTION_SOURCE_HPP_
