#include "payments_engine_impl.hpp"
#include "io/csv_reader.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <vector>

using payments::PaymentsEngineImpl;
using payments::RunStats;
using payments::io::SourceRecord;
using payments::io::TransactionSource;
using payments::io::VectorTransactionSource;
using payments::model::Account;
using payments::model::Money;
using payments::model::Transaction;
using payments::rules::RuleError;
using payments::rules::RuleErrorCode;

namespace {

Money amount(const char* text) {
  return Money::parse(text).value();
}

// Source that yields a malformed record between two good ones.
class MixedSource : public TransactionSource {
 public:
  std::optional<SourceRecord> next() override {
    SourceRecord record;
    record.line = ++calls_;
    switch (calls_) {
      case 1:
        record.transaction = Transaction::deposit(1, 1, amount("10"));
        return record;
      case 2:
        record.error = "unknown transaction type 'transfer'";
        return record;
      case 3:
        record.transaction = Transaction::deposit(1, 2, amount("5"));
        return record;
      default:
        return std::nullopt;
    }
  }

 private:
  std::size_t calls_ = 0;
};

}  // namespace

// Test fixture for ledger-level runs
class PaymentsEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    engine_ = std::make_unique<PaymentsEngineImpl>();
  }

  const Account& account(payments::model::ClientId client_id) {
    const Account* found = engine_->FindAccount(client_id);
    EXPECT_NE(found, nullptr);
    static const Account missing(0);
    return found ? *found : missing;
  }

  std::unique_ptr<PaymentsEngineImpl> engine_;
};

TEST_F(PaymentsEngineTest, DisputeMovesDepositToHeld) {
  EXPECT_FALSE(engine_->Process(Transaction::deposit(1, 1, amount("100.0"))).has_value());
  EXPECT_FALSE(engine_->Process(Transaction::dispute(1, 1)).has_value());

  EXPECT_EQ(account(1).available(), Money::zero());
  EXPECT_EQ(account(1).held(), amount("100"));
  EXPECT_EQ(account(1).total(), amount("100"));
}

TEST_F(PaymentsEngineTest, ChargebackLocksAccount) {
  engine_->Process(Transaction::deposit(1, 1, amount("100.0")));
  engine_->Process(Transaction::dispute(1, 1));
  EXPECT_FALSE(engine_->Process(Transaction::chargeback(1, 1)).has_value());

  EXPECT_EQ(account(1).available(), Money::zero());
  EXPECT_EQ(account(1).held(), Money::zero());
  EXPECT_EQ(account(1).total(), Money::zero());
  EXPECT_TRUE(account(1).frozen());

  auto result = engine_->Process(Transaction::deposit(1, 5, amount("1")));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->code, RuleErrorCode::ACCOUNT_FROZEN);
  EXPECT_EQ(account(1).total(), Money::zero());
}

TEST_F(PaymentsEngineTest, OverdraftIsRejected) {
  engine_->Process(Transaction::deposit(2, 2, amount("50.0")));
  auto result = engine_->Process(Transaction::withdrawal(2, 3, amount("70.0")));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, RuleError::insufficientFunds(3));

  EXPECT_EQ(account(2).available(), amount("50"));
  EXPECT_EQ(account(2).held(), Money::zero());
  EXPECT_EQ(account(2).total(), amount("50"));
  EXPECT_FALSE(account(2).frozen());
}

TEST_F(PaymentsEngineTest, DisputeWithoutDepositCreatesEmptyAccount) {
  auto result = engine_->Process(Transaction::dispute(3, 99));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, RuleError::depositNotFound(99));

  EXPECT_EQ(account(3), Account(3));
}

TEST_F(PaymentsEngineTest, DepositsOnlySumIntoAvailable) {
  std::vector<Transaction> txs;
  Money expected;
  const char* amounts[] = {"0.0001", "12.5", "3", "999.9999", "0.25"};
  payments::model::TransactionId tx_id = 1;
  for (const char* text : amounts) {
    txs.push_back(Transaction::deposit(4, tx_id++, amount(text)));
    expected += amount(text);
  }

  VectorTransactionSource source(txs);
  RunStats stats = engine_->ProcessAll(source);

  EXPECT_EQ(stats.records, 5u);
  EXPECT_EQ(stats.applied, 5u);
  EXPECT_EQ(account(4).available(), expected);
  EXPECT_EQ(account(4).held(), Money::zero());
}

TEST_F(PaymentsEngineTest, ClientsAreIndependent) {
  VectorTransactionSource source({
      Transaction::deposit(1, 1, amount("10")),
      Transaction::deposit(2, 2, amount("20")),
      Transaction::dispute(2, 1),  // tx 1 belongs to client 1
      Transaction::dispute(1, 1),
      Transaction::chargeback(1, 1),
      Transaction::withdrawal(2, 3, amount("5")),
  });
  RunStats stats = engine_->ProcessAll(source);

  EXPECT_EQ(stats.applied, 5u);
  EXPECT_EQ(stats.rejected, 1u);
  EXPECT_TRUE(account(1).frozen());
  EXPECT_FALSE(account(2).frozen());
  EXPECT_EQ(account(2).available(), amount("15"));
}

TEST_F(PaymentsEngineTest, MalformedRecordsAreSkipped) {
  MixedSource source;
  RunStats stats = engine_->ProcessAll(source);

  EXPECT_EQ(stats.records, 3u);
  EXPECT_EQ(stats.applied, 2u);
  EXPECT_EQ(stats.malformed, 1u);
  EXPECT_EQ(account(1).available(), amount("15"));
  EXPECT_EQ(engine_->metrics().counterValue("payments_records_malformed_total"), 1u);
}

TEST_F(PaymentsEngineTest, SnapshotIsOrderedByClient) {
  engine_->Process(Transaction::deposit(30, 1, amount("1")));
  engine_->Process(Transaction::deposit(2, 2, amount("1")));
  engine_->Process(Transaction::deposit(17, 3, amount("1")));

  auto snapshot = engine_->Snapshot();
  ASSERT_EQ(snapshot.size(), 3u);
  EXPECT_EQ(snapshot[0].clientId(), 2);
  EXPECT_EQ(snapshot[1].clientId(), 17);
  EXPECT_EQ(snapshot[2].clientId(), 30);
  EXPECT_EQ(engine_->FindAccount(99), nullptr);
}

TEST_F(PaymentsEngineTest, CountsOutcomesInMetrics) {
  engine_->Process(Transaction::deposit(1, 1, amount("10")));
  engine_->Process(Transaction::withdrawal(1, 2, amount("20")));
  engine_->Process(Transaction::dispute(1, 1));
  engine_->Process(Transaction::chargeback(1, 1));

  const auto& metrics = engine_->metrics();
  EXPECT_EQ(metrics.counterValue("payments_transactions_applied_total", "deposit"), 1u);
  EXPECT_EQ(metrics.counterValue("payments_transactions_applied_total", "chargeback"), 1u);
  EXPECT_EQ(metrics.counterValue("payments_transactions_rejected_total", "insufficient_funds"), 1u);
  EXPECT_EQ(metrics.counterValue("payments_accounts_locked_total"), 1u);
  EXPECT_EQ(metrics.histogramCount("payments_transaction_seconds"), 4u);
  EXPECT_DOUBLE_EQ(metrics.gaugeValue("payments_accounts"), 1.0);
}

TEST_F(PaymentsEngineTest, PolicyIsPassedToRules) {
  payments::rules::RulePolicy lenient;
  lenient.reject_duplicate_deposits = false;
  PaymentsEngineImpl engine(lenient);

  engine.Process(Transaction::deposit(1, 1, amount("10")));
  EXPECT_FALSE(engine.Process(Transaction::deposit(1, 1, amount("5"))).has_value());
  EXPECT_EQ(engine.FindAccount(1)->available(), amount("15"));

  auto strict = engine_->Process(Transaction::deposit(1, 1, amount("10")));
  EXPECT_FALSE(strict.has_value());
  strict = engine_->Process(Transaction::deposit(1, 1, amount("5")));
  ASSERT_TRUE(strict.has_value());
  EXPECT_EQ(strict->code, RuleErrorCode::DUPLICATE_TRANSACTION);
}

TEST_F(PaymentsEngineTest, RunsFromCsvText) {
  std::istringstream input(
      "type, client, tx, amount\n"
      "deposit, 1, 1, 1.0\n"
      "deposit, 2, 2, 2.0\n"
      "deposit, 1, 3, 2.0\n"
      "withdrawal, 1, 4, 1.5\n"
      "withdrawal, 2, 5, 3.0\n"
      "dispute, 1, 1,\n"
      "resolve, 1, 1\n"
      "bogus, 1, 9, 1\n");
  payments::io::CsvTransactionReader reader(input);
  RunStats stats = engine_->ProcessAll(reader);

  EXPECT_EQ(stats.records, 8u);
  EXPECT_EQ(stats.applied, 6u);
  EXPECT_EQ(stats.rejected, 1u);
  EXPECT_EQ(stats.malformed, 1u);

  EXPECT_EQ(account(1).available(), amount("1.5"));
  EXPECT_EQ(account(1).held(), Money::zero());
  EXPECT_EQ(account(2).available(), amount("2"));
  EXPECT_FALSE(account(2).frozen());
}
