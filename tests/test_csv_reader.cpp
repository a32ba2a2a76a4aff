#include "io/csv_reader.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>

using payments::io::CsvTransactionReader;
using payments::io::SourceRecord;
using payments::io::splitCsvLine;
using payments::model::Money;
using payments::model::TransactionKind;

namespace {

std::vector<SourceRecord> readAll(const std::string& text) {
  std::istringstream input(text);
  CsvTransactionReader reader(input);
  std::vector<SourceRecord> records;
  while (auto record = reader.next()) {
    records.push_back(*record);
  }
  return records;
}

}  // namespace

TEST(SplitCsvLineTest, TrimsFields) {
  auto fields = splitCsvLine("  deposit ,1,  2 , 3.5 \r");
  ASSERT_EQ(fields.size(), 4u);
  EXPECT_EQ(fields[0], "deposit");
  EXPECT_EQ(fields[1], "1");
  EXPECT_EQ(fields[2], "2");
  EXPECT_EQ(fields[3], "3.5");
}

TEST(SplitCsvLineTest, HandlesQuotesAndEmptyFields) {
  auto fields = splitCsvLine("\"a,b\",\"say \"\"hi\"\"\",,");
  ASSERT_EQ(fields.size(), 4u);
  EXPECT_EQ(fields[0], "a,b");
  EXPECT_EQ(fields[1], "say \"hi\"");
  EXPECT_EQ(fields[2], "");
  EXPECT_EQ(fields[3], "");
}

TEST(CsvTransactionReaderTest, ParsesAllKinds) {
  auto records = readAll(
      "type,client,tx,amount\n"
      "deposit,1,1,1.0\n"
      "withdrawal,1,2,0.5\n"
      "dispute,1,1,\n"
      "resolve,1,1\n"
      "chargeback,1,1,\n");
  ASSERT_EQ(records.size(), 5u);

  for (const auto& record : records) {
    ASSERT_TRUE(record.transaction.has_value()) << record.error;
  }
  EXPECT_EQ(records[0].transaction->kind(), TransactionKind::DEPOSIT);
  EXPECT_EQ(records[0].transaction->amount(), Money::parse("1"));
  EXPECT_EQ(records[1].transaction->kind(), TransactionKind::WITHDRAWAL);
  EXPECT_EQ(records[1].transaction->txId(), 2u);
  EXPECT_EQ(records[2].transaction->kind(), TransactionKind::DISPUTE);
  EXPECT_FALSE(records[2].transaction->amount().has_value());
  EXPECT_EQ(records[3].transaction->kind(), TransactionKind::RESOLVE);
  EXPECT_EQ(records[4].transaction->kind(), TransactionKind::CHARGEBACK);
  EXPECT_EQ(records[4].line, 6u);
}

TEST(CsvTransactionReaderTest, TrimsWhitespaceAndIgnoresCase) {
  auto records = readAll(
      " Type , CLIENT ,Tx, Amount \r\n"
      "  DePoSiT ,  65535 , 4294967295 ,  2.12345 \r\n");
  ASSERT_EQ(records.size(), 1u);
  ASSERT_TRUE(records[0].transaction.has_value()) << records[0].error;
  const auto& tx = *records[0].transaction;
  EXPECT_EQ(tx.kind(), TransactionKind::DEPOSIT);
  EXPECT_EQ(tx.clientId(), 65535);
  EXPECT_EQ(tx.txId(), 4294967295u);
  EXPECT_EQ(tx.amount(), Money::parse("2.1234"));
}

TEST(CsvTransactionReaderTest, AcceptsColumnsInAnyOrder) {
  auto records = readAll(
      "amount,tx,client,type\n"
      "7.5,3,9,deposit\n");
  ASSERT_EQ(records.size(), 1u);
  ASSERT_TRUE(records[0].transaction.has_value());
  EXPECT_EQ(records[0].transaction->clientId(), 9);
  EXPECT_EQ(records[0].transaction->txId(), 3u);
  EXPECT_EQ(records[0].transaction->amount(), Money::parse("7.5"));
}

TEST(CsvTransactionReaderTest, AmountColumnIsOptional) {
  auto records = readAll(
      "type,client,tx\n"
      "dispute,1,1\n"
      "deposit,1,2\n");
  ASSERT_EQ(records.size(), 2u);
  ASSERT_TRUE(records[1].transaction.has_value());
  // A deposit without an amount is left for the rule engine to refuse.
  EXPECT_FALSE(records[1].transaction->amount().has_value());
}

TEST(CsvTransactionReaderTest, SkipsBlankLines) {
  auto records = readAll(
      "\n"
      "type,client,tx,amount\n"
      "\n"
      "deposit,1,1,1\n"
      "   \n"
      "deposit,1,2,1\n");
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[0].line, 4u);
  EXPECT_EQ(records[1].line, 6u);
}

TEST(CsvTransactionReaderTest, ReportsBadRowsAndContinues) {
  auto records = readAll(
      "type,client,tx,amount\n"
      "transfer,1,1,1.0\n"
      "deposit,70000,2,1.0\n"
      "deposit,-1,3,1.0\n"
      "deposit,1,4294967296,1.0\n"
      "deposit,1,5,abc\n"
      "deposit,1,,1.0\n"
      "deposit,1,6,1.0\n");
  ASSERT_EQ(records.size(), 7u);
  for (std::size_t i = 0; i < 6; ++i) {
    EXPECT_FALSE(records[i].transaction.has_value()) << "row " << i;
    EXPECT_FALSE(records[i].error.empty()) << "row " << i;
  }
  EXPECT_NE(records[0].error.find("transfer"), std::string::npos);
  EXPECT_NE(records[1].error.find("client"), std::string::npos);
  EXPECT_NE(records[4].error.find("amount"), std::string::npos);
  EXPECT_EQ(records[2].line, 4u);
  EXPECT_TRUE(records[6].transaction.has_value());
}

TEST(CsvTransactionReaderTest, IgnoresAmountOnDisputeRows) {
  auto records = readAll(
      "type,client,tx,amount\n"
      "dispute,1,1,not-a-number\n");
  ASSERT_EQ(records.size(), 1u);
  ASSERT_TRUE(records[0].transaction.has_value());
  EXPECT_FALSE(records[0].transaction->amount().has_value());
}

TEST(CsvTransactionReaderTest, RejectsMissingHeaderColumns) {
  std::istringstream no_tx("type,client,amount\ndeposit,1,1.0\n");
  EXPECT_THROW(CsvTransactionReader reader(no_tx), std::runtime_error);

  std::istringstream empty("");
  EXPECT_THROW(CsvTransactionReader reader(empty), std::runtime_error);
}

TEST(CsvTransactionReaderTest, StripsByteOrderMark) {
  auto records = readAll("\xEF\xBB\xBFtype,client,tx,amount\ndeposit,1,1,1\n");
  ASSERT_EQ(records.size(), 1u);
  EXPECT_TRUE(records[0].transaction.has_value());
}

TEST(CsvTransactionReaderTest, OpensFilesFromDisk) {
  EXPECT_THROW(CsvTransactionReader::open("/nonexistent/transactions.csv"), std::runtime_error);

  const std::string path = ::testing::TempDir() + "payments_reader_test.csv";
  {
    std::ofstream out(path);
    out << "type,client,tx,amount\ndeposit,1,1,3.25\n";
  }
  auto reader = CsvTransactionReader::open(path);
  auto record = reader->next();
  ASSERT_TRUE(record.has_value());
  ASSERT_TRUE(record->transaction.has_value());
  EXPECT_EQ(record->transaction->amount(), Money::parse("3.25"));
  EXPECT_FALSE(reader->next().has_value());
  std::remove(path.c_str());
}
