#ifndef CSV_READER_HPP_
#define CSV_READER_HPP_

#include "io/transaction_source.hpp"

#include <fstream>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace payments {
namespace io {

// Splits one CSV line. Double-quoted fields may contain commas and "" escapes.
std::vector<std::string> splitCsvLine(const std::string& line);

/**
 * Reads transactions from CSV with a `type,client,tx,amount` header.
 *
 * Header names are matched case-insensitively in any order; `amount` may be
 * missing entirely. Every field is trimmed. Short rows are accepted, so
 * "dispute,1,1" works with or without a trailing comma.
 */
class CsvTransactionReader : public TransactionSource {
 private:
  // Restricts the file-owning constructor to open().
  struct OpenKey {
    explicit OpenKey() = default;
  };

 public:
  /**
   * Reads the header immediately.
   * Throws std::runtime_error when the header is missing or lacks a required column.
   */
  explicit CsvTransactionReader(std::istream& input);

  /**
   * Opens `path` and reads its header.
   * Throws std::runtime_error when the file cannot be opened or the header is bad.
   */
  static std::unique_ptr<CsvTransactionReader> open(const std::string& path);

  CsvTransactionReader(OpenKey, std::unique_ptr<std::ifstream> file);

  std::optional<SourceRecord> next() override;

 private:

  void readHeader();
  SourceRecord parseRow(const std::vector<std::string>& fields) const;

  std::unique_ptr<std::ifstream> owned_file_;
  std::istream& input_;
  std::size_t line_number_ = 0;

  std::size_t type_column_ = 0;
  std::size_t client_column_ = 0;
  std::size_t tx_column_ = 0;
  std::optional<std::size_t> amount_column_;
};

}  // namespace io
}  // namespace payments

#endif  // CSV_READER_HPP_
