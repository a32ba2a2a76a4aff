#include "io/csv_reader.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <system_error>

namespace payments {
namespace io {

namespace {

constexpr char kUtf8Bom[] = "\xEF\xBB\xBF";

std::string trim(const std::string& text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

std::string toLower(std::string text) {
  for (char& c : text) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return text;
}

// Parses an unsigned decimal that must fit in T, consuming the whole field.
template <typename T>
std::optional<T> parseUnsigned(const std::string& field) {
  std::uint64_t value = 0;
  const char* begin = field.data();
  const char* end = field.data() + field.size();
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (field.empty() || ec != std::errc() || ptr != end ||
      value > std::numeric_limits<T>::max()) {
    return std::nullopt;
  }
  return static_cast<T>(value);
}

const std::string& fieldAt(const std::vector<std::string>& fields, std::size_t index) {
  static const std::string empty;
  return index < fields.size() ? fields[index] : empty;
}

}  // namespace

std::vector<std::string> splitCsvLine(const std::string& line) {
  std::vector<std::string> fields;
  std::string current;
  bool quoted = false;

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quoted) {
      if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
        current += '"';
        ++i;
      } else if (c == '"') {
        quoted = false;
      } else {
        current += c;
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      fields.push_back(trim(current));
      current.clear();
    } else {
      current += c;
    }
  }
  fields.push_back(trim(current));
  return fields;
}

CsvTransactionReader::CsvTransactionReader(std::istream& input) : input_(input) {
  readHeader();
}

CsvTransactionReader::CsvTransactionReader(OpenKey, std::unique_ptr<std::ifstream> file)
    : owned_file_(std::move(file)), input_(*owned_file_) {
  readHeader();
}

std::unique_ptr<CsvTransactionReader> CsvTransactionReader::open(const std::string& path) {
  auto file = std::make_unique<std::ifstream>(path);
  if (!file->is_open()) {
    throw std::runtime_error("cannot open input file: " + path);
  }
  return std::make_unique<CsvTransactionReader>(OpenKey{}, std::move(file));
}

void CsvTransactionReader::readHeader() {
  std::string line;
  while (std::getline(input_, line)) {
    ++line_number_;
    if (line_number_ == 1 && line.compare(0, 3, kUtf8Bom) == 0) {
      line.erase(0, 3);
    }
    if (!trim(line).empty()) {
      break;
    }
    line.clear();
  }
  if (trim(line).empty()) {
    throw std::runtime_error("input has no header row");
  }

  std::optional<std::size_t> type_column;
  std::optional<std::size_t> client_column;
  std::optional<std::size_t> tx_column;

  const auto names = splitCsvLine(line);
  for (std::size_t i = 0; i < names.size(); ++i) {
    const std::string name = toLower(names[i]);
    if (name == "type") {
      type_column = i;
    } else if (name == "client") {
      client_column = i;
    } else if (name == "tx") {
      tx_column = i;
    } else if (name == "amount") {
      amount_column_ = i;
    }
  }

  if (!type_column || !client_column || !tx_column) {
    throw std::runtime_error("header must name 'type', 'client' and 'tx' columns, got: " +
                             trim(line));
  }
  type_column_ = *type_column;
  client_column_ = *client_column;
  tx_column_ = *tx_column;
}

std::optional<SourceRecord> CsvTransactionReader::next() {
  std::string line;
  while (std::getline(input_, line)) {
    ++line_number_;
    if (trim(line).empty()) {
      continue;
    }
    SourceRecord record = parseRow(splitCsvLine(line));
    record.line = line_number_;
    return record;
  }
  return std::nullopt;
}

SourceRecord CsvTransactionReader::parseRow(const std::vector<std::string>& fields) const {
  SourceRecord record;

  const std::string& type_field = fieldAt(fields, type_column_);
  auto kind = model::kindFromString(type_field);
  if (!kind) {
    record.error = "unknown transaction type '" + type_field + "'";
    return record;
  }

  const std::string& client_field = fieldAt(fields, client_column_);
  auto client = parseUnsigned<model::ClientId>(client_field);
  if (!client) {
    record.error = "invalid client id '" + client_field + "'";
    return record;
  }

  const std::string& tx_field = fieldAt(fields, tx_column_);
  auto tx = parseUnsigned<model::TransactionId>(tx_field);
  if (!tx) {
    record.error = "invalid transaction id '" + tx_field + "'";
    return record;
  }

  std::optional<model::Money> amount;
  if (model::kindCarriesAmount(*kind) && amount_column_) {
    const std::string& amount_field = fieldAt(fields, *amount_column_);
    if (!amount_field.empty()) {
      amount = model::Money::parse(amount_field);
      if (!amount) {
        record.error = "invalid amount '" + amount_field + "'";
        return record;
      }
    }
  }

  record.transaction = model::Transaction(*kind, *client, *tx, amount);
  return record;
}

}  // namespace io
}  // namespace payments
