#include "io/snapshot_writer.hpp"

namespace payments {
namespace io {

void SnapshotWriter::write(std::ostream& out, const std::vector<model::Account>& accounts) const {
  if (format_ == config::OutputFormat::JSON) {
    writeJson(out, accounts);
  } else {
    writeCsv(out, accounts);
  }
}

nlohmann::json SnapshotWriter::toJson(const model::Account& account) {
  nlohmann::json row;
  row["client"] = account.clientId();
  row["available"] = account.available().toString();
  row["held"] = account.held().toString();
  row["total"] = account.total().toString();
  row["locked"] = account.frozen();
  return row;
}

void SnapshotWriter::writeCsv(std::ostream& out,
                              const std::vector<model::Account>& accounts) const {
  out << "client,available,held,total,locked\n";
  for (const auto& account : accounts) {
    out << account.clientId() << ','
        << account.available() << ','
        << account.held() << ','
        << account.total() << ','
        << (account.frozen() ? "true" : "false") << '\n';
  }
}

void SnapshotWriter::writeJson(std::ostream& out,
                               const std::vector<model::Account>& accounts) const {
  nlohmann::json rows = nlohmann::json::array();
  for (const auto& account : accounts) {
    rows.push_back(toJson(account));
  }
  out << rows.dump(2) << '\n';
}

}  // namespace io
}  // namespace payments
