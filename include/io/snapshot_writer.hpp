#ifndef SNAPSHOT_WRITER_HPP_
#define SNAPSHOT_WRITER_HPP_

#include "config/engine_config.hpp"
#include "model/account.hpp"

#include <ostream>
#include <vector>

#include <nlohmann/json.hpp>

namespace payments {
namespace io {

/**
 * Writes the final account balances.
 *
 * CSV: header `client,available,held,total,locked` then one row per account.
 * JSON: array of objects with the same keys; amounts are strings so no
 * precision is lost to a JSON number.
 */
class SnapshotWriter {
 public:
  explicit SnapshotWriter(config::OutputFormat format = config::OutputFormat::CSV)
      : format_(format) {}

  void write(std::ostream& out, const std::vector<model::Account>& accounts) const;

  static nlohmann::json toJson(const model::Account& account);

 private:
  void writeCsv(std::ostream& out, const std::vector<model::Account>& accounts) const;
  void writeJson(std::ostream& out, const std::vector<model::Account>& accounts) const;

  config::OutputFormat format_;
};

}  // namespace io
}  // namespace payments

#endif  // SNAPSHOT_WRITER_HPP_
