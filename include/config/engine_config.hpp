#ifndef ENGINE_CONFIG_HPP_
#define ENGINE_CONFIG_HPP_

#include "observability/logger.hpp"
#include "rules/rules.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace payments {
namespace config {

enum class OutputFormat {
  CSV,
  JSON
};

std::string outputFormatToString(OutputFormat format);
std::optional<OutputFormat> outputFormatFromString(std::string_view name);

/**
 * Runtime settings. Every field has a default so an absent config file is
 * equivalent to "{}".
 */
struct EngineConfig {
  observability::LogLevel log_level = observability::LogLevel::WARN;
  OutputFormat output_format = OutputFormat::CSV;
  // Empty disables the metrics dump.
  std::string metrics_path;
  rules::RulePolicy rules;
};

struct LoadResult {
  bool success{false};
  EngineConfig config;
  std::string error;
};

/**
 * Reads EngineConfig from JSON:
 *
 *   {
 *     "log_level": "info",
 *     "output_format": "json",
 *     "metrics_path": "run.prom",
 *     "rules": {
 *       "reject_duplicate_deposits": true,
 *       "reject_active_redispute": false
 *     }
 *   }
 *
 * Unknown keys are ignored. A key with the wrong type or an unknown enum
 * value fails the whole load.
 */
class ConfigLoader {
 public:
  static LoadResult load(const std::string& path);
  static LoadResult loadFromString(const std::string& json_content);
};

}  // namespace config
}  // namespace payments

#endif  // ENGINE_CONFIG_HPP_
