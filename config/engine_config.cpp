#include "config/engine_config.hpp"

#include <cctype>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace payments {
namespace config {

namespace {

using nlohmann::json;

// Each reader leaves `out` untouched when the key is absent and returns false
// with `error` set when the key is present but unusable.

bool readString(const json& node, const char* key, std::string& out, std::string& error) {
  auto it = node.find(key);
  if (it == node.end()) return true;
  if (!it->is_string()) {
    error = std::string("'") + key + "' must be a string";
    return false;
  }
  out = it->get<std::string>();
  return true;
}

bool readBool(const json& node, const char* key, bool& out, std::string& error) {
  auto it = node.find(key);
  if (it == node.end()) return true;
  if (!it->is_boolean()) {
    error = std::string("'") + key + "' must be a boolean";
    return false;
  }
  out = it->get<bool>();
  return true;
}

}  // namespace

std::string outputFormatToString(OutputFormat format) {
  switch (format) {
    case OutputFormat::CSV: return "csv";
    case OutputFormat::JSON: return "json";
    default: return "unknown";
  }
}

std::optional<OutputFormat> outputFormatFromString(std::string_view name) {
  std::string lower;
  for (char c : name) {
    lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  if (lower == "csv") return OutputFormat::CSV;
  if (lower == "json") return OutputFormat::JSON;
  return std::nullopt;
}

LoadResult ConfigLoader::load(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    LoadResult result;
    result.error = "cannot open config file: " + path;
    return result;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return loadFromString(buffer.str());
}

LoadResult ConfigLoader::loadFromString(const std::string& json_content) {
  LoadResult result;

  json root;
  try {
    root = json::parse(json_content);
  } catch (const json::parse_error& e) {
    result.error = std::string("invalid JSON: ") + e.what();
    return result;
  }

  if (!root.is_object()) {
    result.error = "config root must be a JSON object";
    return result;
  }

  EngineConfig& cfg = result.config;

  std::string level_name;
  if (!readString(root, "log_level", level_name, result.error)) return result;
  if (!level_name.empty()) {
    auto level = observability::logLevelFromString(level_name);
    if (!level) {
      result.error = "unknown log_level: " + level_name;
      return result;
    }
    cfg.log_level = *level;
  }

  std::string format_name;
  if (!readString(root, "output_format", format_name, result.error)) return result;
  if (!format_name.empty()) {
    auto format = outputFormatFromString(format_name);
    if (!format) {
      result.error = "unknown output_format: " + format_name;
      return result;
    }
    cfg.output_format = *format;
  }

  if (!readString(root, "metrics_path", cfg.metrics_path, result.error)) return result;

  if (auto rules_node = root.find("rules"); rules_node != root.end()) {
    if (!rules_node->is_object()) {
      result.error = "'rules' must be an object";
      return result;
    }
    if (!readBool(*rules_node, "reject_duplicate_deposits",
                  cfg.rules.reject_duplicate_deposits, result.error)) {
      return result;
    }
    if (!readBool(*rules_node, "reject_active_redispute",
                  cfg.rules.reject_active_redispute, result.error)) {
      return result;
    }
  }

  result.success = true;
  return result;
}

}  // namespace config
}  // namespace payments
