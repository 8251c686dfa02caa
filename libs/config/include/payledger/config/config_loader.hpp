#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace payledger {
namespace config {

struct InputConfig {
  std::string delimiter{","};  // must be a single character
  bool trim{true};
};

struct OutputConfig {
  bool sort_by_client{true};
};

struct ReportConfig {
  bool warnings{true};
  bool summary{false};
  bool state_digest{false};
};

struct AppConfig {
  InputConfig input;
  OutputConfig output;
  ReportConfig report;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  AppConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const AppConfig& config);
  static std::string generate_default();
};

}  // namespace config
}  // namespace payledger
