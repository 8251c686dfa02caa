#include "payledger/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <sstream>

namespace payledger {
namespace config {

namespace {

bool get_bool_or(const toml::table& tbl, std::string_view key, bool default_val) {
  if (auto val = tbl[key].value<bool>()) {
    return *val;
  }
  return default_val;
}

std::string get_str_or(const toml::table& tbl, std::string_view key, std::string_view default_val) {
  if (auto val = tbl[key].value<std::string_view>()) {
    return std::string(*val);
  }
  return std::string(default_val);
}

InputConfig parse_input(const toml::table& root) {
  InputConfig cfg;
  if (auto* input = root["input"].as_table()) {
    cfg.delimiter = get_str_or(*input, "delimiter", cfg.delimiter);
    cfg.trim = get_bool_or(*input, "trim", cfg.trim);
  }
  return cfg;
}

OutputConfig parse_output(const toml::table& root) {
  OutputConfig cfg;
  if (auto* output = root["output"].as_table()) {
    cfg.sort_by_client = get_bool_or(*output, "sort_by_client", cfg.sort_by_client);
  }
  return cfg;
}

ReportConfig parse_report(const toml::table& root) {
  ReportConfig cfg;
  if (auto* report = root["report"].as_table()) {
    cfg.warnings = get_bool_or(*report, "warnings", cfg.warnings);
    cfg.summary = get_bool_or(*report, "summary", cfg.summary);
    cfg.state_digest = get_bool_or(*report, "state_digest", cfg.state_digest);
  }
  return cfg;
}

AppConfig parse_config(const toml::table& root) {
  AppConfig cfg;
  cfg.input = parse_input(root);
  cfg.output = parse_output(root);
  cfg.report = parse_report(root);
  return cfg;
}

LoadResult finish(const toml::parse_result& parse_result) {
  LoadResult result;
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = ConfigLoader::validate(result.config);
  result.success = result.errors.empty();
  return result;
}

}  // namespace

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    LoadResult result;
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }
  return finish(toml::parse_file(path.string()));
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  return finish(toml::parse(toml_content));
}

std::vector<ValidationError> ConfigLoader::validate(const AppConfig& config) {
  std::vector<ValidationError> errors;

  const auto& delimiter = config.input.delimiter;
  if (delimiter.size() != 1) {
    errors.push_back({"input.delimiter", "must be exactly one character"});
  } else if (delimiter.front() == '"' || delimiter.front() == '\n' || delimiter.front() == '\r') {
    errors.push_back({"input.delimiter", "cannot be a quote or line break"});
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# payledger configuration
# Generated default configuration

[input]
delimiter = ","
trim = true

[output]
sort_by_client = true

[report]
warnings = true       # per-record warnings on stderr
summary = false       # replay statistics on stderr
state_digest = false  # BLAKE2b digest of the final account state
)";
}

}  // namespace config
}  // namespace payledger
