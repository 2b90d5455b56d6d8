// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FLEXLOG_POLICY_CONFIG_PARSER_HPP
#define FLEXLOG_POLICY_CONFIG_PARSER_HPP

#include <yaml-cpp/yaml.h>

#include <string>
#include <vector>

#include "decision_resolver.hpp"
#include "flexlog_log_init.hpp"
#include "policy_config.hpp"

namespace flexlog {
namespace config {

/**
 * Build engine options from a validated configuration.
 *
 * @throws std::invalid_argument if a rule carries an unknown severity or behavior
 */
policy::InterceptionOptions build_interception_options(const PolicyConfig& config);

/**
 * Convert the YAML logging section to flexlog::logging::LoggingConfig.
 * An unknown level leaves the current console level unchanged.
 */
void convert_logging_config(
  const LoggingSection& yaml_config, ::flexlog::logging::LoggingConfig& log_config
);

class PolicyConfigParser {
public:
  PolicyConfigParser() = default;

  /**
   * Load configuration from YAML file
   */
  bool load_from_file(const std::string& path, PolicyConfig& config);

  /**
   * Load configuration from YAML string
   */
  bool load_from_string(const std::string& yaml_content, PolicyConfig& config);

  /**
   * Validate configuration
   */
  static bool validate(const PolicyConfig& config, std::string& error_msg);

  /**
   * Validate a single type pattern: non-empty, '*' only as the last character
   */
  static bool validate_pattern(const std::string& pattern, std::string& error_msg);

  /**
   * Get last error message
   */
  std::string get_last_error() const {
    return last_error_;
  }

private:
  bool parse_interception(const YAML::Node& node, PolicyConfig& config);
  bool parse_service(
    const std::string& pattern, const YAML::Node& node, ServiceRuleConfig& service
  );
  bool parse_logging(const YAML::Node& node, LoggingSection& logging);

  // Last error message
  mutable std::string last_error_;
};

}  // namespace config
}  // namespace flexlog

#endif  // FLEXLOG_POLICY_CONFIG_PARSER_HPP
