// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FLEXLOG_POLICY_CONFIG_HPP
#define FLEXLOG_POLICY_CONFIG_HPP

#include <optional>
#include <string>
#include <vector>

namespace flexlog {
namespace config {

/**
 * Diagnostic logging section, as written in YAML.
 */
struct LoggingSection {
  bool console_enabled = true;
  bool console_colors = true;
  std::string console_level = "info";
};

/**
 * Per-service interception rule, keyed by exact type name or "Prefix*".
 */
struct ServiceRuleConfig {
  std::string pattern;
  bool log_input = true;
  bool log_output = false;
  // Explicit behavior ("none", "input", "output", "both"); overrides log_input/log_output
  std::optional<std::string> behavior;
  std::string level = "info";
  std::string exception_level = "error";
  std::optional<std::string> target;
  std::vector<std::string> exclude_method_patterns;
};

/**
 * Root configuration structure.
 */
struct PolicyConfig {
  bool auto_intercept = true;
  // Document order; the first matching wildcard wins
  std::vector<ServiceRuleConfig> services;
  LoggingSection logging;
};

}  // namespace config
}  // namespace flexlog

#endif  // FLEXLOG_POLICY_CONFIG_HPP
