// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "policy_config_parser.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

#define FLEXLOG_LOG_COMPONENT "config_parser"
#include "flexlog_log_macros.hpp"

namespace flexlog {
namespace config {

using logging::kv;

namespace {

std::optional<policy::InterceptionBehavior> parse_behavior(const std::string& value) {
  if (value == "none") {
    return policy::InterceptionBehavior::none;
  }
  if (value == "input") {
    return policy::InterceptionBehavior::capture_input;
  }
  if (value == "output") {
    return policy::InterceptionBehavior::capture_output;
  }
  if (value == "both") {
    return policy::InterceptionBehavior::capture_both;
  }
  return std::nullopt;
}

policy::InterceptionBehavior behavior_from_flags(bool log_input, bool log_output) {
  if (log_input && log_output) {
    return policy::InterceptionBehavior::capture_both;
  }
  if (log_output) {
    return policy::InterceptionBehavior::capture_output;
  }
  return policy::InterceptionBehavior::capture_input;
}

}  // namespace

// ============================================================================
// PolicyConfigParser Implementation
// ============================================================================

bool PolicyConfigParser::load_from_file(const std::string& path, PolicyConfig& config) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  std::stringstream content;
  content << file.rdbuf();
  if (!load_from_string(content.str(), config)) {
    last_error_ = path + ": " + last_error_;
    return false;
  }
  return true;
}

bool PolicyConfigParser::load_from_string(const std::string& yaml_content, PolicyConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);

    // Parse interception policy
    if (node["interception"]) {
      if (!parse_interception(node["interception"], config)) {
        return false;
      }
    }

    // Parse logging config
    if (node["logging"]) {
      parse_logging(node["logging"], config.logging);
    }
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML content: " + std::string(e.what());
    return false;
  }

  std::string error_msg;
  if (!validate(config, error_msg)) {
    last_error_ = "Invalid configuration: " + error_msg;
    return false;
  }

  FLEXLOG_LOG_DEBUG(
    "Loaded interception policy" << kv("auto_intercept", config.auto_intercept ? "true" : "false")
                                 << kv("services", config.services.size())
  );
  return true;
}

bool PolicyConfigParser::parse_interception(const YAML::Node& node, PolicyConfig& config) {
  if (node["auto_intercept"]) {
    config.auto_intercept = node["auto_intercept"].as<bool>();
  }

  if (node["services"]) {
    const auto& services = node["services"];
    if (!services.IsMap()) {
      last_error_ = "interception.services must be a map of type pattern to rule";
      return false;
    }

    // yaml-cpp keeps map entries in document order
    for (const auto& entry : services) {
      ServiceRuleConfig service;
      if (!parse_service(entry.first.as<std::string>(), entry.second, service)) {
        return false;
      }
      config.services.push_back(std::move(service));
    }
  }

  return true;
}

bool PolicyConfigParser::parse_service(
  const std::string& pattern, const YAML::Node& node, ServiceRuleConfig& service
) {
  service.pattern = pattern;

  // "Pattern: ~" or an empty block keeps the defaults
  if (!node || node.IsNull()) {
    return true;
  }
  if (!node.IsMap()) {
    last_error_ = "Service rule must be a map: " + pattern;
    return false;
  }

  if (node["log_input"]) {
    service.log_input = node["log_input"].as<bool>();
  }
  if (node["log_output"]) {
    service.log_output = node["log_output"].as<bool>();
  }
  if (node["behavior"]) {
    service.behavior = node["behavior"].as<std::string>();
  }
  if (node["level"]) {
    service.level = node["level"].as<std::string>();
  }
  if (node["exception_level"]) {
    service.exception_level = node["exception_level"].as<std::string>();
  }
  if (node["target"]) {
    std::string target = node["target"].as<std::string>();
    if (!target.empty()) {
      service.target = target;
    }
  }
  if (node["exclude_method_patterns"]) {
    service.exclude_method_patterns =
      node["exclude_method_patterns"].as<std::vector<std::string>>();
  }

  return true;
}

bool PolicyConfigParser::parse_logging(const YAML::Node& node, LoggingSection& logging) {
  // Parse console section
  if (node["console"]) {
    const auto& console = node["console"];
    if (console["enabled"]) {
      logging.console_enabled = console["enabled"].as<bool>();
    }
    if (console["colors"]) {
      logging.console_colors = console["colors"].as<bool>();
    }
    if (console["level"]) {
      logging.console_level = console["level"].as<std::string>();
    }
  }

  return true;
}

bool PolicyConfigParser::validate_pattern(const std::string& pattern, std::string& error_msg) {
  if (pattern.empty()) {
    error_msg = "Service pattern is empty";
    return false;
  }

  auto star = pattern.find('*');
  if (star != std::string::npos && star != pattern.size() - 1) {
    error_msg = "Wildcard '*' is only allowed at the end of a pattern: " + pattern;
    return false;
  }
  return true;
}

bool PolicyConfigParser::validate(const PolicyConfig& config, std::string& error_msg) {
  for (const auto& service : config.services) {
    if (!validate_pattern(service.pattern, error_msg)) {
      return false;
    }
    if (!logging::parse_severity_level(service.level)) {
      error_msg = "Unknown level '" + service.level + "' for service " + service.pattern;
      return false;
    }
    if (!logging::parse_severity_level(service.exception_level)) {
      error_msg = "Unknown exception_level '" + service.exception_level + "' for service " +
                  service.pattern;
      return false;
    }
    if (service.behavior && !parse_behavior(*service.behavior)) {
      error_msg = "Behavior must be 'none', 'input', 'output' or 'both' for service " +
                  service.pattern;
      return false;
    }
    for (const auto& method_pattern : service.exclude_method_patterns) {
      if (method_pattern.empty()) {
        error_msg = "Empty exclude_method_patterns entry for service " + service.pattern;
        return false;
      }
    }
  }

  if (!logging::parse_severity_level(config.logging.console_level)) {
    error_msg = "Unknown logging.console.level '" + config.logging.console_level + "'";
    return false;
  }

  return true;
}

// ============================================================================
// Conversion helpers
// ============================================================================

policy::InterceptionOptions build_interception_options(const PolicyConfig& config) {
  policy::InterceptionOptions options;
  options.auto_intercept = config.auto_intercept;

  for (const auto& service : config.services) {
    auto level = logging::parse_severity_level(service.level);
    auto exception_level = logging::parse_severity_level(service.exception_level);
    if (!level || !exception_level) {
      throw std::invalid_argument("Unknown severity in rule for " + service.pattern);
    }

    policy::InterceptionBehavior behavior =
      behavior_from_flags(service.log_input, service.log_output);
    if (service.behavior) {
      auto parsed = parse_behavior(*service.behavior);
      if (!parsed) {
        throw std::invalid_argument("Unknown behavior in rule for " + service.pattern);
      }
      behavior = *parsed;
    }

    policy::PatternRule rule;
    rule.pattern = service.pattern;
    rule.decision = policy::InterceptionDecision()
                      .with_behavior(behavior)
                      .with_level(*level)
                      .with_exception_level(*exception_level)
                      .with_target(service.target);
    rule.exclude_method_patterns = service.exclude_method_patterns;
    options.rules.add(std::move(rule));
  }

  return options;
}

void convert_logging_config(
  const LoggingSection& yaml_config, ::flexlog::logging::LoggingConfig& log_config
) {
  // Console settings
  log_config.console_enabled = yaml_config.console_enabled;
  log_config.console_colors = yaml_config.console_colors;

  // Parse console level
  if (auto level = ::flexlog::logging::parse_severity_level(yaml_config.console_level)) {
    log_config.console_level = *level;
  }
}

}  // namespace config
}  // namespace flexlog
