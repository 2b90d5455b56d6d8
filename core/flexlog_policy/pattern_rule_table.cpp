// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "pattern_rule_table.hpp"

#include <algorithm>

#define FLEXLOG_LOG_COMPONENT "pattern_rules"
#include "flexlog_log_macros.hpp"

namespace flexlog {
namespace policy {

using logging::kv;

namespace {

bool starts_with(const std::string& value, const std::string& prefix) {
  return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

PatternRuleTable::PatternRuleTable(std::vector<PatternRule> rules) {
  for (auto& rule : rules) {
    add(std::move(rule));
  }
}

void PatternRuleTable::add(PatternRule rule) {
  auto existing = exact_index_.find(rule.pattern);
  if (existing != exact_index_.end()) {
    rules_[existing->second] = std::move(rule);
    return;
  }

  std::size_t index = rules_.size();
  exact_index_.emplace(rule.pattern, index);
  if (rule.is_wildcard()) {
    wildcards_.emplace_back(rule.pattern.substr(0, rule.pattern.size() - 1), index);
  }
  rules_.push_back(std::move(rule));
}

const PatternRule* PatternRuleTable::match(const std::string& type_name) const {
  if (rules_.empty()) {
    return nullptr;
  }

  auto exact = exact_index_.find(type_name);
  if (exact != exact_index_.end()) {
    return &rules_[exact->second];
  }

  for (const auto& wildcard : wildcards_) {
    if (starts_with(type_name, wildcard.first)) {
      FLEXLOG_LOG_TRACE(
        "Wildcard rule matched" << kv("type", type_name)
                                << kv("pattern", rules_[wildcard.second].pattern)
      );
      return &rules_[wildcard.second];
    }
  }
  return nullptr;
}

std::optional<InterceptionDecision> PatternRuleTable::lookup(const std::string& type_name) const {
  const PatternRule* rule = match(type_name);
  if (rule == nullptr) {
    return std::nullopt;
  }
  return rule->decision;
}

bool PatternRuleTable::is_method_excluded(const PatternRule& rule, const std::string& method_name) {
  return std::any_of(
    rule.exclude_method_patterns.begin(), rule.exclude_method_patterns.end(),
    [&method_name](const std::string& pattern) {
      return matches_method_pattern(method_name, pattern);
    }
  );
}

bool PatternRuleTable::matches_method_pattern(
  const std::string& method_name, const std::string& pattern
) {
  if (pattern == method_name) {
    return true;
  }

  bool leading = !pattern.empty() && pattern.front() == '*';
  bool trailing = !pattern.empty() && pattern.back() == '*';

  if (leading && trailing && pattern.size() >= 2) {
    return method_name.find(pattern.substr(1, pattern.size() - 2)) != std::string::npos;
  }
  if (leading) {
    return ends_with(method_name, pattern.substr(1));
  }
  if (trailing) {
    return starts_with(method_name, pattern.substr(0, pattern.size() - 1));
  }
  return false;
}

}  // namespace policy
}  // namespace flexlog
