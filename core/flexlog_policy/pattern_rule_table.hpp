// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FLEXLOG_PATTERN_RULE_TABLE_HPP
#define FLEXLOG_PATTERN_RULE_TABLE_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "interception_decision.hpp"

namespace flexlog {
namespace policy {

/**
 * One configured rule: an exact type name or a prefix ending in '*'.
 */
struct PatternRule {
  std::string pattern;
  InterceptionDecision decision;
  // Method names that are never intercepted on matching types
  // ("Name", "prefix*", "*suffix", "*contains*")
  std::vector<std::string> exclude_method_patterns;

  bool is_wildcard() const {
    return !pattern.empty() && pattern.back() == '*';
  }
};

/**
 * Ordered table of pattern rules.
 *
 * Lookup tries an exact key first, then the wildcard entries in table order;
 * the first wildcard whose prefix matches wins (not the longest one).
 * Comparison is ordinal. Patterns are validated before they reach the table.
 */
class PatternRuleTable {
public:
  PatternRuleTable() = default;
  explicit PatternRuleTable(std::vector<PatternRule> rules);

  /**
   * Append a rule. A rule with an existing pattern replaces it in place.
   */
  void add(PatternRule rule);

  /**
   * Rule matching a fully-qualified type name, or nullptr.
   */
  const PatternRule* match(const std::string& type_name) const;

  /**
   * Decision of the matching rule, if any.
   */
  std::optional<InterceptionDecision> lookup(const std::string& type_name) const;

  /**
   * True if the method name matches one of the rule's exclusion patterns.
   */
  static bool is_method_excluded(const PatternRule& rule, const std::string& method_name);

  static bool matches_method_pattern(const std::string& method_name, const std::string& pattern);

  const std::vector<PatternRule>& rules() const {
    return rules_;
  }

  std::size_t size() const {
    return rules_.size();
  }

  bool empty() const {
    return rules_.empty();
  }

private:
  std::vector<PatternRule> rules_;
  std::unordered_map<std::string, std::size_t> exact_index_;
  // (prefix, index into rules_) in table order
  std::vector<std::pair<std::string, std::size_t>> wildcards_;
};

}  // namespace policy
}  // namespace flexlog

#endif  // FLEXLOG_PATTERN_RULE_TABLE_HPP
