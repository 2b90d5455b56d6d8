// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FLEXLOG_DECISION_RESOLVER_HPP
#define FLEXLOG_DECISION_RESOLVER_HPP

#include <optional>

#include "interception_decision.hpp"
#include "pattern_rule_table.hpp"
#include "type_descriptor.hpp"

namespace flexlog {
namespace policy {

/**
 * Engine-wide interception options.
 */
struct InterceptionOptions {
  // Intercept every eligible method that has no marker and no matching rule
  bool auto_intercept = true;
  PatternRuleTable rules;
};

/**
 * Resolves the decision for a single method without caching.
 *
 * Order: eligibility, disable markers, enable markers, configured rules,
 * auto-intercept default. Pure given the options; safe to call concurrently.
 */
class DecisionResolver {
public:
  explicit DecisionResolver(InterceptionOptions options);

  /**
   * Decision for the method, or nullptr when it must not be intercepted.
   */
  DecisionPtr resolve(const MethodDescriptor& method) const;

  /**
   * Structural eligibility plus exclusions: types that inject a logger
   * and methods matching an exclusion pattern of the type's rule.
   */
  bool is_eligible(const MethodDescriptor& method) const;

  /**
   * Eligibility and resolution in one pass over the rule table.
   * std::nullopt when the method is ineligible; otherwise the decision,
   * which may itself be nullptr.
   */
  std::optional<DecisionPtr> resolve_if_eligible(const MethodDescriptor& method) const;

  const InterceptionOptions& options() const {
    return options_;
  }

private:
  // Rule matching the declaring type, or nullptr
  const PatternRule* matching_rule(const MethodDescriptor& method) const;
  bool is_eligible(const MethodDescriptor& method, const PatternRule* rule) const;
  DecisionPtr decide(const MethodDescriptor& method, const PatternRule* rule) const;

  InterceptionOptions options_;
  DecisionPtr default_decision_;
};

}  // namespace policy
}  // namespace flexlog

#endif  // FLEXLOG_DECISION_RESOLVER_HPP
