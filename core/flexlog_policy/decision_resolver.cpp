// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "decision_resolver.hpp"

#include <memory>
#include <utility>

#include "identity_resolver.hpp"
#include "marker_inspector.hpp"

namespace flexlog {
namespace policy {

namespace {

DecisionPtr publish(const InterceptionDecision& decision) {
  if (decision.behavior() == InterceptionBehavior::none) {
    return nullptr;
  }
  return std::make_shared<const InterceptionDecision>(decision);
}

}  // namespace

DecisionResolver::DecisionResolver(InterceptionOptions options)
    : options_(std::move(options))
    , default_decision_(std::make_shared<const InterceptionDecision>(make_default_decision())) {}

const PatternRule* DecisionResolver::matching_rule(const MethodDescriptor& method) const {
  return options_.rules.match(method.declaring_type().full_name());
}

bool DecisionResolver::is_eligible(const MethodDescriptor& method, const PatternRule* rule) const {
  if (!MethodIdentityResolver::is_eligible(method)) {
    return false;
  }
  if (method.declaring_type().injects_logger()) {
    return false;
  }
  return rule == nullptr || !PatternRuleTable::is_method_excluded(*rule, method.name());
}

DecisionPtr DecisionResolver::decide(const MethodDescriptor& method, const PatternRule* rule) const {
  if (MarkerInspector::is_disabled(method)) {
    return nullptr;
  }

  if (auto marked = MarkerInspector::resolve(method)) {
    return publish(*marked);
  }

  if (rule != nullptr) {
    return publish(rule->decision);
  }

  if (options_.auto_intercept) {
    return default_decision_;
  }
  return nullptr;
}

bool DecisionResolver::is_eligible(const MethodDescriptor& method) const {
  return is_eligible(method, matching_rule(method));
}

std::optional<DecisionPtr> DecisionResolver::resolve_if_eligible(
  const MethodDescriptor& method
) const {
  const PatternRule* rule = matching_rule(method);
  if (!is_eligible(method, rule)) {
    return std::nullopt;
  }
  return decide(method, rule);
}

DecisionPtr DecisionResolver::resolve(const MethodDescriptor& method) const {
  return resolve_if_eligible(method).value_or(nullptr);
}

}  // namespace policy
}  // namespace flexlog
