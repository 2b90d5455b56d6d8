// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file test_decision_resolver.cpp
 * @brief Unit tests for the per-method resolution order
 */

#include <gtest/gtest.h>

#include <sstream>

#include "decision_resolver.hpp"
#include "type_descriptor.hpp"

using namespace flexlog::policy;

namespace {

PatternRule rule(
  const std::string& pattern, InterceptionBehavior behavior,
  severity_level level = severity_level::info
) {
  PatternRule result;
  result.pattern = pattern;
  result.decision = InterceptionDecision().with_behavior(behavior).with_level(level);
  return result;
}

InterceptionOptions options_with(bool auto_intercept, std::vector<PatternRule> rules = {}) {
  InterceptionOptions options;
  options.auto_intercept = auto_intercept;
  options.rules = PatternRuleTable(std::move(rules));
  return options;
}

}  // namespace

TEST(InterceptionDecisionTest, BuildersReturnModifiedCopies) {
  InterceptionDecision base;
  InterceptionDecision changed = base.with_behavior(InterceptionBehavior::capture_output)
                                   .with_level(severity_level::warn)
                                   .with_target(std::string("audit"));

  EXPECT_EQ(base, make_default_decision());
  EXPECT_NE(base, changed);
  EXPECT_FALSE(changed.captures_input());
  EXPECT_TRUE(changed.captures_output());
  EXPECT_EQ(changed.exception_level(), severity_level::error);
}

TEST(InterceptionDecisionTest, StreamFormat) {
  std::ostringstream oss;
  oss << make_default_decision();
  EXPECT_EQ(oss.str(), "capture_input/INFO/ERROR");

  oss.str("");
  oss << make_default_decision()
           .with_behavior(InterceptionBehavior::capture_both)
           .with_level(severity_level::debug)
           .with_target(std::string("audit"));
  EXPECT_EQ(oss.str(), "capture_both/DEBUG/ERROR->audit");

  EXPECT_STREQ(to_string(InterceptionBehavior::none), "none");
}

TEST(DecisionResolverTest, DefaultOptionsAutoIntercept) {
  InterceptionOptions options;
  EXPECT_TRUE(options.auto_intercept);
  EXPECT_TRUE(options.rules.empty());
}

TEST(DecisionResolverTest, AutoInterceptDefaultDecision) {
  DecisionResolver resolver(options_with(true));
  auto type = TypeBuilder("Shop.Plain").method("Run").build();

  DecisionPtr decision = resolver.resolve(type->methods().front());

  ASSERT_NE(decision, nullptr);
  EXPECT_EQ(*decision, make_default_decision());
  EXPECT_EQ(decision->behavior(), InterceptionBehavior::capture_input);
  EXPECT_EQ(decision->level(), severity_level::info);
  EXPECT_EQ(decision->exception_level(), severity_level::error);
  EXPECT_FALSE(decision->target().has_value());
}

TEST(DecisionResolverTest, AutoInterceptSharesDefaultInstance) {
  DecisionResolver resolver(options_with(true));
  auto type = TypeBuilder("Shop.Plain").method("Run").method("Stop").build();

  EXPECT_EQ(resolver.resolve(type->methods()[0]), resolver.resolve(type->methods()[1]));
}

TEST(DecisionResolverTest, NoAutoInterceptNoRuleIsNull) {
  DecisionResolver resolver(options_with(false));
  auto type = TypeBuilder("Shop.Plain").method("Run").build();

  EXPECT_EQ(resolver.resolve(type->methods().front()), nullptr);
}

TEST(DecisionResolverTest, RuleBeatsDefault) {
  DecisionResolver resolver(
    options_with(true, {rule("Shop.*", InterceptionBehavior::capture_output, severity_level::debug)})
  );
  auto type = TypeBuilder("Shop.Plain").method("Run").build();

  DecisionPtr decision = resolver.resolve(type->methods().front());

  ASSERT_NE(decision, nullptr);
  EXPECT_EQ(decision->behavior(), InterceptionBehavior::capture_output);
  EXPECT_EQ(decision->level(), severity_level::debug);
}

TEST(DecisionResolverTest, TypeMarkerBeatsRule) {
  DecisionResolver resolver(
    options_with(true, {rule("Shop.*", InterceptionBehavior::capture_output, severity_level::debug)})
  );
  auto type = TypeBuilder("Shop.Marked")
                .marker(InterceptionMarker::input(severity_level::warn))
                .method("Run")
                .build();

  DecisionPtr decision = resolver.resolve(type->methods().front());

  ASSERT_NE(decision, nullptr);
  EXPECT_EQ(decision->behavior(), InterceptionBehavior::capture_input);
  EXPECT_EQ(decision->level(), severity_level::warn);
}

TEST(DecisionResolverTest, DisableMarkerBeatsEverything) {
  DecisionResolver resolver(
    options_with(true, {rule("Shop.Marked", InterceptionBehavior::capture_both)})
  );
  auto type = TypeBuilder("Shop.Marked")
                .marker(InterceptionMarker::both())
                .method("Run", {}, {InterceptionMarker::disabled(), InterceptionMarker::both()})
                .build();

  EXPECT_EQ(resolver.resolve(type->methods().front()), nullptr);
}

TEST(DecisionResolverTest, NoneBehaviorRuleIsNull) {
  DecisionResolver resolver(options_with(true, {rule("Shop.Legacy", InterceptionBehavior::none)}));
  auto type = TypeBuilder("Shop.Legacy").method("Run").build();

  EXPECT_EQ(resolver.resolve(type->methods().front()), nullptr);
}

TEST(DecisionResolverTest, IneligibleMethodIsNull) {
  DecisionResolver resolver(options_with(true));

  MethodSpec getter;
  getter.name = "get_Total";
  getter.kind = MethodKind::property_getter;
  getter.markers = {InterceptionMarker::both()};

  auto type = TypeBuilder("Shop.Cart").method(getter).build();

  EXPECT_FALSE(resolver.is_eligible(type->methods().front()));
  EXPECT_EQ(resolver.resolve(type->methods().front()), nullptr);
}

TEST(DecisionResolverTest, LoggerInjectingTypeIsExcluded) {
  DecisionResolver resolver(options_with(true));
  auto type = TypeBuilder("Shop.HandLogged")
                .injects_logger()
                .method("Run", {}, {InterceptionMarker::both()})
                .build();

  EXPECT_FALSE(resolver.is_eligible(type->methods().front()));
  EXPECT_EQ(resolver.resolve(type->methods().front()), nullptr);
}

TEST(DecisionResolverTest, ExcludedMethodPatterns) {
  PatternRule billing = rule("Billing.*", InterceptionBehavior::capture_both);
  billing.exclude_method_patterns = {"Get*", "*Internal"};
  DecisionResolver resolver(options_with(true, {billing}));

  auto type = TypeBuilder("Billing.Service")
                .method("GetBalance")
                .method("ChargeInternal")
                .method("Charge")
                .build();

  EXPECT_EQ(resolver.resolve(*type->find_method("GetBalance", {})), nullptr);
  EXPECT_EQ(resolver.resolve(*type->find_method("ChargeInternal", {})), nullptr);

  DecisionPtr charge = resolver.resolve(*type->find_method("Charge", {}));
  ASSERT_NE(charge, nullptr);
  EXPECT_EQ(charge->behavior(), InterceptionBehavior::capture_both);
}

TEST(DecisionResolverTest, ExclusionOnlyAppliesToMatchingType) {
  PatternRule billing = rule("Billing.Service", InterceptionBehavior::capture_input);
  billing.exclude_method_patterns = {"Get*"};
  DecisionResolver resolver(options_with(true, {billing}));

  auto other = TypeBuilder("Shipping.Service").method("GetRate").build();

  EXPECT_TRUE(resolver.is_eligible(other->methods().front()));
  EXPECT_NE(resolver.resolve(other->methods().front()), nullptr);
}

TEST(DecisionResolverTest, ResolveIfEligibleSeparatesIneligibleFromNull) {
  PatternRule billing = rule("Billing.*", InterceptionBehavior::capture_output);
  billing.exclude_method_patterns = {"Get*"};
  PatternRule legacy = rule("Legacy.*", InterceptionBehavior::none);
  DecisionResolver resolver(options_with(false, {billing, legacy}));

  auto service = TypeBuilder("Billing.Service").method("GetBalance").method("Charge").build();
  auto old = TypeBuilder("Legacy.Service").method("Run").build();
  auto plain = TypeBuilder("Shop.Plain").method("Run").build();

  EXPECT_FALSE(resolver.resolve_if_eligible(*service->find_method("GetBalance", {})).has_value());

  auto charge = resolver.resolve_if_eligible(*service->find_method("Charge", {}));
  ASSERT_TRUE(charge.has_value());
  ASSERT_NE(*charge, nullptr);
  EXPECT_EQ((*charge)->behavior(), InterceptionBehavior::capture_output);

  // Eligible, but resolved to "do not intercept"
  auto run = resolver.resolve_if_eligible(old->methods().front());
  ASSERT_TRUE(run.has_value());
  EXPECT_EQ(*run, nullptr);

  auto unmatched = resolver.resolve_if_eligible(plain->methods().front());
  ASSERT_TRUE(unmatched.has_value());
  EXPECT_EQ(*unmatched, nullptr);
}

TEST(DecisionResolverTest, ResolveIfEligibleAgreesWithResolve) {
  PatternRule shop = rule("Shop.*", InterceptionBehavior::capture_both, severity_level::debug);
  shop.exclude_method_patterns = {"*Internal"};
  DecisionResolver resolver(options_with(true, {shop}));

  MethodSpec setter;
  setter.name = "set_Total";
  setter.kind = MethodKind::property_setter;

  auto type = TypeBuilder("Shop.Cart")
                .method("Checkout")
                .method("SyncInternal")
                .method("Clear", {}, {InterceptionMarker::disabled()})
                .method(setter)
                .build();

  for (const auto& method : type->methods()) {
    auto combined = resolver.resolve_if_eligible(method);
    EXPECT_EQ(combined.has_value(), resolver.is_eligible(method)) << method.name();
    DecisionPtr direct = resolver.resolve(method);
    DecisionPtr via_combined = combined.value_or(nullptr);
    if (direct == nullptr || via_combined == nullptr) {
      EXPECT_EQ(direct, via_combined) << method.name();
    } else {
      EXPECT_EQ(*direct, *via_combined) << method.name();
    }
  }
}
