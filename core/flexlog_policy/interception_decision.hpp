// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FLEXLOG_INTERCEPTION_DECISION_HPP
#define FLEXLOG_INTERCEPTION_DECISION_HPP

#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include "flexlog_log_severity.hpp"

namespace flexlog {
namespace policy {

using logging::severity_level;

/**
 * Which parts of an intercepted call are captured.
 */
enum class InterceptionBehavior { none, capture_input, capture_output, capture_both };

const char* to_string(InterceptionBehavior behavior);

std::ostream& operator<<(std::ostream& strm, InterceptionBehavior behavior);

/**
 * Fully resolved outcome for one method.
 *
 * Immutable value: the with_* functions return a modified copy.
 * Defaults: capture_input, info on completion, error on failure, default sink.
 */
class InterceptionDecision {
public:
  InterceptionDecision() = default;

  InterceptionBehavior behavior() const {
    return behavior_;
  }

  severity_level level() const {
    return level_;
  }

  severity_level exception_level() const {
    return exception_level_;
  }

  // Named sink; std::nullopt routes to the default sink
  const std::optional<std::string>& target() const {
    return target_;
  }

  bool captures_input() const {
    return behavior_ == InterceptionBehavior::capture_input ||
           behavior_ == InterceptionBehavior::capture_both;
  }

  bool captures_output() const {
    return behavior_ == InterceptionBehavior::capture_output ||
           behavior_ == InterceptionBehavior::capture_both;
  }

  InterceptionDecision with_behavior(InterceptionBehavior behavior) const;
  InterceptionDecision with_level(severity_level level) const;
  InterceptionDecision with_exception_level(severity_level level) const;
  InterceptionDecision with_target(std::optional<std::string> target) const;

  bool operator==(const InterceptionDecision& other) const;
  bool operator!=(const InterceptionDecision& other) const {
    return !(*this == other);
  }

private:
  InterceptionBehavior behavior_ = InterceptionBehavior::capture_input;
  severity_level level_ = severity_level::info;
  severity_level exception_level_ = severity_level::error;
  std::optional<std::string> target_;
};

std::ostream& operator<<(std::ostream& strm, const InterceptionDecision& decision);

/**
 * Published decision. A null pointer means "do not intercept".
 * Copying the pointer never allocates, which keeps cached lookups allocation-free.
 */
using DecisionPtr = std::shared_ptr<const InterceptionDecision>;

/**
 * Decision applied by the auto-intercept default policy.
 */
inline InterceptionDecision make_default_decision() {
  return InterceptionDecision()
    .with_behavior(InterceptionBehavior::capture_input)
    .with_level(severity_level::info)
    .with_exception_level(severity_level::error);
}

}  // namespace policy
}  // namespace flexlog

#endif  // FLEXLOG_INTERCEPTION_DECISION_HPP
