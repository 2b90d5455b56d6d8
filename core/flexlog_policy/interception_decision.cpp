// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "interception_decision.hpp"

#include <utility>

namespace flexlog {
namespace policy {

const char* to_string(InterceptionBehavior behavior) {
  switch (behavior) {
    case InterceptionBehavior::none:
      return "none";
    case InterceptionBehavior::capture_input:
      return "capture_input";
    case InterceptionBehavior::capture_output:
      return "capture_output";
    case InterceptionBehavior::capture_both:
      return "capture_both";
    default:
      return "unknown";
  }
}

std::ostream& operator<<(std::ostream& strm, InterceptionBehavior behavior) {
  return strm << to_string(behavior);
}

InterceptionDecision InterceptionDecision::with_behavior(InterceptionBehavior behavior) const {
  InterceptionDecision copy = *this;
  copy.behavior_ = behavior;
  return copy;
}

InterceptionDecision InterceptionDecision::with_level(severity_level level) const {
  InterceptionDecision copy = *this;
  copy.level_ = level;
  return copy;
}

InterceptionDecision InterceptionDecision::with_exception_level(severity_level level) const {
  InterceptionDecision copy = *this;
  copy.exception_level_ = level;
  return copy;
}

InterceptionDecision InterceptionDecision::with_target(std::optional<std::string> target) const {
  InterceptionDecision copy = *this;
  copy.target_ = std::move(target);
  return copy;
}

bool InterceptionDecision::operator==(const InterceptionDecision& other) const {
  return behavior_ == other.behavior_ && level_ == other.level_ &&
         exception_level_ == other.exception_level_ && target_ == other.target_;
}

std::ostream& operator<<(std::ostream& strm, const InterceptionDecision& decision) {
  strm << decision.behavior() << "/" << decision.level() << "/" << decision.exception_level();
  if (decision.target()) {
    strm << "->" << *decision.target();
  }
  return strm;
}

}  // namespace policy
}  // namespace flexlog
