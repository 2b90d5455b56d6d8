// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FLEXLOG_INTERCEPTION_MARKER_HPP
#define FLEXLOG_INTERCEPTION_MARKER_HPP

#include <optional>
#include <string>
#include <utility>

#include "interception_decision.hpp"

namespace flexlog {
namespace policy {

enum class MarkerKind { disabled, capture_input, capture_output, capture_both };

/**
 * Declarative interception intent attached to a method or type.
 *
 * Markers are recorded when a TypeDescriptor is built and never change afterwards.
 * Unset overrides fall back to info / error / default sink when resolved.
 * Only the named factories create markers; there is no default marker.
 */
struct InterceptionMarker {
  MarkerKind kind;
  std::optional<severity_level> level;
  std::optional<severity_level> exception_level;
  std::optional<std::string> target;

  static InterceptionMarker disabled() {
    return InterceptionMarker(MarkerKind::disabled);
  }

  static InterceptionMarker input(
    std::optional<severity_level> level = std::nullopt,
    std::optional<severity_level> exception_level = std::nullopt,
    std::optional<std::string> target = std::nullopt
  ) {
    return make(MarkerKind::capture_input, level, exception_level, std::move(target));
  }

  static InterceptionMarker output(
    std::optional<severity_level> level = std::nullopt,
    std::optional<severity_level> exception_level = std::nullopt,
    std::optional<std::string> target = std::nullopt
  ) {
    return make(MarkerKind::capture_output, level, exception_level, std::move(target));
  }

  static InterceptionMarker both(
    std::optional<severity_level> level = std::nullopt,
    std::optional<severity_level> exception_level = std::nullopt,
    std::optional<std::string> target = std::nullopt
  ) {
    return make(MarkerKind::capture_both, level, exception_level, std::move(target));
  }

private:
  explicit InterceptionMarker(MarkerKind marker_kind)
      : kind(marker_kind) {}

  static InterceptionMarker make(
    MarkerKind kind, std::optional<severity_level> level,
    std::optional<severity_level> exception_level, std::optional<std::string> target
  ) {
    InterceptionMarker marker(kind);
    marker.level = level;
    marker.exception_level = exception_level;
    // An empty sink name means the default sink
    if (target && !target->empty()) {
      marker.target = std::move(target);
    }
    return marker;
  }
};

}  // namespace policy
}  // namespace flexlog

#endif  // FLEXLOG_INTERCEPTION_MARKER_HPP
