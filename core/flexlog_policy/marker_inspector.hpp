// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FLEXLOG_MARKER_INSPECTOR_HPP
#define FLEXLOG_MARKER_INSPECTOR_HPP

#include <optional>
#include <vector>

#include "interception_decision.hpp"
#include "interception_marker.hpp"
#include "type_descriptor.hpp"

namespace flexlog {
namespace policy {

/**
 * Reads markers placed on a method or its declaring type.
 *
 * Precedence: method disable > type disable > method enable > type enable > none.
 * All functions are pure.
 */
class MarkerInspector {
public:
  /**
   * True if a disable marker is present on the method or its declaring type.
   */
  static bool is_disabled(const MethodDescriptor& method);

  /**
   * True if the type itself carries a disable marker.
   */
  static bool is_type_disabled(const TypeDescriptor& type);

  /**
   * Enable-marker decision at method level, else type level.
   * std::nullopt means no marker was found and configuration should be consulted.
   * Call only after is_disabled() returned false.
   */
  static std::optional<InterceptionDecision> resolve(const MethodDescriptor& method);

  /**
   * Merge the enable markers found at a single level.
   *
   * A capture_both marker wins. Co-occurring input and output markers become
   * capture_both with the more verbose level, the first non-empty target (input
   * first) and error on failure unless a marker overrides it.
   */
  static std::optional<InterceptionDecision> combine(
    const std::vector<InterceptionMarker>& markers
  );
};

}  // namespace policy
}  // namespace flexlog

#endif  // FLEXLOG_MARKER_INSPECTOR_HPP
