// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "marker_inspector.hpp"

#include <algorithm>

namespace flexlog {
namespace policy {

namespace {

bool has_disable_marker(const std::vector<InterceptionMarker>& markers) {
  return std::any_of(markers.begin(), markers.end(), [](const InterceptionMarker& marker) {
    return marker.kind == MarkerKind::disabled;
  });
}

const InterceptionMarker* find_marker(
  const std::vector<InterceptionMarker>& markers, MarkerKind kind
) {
  auto it = std::find_if(markers.begin(), markers.end(), [kind](const InterceptionMarker& marker) {
    return marker.kind == kind;
  });
  return it == markers.end() ? nullptr : &*it;
}

InterceptionDecision from_marker(const InterceptionMarker& marker, InterceptionBehavior behavior) {
  return InterceptionDecision()
    .with_behavior(behavior)
    .with_target(marker.target)
    .with_level(marker.level.value_or(severity_level::info))
    .with_exception_level(marker.exception_level.value_or(severity_level::error));
}

}  // namespace

bool MarkerInspector::is_disabled(const MethodDescriptor& method) {
  if (has_disable_marker(method.markers())) {
    return true;
  }
  return is_type_disabled(method.declaring_type());
}

bool MarkerInspector::is_type_disabled(const TypeDescriptor& type) {
  return has_disable_marker(type.markers());
}

std::optional<InterceptionDecision> MarkerInspector::resolve(const MethodDescriptor& method) {
  if (auto method_decision = combine(method.markers())) {
    return method_decision;
  }
  return combine(method.declaring_type().markers());
}

std::optional<InterceptionDecision> MarkerInspector::combine(
  const std::vector<InterceptionMarker>& markers
) {
  if (const auto* both = find_marker(markers, MarkerKind::capture_both)) {
    return from_marker(*both, InterceptionBehavior::capture_both);
  }

  const auto* input = find_marker(markers, MarkerKind::capture_input);
  const auto* output = find_marker(markers, MarkerKind::capture_output);

  if (input != nullptr && output != nullptr) {
    auto level = logging::more_verbose(
      input->level.value_or(severity_level::info), output->level.value_or(severity_level::info)
    );
    auto target = input->target ? input->target : output->target;

    auto exception_level = severity_level::error;
    if (input->exception_level && output->exception_level) {
      exception_level = logging::more_verbose(*input->exception_level, *output->exception_level);
    } else if (input->exception_level) {
      exception_level = *input->exception_level;
    } else if (output->exception_level) {
      exception_level = *output->exception_level;
    }

    return InterceptionDecision()
      .with_behavior(InterceptionBehavior::capture_both)
      .with_target(target)
      .with_level(level)
      .with_exception_level(exception_level);
  }

  if (input != nullptr) {
    return from_marker(*input, InterceptionBehavior::capture_input);
  }
  if (output != nullptr) {
    return from_marker(*output, InterceptionBehavior::capture_output);
  }
  return std::nullopt;
}

}  // namespace policy
}  // namespace flexlog
