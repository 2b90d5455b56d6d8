// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "identity_resolver.hpp"

namespace flexlog {
namespace policy {

const MethodIdentity& MethodIdentityResolver::identity(const MethodDescriptor& method) {
  return method.identity();
}

bool MethodIdentityResolver::is_eligible(const MethodDescriptor& method) {
  if (!method.is_public() || method.is_static() || method.declared_on_root()) {
    return false;
  }
  return method.kind() == MethodKind::regular;
}

const MethodDescriptor* MethodIdentityResolver::resolve_implementation(
  const MethodDescriptor& interface_method,
  const std::vector<std::shared_ptr<const TypeDescriptor>>& candidates
) {
  const TypeDescriptor& interface_type = interface_method.declaring_type();
  if (!interface_type.is_interface()) {
    return nullptr;
  }

  for (const auto& candidate : candidates) {
    if (candidate && !candidate->is_interface() &&
        candidate->implements(interface_type.full_name())) {
      return find_implementation_method(interface_method, *candidate);
    }
  }
  return nullptr;
}

const MethodDescriptor* MethodIdentityResolver::find_implementation_method(
  const MethodDescriptor& interface_method, const TypeDescriptor& implementation_type
) {
  const MethodDescriptor* method =
    implementation_type.find_method(interface_method.name(), interface_method.parameter_types());
  if (method == nullptr || !method->is_public() || method->is_static()) {
    return nullptr;
  }
  return method;
}

}  // namespace policy
}  // namespace flexlog
