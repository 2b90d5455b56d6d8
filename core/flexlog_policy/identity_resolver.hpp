// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FLEXLOG_IDENTITY_RESOLVER_HPP
#define FLEXLOG_IDENTITY_RESOLVER_HPP

#include <memory>
#include <vector>

#include "method_identity.hpp"
#include "type_descriptor.hpp"

namespace flexlog {
namespace policy {

/**
 * Method identity, eligibility and interface-to-implementation bridging.
 */
class MethodIdentityResolver {
public:
  /**
   * Overload-safe identity of a method. Computed when the descriptor was built.
   */
  static const MethodIdentity& identity(const MethodDescriptor& method);

  /**
   * Structural eligibility: public, non-static instance methods that are not
   * constructors, property accessors, event add/remove or declared on the
   * universal base object type.
   */
  static bool is_eligible(const MethodDescriptor& method);

  /**
   * Locate the concrete counterpart of an interface-declared method.
   *
   * Takes the first candidate that is a concrete type implementing the method's
   * interface, then returns its public instance method with the same name and
   * parameter list.
   *
   * @return The implementing method, or nullptr when no candidate implements the
   *         interface or the member is hidden (callers treat this as "do not intercept")
   */
  static const MethodDescriptor* resolve_implementation(
    const MethodDescriptor& interface_method,
    const std::vector<std::shared_ptr<const TypeDescriptor>>& candidates
  );

  /**
   * Public instance method on implementation_type matching name and parameters.
   */
  static const MethodDescriptor* find_implementation_method(
    const MethodDescriptor& interface_method, const TypeDescriptor& implementation_type
  );
};

}  // namespace policy
}  // namespace flexlog

#endif  // FLEXLOG_IDENTITY_RESOLVER_HPP
