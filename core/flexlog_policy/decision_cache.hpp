// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FLEXLOG_DECISION_CACHE_HPP
#define FLEXLOG_DECISION_CACHE_HPP

#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "decision_resolver.hpp"
#include "interception_decision.hpp"
#include "method_identity.hpp"
#include "type_descriptor.hpp"

namespace flexlog {
namespace policy {

/**
 * Precomputed interception decisions for registered service types.
 *
 * Types are registered once at startup; lookups run on every intercepted call.
 * A lookup for a registered type takes a shared lock, performs two hash lookups
 * and copies a shared_ptr.
 *
 * Thread-safety: all public methods are safe to call concurrently.
 */
class DecisionCache {
public:
  explicit DecisionCache(InterceptionOptions options);
  ~DecisionCache() = default;

  // Non-copyable, non-movable
  DecisionCache(const DecisionCache&) = delete;
  DecisionCache& operator=(const DecisionCache&) = delete;
  DecisionCache(DecisionCache&&) = delete;
  DecisionCache& operator=(DecisionCache&&) = delete;

  /**
   * Resolve and store decisions for every eligible method of a concrete type.
   * Registering the same type again replaces its entry.
   *
   * @param type Concrete service type
   * @throws std::invalid_argument if type is null, an interface or unnamed
   */
  void register_type(std::shared_ptr<const TypeDescriptor> type);

  /**
   * Decision for a method about to be invoked.
   *
   * Interface methods are mapped to the first registered implementation.
   * Methods of unregistered concrete types are resolved on demand and not stored.
   *
   * @return Decision, or nullptr when the call must not be intercepted
   */
  DecisionPtr lookup(const MethodDescriptor& method) const;

  bool is_registered(const std::string& type_name) const;

  std::size_t registered_type_count() const;

  /**
   * Drop all registered types.
   */
  void clear();

  const DecisionResolver& resolver() const {
    return resolver_;
  }

private:
  struct TypeEntry {
    std::shared_ptr<const TypeDescriptor> type;
    bool fully_disabled = false;
    std::unordered_map<MethodIdentity, DecisionPtr, MethodIdentityHash> decisions;
  };

  std::shared_ptr<const TypeEntry> build_entry(std::shared_ptr<const TypeDescriptor> type) const;
  DecisionPtr lookup_interface_method(const MethodDescriptor& method) const;

  DecisionResolver resolver_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<const TypeEntry>> entries_;
  // Interface full name -> implementing type names, in registration order
  std::unordered_map<std::string, std::vector<std::string>> implementations_;
};

}  // namespace policy
}  // namespace flexlog

#endif  // FLEXLOG_DECISION_CACHE_HPP
