// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "decision_cache.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "identity_resolver.hpp"
#include "marker_inspector.hpp"

#define FLEXLOG_LOG_COMPONENT "decision_cache"
#include "flexlog_log_macros.hpp"

namespace flexlog {
namespace policy {

using logging::kv;

DecisionCache::DecisionCache(InterceptionOptions options)
    : resolver_(std::move(options)) {}

std::shared_ptr<const DecisionCache::TypeEntry> DecisionCache::build_entry(
  std::shared_ptr<const TypeDescriptor> type
) const {
  auto entry = std::make_shared<TypeEntry>();
  entry->fully_disabled = MarkerInspector::is_type_disabled(*type);

  if (!entry->fully_disabled) {
    for (const auto& method : type->methods()) {
      if (auto decision = resolver_.resolve_if_eligible(method)) {
        entry->decisions.emplace(method.identity(), std::move(*decision));
      }
    }
  }

  entry->type = std::move(type);
  return entry;
}

void DecisionCache::register_type(std::shared_ptr<const TypeDescriptor> type) {
  if (!type) {
    FLEXLOG_LOG_ERROR("Rejected registration of a null type descriptor");
    throw std::invalid_argument("Type descriptor must not be null");
  }
  if (type->full_name().empty()) {
    FLEXLOG_LOG_ERROR("Rejected registration of an unnamed type");
    throw std::invalid_argument("Type descriptor must have a name");
  }
  if (type->is_interface()) {
    FLEXLOG_LOG_ERROR("Rejected registration of an interface" << kv("type", type->full_name()));
    throw std::invalid_argument("Cannot register interface type: " + type->full_name());
  }

  FLEXLOG_LOG_SCOPED_SERVICE(type->full_name());

  auto entry = build_entry(type);
  const std::string& name = entry->type->full_name();

  std::size_t cached = 0;
  for (const auto& decision : entry->decisions) {
    if (decision.second) {
      ++cached;
    }
  }

  {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto previous = entries_.find(name);
    if (previous != entries_.end()) {
      // Drop interfaces the new descriptor no longer lists, keep positions of the rest
      for (const auto& iface : previous->second->type->interfaces()) {
        if (entry->type->implements(iface)) {
          continue;
        }
        auto it = implementations_.find(iface);
        if (it == implementations_.end()) {
          continue;
        }
        auto& names = it->second;
        names.erase(std::remove(names.begin(), names.end(), name), names.end());
        if (names.empty()) {
          implementations_.erase(it);
        }
      }
    }

    for (const auto& iface : entry->type->interfaces()) {
      auto& names = implementations_[iface];
      if (std::find(names.begin(), names.end(), name) == names.end()) {
        names.push_back(name);
      }
    }

    entries_[name] = entry;
  }

  FLEXLOG_LOG_DEBUG(
    "Registered type" << kv("type", name) << kv("methods", entry->decisions.size())
                      << kv("intercepted", cached)
                      << kv("fully_disabled", entry->fully_disabled ? "true" : "false")
  );
}

DecisionPtr DecisionCache::lookup(const MethodDescriptor& method) const {
  const TypeDescriptor& owner = method.declaring_type();

  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(owner.full_name());
    if (it != entries_.end()) {
      const TypeEntry& entry = *it->second;
      if (entry.fully_disabled) {
        return nullptr;
      }
      auto decision = entry.decisions.find(method.identity());
      if (decision == entry.decisions.end()) {
        return nullptr;
      }
      return decision->second;
    }
  }

  if (owner.is_interface()) {
    return lookup_interface_method(method);
  }

  FLEXLOG_LOG_DEBUG_THROTTLE(
    5.0, "Resolving method of unregistered type" << kv("method", method.identity())
  );
  return resolver_.resolve(method);
}

DecisionPtr DecisionCache::lookup_interface_method(const MethodDescriptor& method) const {
  std::vector<std::shared_ptr<const TypeDescriptor>> candidates;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = implementations_.find(method.declaring_type().full_name());
    if (it != implementations_.end()) {
      candidates.reserve(it->second.size());
      for (const auto& name : it->second) {
        auto entry = entries_.find(name);
        if (entry != entries_.end()) {
          candidates.push_back(entry->second->type);
        }
      }
    }
  }

  const MethodDescriptor* implementation =
    MethodIdentityResolver::resolve_implementation(method, candidates);
  if (implementation == nullptr) {
    FLEXLOG_LOG_DEBUG(
      "No implementation found for interface method" << kv("method", method.identity())
                                                     << kv("candidates", candidates.size())
    );
    return nullptr;
  }

  // candidates keeps the implementing descriptor alive for the nested lookup
  return lookup(*implementation);
}

bool DecisionCache::is_registered(const std::string& type_name) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.find(type_name) != entries_.end();
}

std::size_t DecisionCache::registered_type_count() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.size();
}

void DecisionCache::clear() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  entries_.clear();
  implementations_.clear();
  FLEXLOG_LOG_DEBUG("Cleared all registered types");
}

}  // namespace policy
}  // namespace flexlog
