// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FLEXLOG_TYPE_DESCRIPTOR_HPP
#define FLEXLOG_TYPE_DESCRIPTOR_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "interception_marker.hpp"
#include "method_identity.hpp"

namespace flexlog {
namespace policy {

class TypeDescriptor;

enum class TypeKind { concrete_type, interface_type };

enum class MethodKind {
  regular,
  constructor,
  property_getter,
  property_setter,
  event_add,
  event_remove
};

/**
 * Static metadata of one method as declared by the host.
 */
struct MethodSpec {
  std::string name;
  std::vector<std::string> parameter_types;
  MethodKind kind = MethodKind::regular;
  bool is_public = true;
  bool is_static = false;
  bool declared_on_root = false;  // Inherited from the universal base object type
  std::vector<InterceptionMarker> markers;
};

/**
 * Immutable method metadata owned by a TypeDescriptor.
 */
class MethodDescriptor {
public:
  const std::string& name() const {
    return spec_.name;
  }

  const std::vector<std::string>& parameter_types() const {
    return spec_.parameter_types;
  }

  MethodKind kind() const {
    return spec_.kind;
  }

  bool is_public() const {
    return spec_.is_public;
  }

  bool is_static() const {
    return spec_.is_static;
  }

  bool declared_on_root() const {
    return spec_.declared_on_root;
  }

  const std::vector<InterceptionMarker>& markers() const {
    return spec_.markers;
  }

  const TypeDescriptor& declaring_type() const {
    return *declaring_type_;
  }

  const MethodIdentity& identity() const {
    return identity_;
  }

private:
  friend class TypeBuilder;

  MethodDescriptor(MethodSpec spec, const TypeDescriptor* declaring_type, MethodIdentity identity);

  MethodSpec spec_;
  const TypeDescriptor* declaring_type_;
  MethodIdentity identity_;
};

/**
 * Load-time side table describing a service type: its markers, the interfaces
 * it implements and its methods. Built once with TypeBuilder and shared read-only.
 *
 * Thread-safety: immutable after build(); safe to read from any thread.
 */
class TypeDescriptor {
public:
  // Non-copyable, non-movable: MethodDescriptors point back at their owner
  TypeDescriptor(const TypeDescriptor&) = delete;
  TypeDescriptor& operator=(const TypeDescriptor&) = delete;
  TypeDescriptor(TypeDescriptor&&) = delete;
  TypeDescriptor& operator=(TypeDescriptor&&) = delete;

  const std::string& full_name() const {
    return full_name_;
  }

  TypeKind kind() const {
    return kind_;
  }

  bool is_interface() const {
    return kind_ == TypeKind::interface_type;
  }

  /**
   * Full names of every interface this type can be assigned to,
   * including interfaces inherited through other interfaces.
   */
  const std::vector<std::string>& interfaces() const {
    return interfaces_;
  }

  bool implements(const std::string& interface_name) const;

  const std::vector<InterceptionMarker>& markers() const {
    return markers_;
  }

  // True when the service takes a logger directly and logs by hand
  bool injects_logger() const {
    return injects_logger_;
  }

  const std::vector<MethodDescriptor>& methods() const {
    return methods_;
  }

  /**
   * Find a method by name and parameter list. Returns nullptr if absent.
   */
  const MethodDescriptor* find_method(
    const std::string& name, const std::vector<std::string>& parameter_types
  ) const;

private:
  friend class TypeBuilder;

  TypeDescriptor() = default;

  std::string full_name_;
  TypeKind kind_ = TypeKind::concrete_type;
  std::vector<std::string> interfaces_;
  std::vector<InterceptionMarker> markers_;
  bool injects_logger_ = false;
  std::vector<MethodDescriptor> methods_;
};

/**
 * Fluent builder for TypeDescriptor.
 *
 * Usage:
 *   auto type = TypeBuilder("Shop.OrderService")
 *     .implements("Shop.IOrderService")
 *     .marker(InterceptionMarker::input(severity_level::info))
 *     .method("Cancel", {"int"}, {InterceptionMarker::both(severity_level::warn)})
 *     .method("Create")
 *     .build();
 */
class TypeBuilder {
public:
  explicit TypeBuilder(std::string full_name);

  TypeBuilder& as_interface();
  TypeBuilder& implements(std::string interface_name);
  TypeBuilder& marker(InterceptionMarker marker);
  TypeBuilder& injects_logger(bool value = true);

  TypeBuilder& method(MethodSpec spec);
  TypeBuilder& method(
    std::string name, std::vector<std::string> parameter_types = {},
    std::vector<InterceptionMarker> markers = {}
  );

  /**
   * Validate the collected metadata and produce the descriptor.
   *
   * @throws std::invalid_argument for an empty type, method or parameter type name,
   *         or two methods with the same name and parameter list
   */
  std::shared_ptr<const TypeDescriptor> build() const;

private:
  std::string full_name_;
  TypeKind kind_ = TypeKind::concrete_type;
  std::vector<std::string> interfaces_;
  std::vector<InterceptionMarker> markers_;
  bool injects_logger_ = false;
  std::vector<MethodSpec> methods_;
};

}  // namespace policy
}  // namespace flexlog

#endif  // FLEXLOG_TYPE_DESCRIPTOR_HPP
