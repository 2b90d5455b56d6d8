// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "type_descriptor.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace flexlog {
namespace policy {

MethodDescriptor::MethodDescriptor(
  MethodSpec spec, const TypeDescriptor* declaring_type, MethodIdentity identity
)
    : spec_(std::move(spec))
    , declaring_type_(declaring_type)
    , identity_(std::move(identity)) {}

bool TypeDescriptor::implements(const std::string& interface_name) const {
  return std::find(interfaces_.begin(), interfaces_.end(), interface_name) != interfaces_.end();
}

const MethodDescriptor* TypeDescriptor::find_method(
  const std::string& name, const std::vector<std::string>& parameter_types
) const {
  for (const auto& method : methods_) {
    if (method.name() == name && method.parameter_types() == parameter_types) {
      return &method;
    }
  }
  return nullptr;
}

TypeBuilder::TypeBuilder(std::string full_name)
    : full_name_(std::move(full_name)) {}

TypeBuilder& TypeBuilder::as_interface() {
  kind_ = TypeKind::interface_type;
  return *this;
}

TypeBuilder& TypeBuilder::implements(std::string interface_name) {
  if (std::find(interfaces_.begin(), interfaces_.end(), interface_name) == interfaces_.end()) {
    interfaces_.push_back(std::move(interface_name));
  }
  return *this;
}

TypeBuilder& TypeBuilder::marker(InterceptionMarker marker) {
  markers_.push_back(std::move(marker));
  return *this;
}

TypeBuilder& TypeBuilder::injects_logger(bool value) {
  injects_logger_ = value;
  return *this;
}

TypeBuilder& TypeBuilder::method(MethodSpec spec) {
  methods_.push_back(std::move(spec));
  return *this;
}

TypeBuilder& TypeBuilder::method(
  std::string name, std::vector<std::string> parameter_types,
  std::vector<InterceptionMarker> markers
) {
  MethodSpec spec;
  spec.name = std::move(name);
  spec.parameter_types = std::move(parameter_types);
  spec.markers = std::move(markers);
  return method(std::move(spec));
}

std::shared_ptr<const TypeDescriptor> TypeBuilder::build() const {
  if (full_name_.empty()) {
    throw std::invalid_argument("TypeBuilder: type name cannot be empty");
  }
  for (const auto& interface_name : interfaces_) {
    if (interface_name.empty()) {
      throw std::invalid_argument("TypeBuilder: " + full_name_ + " lists an unnamed interface");
    }
  }

  std::shared_ptr<TypeDescriptor> type(new TypeDescriptor());
  type->full_name_ = full_name_;
  type->kind_ = kind_;
  type->interfaces_ = interfaces_;
  type->markers_ = markers_;
  type->injects_logger_ = injects_logger_;
  type->methods_.reserve(methods_.size());

  std::unordered_set<MethodIdentity, MethodIdentityHash> seen;
  for (const auto& spec : methods_) {
    if (spec.name.empty()) {
      throw std::invalid_argument("TypeBuilder: " + full_name_ + " has an unnamed method");
    }
    for (const auto& parameter : spec.parameter_types) {
      if (parameter.empty()) {
        throw std::invalid_argument(
          "TypeBuilder: " + full_name_ + "." + spec.name + " has an unnamed parameter type"
        );
      }
    }

    MethodIdentity identity(full_name_, spec.name, spec.parameter_types);
    if (!seen.insert(identity).second) {
      throw std::invalid_argument("TypeBuilder: duplicate method " + identity.to_string());
    }
    type->methods_.push_back(MethodDescriptor(spec, type.get(), std::move(identity)));
  }

  return type;
}

}  // namespace policy
}  // namespace flexlog
