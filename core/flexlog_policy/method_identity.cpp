// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "method_identity.hpp"

#include <boost/container_hash/hash.hpp>

#include <sstream>
#include <utility>

namespace flexlog {
namespace policy {

namespace {

std::size_t compute_hash(
  const std::string& owner_type, const std::string& method_name,
  const std::vector<std::string>& parameter_types
) {
  std::size_t seed = 0;
  boost::hash_combine(seed, owner_type);
  boost::hash_combine(seed, method_name);
  boost::hash_combine(seed, parameter_types.size());
  for (const auto& parameter : parameter_types) {
    boost::hash_combine(seed, parameter);
  }
  return seed;
}

}  // namespace

MethodIdentity::MethodIdentity(
  std::string owner_type, std::string method_name, std::vector<std::string> parameter_types
)
    : owner_type_(std::move(owner_type))
    , method_name_(std::move(method_name))
    , parameter_types_(std::move(parameter_types))
    , hash_(compute_hash(owner_type_, method_name_, parameter_types_)) {}

std::string MethodIdentity::to_string() const {
  std::ostringstream oss;
  oss << *this;
  return oss.str();
}

bool MethodIdentity::operator==(const MethodIdentity& other) const {
  return hash_ == other.hash_ && owner_type_ == other.owner_type_ &&
         method_name_ == other.method_name_ && parameter_types_ == other.parameter_types_;
}

std::ostream& operator<<(std::ostream& strm, const MethodIdentity& identity) {
  strm << identity.owner_type() << "." << identity.method_name() << "(";
  for (std::size_t i = 0; i < identity.parameter_types().size(); ++i) {
    if (i > 0) {
      strm << ", ";
    }
    strm << identity.parameter_types()[i];
  }
  return strm << ")";
}

}  // namespace policy
}  // namespace flexlog
