// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FLEXLOG_METHOD_IDENTITY_HPP
#define FLEXLOG_METHOD_IDENTITY_HPP

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace flexlog {
namespace policy {

/**
 * Overload-safe cache key: owning type, method name and parameter type names.
 *
 * Two identities are equal iff all three parts match. The hash is computed once
 * at construction so hashing on the lookup path is a field read.
 */
class MethodIdentity {
public:
  MethodIdentity(
    std::string owner_type, std::string method_name, std::vector<std::string> parameter_types
  );

  const std::string& owner_type() const {
    return owner_type_;
  }

  const std::string& method_name() const {
    return method_name_;
  }

  const std::vector<std::string>& parameter_types() const {
    return parameter_types_;
  }

  std::size_t hash() const noexcept {
    return hash_;
  }

  // "Owner.Name(P1, P2)"
  std::string to_string() const;

  bool operator==(const MethodIdentity& other) const;
  bool operator!=(const MethodIdentity& other) const {
    return !(*this == other);
  }

private:
  std::string owner_type_;
  std::string method_name_;
  std::vector<std::string> parameter_types_;
  std::size_t hash_;
};

std::ostream& operator<<(std::ostream& strm, const MethodIdentity& identity);

struct MethodIdentityHash {
  std::size_t operator()(const MethodIdentity& identity) const noexcept {
    return identity.hash();
  }
};

}  // namespace policy
}  // namespace flexlog

#endif  // FLEXLOG_METHOD_IDENTITY_HPP
