/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"
#include "common/cmp.hpp"

namespace xr::primitives::address {
  constexpr size_t kAddressSize{20};

  /**
   * @brief Address refers to an account or a contract on an EVM chain
   */
  struct Address : public common::Blob<kAddressSize> {
    using Blob::Blob;

    Address() = default;

    explicit Address(const Blob &blob) : Blob{blob} {}

    /// Make address from last 8 bytes, used to derive deterministic addresses
    static Address makeFromId(uint64_t id);

    /// Parse "0x" prefixed 40 chars hex
    static outcome::result<Address> fromString(std::string_view str);

    /// "0x" prefixed lowercase hex
    std::string toString() const;

    bool isZero() const;
  };

  /// Zero address, the owner of nothing
  extern const Address kZeroAddress;

  inline bool operator==(const Address &lhs, const Address &rhs) {
    return static_cast<const Address::Blob &>(lhs)
           == static_cast<const Address::Blob &>(rhs);
  }
  XR_OPERATOR_NOT_EQUAL(Address)

  inline bool operator<(const Address &lhs, const Address &rhs) {
    return static_cast<const Address::Blob &>(lhs)
           < static_cast<const Address::Blob &>(rhs);
  }

  inline std::ostream &operator<<(std::ostream &os, const Address &address) {
    return os << address.toString();
  }
}  // namespace xr::primitives::address

template <>
struct std::hash<xr::primitives::address::Address> {
  size_t operator()(const xr::primitives::address::Address &address) const {
    return std::hash<xr::common::Blob<xr::primitives::address::kAddressSize>>{}(
        address);
  }
};
