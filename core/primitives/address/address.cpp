/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/address/address.hpp"

#include <boost/endian/conversion.hpp>

namespace xr::primitives::address {
  const Address kZeroAddress{};

  Address Address::makeFromId(uint64_t id) {
    Address address;
    boost::endian::store_big_u64(address.data() + kAddressSize - sizeof(id),
                                 id);
    return address;
  }

  outcome::result<Address> Address::fromString(std::string_view str) {
    OUTCOME_TRY(blob, Blob::fromHexWithPrefix(str));
    return Address{blob};
  }

  std::string Address::toString() const {
    return common::hex_lower_0x(*this);
  }

  bool Address::isZero() const {
    return *this == kZeroAddress;
  }
}  // namespace xr::primitives::address
