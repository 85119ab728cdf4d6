/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "codec/abi/abi_errors.hpp"
#include "primitives/address/address.hpp"
#include "primitives/big_int.hpp"

namespace xr::codec::abi {
  using primitives::UInt256;
  using primitives::address::Address;

  /**
   * Non-standard packed ABI encoding, same as solidity abi.encodePacked:
   * values are written with their own width and without padding
   */
  class AbiPackedEncoder {
   public:
    AbiPackedEncoder &address(const Address &value);
    AbiPackedEncoder &uint256(const UInt256 &value);
    AbiPackedEncoder &uint16(uint16_t value);
    AbiPackedEncoder &uint8(uint8_t value);

    const Bytes &bytes() const {
      return bytes_;
    }

   private:
    Bytes bytes_;
  };

  /**
   * Reads values written by AbiPackedEncoder
   */
  class AbiPackedReader {
   public:
    explicit AbiPackedReader(BytesIn input) : input_{input} {}

    outcome::result<Address> address();
    outcome::result<UInt256> uint256();
    outcome::result<uint16_t> uint16();
    outcome::result<uint8_t> uint8();

    /// Input must be fully consumed
    outcome::result<void> finish() const;

    size_t remaining() const {
      return static_cast<size_t>(input_.size());
    }

   private:
    outcome::result<BytesIn> take(size_t n);

    BytesIn input_;
  };
}  // namespace xr::codec::abi
