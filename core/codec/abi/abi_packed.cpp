/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/abi/abi_packed.hpp"

#include "common/endian.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(xr::codec::abi, AbiDecodeError, e) {
  using xr::codec::abi::AbiDecodeError;
  switch (e) {
    case AbiDecodeError::kNotEnoughInput:
      return "Not enough input to decode value";
    case AbiDecodeError::kTrailingBytes:
      return "Input has trailing bytes";
    default:
      return "Unknown error";
  }
}

namespace xr::codec::abi {
  using primitives::address::kAddressSize;
  using primitives::kUInt256Size;

  AbiPackedEncoder &AbiPackedEncoder::address(const Address &value) {
    append(bytes_, value);
    return *this;
  }

  AbiPackedEncoder &AbiPackedEncoder::uint256(const UInt256 &value) {
    append(bytes_, primitives::toBytes32(value));
    return *this;
  }

  AbiPackedEncoder &AbiPackedEncoder::uint16(uint16_t value) {
    common::putUint16BigEndian(bytes_, value);
    return *this;
  }

  AbiPackedEncoder &AbiPackedEncoder::uint8(uint8_t value) {
    bytes_.push_back(value);
    return *this;
  }

  outcome::result<BytesIn> AbiPackedReader::take(size_t n) {
    if (remaining() < n) {
      return AbiDecodeError::kNotEnoughInput;
    }
    auto head = input_.first(static_cast<ptrdiff_t>(n));
    input_ = input_.subspan(static_cast<ptrdiff_t>(n));
    return head;
  }

  outcome::result<Address> AbiPackedReader::address() {
    OUTCOME_TRY(bytes, take(kAddressSize));
    OUTCOME_TRY(blob, Address::Blob::fromSpan(bytes));
    return Address{blob};
  }

  outcome::result<UInt256> AbiPackedReader::uint256() {
    OUTCOME_TRY(bytes, take(kUInt256Size));
    return primitives::fromBytes32(bytes);
  }

  outcome::result<uint16_t> AbiPackedReader::uint16() {
    OUTCOME_TRY(bytes, take(sizeof(uint16_t)));
    return common::getUint16BigEndian(bytes);
  }

  outcome::result<uint8_t> AbiPackedReader::uint8() {
    OUTCOME_TRY(bytes, take(sizeof(uint8_t)));
    return bytes[0];
  }

  outcome::result<void> AbiPackedReader::finish() const {
    if (remaining() != 0) {
      return AbiDecodeError::kTrailingBytes;
    }
    return outcome::success();
  }
}  // namespace xr::codec::abi
