/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#include "common/bytes.hpp"

namespace xr::primitives {
  using UInt256 = boost::multiprecision::uint256_t;

  constexpr size_t kUInt256Size{32};

  /// Writes value as 32 bytes big-endian, left padded with zeros
  inline BytesN<kUInt256Size> toBytes32(const UInt256 &value) {
    Bytes bytes;
    boost::multiprecision::export_bits(value, std::back_inserter(bytes), 8);
    BytesN<kUInt256Size> out{};
    std::copy(bytes.begin(), bytes.end(), out.end() - bytes.size());
    return out;
  }

  /// Reads 32 bytes big-endian
  inline UInt256 fromBytes32(BytesIn bytes) {
    UInt256 value;
    boost::multiprecision::import_bits(value, bytes.begin(), bytes.end());
    return value;
  }
}  // namespace xr::primitives
