/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/abi/abi_packed.hpp"

#include <gtest/gtest.h>

#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

namespace xr::codec::abi {

  /**
   * @given values of each packed type
   * @when encoding them
   * @then each value takes its own width, big-endian, without padding
   */
  TEST(AbiPacked, Encode) {
    const auto bytes = AbiPackedEncoder{}
                           .address(Address::makeFromId(0xab))
                           .uint256(UInt256{0x0102})
                           .uint16(0x0304)
                           .uint8(5)
                           .bytes();
    EXPECT_EQ(
        bytes,
        "00000000000000000000000000000000000000ab"
        "0000000000000000000000000000000000000000000000000000000000000102"
        "0304"
        "05"_unhex);
  }

  /// Full width uint256 keeps every byte
  TEST(AbiPacked, EncodeMaxUint256) {
    const UInt256 max{~UInt256{0}};
    const auto bytes = AbiPackedEncoder{}.uint256(max).bytes();
    EXPECT_EQ(bytes, Bytes(32, 0xff));
  }

  /**
   * @given packed bytes
   * @when reading values in the same order
   * @then values are read back and input is consumed
   */
  TEST(AbiPacked, Read) {
    const auto bytes = "00000000000000000000000000000000000000ab"
                       "0000000000000000000000000000000000000000000000000000000000000102"
                       "0304"_unhex;
    AbiPackedReader reader{bytes};
    EXPECT_OUTCOME_EQ(reader.address(), Address::makeFromId(0xab));
    EXPECT_OUTCOME_EQ(reader.uint256(), UInt256{0x0102});
    EXPECT_OUTCOME_EQ(reader.uint16(), 0x0304);
    EXPECT_OUTCOME_TRUE_1(reader.finish());
  }

  /// Short and long inputs are rejected
  TEST(AbiPacked, ReadErrors) {
    const auto bytes = "0102"_unhex;
    AbiPackedReader reader{bytes};
    EXPECT_OUTCOME_ERROR(AbiDecodeError::kNotEnoughInput, reader.uint256());
    EXPECT_OUTCOME_ERROR(AbiDecodeError::kTrailingBytes, reader.finish());
    EXPECT_OUTCOME_EQ(reader.uint8(), 1);
    EXPECT_OUTCOME_EQ(reader.uint8(), 2);
    EXPECT_OUTCOME_ERROR(AbiDecodeError::kNotEnoughInput, reader.uint8());
  }
}  // namespace xr::codec::abi
