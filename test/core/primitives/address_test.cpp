/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/address/address.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

namespace xr::primitives::address {

  /// Id is stored in the trailing bytes
  TEST(AddressTest, MakeFromId) {
    EXPECT_EQ(Address::makeFromId(0x0102).toString(),
              "0x0000000000000000000000000000000000000102");
    EXPECT_TRUE(Address{}.isZero());
    EXPECT_FALSE(Address::makeFromId(1).isZero());
  }

  /**
   * @given address string
   * @when parsing it
   * @then prefixed 40 hex chars are accepted only
   */
  TEST(AddressTest, FromString) {
    EXPECT_OUTCOME_EQ(
        Address::fromString("0x00000000000000000000000000000000000000ff"),
        Address::makeFromId(0xff));
    EXPECT_OUTCOME_FALSE_1(
        Address::fromString("00000000000000000000000000000000000000ff"));
    EXPECT_OUTCOME_FALSE_1(Address::fromString("0x00ff"));
  }

  /// Addresses are ordered bytewise
  TEST(AddressTest, Order) {
    EXPECT_LT(Address::makeFromId(1), Address::makeFromId(2));
    EXPECT_NE(Address::makeFromId(1), Address::makeFromId(2));
  }
}  // namespace xr::primitives::address
