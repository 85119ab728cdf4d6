/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/secp256k1/secp256k1_types.hpp"
#include "primitives/address/address.hpp"

namespace xr::crypto::secp256k1 {
  using primitives::address::Address;

  /**
   * Address controlled by the key, the last 20 bytes of the sha256 digest of
   * the key without its format byte
   */
  Address toAddress(const PublicKeyUncompressed &public_key);
}  // namespace xr::crypto::secp256k1
