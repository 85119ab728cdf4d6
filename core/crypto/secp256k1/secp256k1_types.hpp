/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>

#include "common/cmp.hpp"

namespace xr::crypto::secp256k1 {

  static const size_t kPrivateKeyLength = 32;
  static const size_t kPublicKeyUncompressedLength = 65;
  static const size_t kSignatureLength = 65;

  using PrivateKey = std::array<uint8_t, kPrivateKeyLength>;
  using PublicKeyUncompressed =
      std::array<uint8_t, kPublicKeyUncompressedLength>;
  /**
   * Compact ECDSA signature format with a 65-byte signature with the recovery
   * id at the end
   */
  using SignatureCompact = std::array<uint8_t, kSignatureLength>;

  using Signature = SignatureCompact;
  using PublicKey = PublicKeyUncompressed;

  /**
   * @struct Key pair
   */
  struct KeyPair {
    PrivateKey private_key; /**< Secp256k1 private key */
    PublicKey public_key;   /**< Secp256k1 public uncompressed key */

    bool operator==(const KeyPair &other) const {
      return private_key == other.private_key && public_key == other.public_key;
    }
  };
  XR_OPERATOR_NOT_EQUAL(KeyPair)
}  // namespace xr::crypto::secp256k1
