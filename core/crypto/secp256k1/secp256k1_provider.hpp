/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/bytes.hpp"
#include "common/outcome.hpp"
#include "crypto/secp256k1/secp256k1_types.hpp"

namespace xr::crypto::secp256k1 {

  /**
   * Signs with recoverable signatures, so the signer is known from the
   * signature alone:
   * - public key in uncompressed form
   * - signature in compact format with recovery id
   */
  class Secp256k1Provider {
   public:
    virtual ~Secp256k1Provider() = default;

    /**
     * @brief Generate public key from private key
     * @param key - private key for deriving public key
     * @return Derived public key or error code
     */
    virtual outcome::result<PublicKeyUncompressed> derive(
        const PrivateKey &key) const = 0;

    /**
     * @brief Create signature for a message
     * @param message - data to signing
     * @param key - private key for signing
     * @return Secp256k1 signature or error code
     */
    virtual outcome::result<SignatureCompact> sign(
        BytesIn message, const PrivateKey &key) const = 0;

    /**
     * RecoverPubkey returns the the public key of the signer.
     * @param message - signed data
     * @param signature - target for verifying
     * @return Derived public key or error code
     */
    virtual outcome::result<PublicKeyUncompressed> recoverPublicKey(
        BytesIn message, const SignatureCompact &signature) const = 0;
  };

}  // namespace xr::crypto::secp256k1
