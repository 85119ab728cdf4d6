/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <secp256k1.h>

#include "crypto/secp256k1/secp256k1_provider.hpp"

namespace xr::crypto::secp256k1 {

  /**
   * Implemetation of Secp256k1 provider with
   * - public key in uncompressed form
   * - signature in compact form
   * - NO digest function, message must be a 32 byte hash
   */
  class Secp256k1ProviderImpl : public Secp256k1Provider {
   public:
    Secp256k1ProviderImpl();

    outcome::result<PublicKeyUncompressed> derive(
        const PrivateKey &key) const override;

    outcome::result<SignatureCompact> sign(
        BytesIn message, const PrivateKey &key) const override;

    outcome::result<PublicKeyUncompressed> recoverPublicKey(
        BytesIn message, const SignatureCompact &signature) const override;

   private:
    std::unique_ptr<secp256k1_context, void (*)(secp256k1_context *)> context_;

    static outcome::result<void> checkMessage(BytesIn message);
  };

  /// Signs the sha256 digest of the message
  class Secp256k1Sha256ProviderImpl : public Secp256k1ProviderImpl {
   public:
    outcome::result<SignatureCompact> sign(
        BytesIn message, const PrivateKey &key) const override;

    outcome::result<PublicKeyUncompressed> recoverPublicKey(
        BytesIn message, const SignatureCompact &signature) const override;
  };

}  // namespace xr::crypto::secp256k1
