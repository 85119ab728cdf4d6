/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/secp256k1/impl/secp256k1_provider_impl.hpp"

#include <secp256k1_recovery.h>

#include "crypto/secp256k1/secp256k1_error.hpp"
#include "crypto/sha/sha256.hpp"

namespace xr::crypto::secp256k1 {
  constexpr size_t kMessageHashLength = 32;

  Secp256k1ProviderImpl::Secp256k1ProviderImpl()
      : context_(secp256k1_context_create(SECP256K1_CONTEXT_SIGN
                                          | SECP256K1_CONTEXT_VERIFY),
                 secp256k1_context_destroy) {}

  outcome::result<PublicKeyUncompressed> Secp256k1ProviderImpl::derive(
      const PrivateKey &key) const {
    secp256k1_pubkey pubkey;

    if (!secp256k1_ec_pubkey_create(context_.get(), &pubkey, key.data())) {
      return Secp256k1Error::kKeyGenerationFailed;
    }

    PublicKeyUncompressed public_key{};
    size_t outputlen = kPublicKeyUncompressedLength;
    if (!secp256k1_ec_pubkey_serialize(context_.get(),
                                       public_key.data(),
                                       &outputlen,
                                       &pubkey,
                                       SECP256K1_EC_UNCOMPRESSED)) {
      return Secp256k1Error::kPubkeySerializationError;
    }

    return public_key;
  }

  outcome::result<SignatureCompact> Secp256k1ProviderImpl::sign(
      BytesIn message, const PrivateKey &key) const {
    OUTCOME_TRY(checkMessage(message));

    secp256k1_ecdsa_recoverable_signature sig_struct;
    if (!secp256k1_ecdsa_sign_recoverable(context_.get(),
                                          &sig_struct,
                                          message.data(),
                                          key.data(),
                                          secp256k1_nonce_function_rfc6979,
                                          nullptr)) {
      return Secp256k1Error::kCannotSignError;
    }
    SignatureCompact signature{};
    int recid = 0;
    if (!secp256k1_ecdsa_recoverable_signature_serialize_compact(
            context_.get(), signature.data(), &recid, &sig_struct)) {
      return Secp256k1Error::kSignatureSerializationError;
    }
    signature[64] = static_cast<uint8_t>(recid);
    return signature;
  }

  outcome::result<PublicKeyUncompressed>
  Secp256k1ProviderImpl::recoverPublicKey(
      BytesIn message, const SignatureCompact &signature) const {
    OUTCOME_TRY(checkMessage(message));
    if (signature[64] > 3) {
      return Secp256k1Error::kSignatureParseError;
    }

    secp256k1_ecdsa_recoverable_signature sig_rec;
    secp256k1_pubkey pubkey;

    if (!secp256k1_ecdsa_recoverable_signature_parse_compact(
            context_.get(),
            &sig_rec,
            signature.data(),
            static_cast<int>(signature[64]))) {
      return Secp256k1Error::kSignatureParseError;
    }
    if (!secp256k1_ecdsa_recover(
            context_.get(), &pubkey, &sig_rec, message.data())) {
      return Secp256k1Error::kRecoverError;
    }
    PublicKeyUncompressed pubkey_out;
    size_t outputlen = kPublicKeyUncompressedLength;
    if (!secp256k1_ec_pubkey_serialize(context_.get(),
                                       pubkey_out.data(),
                                       &outputlen,
                                       &pubkey,
                                       SECP256K1_EC_UNCOMPRESSED)) {
      return Secp256k1Error::kPubkeySerializationError;
    }

    return pubkey_out;
  }

  outcome::result<void> Secp256k1ProviderImpl::checkMessage(BytesIn message) {
    if (message.size() != kMessageHashLength) {
      return Secp256k1Error::kSignatureParseError;
    }
    return outcome::success();
  }

  outcome::result<SignatureCompact> Secp256k1Sha256ProviderImpl::sign(
      BytesIn message, const PrivateKey &key) const {
    const auto digest = sha::sha256(message);
    return Secp256k1ProviderImpl::sign(digest, key);
  }

  outcome::result<PublicKeyUncompressed>
  Secp256k1Sha256ProviderImpl::recoverPublicKey(
      BytesIn message, const SignatureCompact &signature) const {
    const auto digest = sha::sha256(message);
    return Secp256k1ProviderImpl::recoverPublicKey(digest, signature);
  }

}  // namespace xr::crypto::secp256k1
