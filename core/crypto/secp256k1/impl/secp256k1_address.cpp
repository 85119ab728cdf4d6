/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/secp256k1/secp256k1_address.hpp"

#include "crypto/sha/sha256.hpp"

namespace xr::crypto::secp256k1 {
  Address toAddress(const PublicKeyUncompressed &public_key) {
    const auto digest =
        sha::sha256(gsl::make_span(public_key).subspan(1));
    Address address;
    std::copy(digest.end() - Address::size(), digest.end(), address.begin());
    return address;
  }
}  // namespace xr::crypto::secp256k1
