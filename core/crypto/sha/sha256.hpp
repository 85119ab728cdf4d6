/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <libp2p/crypto/sha/sha256.hpp>

#include "common/blob.hpp"

namespace xr::crypto::sha {
  using common::Hash256;

  inline Hash256 sha256(BytesIn input) {
    return Hash256{libp2p::crypto::sha256(input).value()};
  }
}  // namespace xr::crypto::sha
