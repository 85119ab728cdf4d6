/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace xr::crypto::secp256k1 {

  enum class Secp256k1Error {
    kKeyGenerationFailed = 1,
    kSignatureParseError,
    kSignatureSerializationError,
    kCannotSignError,
    kPubkeySerializationError,
    kRecoverError,
  };

}

OUTCOME_HPP_DECLARE_ERROR(xr::crypto::secp256k1, Secp256k1Error);
