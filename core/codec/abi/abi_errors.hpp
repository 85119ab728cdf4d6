/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace xr::codec::abi {
  enum class AbiDecodeError {
    kNotEnoughInput = 1,
    kTrailingBytes,
  };
}  // namespace xr::codec::abi

OUTCOME_HPP_DECLARE_ERROR(xr::codec::abi, AbiDecodeError);
