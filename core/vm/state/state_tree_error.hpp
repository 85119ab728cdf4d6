/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace xr::vm::state {

  /**
   * @brief Type of errors returned by StateTree
   */
  enum class StateTreeError {
    kStateNotFound = 1,
    kAddressInUse,
  };

}  // namespace xr::vm::state

OUTCOME_HPP_DECLARE_ERROR(xr::vm::state, StateTreeError);
