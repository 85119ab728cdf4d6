/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/state/state_tree_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(xr::vm::state, StateTreeError, e) {
  using xr::vm::state::StateTreeError;

  switch (e) {
    case StateTreeError::kStateNotFound:
      return "StateTreeError: state not found";
    case StateTreeError::kAddressInUse:
      return "StateTreeError: address is already in use";
  }
  return "unknown error";
}
