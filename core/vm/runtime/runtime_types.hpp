/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"
#include "primitives/address/address.hpp"
#include "primitives/types.hpp"

namespace xr::vm::runtime {
  using common::Hash256;
  using primitives::ChainSelector;
  using primitives::address::Address;

  /// Cross-chain message as delivered by the router to its receiver
  struct Any2EvmMessage {
    Hash256 message_id;
    ChainSelector source_chain{};
    Address sender;
    Bytes data;
  };

  /// Cross-chain message handed to the router for sending
  struct Evm2AnyMessage {
    Address receiver;
    Bytes data;
    Address fee_token;
    Bytes extra_args;
  };
}  // namespace xr::vm::runtime
