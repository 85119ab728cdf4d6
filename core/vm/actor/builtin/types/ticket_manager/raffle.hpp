/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>

#include <boost/optional.hpp>

#include "vm/actor/builtin/shared/ccip.hpp"
#include "vm/actor/builtin/types/raffle.hpp"

namespace xr::vm::actor::builtin::types::ticket_manager {
  using primitives::RaffleId;
  using primitives::RequestId;
  using primitives::Timestamp;
  using primitives::TokenAmount;
  using primitives::UInt256;
  using primitives::address::Address;
  using shared::CcipCounterpart;

  /// Participation of a player in a raffle
  struct Participation {
    /// Value paid for tickets, smallest currency units
    uint64_t total_spent{};
    uint32_t total_purchased{};
    /// Paid value was refunded after cancellation
    bool withdrawn{};
  };

  inline bool operator==(const Participation &lhs, const Participation &rhs) {
    return lhs.total_spent == rhs.total_spent
           && lhs.total_purchased == rhs.total_purchased
           && lhs.withdrawn == rhs.withdrawn;
  }

  struct Raffle {
    RaffleStatus status{RaffleStatus::kNone};
    Timestamp starts_at{};
    Timestamp ends_at{};
    uint32_t min_tickets_threshold{};
    /// Zero means unlimited, the raffle is then drawable after the first sale
    uint32_t max_ticket_supply{};
    /// Zero means unlimited
    uint32_t max_holdings{};
    TokenAmount total_raised{};
    RequestId request_id{};
    /// Prize manager that locked the prize, answered on cancel and draw
    CcipCounterpart prize_manager;
    std::map<Address, Participation> participations;
  };

  /// Randomness request, the word is set once by the coordinator
  struct RandomnessRequest {
    RaffleId raffle_id;
    boost::optional<UInt256> random_word;
  };
}  // namespace xr::vm::actor::builtin::types::ticket_manager
