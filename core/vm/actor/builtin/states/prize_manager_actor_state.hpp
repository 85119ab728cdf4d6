/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <set>

#include "vm/actor/actor.hpp"
#include "vm/actor/builtin/shared/ccip.hpp"
#include "vm/actor/builtin/shared/roles.hpp"
#include "vm/actor/builtin/types/prize_manager/prize.hpp"

namespace xr::vm::actor::builtin::states {
  using primitives::RaffleId;
  using primitives::TokenAmount;
  using primitives::TokenId;
  using primitives::address::Address;
  using types::prize_manager::NftInfo;
  using types::prize_manager::RafflePrize;
  using types::prize_manager::TokenInfo;

  /**
   * Prize ledger. The locked accumulators always equal the sum of the
   * prizes that are neither claimed nor canceled.
   */
  struct PrizeManagerActorState : ActorState {
    /// Prize record or nullptr
    const RafflePrize *tryGetPrize(const RaffleId &raffle_id) const;

    /// NFT is locked as a prize of some raffle
    bool isNftLocked(const Address &nft, const TokenId &token_id) const;

    TokenAmount tokensLocked(const Address &token) const;

    /// Add the prize of the raffle to the locked accumulators
    void lockPrize(const RaffleId &raffle_id);

    /// Remove the prize of the raffle from the locked accumulators
    void unlockPrize(const RaffleId &raffle_id);

    shared::Roles roles;
    shared::CcipConfig ccip;

    std::map<RaffleId, RafflePrize> raffle_prizes;
    std::map<RaffleId, NftInfo> nft_raffles;
    std::map<RaffleId, TokenAmount> eth_raffles;
    std::map<RaffleId, TokenInfo> token_raffles;

    TokenAmount eth_locked{};
    std::map<Address, TokenAmount> tokens_locked;
    std::set<std::pair<Address, TokenId>> nfts_locked;
  };
}  // namespace xr::vm::actor::builtin::states
