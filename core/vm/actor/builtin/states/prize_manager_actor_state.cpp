/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/actor/builtin/states/prize_manager_actor_state.hpp"

namespace xr::vm::actor::builtin::states {
  using types::RaffleType;

  const RafflePrize *PrizeManagerActorState::tryGetPrize(
      const RaffleId &raffle_id) const {
    const auto it = raffle_prizes.find(raffle_id);
    if (it == raffle_prizes.end()) {
      return nullptr;
    }
    return &it->second;
  }

  bool PrizeManagerActorState::isNftLocked(const Address &nft,
                                           const TokenId &token_id) const {
    return nfts_locked.count({nft, token_id}) != 0;
  }

  TokenAmount PrizeManagerActorState::tokensLocked(
      const Address &token) const {
    const auto it = tokens_locked.find(token);
    return it == tokens_locked.end() ? TokenAmount{0} : it->second;
  }

  void PrizeManagerActorState::lockPrize(const RaffleId &raffle_id) {
    switch (raffle_prizes.at(raffle_id).type) {
      case RaffleType::kNft: {
        const auto &nft = nft_raffles.at(raffle_id);
        nfts_locked.emplace(nft.contract, nft.token_id);
        break;
      }
      case RaffleType::kEth:
        eth_locked += eth_raffles.at(raffle_id);
        break;
      case RaffleType::kToken: {
        const auto &token = token_raffles.at(raffle_id);
        tokens_locked[token.token_contract] += token.amount;
        break;
      }
      case RaffleType::kNone:
        break;
    }
  }

  void PrizeManagerActorState::unlockPrize(const RaffleId &raffle_id) {
    switch (raffle_prizes.at(raffle_id).type) {
      case RaffleType::kNft: {
        const auto &nft = nft_raffles.at(raffle_id);
        nfts_locked.erase({nft.contract, nft.token_id});
        break;
      }
      case RaffleType::kEth:
        eth_locked -= eth_raffles.at(raffle_id);
        break;
      case RaffleType::kToken: {
        const auto &token = token_raffles.at(raffle_id);
        auto &locked = tokens_locked.at(token.token_contract);
        locked -= token.amount;
        if (locked == 0) {
          tokens_locked.erase(token.token_contract);
        }
        break;
      }
      case RaffleType::kNone:
        break;
    }
  }
}  // namespace xr::vm::actor::builtin::states
