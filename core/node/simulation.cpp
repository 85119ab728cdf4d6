/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "node/simulation.hpp"

#include "codec/abi/abi_packed.hpp"
#include "crypto/sha/sha256.hpp"
#include "vm/actor/builtin/prize_manager/prize_manager_actor.hpp"
#include "vm/actor/builtin/ticket_manager/ticket_manager_actor.hpp"

namespace xr::node {
  namespace prize_manager = vm::actor::builtin::prize_manager;
  namespace ticket_manager = vm::actor::builtin::ticket_manager;

  namespace {
    /// Blocks a coupon stays valid for
    constexpr BlockNumber kCouponValidity{10};
    /// First player address id
    constexpr uint64_t kPlayerIdBase{0x1000};

    common::Logger logger() {
      static common::Logger logger = common::createLogger("simulation");
      return logger;
    }

    UInt256 randomWord(const RaffleId &raffle_id, BlockNumber block) {
      const auto digest = crypto::sha::sha256(
          codec::abi::AbiPackedEncoder{}.uint256(raffle_id).uint256(block).bytes());
      return primitives::fromBytes32(digest);
    }

    outcome::result<size_t> relay(const Deployment &deployment) {
      OUTCOME_TRY(delivered, deployment.relay->relayAll());
      logger()->info("relayed {} messages", delivered);
      return delivered;
    }
  }  // namespace

  outcome::result<SimulationReport> runEthRaffle(
      const Deployment &deployment, const SimulationParams &params) {
    SimulationReport report;
    auto &prize_env = *deployment.prize_chain.env;
    auto &ticket_env = *deployment.ticket_chain.env;
    const auto &raffle_id = params.raffle_id;

    OUTCOME_TRY(prize_env.call<prize_manager::LockETH>(
        deployment.admin,
        deployment.prize_manager,
        {deployment.ticket_manager,
         ticket_env.chain,
         raffle_id,
         params.prize},
        params.prize));
    logger()->info("raffle {} prize of {} wei locked",
                   raffle_id.str(),
                   params.prize.str());
    OUTCOME_TRY(sent, relay(deployment));
    report.messages += sent;

    const auto starts_at = ticket_env.timestamp;
    OUTCOME_TRY(ticket_env.call<ticket_manager::CreateRaffle>(
        deployment.admin,
        deployment.ticket_manager,
        {raffle_id, starts_at, starts_at + params.duration, 1, 0, 0}));

    for (size_t i = 0; i < params.purchases.size(); ++i) {
      const auto player = Address::makeFromId(kPlayerIdBase + i);
      const auto count = params.purchases[i];
      const TokenAmount value{params.ticket_price * count};
      OUTCOME_TRY(ticket_env.createAccount(player, value));
      const auto valid_until = ticket_env.block_number + kCouponValidity;
      OUTCOME_TRY(signature,
                  deployment.signCoupon(
                      player, raffle_id, count, valid_until, value));
      OUTCOME_TRY(ticket_env.call<ticket_manager::BuyTickets>(
          player,
          deployment.ticket_manager,
          {raffle_id, count, valid_until, signature},
          value));
      logger()->info(
          "{} bought {} tickets for {} wei", player.toString(), count, value.str());
    }

    deployment.advanceTime(params.duration);
    OUTCOME_TRY(ticket_env.call<ticket_manager::DrawWinner>(
        deployment.admin, deployment.ticket_manager, {raffle_id}));
    OUTCOME_TRY(raffle,
                ticket_env.call<ticket_manager::GetRaffle>(
                    deployment.admin, deployment.ticket_manager, {raffle_id}));
    report.total_raised = raffle.total_raised;
    OUTCOME_TRY(ticket_env.fulfillRandomWords(
        deployment.vrf_coordinator,
        deployment.vrf_oracle,
        raffle.request_id,
        {randomWord(raffle_id, ticket_env.block_number)}));
    OUTCOME_TRY(ticket_env.call<ticket_manager::PropagateRaffleWinner>(
        deployment.admin, deployment.ticket_manager, {raffle_id}));
    OUTCOME_TRY(sent_back, relay(deployment));
    report.messages += sent_back;

    OUTCOME_TRYA(report.winner,
                 prize_env.call<prize_manager::GetWinner>(
                     deployment.admin, deployment.prize_manager, {raffle_id}));
    OUTCOME_TRY(prize_env.call<prize_manager::ClaimPrize>(
        report.winner, deployment.prize_manager, {raffle_id}));
    OUTCOME_TRY(balance, prize_env.getBalance(report.winner));
    logger()->info("raffle {} won by {}, balance {} wei",
                   raffle_id.str(),
                   report.winner.toString(),
                   balance.str());
    return report;
  }
}  // namespace xr::node
