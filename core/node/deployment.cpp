/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "node/deployment.hpp"

#include "crypto/secp256k1/secp256k1_address.hpp"
#include "vm/actor/builtin/ccip_router/ccip_router_actor.hpp"
#include "vm/actor/builtin/erc20/erc20_actor.hpp"
#include "vm/actor/builtin/prize_manager/prize_manager_actor.hpp"
#include "vm/actor/builtin/ticket_collection/ticket_collection_actor.hpp"
#include "vm/actor/builtin/ticket_manager/ticket_manager_actor.hpp"
#include "vm/actor/builtin/vrf_coordinator/vrf_coordinator_actor.hpp"

namespace xr::node {
  using vm::actor::CodeId;
  using vm::actor::builtin::types::Role;

  namespace ccip_router = vm::actor::builtin::ccip_router;
  namespace erc20 = vm::actor::builtin::erc20;
  namespace prize_manager = vm::actor::builtin::prize_manager;
  namespace ticket_collection = vm::actor::builtin::ticket_collection;
  namespace ticket_manager = vm::actor::builtin::ticket_manager;
  namespace vrf_coordinator = vm::actor::builtin::vrf_coordinator;

  namespace {
    /// Balance of the admin account on each chain
    const TokenAmount kAdminBalance{TokenAmount{1000} * 1000000000000000000};

    outcome::result<ChainContracts> deployChain(
        const DeploymentConfig &config, ChainSelector chain) {
      ChainContracts contracts;
      contracts.env = std::make_shared<Env>(chain);
      auto &env = *contracts.env;
      env.timestamp = config.start_timestamp;
      env.block_number = config.start_block;
      OUTCOME_TRY(env.createAccount(config.admin, kAdminBalance));
      OUTCOME_TRYA(contracts.link,
                   env.deploy<erc20::Construct>(
                       CodeId::kErc20Token, config.admin, {}));
      OUTCOME_TRYA(contracts.router,
                   env.deploy<ccip_router::Construct>(
                       CodeId::kCcipRouter,
                       config.admin,
                       {chain, contracts.link, config.link_fee}));
      return contracts;
    }

    /// Fund the manager and let it talk to its counterpart
    template <typename SetCounterpart, typename SetExtraArgs>
    outcome::result<void> connect(const DeploymentConfig &config,
                                  const ChainContracts &contracts,
                                  const Address &manager,
                                  const Address &counterpart,
                                  ChainSelector counterpart_chain) {
      auto &env = *contracts.env;
      OUTCOME_TRY(env.call<erc20::Mint>(
          config.admin, contracts.link, {manager, config.link_funding}));
      OUTCOME_TRY(env.call<SetCounterpart>(
          config.admin, manager, {counterpart, counterpart_chain, true}));
      if (!config.extra_args.empty()) {
        OUTCOME_TRY(env.call<SetExtraArgs>(
            config.admin, manager, {config.extra_args}));
      }
      return outcome::success();
    }
  }  // namespace

  outcome::result<Deployment> Deployment::make(const DeploymentConfig &config) {
    Deployment deployment;
    deployment.admin = config.admin;
    deployment.api_key = config.api_key;
    deployment.vrf_oracle = Address::makeFromId(0xf0);

    OUTCOME_TRYA(deployment.prize_chain,
                 deployChain(config, config.prize_chain));
    OUTCOME_TRYA(deployment.ticket_chain,
                 deployChain(config, config.ticket_chain));
    auto &prize_env = *deployment.prize_chain.env;
    auto &ticket_env = *deployment.ticket_chain.env;

    OUTCOME_TRY(api_public_key, prize_env.secp256k1->derive(config.api_key));
    deployment.api = crypto::secp256k1::toAddress(api_public_key);

    OUTCOME_TRYA(deployment.prize_manager,
                 prize_env.deploy<prize_manager::Construct>(
                     CodeId::kPrizeManager,
                     config.admin,
                     {deployment.prize_chain.link,
                      deployment.prize_chain.router}));

    OUTCOME_TRY(ticket_env.createAccount(deployment.vrf_oracle, 0));
    OUTCOME_TRYA(deployment.vrf_coordinator,
                 ticket_env.deploy<vrf_coordinator::Construct>(
                     CodeId::kVrfCoordinator, deployment.vrf_oracle, {}));
    OUTCOME_TRYA(deployment.tickets,
                 ticket_env.deploy<ticket_collection::Construct>(
                     CodeId::kTicketCollection, config.admin, {config.admin}));
    OUTCOME_TRYA(deployment.ticket_manager,
                 ticket_env.deploy<ticket_manager::Construct>(
                     CodeId::kTicketManager,
                     config.admin,
                     {deployment.ticket_chain.link,
                      deployment.ticket_chain.router,
                      deployment.tickets,
                      deployment.vrf_coordinator}));
    OUTCOME_TRY(ticket_env.call<ticket_collection::SetMinter>(
        config.admin, deployment.tickets, {deployment.ticket_manager}));
    OUTCOME_TRY(ticket_env.call<ticket_manager::SetRole>(
        config.admin,
        deployment.ticket_manager,
        {deployment.api, Role::kApi, true}));

    // parenthesized, template arguments would split the macro arguments
    OUTCOME_TRY((connect<prize_manager::SetCCIPCounterpart,
                         prize_manager::SetCCIPExtraArgs>(
        config,
        deployment.prize_chain,
        deployment.prize_manager,
        deployment.ticket_manager,
        config.ticket_chain)));
    OUTCOME_TRY((connect<ticket_manager::SetCCIPCounterpart,
                         ticket_manager::SetCCIPExtraArgs>(
        config,
        deployment.ticket_chain,
        deployment.ticket_manager,
        deployment.prize_manager,
        config.prize_chain)));

    deployment.relay = std::make_shared<CcipRelay>();
    OUTCOME_TRY(deployment.relay->addChain(deployment.prize_chain.env,
                                           deployment.prize_chain.router));
    OUTCOME_TRY(deployment.relay->addChain(deployment.ticket_chain.env,
                                           deployment.ticket_chain.router));
    return deployment;
  }

  outcome::result<Bytes> Deployment::signCoupon(
      const Address &buyer,
      const RaffleId &raffle_id,
      TicketCount count,
      BlockNumber valid_until,
      const TokenAmount &value) const {
    auto &env = *ticket_chain.env;
    OUTCOME_TRY(nonce,
                env.call<ticket_manager::GetNonce>(
                    buyer, ticket_manager, {buyer}));
    const auto message = ticket_manager::couponMessage(
        buyer, nonce, raffle_id, count, valid_until, value);
    OUTCOME_TRY(signature, env.secp256k1->sign(message, api_key));
    return Bytes{signature.begin(), signature.end()};
  }

  void Deployment::advanceTime(primitives::Timestamp seconds) const {
    prize_chain.env->advanceTime(seconds);
    ticket_chain.env->advanceTime(seconds);
  }
}  // namespace xr::node
