/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/runtime/env.hpp"

#include "codec/abi/abi_packed.hpp"
#include "crypto/secp256k1/impl/secp256k1_provider_impl.hpp"
#include "crypto/sha/sha256.hpp"
#include "vm/actor/builtin/prize_manager/prize_manager_actor.hpp"
#include "vm/actor/builtin/states/ccip_router_actor_state.hpp"
#include "vm/actor/builtin/ticket_manager/ticket_manager_actor.hpp"
#include "vm/actor/builtin/vrf_coordinator/vrf_coordinator_actor.hpp"

namespace xr::vm::runtime {
  using actor::builtin::states::CcipRouterActorState;

  namespace prize_manager = actor::builtin::prize_manager;
  namespace ticket_manager = actor::builtin::ticket_manager;
  namespace vrf_coordinator = actor::builtin::vrf_coordinator;

  constexpr Timestamp kBlockTime{12};

  Env::Env(ChainSelector chain)
      : state_tree{std::make_shared<StateTreeImpl>()},
        secp256k1{
            std::make_shared<crypto::secp256k1::Secp256k1Sha256ProviderImpl>()},
        chain{chain},
        logger_{common::createLogger("env")} {}

  outcome::result<void> Env::createAccount(const Address &address,
                                           const TokenAmount &balance) {
    OUTCOME_TRY(actor, state_tree->tryGet(address));
    if (actor) {
      return state::StateTreeError::kAddressInUse;
    }
    return state_tree->set(address, Actor{CodeId::kAccount, balance, nullptr});
  }

  outcome::result<void> Env::send(const Address &from,
                                  const Address &to,
                                  const TokenAmount &value) {
    return withRevert([&] { return sendFunds(from, to, value); });
  }

  outcome::result<void> Env::sendFunds(const Address &from,
                                       const Address &to,
                                       const TokenAmount &value) {
    OUTCOME_TRY(transfer(from, to, value));
    const auto hook = receive_hooks.find(to);
    if (hook != receive_hooks.end()) {
      // copy, the hook may replace itself
      const auto receive = hook->second;
      OUTCOME_TRY(receive(from, value));
    }
    return outcome::success();
  }

  outcome::result<TokenAmount> Env::getBalance(const Address &address) const {
    OUTCOME_TRY(actor, state_tree->tryGet(address));
    if (!actor) {
      return TokenAmount{0};
    }
    return actor->balance;
  }

  outcome::result<std::vector<OutboundMessage>> Env::outbox(
      const Address &router, size_t from_index) const {
    OUTCOME_TRY(actor, state_tree->get(router));
    const auto state =
        std::dynamic_pointer_cast<const CcipRouterActorState>(actor.head);
    if (actor.code != CodeId::kCcipRouter || !state) {
      return VMExitCode::kSysErrInvalidReceiver;
    }
    if (from_index >= state->outbox.size()) {
      return std::vector<OutboundMessage>{};
    }
    return std::vector<OutboundMessage>{
        state->outbox.begin() + static_cast<ptrdiff_t>(from_index),
        state->outbox.end()};
  }

  outcome::result<void> Env::deliverCcip(const Address &router,
                                         const OutboundMessage &message) {
    OUTCOME_TRY(router_actor, state_tree->get(router));
    if (router_actor.code != CodeId::kCcipRouter) {
      return VMExitCode::kSysErrInvalidReceiver;
    }
    OUTCOME_TRY(receiver, state_tree->get(message.receiver));
    const Any2EvmMessage delivered{message.message_id,
                                   message.source_chain,
                                   message.sender,
                                   message.data};
    switch (receiver.code) {
      case CodeId::kPrizeManager: {
        OUTCOME_TRY(call<prize_manager::CcipReceive>(
            router, message.receiver, {delivered}));
        break;
      }
      case CodeId::kTicketManager: {
        OUTCOME_TRY(call<ticket_manager::CcipReceive>(
            router, message.receiver, {delivered}));
        break;
      }
      default:
        return VMExitCode::kSysErrInvalidReceiver;
    }
    return outcome::success();
  }

  outcome::result<void> Env::fulfillRandomWords(
      const Address &coordinator,
      const Address &oracle,
      const RequestId &request_id,
      const std::vector<UInt256> &words) {
    return withRevert([&]() -> outcome::result<void> {
      OUTCOME_TRY(consumer,
                  call<vrf_coordinator::TakeRequest>(
                      oracle, coordinator, {request_id}));
      OUTCOME_TRY(call<ticket_manager::FulfillRandomWords>(
          coordinator, consumer, {request_id, words}));
      return outcome::success();
    });
  }

  void Env::advanceTime(Timestamp seconds) {
    timestamp += seconds;
    block_number += seconds / kBlockTime;
  }

  std::vector<Event> Env::eventsOf(const Address &emitter) const {
    std::vector<Event> result;
    for (const auto &emitted : events) {
      if (emitted.emitter == emitter) {
        result.push_back(emitted.event);
      }
    }
    return result;
  }

  outcome::result<void> Env::transfer(const Address &from,
                                      const Address &to,
                                      const TokenAmount &value) {
    if (value == 0 || from == to) {
      return outcome::success();
    }
    OUTCOME_TRY(from_actor, state_tree->tryGet(from));
    if (!from_actor || from_actor->balance < value) {
      return VMExitCode::kSysErrInsufficientFunds;
    }
    from_actor->balance -= value;
    OUTCOME_TRY(state_tree->set(from, *from_actor));

    OUTCOME_TRY(to_actor, state_tree->tryGet(to));
    if (!to_actor) {
      to_actor = Actor{CodeId::kAccount, 0, nullptr};
    }
    to_actor->balance += value;
    OUTCOME_TRY(state_tree->set(to, *to_actor));
    return outcome::success();
  }

  Address Env::newActorAddress() {
    const auto digest = crypto::sha::sha256(codec::abi::AbiPackedEncoder{}
                                                .uint256(chain)
                                                .uint256(actors_created_)
                                                .bytes());
    ++actors_created_;
    Address address;
    std::copy(digest.end() - Address::size(), digest.end(), address.begin());
    return address;
  }
}  // namespace xr::vm::runtime
