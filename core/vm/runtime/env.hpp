/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <map>
#include <vector>

#include <gsl/gsl_util>

#include "common/logger.hpp"
#include "crypto/secp256k1/secp256k1_provider.hpp"
#include "vm/actor/builtin/states/ccip_router_actor_state.hpp"
#include "vm/runtime/impl/runtime_impl.hpp"
#include "vm/state/impl/state_tree_impl.hpp"

namespace xr::vm::runtime {
  using actor::Actor;
  using actor::CodeId;
  using actor::builtin::states::OutboundMessage;
  using primitives::UInt256;
  using state::StateTreeImpl;

  /**
   * Contract behind an account, runs when value is sent to it. Failure
   * reverts the transfer and is returned to the sender.
   */
  using ReceiveHook = std::function<outcome::result<void>(
      const Address &from, const TokenAmount &value)>;

  /// Event with the address of the emitting actor
  struct EmittedEvent {
    Address emitter;
    Event event;
  };

  /// Environment of one chain, contains objects shared by runtime contexts
  struct Env : std::enable_shared_from_this<Env> {
    explicit Env(ChainSelector chain);

    /**
     * Call actor method. The call runs in its own state tree layer, changes
     * and events are reverted if it fails.
     * @tparam M - actor method
     * @param from - immediate caller
     * @param to - actor executing the method
     * @param value - attached value, moved before the method runs
     */
    template <typename M>
    outcome::result<typename M::Result> call(const Address &from,
                                             const Address &to,
                                             const typename M::Params &params,
                                             const TokenAmount &value = 0) {
      return withRevert([&]() -> outcome::result<typename M::Result> {
        OUTCOME_TRY(maybe_actor, state_tree->tryGet(to));
        if (!maybe_actor || maybe_actor->code == CodeId::kAccount) {
          return VMExitCode::kSysErrInvalidReceiver;
        }
        OUTCOME_TRY(transfer(from, to, value));
        RuntimeImpl runtime{shared_from_this(), from, to, value};
        return M::call(runtime, params);
      });
    }

    /**
     * Create actor at a fresh address and run its constructor
     * @tparam Construct - constructor method of the actor
     * @return address of the new actor
     */
    template <typename Construct>
    outcome::result<Address> deploy(CodeId code,
                                    const Address &deployer,
                                    const typename Construct::Params &params) {
      return withRevert([&]() -> outcome::result<Address> {
        const auto address = newActorAddress();
        OUTCOME_TRY(state_tree->set(address, Actor{code, 0, nullptr}));
        OUTCOME_TRY(call<Construct>(deployer, address, params));
        return address;
      });
    }

    /// Create externally owned account holding the balance
    outcome::result<void> createAccount(const Address &address,
                                        const TokenAmount &balance);

    /// Send value to any address, runs the receive hook of the recipient
    outcome::result<void> send(const Address &from,
                               const Address &to,
                               const TokenAmount &value);

    /// Value transfer followed by the receive hook of the recipient
    outcome::result<void> sendFunds(const Address &from,
                                    const Address &to,
                                    const TokenAmount &value);

    outcome::result<TokenAmount> getBalance(const Address &address) const;

    /// Messages the router accepted since the given outbox index
    outcome::result<std::vector<OutboundMessage>> outbox(
        const Address &router, size_t from_index = 0) const;

    /**
     * Deliver message sent from another chain through the local router. The
     * receiver is called with the router as immediate caller.
     */
    outcome::result<void> deliverCcip(const Address &router,
                                      const OutboundMessage &message);

    /**
     * Fulfill randomness request as the coordinator oracle, the consumer is
     * called back with the words
     */
    outcome::result<void> fulfillRandomWords(const Address &coordinator,
                                             const Address &oracle,
                                             const RequestId &request_id,
                                             const std::vector<UInt256> &words);

    /// Move time forward, one block per twelve seconds
    void advanceTime(Timestamp seconds);

    /// Events emitted by the actor, in emission order
    std::vector<Event> eventsOf(const Address &emitter) const;

    std::shared_ptr<StateTreeImpl> state_tree;
    std::shared_ptr<crypto::secp256k1::Secp256k1Provider> secp256k1;
    ChainSelector chain;
    Timestamp timestamp{};
    BlockNumber block_number{};
    std::vector<EmittedEvent> events;
    std::map<Address, ReceiveHook> receive_hooks;

   private:
    template <typename F>
    auto withRevert(F &&f) -> decltype(f()) {
      state_tree->txBegin();
      const auto events_before = events.size();
      auto BOOST_OUTCOME_TRY_UNIQUE_NAME{
          gsl::finally([&] { state_tree->txEnd(); })};
      auto result = f();
      if (!result) {
        state_tree->txRevert();
        events.erase(
            events.begin() + static_cast<ptrdiff_t>(events_before),
            events.end());
        logger_->debug("chain {} reverted: {}", chain, result.error().message());
      }
      return result;
    }

    outcome::result<void> transfer(const Address &from,
                                   const Address &to,
                                   const TokenAmount &value);

    Address newActorAddress();

    uint64_t actors_created_{};
    common::Logger logger_;
  };
}  // namespace xr::vm::runtime
