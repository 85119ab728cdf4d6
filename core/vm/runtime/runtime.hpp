/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"
#include "primitives/address/address.hpp"
#include "primitives/types.hpp"
#include "vm/actor/actor.hpp"
#include "vm/actor/builtin/types/events.hpp"
#include "vm/exit_code/exit_code.hpp"
#include "vm/runtime/runtime_types.hpp"

namespace xr::vm::runtime {
  using actor::ActorStatePtr;
  using actor::builtin::types::Event;
  using primitives::BlockNumber;
  using primitives::RaffleId;
  using primitives::RequestId;
  using primitives::TicketCount;
  using primitives::TicketSupply;
  using primitives::Timestamp;
  using primitives::TokenAmount;
  using primitives::TokenId;

  /**
   * @class Runtime is the VM's internal runtime object exposed to actors
   */
  class Runtime {
   public:
    virtual ~Runtime() = default;

    /**
     * The address of the immediate calling actor. Not necessarily the account
     * that signed the initial transaction.
     */
    virtual Address getImmediateCaller() const = 0;

    /** The address of the actor receiving the message. */
    virtual Address getCurrentReceiver() const = 0;

    /// Timestamp of the block being executed, in seconds
    virtual Timestamp getBlockTimestamp() const = 0;

    virtual BlockNumber getBlockNumber() const = 0;

    /// Value attached to the current call
    virtual TokenAmount getValueReceived() const = 0;

    virtual outcome::result<TokenAmount> getBalance(
        const Address &address) const = 0;

    /**
     * Transfer value from the current receiver. Runs the receive hook of a
     * contract recipient, whose failure is returned as is.
     * @param to - recipient
     * @param value - amount transferred
     */
    virtual outcome::result<void> sendFunds(const Address &to,
                                            const TokenAmount &value) = 0;

    /// ERC-20 balanceOf
    virtual outcome::result<TokenAmount> getTokenBalance(
        const Address &token, const Address &owner) const = 0;

    /// ERC-20 transfer from the current receiver
    virtual outcome::result<void> transferTokens(const Address &token,
                                                 const Address &to,
                                                 const TokenAmount &amount) = 0;

    /**
     * ERC-721 ownerOf
     * @return zero address for a token that was never minted, kNotAnNFT if
     * the contract is not an NFT collection
     */
    virtual outcome::result<Address> getNftOwner(
        const Address &nft, const TokenId &token_id) const = 0;

    /// ERC-721 transferFrom the current receiver
    virtual outcome::result<void> transferNft(const Address &nft,
                                              const Address &to,
                                              const TokenId &token_id) = 0;

    /// Fee in LINK charged by the router for the message
    virtual outcome::result<TokenAmount> getCcipFee(
        const Address &router,
        ChainSelector destination_chain,
        const Evm2AnyMessage &message) const = 0;

    /**
     * Hand the message to the router, the fee must already be paid
     * @return id of the message
     */
    virtual outcome::result<Hash256> ccipSend(
        const Address &router,
        ChainSelector destination_chain,
        const Evm2AnyMessage &message) = 0;

    /**
     * Request a single random word from the coordinator, fulfilled later by
     * a call from the coordinator
     */
    virtual outcome::result<RequestId> requestRandomWords(
        const Address &coordinator) = 0;

    /// Issue tickets of the raffle to the buyer
    virtual outcome::result<void> mintTickets(const Address &collection,
                                              const Address &to,
                                              const RaffleId &raffle_id,
                                              TicketCount count) = 0;

    virtual outcome::result<TicketSupply> getTicketSupply(
        const Address &collection, const RaffleId &raffle_id) const = 0;

    /// Owner of the ticket number n of the raffle
    virtual outcome::result<Address> getTicketOwner(
        const Address &collection,
        const RaffleId &raffle_id,
        TicketSupply n) const = 0;

    /**
     * Recover address of the signer of the message
     * @param message - signed data
     * @param signature - compact signature with recovery id
     */
    virtual outcome::result<Address> recoverSigner(BytesIn message,
                                                   BytesIn signature) = 0;

    /// Append event to the chain log
    virtual void emitEvent(Event event) = 0;

    /// Get current actor state
    virtual outcome::result<ActorStatePtr> getActorHead() const = 0;

    /// Update actor state
    virtual outcome::result<void> commit(ActorStatePtr new_state) = 0;

    /// Get typed current actor state
    template <typename T>
    outcome::result<T> getActorState() const {
      OUTCOME_TRY(head, getActorHead());
      const auto state = std::dynamic_pointer_cast<const T>(head);
      if (!state) {
        ABORT(VMExitCode::kSysErrInvalidReceiver);
      }
      return *state;
    }

    /**
     * Commit actor state
     * @param state - actor state
     * @return error in case of failure
     */
    template <typename T>
    outcome::result<void> commitState(const T &state) {
      return commit(std::make_shared<const T>(state));
    }

    inline auto getCurrentBalance() const {
      return getBalance(getCurrentReceiver());
    }

    inline outcome::result<void> validateImmediateCallerIs(
        const Address &address) const {
      if (getImmediateCaller() == address) {
        return outcome::success();
      }
      ABORT(VMExitCode::kSysErrForbidden);
    }
  };
}  // namespace xr::vm::runtime
