/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "vm/runtime/runtime.hpp"

namespace xr::vm::runtime {
  struct Env;

  /// Runtime of a single actor method call
  class RuntimeImpl : public Runtime {
   public:
    RuntimeImpl(std::shared_ptr<Env> env,
                const Address &caller,
                const Address &receiver,
                const TokenAmount &value);

    /** \copydoc Runtime::getImmediateCaller() */
    Address getImmediateCaller() const override;

    /** \copydoc Runtime::getCurrentReceiver() */
    Address getCurrentReceiver() const override;

    Timestamp getBlockTimestamp() const override;

    BlockNumber getBlockNumber() const override;

    TokenAmount getValueReceived() const override;

    /** \copydoc Runtime::getBalance() */
    outcome::result<TokenAmount> getBalance(
        const Address &address) const override;

    /** \copydoc Runtime::sendFunds() */
    outcome::result<void> sendFunds(const Address &to,
                                    const TokenAmount &value) override;

    outcome::result<TokenAmount> getTokenBalance(
        const Address &token, const Address &owner) const override;

    outcome::result<void> transferTokens(const Address &token,
                                         const Address &to,
                                         const TokenAmount &amount) override;

    /** \copydoc Runtime::getNftOwner() */
    outcome::result<Address> getNftOwner(
        const Address &nft, const TokenId &token_id) const override;

    outcome::result<void> transferNft(const Address &nft,
                                      const Address &to,
                                      const TokenId &token_id) override;

    outcome::result<TokenAmount> getCcipFee(
        const Address &router,
        ChainSelector destination_chain,
        const Evm2AnyMessage &message) const override;

    outcome::result<Hash256> ccipSend(const Address &router,
                                      ChainSelector destination_chain,
                                      const Evm2AnyMessage &message) override;

    outcome::result<RequestId> requestRandomWords(
        const Address &coordinator) override;

    outcome::result<void> mintTickets(const Address &collection,
                                      const Address &to,
                                      const RaffleId &raffle_id,
                                      TicketCount count) override;

    outcome::result<TicketSupply> getTicketSupply(
        const Address &collection, const RaffleId &raffle_id) const override;

    outcome::result<Address> getTicketOwner(const Address &collection,
                                            const RaffleId &raffle_id,
                                            TicketSupply n) const override;

    /** \copydoc Runtime::recoverSigner() */
    outcome::result<Address> recoverSigner(BytesIn message,
                                           BytesIn signature) override;

    void emitEvent(Event event) override;

    outcome::result<ActorStatePtr> getActorHead() const override;

    outcome::result<void> commit(ActorStatePtr new_state) override;

   private:
    std::shared_ptr<Env> env_;
    Address caller_;
    Address receiver_;
    TokenAmount value_;
  };
}  // namespace xr::vm::runtime
