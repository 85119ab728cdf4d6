/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "testutil/outcome.hpp"
#include "vm/runtime/runtime.hpp"

namespace xr::vm::runtime {

  class MockRuntime : public Runtime {
   public:
    MOCK_CONST_METHOD0(getImmediateCaller, Address());

    MOCK_CONST_METHOD0(getCurrentReceiver, Address());

    MOCK_CONST_METHOD0(getBlockTimestamp, Timestamp());

    MOCK_CONST_METHOD0(getBlockNumber, BlockNumber());

    MOCK_CONST_METHOD0(getValueReceived, TokenAmount());

    MOCK_CONST_METHOD1(getBalance,
                       outcome::result<TokenAmount>(const Address &address));

    MOCK_METHOD2(sendFunds,
                 outcome::result<void>(const Address &to,
                                       const TokenAmount &value));

    MOCK_CONST_METHOD2(getTokenBalance,
                       outcome::result<TokenAmount>(const Address &token,
                                                    const Address &owner));

    MOCK_METHOD3(transferTokens,
                 outcome::result<void>(const Address &token,
                                       const Address &to,
                                       const TokenAmount &amount));

    MOCK_CONST_METHOD2(getNftOwner,
                       outcome::result<Address>(const Address &nft,
                                                const TokenId &token_id));

    MOCK_METHOD3(transferNft,
                 outcome::result<void>(const Address &nft,
                                       const Address &to,
                                       const TokenId &token_id));

    MOCK_CONST_METHOD3(
        getCcipFee,
        outcome::result<TokenAmount>(const Address &router,
                                     ChainSelector destination_chain,
                                     const Evm2AnyMessage &message));

    MOCK_METHOD3(ccipSend,
                 outcome::result<Hash256>(const Address &router,
                                          ChainSelector destination_chain,
                                          const Evm2AnyMessage &message));

    MOCK_METHOD1(requestRandomWords,
                 outcome::result<RequestId>(const Address &coordinator));

    MOCK_METHOD4(mintTickets,
                 outcome::result<void>(const Address &collection,
                                       const Address &to,
                                       const RaffleId &raffle_id,
                                       TicketCount count));

    MOCK_CONST_METHOD2(
        getTicketSupply,
        outcome::result<TicketSupply>(const Address &collection,
                                      const RaffleId &raffle_id));

    MOCK_CONST_METHOD3(getTicketOwner,
                       outcome::result<Address>(const Address &collection,
                                                const RaffleId &raffle_id,
                                                TicketSupply n));

    MOCK_METHOD2(recoverSigner,
                 outcome::result<Address>(BytesIn message, BytesIn signature));

    MOCK_METHOD1(emitEvent, void(Event event));

    MOCK_CONST_METHOD0(getActorHead, outcome::result<ActorStatePtr>());

    MOCK_METHOD1(commit, outcome::result<void>(ActorStatePtr new_state));
  };
}  // namespace xr::vm::runtime
