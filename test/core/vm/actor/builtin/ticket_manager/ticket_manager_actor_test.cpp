/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/actor/builtin/ticket_manager/ticket_manager_actor.hpp"

#include <limits>

#include <gtest/gtest.h>

#include "codec/ccip/ccip_message.hpp"
#include "crypto/secp256k1/secp256k1_error.hpp"
#include "testutil/vm/actor/builtin/actor_test_fixture.hpp"

namespace xr::vm::actor::builtin::ticket_manager {
  using codec::ccip::encode;
  using common::Hash256;
  using primitives::ChainSelector;
  using runtime::Evm2AnyMessage;
  using testing::_;
  using testing::Return;
  using testutil::vm::actor::builtin::ActorTestFixture;
  using types::Role;

  const Address kAdmin = Address::makeFromId(1);
  const Address kRouter = Address::makeFromId(2);
  const Address kLink = Address::makeFromId(3);
  const Address kPrizeManager = Address::makeFromId(4);
  const Address kTickets = Address::makeFromId(5);
  const Address kCoordinator = Address::makeFromId(6);
  const Address kApi = Address::makeFromId(7);
  const Address kAlice = Address::makeFromId(10);
  const Address kBob = Address::makeFromId(11);
  constexpr ChainSelector kPrizeChain{111};
  constexpr Timestamp kNow{1700000000};
  constexpr Timestamp kEnd{kNow + 3600};
  const TokenAmount kPrice{100};

  class TicketManagerActorTest
      : public ActorTestFixture<TicketManagerActorState> {
   public:
    void SetUp() override {
      ActorTestFixture<TicketManagerActorState>::SetUp();
      callerIs(kAdmin);
      timestampIs(kNow);
      blockIs(10);
      state = TicketManagerActorState{};
      state->roles.setRole(kAdmin, Role::kAdmin, true);
      state->roles.setRole(kApi, Role::kApi, true);
      state->ccip.router = kRouter;
      state->ccip.link_token = kLink;
      state->ccip.setCounterpart({kPrizeManager, kPrizeChain}, true);
      state->tickets = kTickets;
      state->vrf_coordinator = kCoordinator;

      EXPECT_CALL(runtime, mintTickets(kTickets, _, _, _))
          .WillRepeatedly(testing::Invoke(
              [&](auto &, const Address &to, const RaffleId &raffle_id,
                  TicketCount count) -> outcome::result<void> {
                auto &owners = tickets[raffle_id];
                owners.insert(owners.end(), count, to);
                return outcome::success();
              }));
      EXPECT_CALL(runtime, getTicketSupply(kTickets, _))
          .WillRepeatedly(testing::Invoke(
              [&](auto &, const RaffleId &raffle_id)
                  -> outcome::result<TicketSupply> {
                return tickets[raffle_id].size();
              }));
      EXPECT_CALL(runtime, getTicketOwner(kTickets, _, _))
          .WillRepeatedly(testing::Invoke(
              [&](auto &, const RaffleId &raffle_id, TicketSupply n)
                  -> outcome::result<Address> {
                const auto &owners = tickets[raffle_id];
                if (n >= owners.size()) {
                  return VMExitCode::kInexistentTicket;
                }
                return owners[n];
              }));
      EXPECT_CALL(runtime, recoverSigner(_, _))
          .WillRepeatedly(testing::Invoke(
              [&](BytesIn message, BytesIn) -> outcome::result<Address> {
                signed_messages.emplace_back(message.begin(), message.end());
                return signer;
              }));
      EXPECT_CALL(runtime, getCcipFee(kRouter, kPrizeChain, _))
          .WillRepeatedly(Return(outcome::success(TokenAmount{1})));
      EXPECT_CALL(runtime, getTokenBalance(kLink, actor_address))
          .WillRepeatedly(Return(outcome::success(TokenAmount{1000})));
      EXPECT_CALL(runtime, transferTokens(kLink, kRouter, TokenAmount{1}))
          .WillRepeatedly(Return(outcome::success()));
      EXPECT_CALL(runtime, ccipSend(kRouter, kPrizeChain, _))
          .WillRepeatedly(testing::Invoke(
              [&](auto &, auto, const Evm2AnyMessage &message)
                  -> outcome::result<Hash256> {
                sent.push_back(message);
                return Hash256{};
              }));
      EXPECT_CALL(runtime, requestRandomWords(kCoordinator))
          .WillRepeatedly(testing::Invoke(
              [&](auto &) -> outcome::result<RequestId> {
                return ++last_request_id;
              }));
    }

    outcome::result<None> receivePrizeLocked(const RaffleId &raffle_id) {
      callerIs(kRouter);
      auto result = CcipReceive::call(
          runtime,
          {{Hash256{}, kPrizeChain, kPrizeManager,
            encode(codec::ccip::PrizeLocked{raffle_id})}});
      callerIs(kAdmin);
      return result;
    }

    /// Raffle open from now until kEnd
    void openRaffle(const RaffleId &raffle_id,
                    uint32_t min_tickets = 1,
                    uint32_t max_tickets = 0,
                    uint32_t max_holdings = 0) {
      EXPECT_OUTCOME_TRUE_1(receivePrizeLocked(raffle_id));
      EXPECT_OUTCOME_TRUE_1(CreateRaffle::call(
          runtime,
          {raffle_id, kNow, kEnd, min_tickets, max_tickets, max_holdings}));
    }

    outcome::result<None> buy(const Address &player,
                              const RaffleId &raffle_id,
                              TicketCount count) {
      callerIs(player);
      valueIs(kPrice * count);
      auto result = BuyTickets::call(
          runtime, {raffle_id, count, block_number + 5, Bytes(65, 1)});
      callerIs(kAdmin);
      valueIs(0);
      return result;
    }

    /// Draw and fulfill with the random word
    void drawWith(const RaffleId &raffle_id, const UInt256 &word) {
      timestampIs(kEnd);
      EXPECT_OUTCOME_TRUE_1(DrawWinner::call(runtime, {raffle_id}));
      callerIs(kCoordinator);
      EXPECT_OUTCOME_TRUE_1(
          FulfillRandomWords::call(runtime, {last_request_id, {word}}));
      callerIs(kAdmin);
    }

    std::map<RaffleId, std::vector<Address>> tickets;
    Address signer{kApi};
    std::vector<Bytes> signed_messages;
    std::vector<Evm2AnyMessage> sent;
    RequestId last_request_id{};
  };

  /**
   * @given actor without state
   * @when constructing it
   * @then caller is admin and collaborators are recorded
   */
  TEST_F(TicketManagerActorTest, Construct) {
    state = boost::none;
    EXPECT_OUTCOME_TRUE_1(
        Construct::call(runtime, {kLink, kRouter, kTickets, kCoordinator}));
    EXPECT_TRUE(state->roles.hasRole(kAdmin, Role::kAdmin));
    EXPECT_EQ(state->tickets, kTickets);
    EXPECT_EQ(state->vrf_coordinator, kCoordinator);
    EXPECT_OUTCOME_ERROR(
        VMExitCode::kSysErrForbidden,
        Construct::call(runtime, {kLink, kRouter, kTickets, kCoordinator}));
  }

  /**
   * @given prize locked message
   * @when it is delivered twice
   * @then raffle is recorded once with the sender as its prize manager
   */
  TEST_F(TicketManagerActorTest, PrizeLocked) {
    EXPECT_OUTCOME_TRUE_1(receivePrizeLocked(1));
    const auto &raffle = state->raffles.at(1);
    EXPECT_EQ(raffle.status, RaffleStatus::kPrizeLocked);
    EXPECT_EQ(raffle.prize_manager.contract, kPrizeManager);
    EXPECT_EQ(raffle.prize_manager.chain, kPrizeChain);
    EXPECT_EQ(emitted<types::RafflePrizeLocked>().size(), 1);

    EXPECT_OUTCOME_TRUE_1(receivePrizeLocked(1));
    EXPECT_EQ(emitted<types::RafflePrizeLocked>().size(), 1);
  }

  /// Inbound messages are authenticated and decoded
  TEST_F(TicketManagerActorTest, ReceiveErrors) {
    EXPECT_OUTCOME_ERROR(
        VMExitCode::kInvalidRouter,
        CcipReceive::call(runtime,
                          {{Hash256{}, kPrizeChain, kPrizeManager,
                            encode(codec::ccip::PrizeLocked{1})}}));
    callerIs(kRouter);
    EXPECT_OUTCOME_ERROR(
        VMExitCode::kUnauthorizedCCIPSender,
        CcipReceive::call(runtime,
                          {{Hash256{}, kPrizeChain + 1, kPrizeManager,
                            encode(codec::ccip::PrizeLocked{1})}}));
    EXPECT_OUTCOME_ERROR(
        codec::ccip::CcipMessageError::kInvalidLength,
        CcipReceive::call(runtime,
                          {{Hash256{}, kPrizeChain, kPrizeManager, Bytes{1}}}));
  }

  /**
   * @given raffle timings
   * @when creating raffle
   * @then prize must be locked and the raffle must stay open long enough
   */
  TEST_F(TicketManagerActorTest, CreateRaffleErrors) {
    EXPECT_OUTCOME_ERROR(
        VMExitCode::kPrizeNotLocked,
        CreateRaffle::call(runtime, {1, kNow, kEnd, 1, 0, 0}));
    EXPECT_OUTCOME_TRUE_1(receivePrizeLocked(1));
    EXPECT_OUTCOME_ERROR(VMExitCode::kRaffleNeedsStartTime,
                         CreateRaffle::call(runtime, {1, 0, kEnd, 1, 0, 0}));
    EXPECT_OUTCOME_ERROR(
        VMExitCode::kRaffleClosingTooSoon,
        CreateRaffle::call(runtime, {1, kNow, kNow + 59, 1, 0, 0}));
    EXPECT_OUTCOME_ERROR(
        VMExitCode::kRaffleClosingTooSoon,
        CreateRaffle::call(runtime, {1, kNow - 1000, kNow + 10, 1, 0, 0}));
    callerIs(kAlice);
    EXPECT_OUTCOME_ERROR(
        VMExitCode::kMissingRole,
        CreateRaffle::call(runtime, {1, kNow, kEnd, 1, 0, 0}));
    callerIs(kAdmin);
    EXPECT_OUTCOME_TRUE_1(
        CreateRaffle::call(runtime, {1, kNow, kNow + 60, 1, 0, 0}));
    EXPECT_EQ(emitted<types::NewRaffle>().size(), 1);
    EXPECT_OUTCOME_ERROR(
        VMExitCode::kPrizeNotLocked,
        CreateRaffle::call(runtime, {1, kNow, kEnd, 1, 0, 0}));
  }

  /**
   * @given open raffle
   * @when buying tickets with a coupon of the API signer
   * @then tickets are minted, participation and nonce are updated
   */
  TEST_F(TicketManagerActorTest, BuyTickets) {
    openRaffle(1);
    EXPECT_OUTCOME_TRUE_1(buy(kAlice, 1, 3));
    ASSERT_EQ(signed_messages.size(), 1);
    EXPECT_EQ(signed_messages[0],
              couponMessage(kAlice, 0, 1, 3, block_number + 5, kPrice * 3));

    EXPECT_OUTCOME_TRUE_1(buy(kAlice, 1, 2));
    EXPECT_EQ(signed_messages[1],
              couponMessage(kAlice, 1, 1, 2, block_number + 5, kPrice * 2));

    EXPECT_OUTCOME_EQ(GetParticipation::call(runtime, {1, kAlice}),
                      (Participation{500, 5, false}));
    EXPECT_OUTCOME_EQ(GetNonce::call(runtime, {kAlice}), 2);
    EXPECT_EQ(tickets[1].size(), 5);
    EXPECT_EQ(state->locked_eth, 500);
    EXPECT_OUTCOME_TRUE(raffle, GetRaffle::call(runtime, {1}));
    EXPECT_EQ(raffle.total_raised, 500);
    EXPECT_EQ(raffle.status, RaffleStatus::kIdle);
  }

  /**
   * @given raffle window
   * @when buying outside of it or with a zero count
   * @then purchase is rejected
   */
  TEST_F(TicketManagerActorTest, BuyTicketsWindow) {
    EXPECT_OUTCOME_ERROR(VMExitCode::kInvalidRaffle, buy(kAlice, 1, 1));
    EXPECT_OUTCOME_TRUE_1(receivePrizeLocked(1));
    EXPECT_OUTCOME_ERROR(VMExitCode::kInvalidRaffle, buy(kAlice, 1, 1));
    EXPECT_OUTCOME_TRUE_1(
        CreateRaffle::call(runtime, {1, kNow + 100, kEnd, 1, 0, 0}));
    EXPECT_OUTCOME_ERROR(VMExitCode::kInvalidTicketCount, buy(kAlice, 1, 0));
    EXPECT_OUTCOME_ERROR(VMExitCode::kRaffleHasNotStarted, buy(kAlice, 1, 1));
    timestampIs(kEnd);
    EXPECT_OUTCOME_TRUE_1(buy(kAlice, 1, 1));
    timestampIs(kEnd + 1);
    EXPECT_OUTCOME_ERROR(VMExitCode::kRaffleHasEnded, buy(kAlice, 1, 1));
  }

  /// Holdings and supply limits
  TEST_F(TicketManagerActorTest, BuyTicketsLimits) {
    openRaffle(1, 1, 5, 3);
    EXPECT_OUTCOME_TRUE_1(buy(kAlice, 1, 3));
    EXPECT_OUTCOME_ERROR(VMExitCode::kTooManyTickets, buy(kAlice, 1, 1));
    EXPECT_OUTCOME_ERROR(VMExitCode::kTooManyTickets, buy(kBob, 1, 3));
    EXPECT_OUTCOME_TRUE_1(buy(kBob, 1, 2));
  }

  /**
   * @given participation totals at the limit of their widths
   * @when the player buys more
   * @then kParticipationOverflow and nothing is minted
   */
  TEST_F(TicketManagerActorTest, BuyTicketsParticipationOverflow) {
    openRaffle(1);
    auto &raffle = state->raffles.at(1);
    raffle.participations[kAlice] = {
        std::numeric_limits<uint64_t>::max() - 50, 0, false};
    EXPECT_OUTCOME_ERROR(VMExitCode::kParticipationOverflow,
                         buy(kAlice, 1, 1));

    raffle.participations[kAlice] = {
        0, std::numeric_limits<uint32_t>::max(), false};
    EXPECT_OUTCOME_ERROR(VMExitCode::kParticipationOverflow,
                         buy(kAlice, 1, 1));
    EXPECT_TRUE(tickets[1].empty());
    EXPECT_OUTCOME_EQ(GetNonce::call(runtime, {kAlice}), 0);
  }

  /**
   * @given coupons that do not authorize the purchase
   * @when buying
   * @then purchase is rejected without minting
   */
  TEST_F(TicketManagerActorTest, BuyTicketsCoupon) {
    openRaffle(1);
    callerIs(kAlice);
    valueIs(kPrice);
    EXPECT_OUTCOME_ERROR(
        VMExitCode::kExpiredCoupon,
        BuyTickets::call(runtime, {1, 1, block_number - 1, Bytes(65, 1)}));

    signer = kAlice;
    EXPECT_OUTCOME_ERROR(VMExitCode::kUnauthorized, buy(kAlice, 1, 1));

    EXPECT_CALL(runtime, recoverSigner(_, _))
        .WillRepeatedly(Return(outcome::failure(
            crypto::secp256k1::Secp256k1Error::kSignatureParseError)));
    EXPECT_OUTCOME_ERROR(VMExitCode::kUnauthorized, buy(kAlice, 1, 1));
    EXPECT_TRUE(tickets[1].empty());
    EXPECT_OUTCOME_EQ(GetNonce::call(runtime, {kAlice}), 0);
  }

  /**
   * @given open raffle
   * @when checking whether it can be drawn
   * @then each unmet condition is reported
   */
  TEST_F(TicketManagerActorTest, ShouldDraw) {
    EXPECT_OUTCOME_ERROR(VMExitCode::kInvalidRaffle,
                         ShouldDrawRaffle::call(runtime, {1}));
    openRaffle(1, 3, 5);
    EXPECT_OUTCOME_ERROR(VMExitCode::kNoParticipants,
                         ShouldDrawRaffle::call(runtime, {1}));
    EXPECT_OUTCOME_TRUE_1(buy(kAlice, 1, 2));
    EXPECT_OUTCOME_ERROR(VMExitCode::kRaffleIsStillOpen,
                         ShouldDrawRaffle::call(runtime, {1}));
    timestampIs(kEnd);
    EXPECT_OUTCOME_ERROR(VMExitCode::kTargetTicketsNotReached,
                         ShouldDrawRaffle::call(runtime, {1}));
    EXPECT_OUTCOME_ERROR(VMExitCode::kTargetTicketsNotReached,
                         DrawWinner::call(runtime, {1}));
  }

  /// Sold out raffle is drawn before its end
  TEST_F(TicketManagerActorTest, DrawSoldOut) {
    openRaffle(1, 1, 2);
    EXPECT_OUTCOME_TRUE_1(buy(kAlice, 1, 2));
    EXPECT_OUTCOME_EQ(ShouldDrawRaffle::call(runtime, {1}), true);
    EXPECT_OUTCOME_TRUE_1(DrawWinner::call(runtime, {1}));
    EXPECT_EQ(state->raffles.at(1).status, RaffleStatus::kRequested);
    EXPECT_EQ(state->raffles.at(1).request_id, last_request_id);
    EXPECT_EQ(emitted<types::RequestSent>().size(), 1);
    EXPECT_OUTCOME_ERROR(VMExitCode::kInvalidRaffle,
                         DrawWinner::call(runtime, {1}));
  }

  /**
   * @given raffle without a supply limit
   * @when the first ticket is sold
   * @then it can be drawn before its end
   */
  TEST_F(TicketManagerActorTest, DrawUnlimitedSupply) {
    openRaffle(1, 0, 0);
    EXPECT_OUTCOME_ERROR(VMExitCode::kNoParticipants,
                         DrawWinner::call(runtime, {1}));
    EXPECT_OUTCOME_TRUE_1(buy(kAlice, 1, 1));
    EXPECT_OUTCOME_EQ(ShouldDrawRaffle::call(runtime, {1}), true);
    EXPECT_OUTCOME_TRUE_1(DrawWinner::call(runtime, {1}));
    EXPECT_EQ(state->raffles.at(1).status, RaffleStatus::kRequested);
  }

  /**
   * @given requested randomness
   * @when fulfilled by others, with no words, or twice
   * @then only the first fulfillment by the coordinator counts
   */
  TEST_F(TicketManagerActorTest, FulfillRandomWords) {
    openRaffle(1);
    EXPECT_OUTCOME_TRUE_1(buy(kAlice, 1, 1));
    timestampIs(kEnd);
    EXPECT_OUTCOME_TRUE_1(DrawWinner::call(runtime, {1}));

    EXPECT_OUTCOME_ERROR(
        VMExitCode::kOnlyCoordinatorCanFulfill,
        FulfillRandomWords::call(runtime, {last_request_id, {7}}));
    callerIs(kCoordinator);
    EXPECT_OUTCOME_ERROR(VMExitCode::kSysErrIllegalArgument,
                         FulfillRandomWords::call(runtime, {last_request_id, {}}));
    EXPECT_OUTCOME_ERROR(
        VMExitCode::kRequestNotFound,
        FulfillRandomWords::call(runtime, {last_request_id + 1, {7}}));
    EXPECT_OUTCOME_TRUE_1(
        FulfillRandomWords::call(runtime, {last_request_id, {7}}));
    EXPECT_EQ(state->raffles.at(1).status, RaffleStatus::kFulfilled);
    EXPECT_EQ(emitted<types::WinnerDrawn>().size(), 1);
    EXPECT_OUTCOME_ERROR(
        VMExitCode::kRequestNotFound,
        FulfillRandomWords::call(runtime, {last_request_id, {8}}));
  }

  /**
   * @given tickets of two players and a random word
   * @when the winner is computed
   * @then owner of ticket word mod supply wins
   */
  TEST_F(TicketManagerActorTest, Winner) {
    openRaffle(1);
    EXPECT_OUTCOME_TRUE_1(buy(kAlice, 1, 2));
    EXPECT_OUTCOME_TRUE_1(buy(kBob, 1, 3));
    EXPECT_OUTCOME_ERROR(VMExitCode::kRaffleNotFulfilled,
                         GetWinner::call(runtime, {1}));
    // ticket 7 mod 5 = 2, the first ticket of bob
    drawWith(1, 7);
    EXPECT_OUTCOME_EQ(GetWinner::call(runtime, {1}), kBob);
  }

  /**
   * @given fulfilled raffle
   * @when propagating the winner
   * @then prize manager is told the winner once and sales become revenue
   */
  TEST_F(TicketManagerActorTest, PropagateRaffleWinner) {
    openRaffle(1);
    EXPECT_OUTCOME_TRUE_1(buy(kAlice, 1, 2));
    EXPECT_OUTCOME_ERROR(VMExitCode::kInvalidRaffleStatus,
                         PropagateRaffleWinner::call(runtime, {1}));
    drawWith(1, 1);
    callerIs(kBob);
    EXPECT_OUTCOME_TRUE_1(PropagateRaffleWinner::call(runtime, {1}));
    ASSERT_EQ(sent.size(), 1);
    EXPECT_EQ(sent[0].receiver, kPrizeManager);
    EXPECT_EQ(sent[0].data, encode(codec::ccip::WinnerDrawn{1, kAlice}));
    EXPECT_EQ(state->raffles.at(1).status, RaffleStatus::kPropagated);
    EXPECT_EQ(state->locked_eth, 0);
    EXPECT_EQ(emitted<types::WinnerPropagated>().size(), 1);
    EXPECT_OUTCOME_ERROR(VMExitCode::kInvalidRaffleStatus,
                         PropagateRaffleWinner::call(runtime, {1}));
    EXPECT_OUTCOME_EQ(GetWinner::call(runtime, {1}), kAlice);
  }

  /// Raffle that never opened is canceled at once
  TEST_F(TicketManagerActorTest, CancelPrizeLocked) {
    EXPECT_OUTCOME_TRUE_1(receivePrizeLocked(1));
    EXPECT_OUTCOME_EQ(ShouldCancelRaffle::call(runtime, {1}), true);
    EXPECT_OUTCOME_TRUE_1(CancelRaffle::call(runtime, {1}));
    ASSERT_EQ(sent.size(), 1);
    EXPECT_EQ(sent[0].data, encode(codec::ccip::RaffleCanceled{1}));
    EXPECT_EQ(emitted<types::RaffleCanceled>().size(), 1);
    EXPECT_OUTCOME_ERROR(VMExitCode::kInvalidRaffle,
                         CancelRaffle::call(runtime, {1}));
  }

  /**
   * @given open raffle
   * @when canceling it
   * @then it must be over and must not have passed the threshold
   */
  TEST_F(TicketManagerActorTest, CancelConditions) {
    EXPECT_OUTCOME_ERROR(VMExitCode::kInvalidRaffle,
                         ShouldCancelRaffle::call(runtime, {1}));
    openRaffle(1, 2);
    openRaffle(2, 2);
    EXPECT_OUTCOME_TRUE_1(buy(kAlice, 1, 2));
    EXPECT_OUTCOME_TRUE_1(buy(kAlice, 2, 3));
    EXPECT_OUTCOME_ERROR(VMExitCode::kRaffleIsStillOpen,
                         ShouldCancelRaffle::call(runtime, {1}));
    // tickets are still sold in the last second
    timestampIs(kEnd);
    EXPECT_OUTCOME_ERROR(VMExitCode::kRaffleIsStillOpen,
                         ShouldCancelRaffle::call(runtime, {1}));
    EXPECT_OUTCOME_ERROR(VMExitCode::kRaffleIsStillOpen,
                         CancelRaffle::call(runtime, {1}));

    timestampIs(kEnd + 1);
    // threshold reached but not passed
    EXPECT_OUTCOME_EQ(ShouldCancelRaffle::call(runtime, {1}), true);
    EXPECT_OUTCOME_ERROR(VMExitCode::kTargetTicketsReached,
                         ShouldCancelRaffle::call(runtime, {2}));
    callerIs(kAlice);
    EXPECT_OUTCOME_ERROR(VMExitCode::kMissingRole,
                         CancelRaffle::call(runtime, {1}));
  }

  /**
   * @given canceled raffle
   * @when refunding players
   * @then each player gets their payment back once
   */
  TEST_F(TicketManagerActorTest, RefundPlayers) {
    openRaffle(1, 10);
    EXPECT_OUTCOME_TRUE_1(buy(kAlice, 1, 2));
    EXPECT_OUTCOME_TRUE_1(buy(kBob, 1, 1));
    EXPECT_OUTCOME_ERROR(VMExitCode::kInvalidRaffle,
                         RefundPlayers::call(runtime, {1, {kAlice}}));
    timestampIs(kEnd + 1);
    EXPECT_OUTCOME_TRUE_1(CancelRaffle::call(runtime, {1}));

    EXPECT_CALL(runtime, sendFunds(kAlice, TokenAmount{200}))
        .WillOnce(Return(outcome::success()));
    EXPECT_CALL(runtime, sendFunds(kBob, TokenAmount{100}))
        .WillOnce(Return(outcome::success()));
    EXPECT_OUTCOME_TRUE_1(RefundPlayers::call(runtime, {1, {kAlice, kBob}}));
    EXPECT_EQ(state->locked_eth, 0);
    EXPECT_TRUE(state->getParticipation(1, kAlice).withdrawn);
    EXPECT_EQ(emitted<types::PlayerRefund>().size(), 2);

    EXPECT_OUTCOME_ERROR(VMExitCode::kPlayerAlreadyRefunded,
                         RefundPlayers::call(runtime, {1, {kAlice}}));
    EXPECT_OUTCOME_ERROR(VMExitCode::kNothingToSend,
                         RefundPlayers::call(runtime, {1, {kAdmin}}));
  }

  /// Refund transfer failure is reported as kETHTransferFail
  TEST_F(TicketManagerActorTest, RefundTransferFails) {
    openRaffle(1, 10);
    EXPECT_OUTCOME_TRUE_1(buy(kAlice, 1, 1));
    timestampIs(kEnd + 1);
    EXPECT_OUTCOME_TRUE_1(CancelRaffle::call(runtime, {1}));
    EXPECT_CALL(runtime, sendFunds(kAlice, TokenAmount{100}))
        .WillOnce(
            Return(outcome::failure(VMExitCode::kSysErrInsufficientFunds)));
    EXPECT_OUTCOME_ERROR(VMExitCode::kETHTransferFail,
                         RefundPlayers::call(runtime, {1, {kAlice}}));
  }

  /**
   * @given sales of an open raffle and of a drawn one
   * @when withdrawing ETH
   * @then sales of the open raffle stay locked
   */
  TEST_F(TicketManagerActorTest, WithdrawETH) {
    openRaffle(1);
    openRaffle(2);
    EXPECT_OUTCOME_TRUE_1(buy(kAlice, 1, 1));
    EXPECT_OUTCOME_TRUE_1(buy(kAlice, 2, 2));
    balances[actor_address] = 300;
    drawWith(2, 0);
    EXPECT_OUTCOME_TRUE_1(PropagateRaffleWinner::call(runtime, {2}));
    EXPECT_OUTCOME_ERROR(VMExitCode::kInsufficientBalance,
                         WithdrawETH::call(runtime, {201}));
    EXPECT_CALL(runtime, sendFunds(kAdmin, TokenAmount{200}))
        .WillOnce(Return(outcome::success()));
    EXPECT_OUTCOME_TRUE_1(WithdrawETH::call(runtime, {200}));
  }

  /**
   * @given tokens held by the ticket manager
   * @when admin withdraws them
   * @then at most the balance leaves
   */
  TEST_F(TicketManagerActorTest, WithdrawTokens) {
    const Address token = Address::makeFromId(8);
    EXPECT_CALL(runtime, getTokenBalance(token, actor_address))
        .WillRepeatedly(Return(outcome::success(TokenAmount{50})));
    EXPECT_OUTCOME_ERROR(VMExitCode::kInsufficientBalance,
                         WithdrawTokens::call(runtime, {token, 51}));
    EXPECT_CALL(runtime, transferTokens(token, kAdmin, TokenAmount{50}))
        .WillOnce(Return(outcome::success()));
    EXPECT_OUTCOME_TRUE_1(WithdrawTokens::call(runtime, {token, 50}));
    callerIs(kAlice);
    EXPECT_OUTCOME_ERROR(VMExitCode::kMissingRole,
                         WithdrawTokens::call(runtime, {token, 1}));
  }
}  // namespace xr::vm::actor::builtin::ticket_manager
