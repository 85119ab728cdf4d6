/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/runtime/impl/runtime_impl.hpp"

#include "crypto/secp256k1/secp256k1_address.hpp"
#include "crypto/secp256k1/secp256k1_error.hpp"
#include "vm/actor/builtin/ccip_router/ccip_router_actor.hpp"
#include "vm/actor/builtin/erc20/erc20_actor.hpp"
#include "vm/actor/builtin/erc721/erc721_actor.hpp"
#include "vm/actor/builtin/ticket_collection/ticket_collection_actor.hpp"
#include "vm/actor/builtin/vrf_coordinator/vrf_coordinator_actor.hpp"
#include "vm/runtime/env.hpp"

namespace xr::vm::runtime {
  using crypto::secp256k1::Secp256k1Error;
  using crypto::secp256k1::SignatureCompact;

  namespace ccip_router = actor::builtin::ccip_router;
  namespace erc20 = actor::builtin::erc20;
  namespace erc721 = actor::builtin::erc721;
  namespace ticket_collection = actor::builtin::ticket_collection;
  namespace vrf_coordinator = actor::builtin::vrf_coordinator;

  RuntimeImpl::RuntimeImpl(std::shared_ptr<Env> env,
                           const Address &caller,
                           const Address &receiver,
                           const TokenAmount &value)
      : env_{std::move(env)},
        caller_{caller},
        receiver_{receiver},
        value_{value} {}

  Address RuntimeImpl::getImmediateCaller() const {
    return caller_;
  }

  Address RuntimeImpl::getCurrentReceiver() const {
    return receiver_;
  }

  Timestamp RuntimeImpl::getBlockTimestamp() const {
    return env_->timestamp;
  }

  BlockNumber RuntimeImpl::getBlockNumber() const {
    return env_->block_number;
  }

  TokenAmount RuntimeImpl::getValueReceived() const {
    return value_;
  }

  outcome::result<TokenAmount> RuntimeImpl::getBalance(
      const Address &address) const {
    return env_->getBalance(address);
  }

  outcome::result<void> RuntimeImpl::sendFunds(const Address &to,
                                               const TokenAmount &value) {
    return env_->sendFunds(receiver_, to, value);
  }

  outcome::result<TokenAmount> RuntimeImpl::getTokenBalance(
      const Address &token, const Address &owner) const {
    return env_->call<erc20::BalanceOf>(receiver_, token, {owner});
  }

  outcome::result<void> RuntimeImpl::transferTokens(const Address &token,
                                                    const Address &to,
                                                    const TokenAmount &amount) {
    OUTCOME_TRY(env_->call<erc20::Transfer>(receiver_, token, {to, amount}));
    return outcome::success();
  }

  outcome::result<Address> RuntimeImpl::getNftOwner(
      const Address &nft, const TokenId &token_id) const {
    OUTCOME_TRY(actor, env_->state_tree->tryGet(nft));
    if (!actor || actor->code != CodeId::kErc721Collection) {
      ABORT(VMExitCode::kNotAnNFT);
    }
    return env_->call<erc721::OwnerOf>(receiver_, nft, {token_id});
  }

  outcome::result<void> RuntimeImpl::transferNft(const Address &nft,
                                                 const Address &to,
                                                 const TokenId &token_id) {
    OUTCOME_TRY(env_->call<erc721::TransferFrom>(
        receiver_, nft, {receiver_, to, token_id}));
    return outcome::success();
  }

  outcome::result<TokenAmount> RuntimeImpl::getCcipFee(
      const Address &router,
      ChainSelector destination_chain,
      const Evm2AnyMessage &message) const {
    return env_->call<ccip_router::GetFee>(
        receiver_, router, {destination_chain, message});
  }

  outcome::result<Hash256> RuntimeImpl::ccipSend(
      const Address &router,
      ChainSelector destination_chain,
      const Evm2AnyMessage &message) {
    return env_->call<ccip_router::CcipSend>(
        receiver_, router, {destination_chain, message});
  }

  outcome::result<RequestId> RuntimeImpl::requestRandomWords(
      const Address &coordinator) {
    return env_->call<vrf_coordinator::RequestRandomWords>(
        receiver_, coordinator, {});
  }

  outcome::result<void> RuntimeImpl::mintTickets(const Address &collection,
                                                 const Address &to,
                                                 const RaffleId &raffle_id,
                                                 TicketCount count) {
    OUTCOME_TRY(env_->call<ticket_collection::Mint>(
        receiver_, collection, {to, raffle_id, count}));
    return outcome::success();
  }

  outcome::result<TicketSupply> RuntimeImpl::getTicketSupply(
      const Address &collection, const RaffleId &raffle_id) const {
    return env_->call<ticket_collection::SupplyOf>(
        receiver_, collection, {raffle_id});
  }

  outcome::result<Address> RuntimeImpl::getTicketOwner(
      const Address &collection,
      const RaffleId &raffle_id,
      TicketSupply n) const {
    return env_->call<ticket_collection::OwnerOf>(
        receiver_, collection, {raffle_id, n});
  }

  outcome::result<Address> RuntimeImpl::recoverSigner(BytesIn message,
                                                      BytesIn signature) {
    SignatureCompact compact{};
    if (signature.size() != compact.size()) {
      return Secp256k1Error::kSignatureParseError;
    }
    std::copy(signature.begin(), signature.end(), compact.begin());
    OUTCOME_TRY(public_key, env_->secp256k1->recoverPublicKey(message, compact));
    return crypto::secp256k1::toAddress(public_key);
  }

  void RuntimeImpl::emitEvent(Event event) {
    env_->events.push_back({receiver_, std::move(event)});
  }

  outcome::result<ActorStatePtr> RuntimeImpl::getActorHead() const {
    OUTCOME_TRY(actor, env_->state_tree->get(receiver_));
    return actor.head;
  }

  outcome::result<void> RuntimeImpl::commit(ActorStatePtr new_state) {
    OUTCOME_TRY(actor, env_->state_tree->get(receiver_));
    actor.head = std::move(new_state);
    return env_->state_tree->set(receiver_, actor);
  }
}  // namespace xr::vm::runtime
