/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/bridge/ccip_relay.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(xr::vm::bridge, CcipRelayError, e) {
  using xr::vm::bridge::CcipRelayError;
  switch (e) {
    case CcipRelayError::kUnknownChain:
      return "CcipRelayError: chain is not registered";
    case CcipRelayError::kRouterMismatch:
      return "CcipRelayError: chain is registered with another router";
  }
  return "CcipRelayError: unknown error";
}

namespace xr::vm::bridge {
  CcipRelay::CcipRelay() : logger_{common::createLogger("ccip_relay")} {}

  outcome::result<void> CcipRelay::addChain(std::shared_ptr<Env> env,
                                            const Address &router) {
    const auto chain = env->chain;
    const auto it = chains_.find(chain);
    if (it != chains_.end()) {
      if (it->second.router != router) {
        return CcipRelayError::kRouterMismatch;
      }
      return outcome::success();
    }
    // start from the current outbox, earlier messages were not relayed here
    OUTCOME_TRY(pending, env->outbox(router));
    chains_.emplace(chain, Chain{std::move(env), router, pending.size()});
    return outcome::success();
  }

  outcome::result<std::vector<OutboundMessage>> CcipRelay::fetch(
      ChainSelector source) {
    const auto it = chains_.find(source);
    if (it == chains_.end()) {
      return CcipRelayError::kUnknownChain;
    }
    auto &chain = it->second;
    OUTCOME_TRY(messages, chain.env->outbox(chain.router, chain.cursor));
    chain.cursor += messages.size();
    return std::move(messages);
  }

  outcome::result<void> CcipRelay::deliver(const OutboundMessage &message) {
    const auto it = chains_.find(message.destination_chain);
    if (it == chains_.end()) {
      return CcipRelayError::kUnknownChain;
    }
    auto &destination = it->second;
    logger_->debug("deliver {} from {}:{} to {}:{}",
                   message.message_id.toHex(),
                   message.source_chain,
                   message.sender.toString(),
                   message.destination_chain,
                   message.receiver.toString());
    auto delivered = destination.env->deliverCcip(destination.router, message);
    if (!delivered) {
      logger_->error("message {} failed: {}",
                     message.message_id.toHex(),
                     delivered.error().message());
    }
    return delivered;
  }

  outcome::result<size_t> CcipRelay::relayAll() {
    size_t delivered = 0;
    for (auto &[source, chain] : chains_) {
      OUTCOME_TRY(messages, fetch(source));
      for (const auto &message : messages) {
        OUTCOME_TRY(deliver(message));
        ++delivered;
      }
    }
    return delivered;
  }
}  // namespace xr::vm::bridge
