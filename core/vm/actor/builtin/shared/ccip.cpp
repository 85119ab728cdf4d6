/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/actor/builtin/shared/ccip.hpp"

namespace xr::vm::actor::builtin::shared {
  using runtime::Evm2AnyMessage;

  bool CcipConfig::isCounterpart(const CcipCounterpart &counterpart) const {
    return counterparts.count(counterpart) != 0;
  }

  void CcipConfig::setCounterpart(const CcipCounterpart &counterpart,
                                  bool enabled) {
    if (enabled) {
      counterparts.insert(counterpart);
    } else {
      counterparts.erase(counterpart);
    }
  }

  outcome::result<void> validateCcipReceive(const Runtime &runtime,
                                            const CcipConfig &config,
                                            const Any2EvmMessage &message) {
    if (runtime.getImmediateCaller() != config.router) {
      ABORT(VMExitCode::kInvalidRouter);
    }
    if (!config.isCounterpart({message.sender, message.source_chain})) {
      ABORT(VMExitCode::kUnauthorizedCCIPSender);
    }
    return outcome::success();
  }

  outcome::result<Hash256> sendCcipMessage(Runtime &runtime,
                                           const CcipConfig &config,
                                           const CcipCounterpart &destination,
                                           Bytes data) {
    if (destination.contract.isZero() || destination.chain == 0) {
      ABORT(VMExitCode::kMissingCCIPParams);
    }
    if (!config.isCounterpart(destination)) {
      ABORT(VMExitCode::kUnknownCounterpart);
    }
    const Evm2AnyMessage message{destination.contract,
                                 std::move(data),
                                 config.link_token,
                                 config.extra_args};
    OUTCOME_TRY(fee,
                runtime.getCcipFee(config.router, destination.chain, message));
    OUTCOME_TRY(link_balance,
                runtime.getTokenBalance(config.link_token,
                                        runtime.getCurrentReceiver()));
    if (link_balance < fee) {
      ABORT(VMExitCode::kInsufficientLinkBalance);
    }
    if (fee != 0) {
      OUTCOME_TRY(runtime.transferTokens(config.link_token, config.router, fee));
    }
    return runtime.ccipSend(config.router, destination.chain, message);
  }
}  // namespace xr::vm::actor::builtin::shared
