/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/exit_code/exit_code.hpp"

#include <spdlog/fmt/fmt.h>

namespace {
  using xr::vm::VMExitCode;

  const char *exitCodeName(VMExitCode e) {
    switch (e) {
      case VMExitCode::kOk:
        return "Ok";
      case VMExitCode::kSysErrInvalidReceiver:
        return "SysErrInvalidReceiver";
      case VMExitCode::kSysErrInsufficientFunds:
        return "SysErrInsufficientFunds";
      case VMExitCode::kSysErrForbidden:
        return "SysErrForbidden";
      case VMExitCode::kSysErrIllegalArgument:
        return "SysErrIllegalArgument";
      case VMExitCode::kMissingRole:
        return "MissingRole";
      case VMExitCode::kInvalidRouter:
        return "InvalidRouter";
      case VMExitCode::kUnauthorizedCCIPSender:
        return "UnauthorizedCCIPSender";
      case VMExitCode::kMissingCCIPParams:
        return "MissingCCIPParams";
      case VMExitCode::kUnknownCounterpart:
        return "UnknownCounterpart";
      case VMExitCode::kInsufficientLinkBalance:
        return "InsufficientLinkBalance";
      case VMExitCode::kIllegalRaffleId:
        return "IllegalRaffleId";
      case VMExitCode::kInvalidRaffleId:
        return "InvalidRaffleId";
      case VMExitCode::kInvalidPrize:
        return "InvalidPrize";
      case VMExitCode::kLINKTokenNotPermitted:
        return "LINKTokenNotPermitted";
      case VMExitCode::kUnauthorizedToClaim:
        return "UnauthorizedToClaim";
      case VMExitCode::kAlreadyClaimed:
        return "AlreadyClaimed";
      case VMExitCode::kInsufficientBalance:
        return "InsufficientBalance";
      case VMExitCode::kNFTLocked:
        return "NFTLocked";
      case VMExitCode::kNotAnNFT:
        return "NotAnNFT";
      case VMExitCode::kETHTransferFail:
        return "ETHTransferFail";
      case VMExitCode::kPrizeNotLocked:
        return "PrizeNotLocked";
      case VMExitCode::kRaffleNeedsStartTime:
        return "RaffleNeedsStartTime";
      case VMExitCode::kRaffleClosingTooSoon:
        return "RaffleClosingTooSoon";
      case VMExitCode::kInvalidTicketCount:
        return "InvalidTicketCount";
      case VMExitCode::kRaffleHasNotStarted:
        return "RaffleHasNotStarted";
      case VMExitCode::kRaffleHasEnded:
        return "RaffleHasEnded";
      case VMExitCode::kTooManyTickets:
        return "TooManyTickets";
      case VMExitCode::kExpiredCoupon:
        return "ExpiredCoupon";
      case VMExitCode::kUnauthorized:
        return "Unauthorized";
      case VMExitCode::kNoParticipants:
        return "NoParticipants";
      case VMExitCode::kRaffleIsStillOpen:
        return "RaffleIsStillOpen";
      case VMExitCode::kTargetTicketsNotReached:
        return "TargetTicketsNotReached";
      case VMExitCode::kTargetTicketsReached:
        return "TargetTicketsReached";
      case VMExitCode::kRequestNotFound:
        return "RequestNotFound";
      case VMExitCode::kOnlyCoordinatorCanFulfill:
        return "OnlyCoordinatorCanFulfill";
      case VMExitCode::kInvalidRaffleStatus:
        return "InvalidRaffleStatus";
      case VMExitCode::kRaffleNotFulfilled:
        return "RaffleNotFulfilled";
      case VMExitCode::kPlayerAlreadyRefunded:
        return "PlayerAlreadyRefunded";
      case VMExitCode::kNothingToSend:
        return "NothingToSend";
      case VMExitCode::kParticipationOverflow:
        return "ParticipationOverflow";
      case VMExitCode::kInvalidRaffle:
        return "InvalidRaffle";
      case VMExitCode::kInexistentTicket:
        return "InexistentTicket";
      case VMExitCode::kTokenInsufficientBalance:
        return "TokenInsufficientBalance";
      case VMExitCode::kNotTokenOwner:
        return "NotTokenOwner";
    }
    return nullptr;
  }
}  // namespace

OUTCOME_CPP_DEFINE_CATEGORY(xr::vm, VMExitCode, e) {
  if (const auto name = exitCodeName(e)) {
    return fmt::format("VMExitCode::{}", name);
  }
  return fmt::format("VMExitCode vm exit code {}", static_cast<int64_t>(e));
}

namespace xr::vm {
  bool isVMExitCode(const std::error_code &error) {
    return error.category() == __libp2p::Category<VMExitCode>::get();
  }

  outcome::result<VMExitCode> asExitCode(const std::error_code &error) {
    if (isVMExitCode(error)) {
      return outcome::success(static_cast<VMExitCode>(error.value()));
    }
    return outcome::failure(error);
  }
}  // namespace xr::vm
