/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

/**
 * Returns another error if res has error and the error is not VMExitCode
 */
#define CHANGE_ERROR(expr, err_code) \
  OUTCOME_TRY(::xr::vm::changeError((expr), (err_code)))

/**
 * In addition to CHANGE_ERROR allows to create res variable
 */
#define CHANGE_ERROR_A(res, expr, err_code) \
  OUTCOME_TRY((res), ::xr::vm::changeErrorAssign((expr), (err_code)))

/**
 * Break the method and return VMExitCode
 */
#define ABORT(err_code) return ::xr::outcome::failure(err_code)

namespace xr::vm {
  /**
   * Contract exit codes. Every failure of an actor method is reported with
   * one of them, so the caller can tell the reason apart.
   */
  enum class VMExitCode : int64_t {
    kOk = 0,

    // host errors
    kSysErrInvalidReceiver = 1,
    kSysErrInsufficientFunds,
    kSysErrForbidden,
    kSysErrIllegalArgument,

    // roles and cross-chain plumbing
    kMissingRole = 16,
    kInvalidRouter,
    kUnauthorizedCCIPSender,
    kMissingCCIPParams,
    kUnknownCounterpart,
    kInsufficientLinkBalance,

    // prize side
    kIllegalRaffleId = 32,
    kInvalidRaffleId,
    kInvalidPrize,
    kLINKTokenNotPermitted,
    kUnauthorizedToClaim,
    kAlreadyClaimed,
    kInsufficientBalance,
    kNFTLocked,
    kNotAnNFT,
    kETHTransferFail,

    // ticket side
    kPrizeNotLocked = 64,
    kRaffleNeedsStartTime,
    kRaffleClosingTooSoon,
    kInvalidTicketCount,
    kRaffleHasNotStarted,
    kRaffleHasEnded,
    kTooManyTickets,
    kExpiredCoupon,
    kUnauthorized,
    kNoParticipants,
    kRaffleIsStillOpen,
    kTargetTicketsNotReached,
    kTargetTicketsReached,
    kRequestNotFound,
    kOnlyCoordinatorCanFulfill,
    kInvalidRaffleStatus,
    kRaffleNotFulfilled,
    kPlayerAlreadyRefunded,
    kNothingToSend,
    kParticipationOverflow,

    // shared
    kInvalidRaffle = 96,

    // external collaborators
    kInexistentTicket = 128,
    kTokenInsufficientBalance,
    kNotTokenOwner,
  };

  /// Distinguish VMExitCode errors from other errors
  bool isVMExitCode(const std::error_code &error);

  outcome::result<VMExitCode> asExitCode(const std::error_code &error);

  template <typename T>
  outcome::result<VMExitCode> asExitCode(const outcome::result<T> &result) {
    if (result) {
      return outcome::success(VMExitCode::kOk);
    }
    return asExitCode(result.error());
  }

  /**
   * Replaces error that is not VMExitCode
   * @tparam T - result type
   * @param res - result to check
   * @param default_error - VMExitCode to return instead
   * @return If res has no error, success() returned. Otherwise if res.error()
   * is VMExitCode, the res.error() returned, else default_error returned
   */
  template <typename T>
  outcome::result<void> changeError(const outcome::result<T> &res,
                                    const VMExitCode &default_error) {
    if (res.has_error()) {
      if (isVMExitCode(res.error())) {
        return res.error();
      }
      return default_error;
    }
    return outcome::success();
  }

  /// In addition to changeError() returns the value of res
  template <typename T>
  outcome::result<T> changeErrorAssign(outcome::result<T> &&res,
                                       const VMExitCode &default_error) {
    OUTCOME_TRY(changeError(res, default_error));
    return std::move(res.value());
  }
}  // namespace xr::vm

OUTCOME_HPP_DECLARE_ERROR(xr::vm, VMExitCode);
