/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/ccip/ccip_message.hpp"

#include "codec/abi/abi_packed.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(xr::codec::ccip, CcipMessageError, e) {
  using xr::codec::ccip::CcipMessageError;
  switch (e) {
    case CcipMessageError::kUnknownMessageType:
      return "Unknown CCIP message type";
    case CcipMessageError::kInvalidLength:
      return "CCIP message has invalid length for its type";
    default:
      return "Unknown error";
  }
}

namespace xr::codec::ccip {
  using abi::AbiPackedEncoder;
  using abi::AbiPackedReader;

  Bytes encode(const RaffleCanceled &message) {
    return AbiPackedEncoder{}
        .uint8(static_cast<uint8_t>(MessageType::kRaffleCanceled))
        .uint256(message.raffle_id)
        .bytes();
  }

  Bytes encode(const WinnerDrawn &message) {
    return AbiPackedEncoder{}
        .uint8(static_cast<uint8_t>(MessageType::kWinnerDrawn))
        .uint256(message.raffle_id)
        .address(message.winner)
        .bytes();
  }

  Bytes encode(const PrizeLocked &message) {
    return AbiPackedEncoder{}.uint256(message.raffle_id).bytes();
  }

  Bytes encode(const PrizeChainMessage &message) {
    return std::visit([](const auto &m) { return encode(m); }, message);
  }

  outcome::result<PrizeChainMessage> decodePrizeChainMessage(BytesIn data) {
    if (data.empty()) {
      return CcipMessageError::kInvalidLength;
    }
    AbiPackedReader reader{data};
    OUTCOME_TRY(type, reader.uint8());
    switch (static_cast<MessageType>(type)) {
      case MessageType::kRaffleCanceled: {
        if (static_cast<size_t>(data.size()) != kRaffleCanceledSize) {
          return CcipMessageError::kInvalidLength;
        }
        OUTCOME_TRY(raffle_id, reader.uint256());
        return PrizeChainMessage{RaffleCanceled{raffle_id}};
      }
      case MessageType::kWinnerDrawn: {
        if (static_cast<size_t>(data.size()) != kWinnerDrawnSize) {
          return CcipMessageError::kInvalidLength;
        }
        OUTCOME_TRY(raffle_id, reader.uint256());
        OUTCOME_TRY(winner, reader.address());
        return PrizeChainMessage{WinnerDrawn{raffle_id, winner}};
      }
    }
    return CcipMessageError::kUnknownMessageType;
  }

  outcome::result<PrizeLocked> decodePrizeLocked(BytesIn data) {
    if (static_cast<size_t>(data.size()) != kPrizeLockedSize) {
      return CcipMessageError::kInvalidLength;
    }
    AbiPackedReader reader{data};
    OUTCOME_TRY(raffle_id, reader.uint256());
    return PrizeLocked{raffle_id};
  }
}  // namespace xr::codec::ccip
