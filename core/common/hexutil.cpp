/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <boost/algorithm/hex.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(xr::common, UnhexError, e) {
  using xr::common::UnhexError;
  switch (e) {
    case UnhexError::kNotEnoughInput:
      return "Input contains odd number of characters";
    case UnhexError::kNonHexInput:
      return "Input contains non-hex characters";
    case UnhexError::kMissing0xPrefix:
      return "Input is expected to start with 0x";
  }
  return "Unknown UnhexError";
}

namespace xr::common {
  constexpr std::string_view k0x{"0x"};

  std::string hex_lower(BytesIn bytes) {
    std::string res(bytes.size() * 2, '\x00');
    boost::algorithm::hex_lower(bytes.begin(), bytes.end(), res.begin());
    return res;
  }

  std::string hex_lower_0x(BytesIn bytes) {
    return std::string{k0x} + hex_lower(bytes);
  }

  outcome::result<Bytes> unhex(std::string_view hex) {
    Bytes blob;
    blob.reserve((hex.size() + 1) / 2);
    try {
      boost::algorithm::unhex(hex.begin(), hex.end(), std::back_inserter(blob));
      return blob;
    } catch (const boost::algorithm::not_enough_input &) {
      return UnhexError::kNotEnoughInput;
    } catch (const boost::algorithm::non_hex_input &) {
      return UnhexError::kNonHexInput;
    }
  }

  outcome::result<Bytes> unhexWith0x(std::string_view hex) {
    if (hex.substr(0, k0x.size()) != k0x) {
      return UnhexError::kMissing0xPrefix;
    }
    return unhex(hex.substr(k0x.size()));
  }
}  // namespace xr::common
