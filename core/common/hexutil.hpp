/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace xr::common {

  /**
   * @brief error codes for exceptions that may occur during unhexing
   */
  enum class UnhexError {
    kNotEnoughInput = 1,
    kNonHexInput,
    kMissing0xPrefix,
  };

  /**
   * @brief Converts bytes to lowercase hex representation
   * @param bytes
   * @return hexstring
   */
  std::string hex_lower(BytesIn bytes);

  /**
   * @brief Converts bytes to lowercase hex representation prefixed with 0x
   */
  std::string hex_lower_0x(BytesIn bytes);

  /**
   * @brief Converts hex representation to bytes
   * @param hex individual chars, both uppercase and lowercase are accepted
   * @return result containing array of bytes if input string is hex encoded
   * and has even length
   */
  outcome::result<Bytes> unhex(std::string_view hex);

  /**
   * @brief Unhex hex-string with 0x in the beginning
   * @param hex hex string with 0x in the beginning
   * @return unhexed bytes
   */
  outcome::result<Bytes> unhexWith0x(std::string_view hex);
}  // namespace xr::common

OUTCOME_HPP_DECLARE_ERROR(xr::common, UnhexError);
