/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/endian/conversion.hpp>

#include "common/bytes.hpp"

namespace xr::common {
  inline void putUint16BigEndian(Bytes &l, uint16_t n) {
    l.resize(l.size() + sizeof(n));
    boost::endian::store_big_u16(&(*(l.end() - sizeof(n))), n);
  }

  inline void putUint64BigEndian(Bytes &l, uint64_t n) {
    l.resize(l.size() + sizeof(n));
    boost::endian::store_big_u64(&(*(l.end() - sizeof(n))), n);
  }

  inline uint16_t getUint16BigEndian(BytesIn input) {
    return boost::endian::load_big_u16(input.data());
  }
}  // namespace xr::common
