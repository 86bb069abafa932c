/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <boost/endian/conversion.hpp>
#include <qtils/byte_arr.hpp>

namespace keel {

  /// Little-endian encoding of integer, as used in hash preimages
  inline qtils::ByteArr<8> leBytes(uint64_t value) {
    qtils::ByteArr<8> out;
    boost::endian::store_little_u64(out.data(), value);
    return out;
  }

  /// Reads little-endian integer from first 8 bytes
  inline uint64_t leU64(const qtils::ByteArr<32> &bytes) {
    return boost::endian::load_little_u64(bytes.data());
  }

}  // namespace keel
