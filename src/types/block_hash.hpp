/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_arr.hpp>

namespace keel {
  using BlockHash = qtils::ByteArr<32>;
  using StateRoot = qtils::ByteArr<32>;
  using BodyRoot = qtils::ByteArr<32>;

  constexpr BlockHash kZeroHash;
}  // namespace keel
