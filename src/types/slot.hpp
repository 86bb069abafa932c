/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

namespace keel {
  using Slot = uint64_t;
  using Height = uint64_t;
  using Round = uint64_t;
  using Epoch = uint64_t;
  using TimestampMs = uint64_t;

  using Amount = uint64_t;
  using VotingPower = uint64_t;
}  // namespace keel
