/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

namespace keel {

  /// Denominator of every "basis points" parameter
  static constexpr uint64_t BPS_DENOMINATOR = 10'000;

  /// Upper bound of the opaque block payload
  static constexpr uint64_t MAX_PAYLOAD_BYTES = 1 << 20;  // 1 MiB

  /// Upper bound of slashing evidence carried by one block
  static constexpr uint64_t MAX_BLOCK_EVIDENCE = 16;

  /// Locally detected evidence waiting for inclusion into a block
  static constexpr uint64_t MAX_PENDING_EVIDENCE = 256;

  /// Upper bound of the validator set, used as SSZ list limit
  static constexpr uint64_t VALIDATOR_REGISTRY_LIMIT = 1 << 12;  // 4'096 val

  static constexpr uint64_t ADDRESS_SIZE = 20;

}  // namespace keel
