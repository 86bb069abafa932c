/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "types/block.hpp"
#include "types/checkpoint.hpp"
#include "types/vote.hpp"

namespace keel::consensus {

  /// Outbound side of gossip transport
  class Broadcaster {
   public:
    virtual ~Broadcaster() = default;

    virtual void broadcastBlock(const Block &block) = 0;

    virtual void broadcastVote(const SignedVote &vote) = 0;

    virtual void broadcastCheckpointSignature(
        const CheckpointSignature &signature) = 0;
  };

}  // namespace keel::consensus
