/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <optional>
#include <vector>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "blockchain/block_arena.hpp"
#include "log/logger.hpp"
#include "types/config.hpp"
#include "types/vote.hpp"
#include "utils/ordered_buffer.hpp"

namespace keel {
  class ValidatorRegistry;
}  // namespace keel

namespace keel {

  /**
   * Local view of the block tree rooted at the latest finalized block.
   *
   * It tracks:
   * - known blocks descending from the finalized root,
   * - blocks waiting for their parent (bounded, oldest evicted first),
   * - the latest vote of every validator,
   * - and the current head selected by configured strategy.
   *
   * GHOST descends from the root into the child whose subtree carries most
   * voting power of eligible validators' latest votes. Longest chain picks
   * the highest leaf. Both prefer the lexicographically smallest hash on
   * ties.
   */
  class ForkChoice {
   public:
    enum class Error {
      INVALID_ANCESTRY = 1,
      INVALID_HEIGHT,
      INVALID_SLOT,
      STATE_ROOT_MISMATCH,
      UNKNOWN_BLOCK,
    };
    Q_ENUM_ERROR_CODE_FRIEND(Error) {
      using E = decltype(e);
      switch (e) {
        case E::INVALID_ANCESTRY:
          return "Block does not descend from finalized block and checkpoint";
        case E::INVALID_HEIGHT:
          return "Block height is not parent height plus one";
        case E::INVALID_SLOT:
          return "Block slot is not above parent slot";
        case E::STATE_ROOT_MISMATCH:
          return "Block state root does not follow parent state root";
        case E::UNKNOWN_BLOCK:
          return "Unknown block";
      }
      abort();
    }

    struct Insertion {
      BlockHash head;
      /// Newly integrated blocks, parents before children
      std::vector<BlockHash> integrated;
      /// Block waits for unknown parent
      bool buffered = false;
    };

    ForkChoice(qtils::SharedRef<log::LoggingSystem> logging_system,
               qtils::SharedRef<ValidatorRegistry> validator_registry,
               const ConsensusConfig &config,
               Block genesis);

    outcome::result<Insertion> onBlock(const Block &block);

    /// Records vote if it is newer than latest known vote of validator
    BlockHash onVote(const Vote &vote);

    /// Moves root to finalized block and prunes other branches
    outcome::result<BlockHash> onFinalized(const BlockHash &hash);

    /// Sets lower bound for future fork resolution
    outcome::result<BlockHash> onCheckpoint(const BlockHash &hash);

    /// Drops buffered blocks older than orphan timeout
    size_t expireOrphans(Slot current_slot);

    const BlockHash &head() const {
      return head_;
    }

    const BlockHeader &headHeader() const;

    const BlockHash &root() const {
      return root_;
    }

    const BlockArena &arena() const {
      return arena_;
    }

    bool contains(const BlockHash &hash) const {
      return arena_.contains(hash);
    }

    /// Block is an ancestor of head or head itself
    bool isCanonical(const BlockHash &hash) const;

    /// Blocks from root (exclusive) to head (inclusive)
    std::vector<BlockHash> canonicalChain() const;

    size_t orphanCount() const {
      return orphans_.size();
    }

   private:
    struct LatestVote {
      BlockHash block_hash;
      Height height;
      Round round;
      VotePhase phase;
    };

    outcome::result<void> validate(const BlockHeader &header) const;
    void integrate(Block block,
                   const BlockHash &hash,
                   std::vector<BlockHash> &integrated);
    BlockHash computeHead() const;
    BlockHash computeGhostHead() const;
    BlockHash computeLongestChainHead() const;

    log::Logger logger_;
    qtils::SharedRef<ValidatorRegistry> validator_registry_;
    ForkChoiceStrategy strategy_;
    Slot orphan_timeout_slots_;

    BlockArena arena_;
    BoundedFifo<Block> orphans_;
    std::map<ValidatorId, LatestVote> latest_votes_;
    BlockHash root_;
    std::optional<BlockHash> checkpoint_;
    BlockHash head_;
  };

}  // namespace keel
