/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <optional>
#include <unordered_map>
#include <vector>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "consensus/quorum.hpp"
#include "log/logger.hpp"
#include "types/block.hpp"
#include "types/config.hpp"
#include "types/quorum_certificate.hpp"
#include "utils/ordered_buffer.hpp"

namespace keel {
  class ConsensusRecords;
  class ValidatorRegistry;
}  // namespace keel

namespace keel::consensus {

  enum class BlockStatus : uint8_t {
    Proposed,
    Prepared,
    Committed,
    Finalized,
    Abandoned,
  };

  /**
   * Two-phase stake-weighted voting state machine.
   *
   * Per block: Proposed -> Prepared -> Committed -> Finalized.
   * - prepare quorum moves a block to Prepared;
   * - commit quorum, counted independently, moves a prepared block to
   *   Committed and finalizes it together with all non-finalized ancestors;
   * - a block is Abandoned when head is `safety_window` heights past it on
   *   another branch, or when a conflicting block is finalized at or above
   *   its height.
   *
   * Finalizing a block which conflicts with existing finality record halts
   * the gadget for good.
   *
   * In confirmation depth mode votes are tracked the same way, but only
   * depth below head finalizes.
   */
  class FinalityGadget {
   public:
    enum class Error {
      UNKNOWN_VALIDATOR = 1,
      INELIGIBLE_VOTER,
      HEIGHT_MISMATCH,
      ROUND_MISMATCH,
      UNKNOWN_BLOCK,
      SAFETY_VIOLATION,
      HALTED,
    };
    Q_ENUM_ERROR_CODE_FRIEND(Error) {
      using E = decltype(e);
      switch (e) {
        case E::UNKNOWN_VALIDATOR:
          return "Vote from unknown validator";
        case E::INELIGIBLE_VOTER:
          return "Vote from validator not eligible in current epoch";
        case E::HEIGHT_MISMATCH:
          return "Vote height differs from block height";
        case E::ROUND_MISMATCH:
          return "Vote round differs from block round";
        case E::UNKNOWN_BLOCK:
          return "Unknown block";
        case E::SAFETY_VIOLATION:
          return "Conflicting block finalized, finalization halted";
        case E::HALTED:
          return "Finalization halted after safety violation";
      }
      abort();
    }

    enum class VoteStatus : uint8_t {
      Counted,
      Duplicate,
      /// Block is unknown yet
      Buffered,
      /// Height is already finalized
      Stale,
    };

    struct VoteReceipt {
      VoteStatus status = VoteStatus::Counted;
      /// Block just reached prepare quorum
      bool prepared = false;
      /// Block just reached commit quorum
      bool committed = false;
    };

    FinalityGadget(qtils::SharedRef<log::LoggingSystem> logging_system,
                   qtils::SharedRef<ValidatorRegistry> validator_registry,
                   qtils::SharedRef<ConsensusRecords> records,
                   const ConsensusConfig &config,
                   Quorum quorum,
                   const Block &genesis);

    /**
     * Starts tracking block and applies votes buffered for it.
     * @return blocks which became prepared
     */
    outcome::result<std::vector<BlockHash>> onBlock(const BlockHeader &header,
                                                    const BlockHash &hash);

    /// Signature must be verified by caller
    outcome::result<VoteReceipt> onVote(const SignedVote &vote);

    /// Finalizes block and every non-finalized ancestor
    outcome::result<void> finalize(const BlockHash &hash,
                                   FinalizedBy finalized_by,
                                   VotingPower power);

    /// Abandons diverged blocks, finalizes by depth in depth mode
    outcome::result<void> onHead(const BlockHash &head);

    [[nodiscard]] std::optional<BlockStatus> status(
        const BlockHash &hash) const;

    [[nodiscard]] std::vector<SignedVote> votes(const BlockHash &hash,
                                                VotePhase phase) const;

    [[nodiscard]] std::optional<FinalizedBlock> finalizedAt(
        Height height) const;

    [[nodiscard]] const FinalizedBlock &latestFinalized() const;

    [[nodiscard]] std::optional<QuorumCertificate> qcAt(Height height) const;

    /// Finalizing the block would contradict the finality record
    [[nodiscard]] bool conflictsWithFinality(const BlockHash &hash) const;

    [[nodiscard]] bool isHalted() const {
      return halted_;
    }

    [[nodiscard]] size_t bufferedVotes() const {
      return buffered_.size();
    }

    [[nodiscard]] const Quorum &quorum() const {
      return quorum_;
    }

   private:
    struct Tracker {
      BlockHash hash;
      BlockHash parent;
      Height height = 0;
      Round round = 0;
      StateRoot state_root;
      BlockStatus status = BlockStatus::Proposed;
      std::map<ValidatorId, SignedVote> prepares;
      VotingPower prepare_power = 0;
      std::map<ValidatorId, SignedVote> commits;
      VotingPower commit_power = 0;
    };

    outcome::result<VoteReceipt> applyVote(Tracker &tracker,
                                           const SignedVote &vote);
    outcome::result<void> advance(Tracker &tracker, VoteReceipt &receipt);
    outcome::result<void> safetyViolation(const BlockHash &hash,
                                          Height height);
    std::optional<BlockHash> ancestorAt(const BlockHash &hash,
                                        Height height) const;
    void abandonConflicting(Height finalized_height);
    void prune();

    log::Logger logger_;
    qtils::SharedRef<ValidatorRegistry> validator_registry_;
    qtils::SharedRef<ConsensusRecords> records_;
    Quorum quorum_;
    FinalityMode mode_;
    Height safety_window_;
    Height vote_buffer_expiry_heights_;

    std::unordered_map<BlockHash, Tracker> trackers_;
    BoundedFifo<SignedVote> buffered_;
    std::map<Height, FinalizedBlock> finalized_;
    std::unordered_map<BlockHash, Height> finalized_hashes_;
    std::map<Height, QuorumCertificate> qcs_;
    bool halted_ = false;
  };

}  // namespace keel::consensus

template <>
struct fmt::formatter<keel::consensus::BlockStatus>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(keel::consensus::BlockStatus v, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    using S = keel::consensus::BlockStatus;
    std::string_view name = "?";
    switch (v) {
      case S::Proposed:
        name = "proposed";
        break;
      case S::Prepared:
        name = "prepared";
        break;
      case S::Committed:
        name = "committed";
        break;
      case S::Finalized:
        name = "finalized";
        break;
      case S::Abandoned:
        name = "abandoned";
        break;
    }
    return fmt::formatter<std::string_view>::format(name, ctx);
  }
};
