/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/fork_choice.hpp"

#include <algorithm>
#include <tuple>

#include "blockchain/validator_registry.hpp"

namespace keel {

  ForkChoice::ForkChoice(qtils::SharedRef<log::LoggingSystem> logging_system,
                         qtils::SharedRef<ValidatorRegistry> validator_registry,
                         const ConsensusConfig &config,
                         Block genesis)
      : logger_{logging_system->getLogger("ForkChoice", "fork_choice")},
        validator_registry_{std::move(validator_registry)},
        strategy_{config.fork_choice},
        orphan_timeout_slots_{config.orphan_timeout_slots},
        orphans_{config.orphan_buffer_limit},
        root_{genesis.hash()},
        head_{root_} {
    arena_.insert(std::move(genesis), root_);
    SL_INFO(logger_, "Fork choice rooted at genesis {:0x}", root_);
  }

  const BlockHeader &ForkChoice::headHeader() const {
    return arena_.get(head_)->header();
  }

  outcome::result<void> ForkChoice::validate(const BlockHeader &header) const {
    auto parent = arena_.get(header.parent_hash);
    if (parent == nullptr) {
      return Error::UNKNOWN_BLOCK;
    }
    auto &parent_header = parent->header();
    if (header.height != parent_header.height + 1) {
      return Error::INVALID_HEIGHT;
    }
    if (header.slot <= parent_header.slot) {
      return Error::INVALID_SLOT;
    }
    if (header.state_root
        != nextStateRoot(parent_header.state_root, header.body_root)) {
      return Error::STATE_ROOT_MISMATCH;
    }
    if (not arena_.isDescendant(root_, header.parent_hash)) {
      return Error::INVALID_ANCESTRY;
    }
    if (checkpoint_) {
      if (auto checkpoint = arena_.get(*checkpoint_);
          checkpoint != nullptr
          and parent_header.height >= checkpoint->header().height
          and not arena_.isDescendant(*checkpoint_, header.parent_hash)) {
        return Error::INVALID_ANCESTRY;
      }
    }
    return outcome::success();
  }

  outcome::result<ForkChoice::Insertion> ForkChoice::onBlock(
      const Block &block) {
    auto hash = block.hash();
    Insertion insertion{.head = head_};

    if (arena_.contains(hash)) {
      return insertion;
    }

    auto &root_header = arena_.get(root_)->header();
    if (block.header.height <= root_header.height) {
      SL_WARN(logger_,
              "Block {} is not above finalized height {}",
              block.header,
              root_header.height);
      return Error::INVALID_ANCESTRY;
    }

    if (not arena_.contains(block.header.parent_hash)) {
      if (block.header.height == root_header.height + 1) {
        SL_WARN(logger_,
                "Block {} does not build on finalized block {:0x}",
                block.header,
                root_);
        return Error::INVALID_ANCESTRY;
      }
      auto known = orphans_.any(
          [&](const Block &orphan) { return orphan.hash() == hash; });
      if (not known) {
        if (auto evicted = orphans_.push(block)) {
          SL_DEBUG(logger_,
                   "Orphan buffer full, dropped block {}",
                   evicted->header);
        }
        SL_DEBUG(logger_,
                 "Block {} buffered until parent {:0x} arrives",
                 block.header,
                 block.header.parent_hash);
      }
      insertion.buffered = true;
      return insertion;
    }

    if (auto res = validate(block.header); res.has_error()) {
      SL_WARN(logger_, "Block {} rejected: {}", block.header, res.error());
      return res.error();
    }

    integrate(block, hash, insertion.integrated);
    head_ = computeHead();
    insertion.head = head_;
    return insertion;
  }

  void ForkChoice::integrate(Block block,
                             const BlockHash &hash,
                             std::vector<BlockHash> &integrated) {
    SL_TRACE(logger_, "Block {} integrated", block.header);
    arena_.insert(std::move(block), hash);
    integrated.emplace_back(hash);

    auto children = orphans_.extract([&](const Block &orphan) {
      return orphan.header.parent_hash == hash;
    });
    for (auto &child : children) {
      if (auto res = validate(child.header); res.has_error()) {
        SL_WARN(logger_,
                "Buffered block {} rejected: {}",
                child.header,
                res.error());
        continue;
      }
      auto child_hash = child.hash();
      if (not arena_.contains(child_hash)) {
        integrate(std::move(child), child_hash, integrated);
      }
    }
  }

  BlockHash ForkChoice::onVote(const Vote &vote) {
    auto key = std::tuple{vote.height, vote.round, vote.phase()};
    auto it = latest_votes_.find(vote.validator);
    if (it != latest_votes_.end()) {
      auto &latest = it->second;
      if (std::tuple{latest.height, latest.round, latest.phase} >= key) {
        return head_;
      }
    }
    latest_votes_.insert_or_assign(vote.validator,
                                   LatestVote{
                                       .block_hash = vote.block_hash,
                                       .height = vote.height,
                                       .round = vote.round,
                                       .phase = vote.phase(),
                                   });
    head_ = computeHead();
    return head_;
  }

  outcome::result<BlockHash> ForkChoice::onFinalized(const BlockHash &hash) {
    if (hash == root_) {
      return head_;
    }
    if (not arena_.contains(hash)) {
      return Error::UNKNOWN_BLOCK;
    }
    if (not arena_.isDescendant(root_, hash)) {
      SL_ERROR(logger_,
               "Finalized block {:0x} does not descend from root {:0x}",
               hash,
               root_);
      return Error::INVALID_ANCESTRY;
    }
    root_ = hash;
    auto root_height = arena_.get(root_)->header().height;
    auto pruned = arena_.prune(root_);
    auto stale = orphans_.extract([&](const Block &orphan) {
      return orphan.header.height <= root_height;
    });
    head_ = computeHead();
    SL_DEBUG(logger_,
             "Root moved to {}, pruned {} blocks and {} orphans, head {:0x}",
             BlockIndexRef{root_height, root_},
             pruned,
             stale.size(),
             head_);
    return head_;
  }

  outcome::result<BlockHash> ForkChoice::onCheckpoint(const BlockHash &hash) {
    if (not arena_.contains(hash)) {
      return Error::UNKNOWN_BLOCK;
    }
    checkpoint_ = hash;
    auto &header = arena_.get(hash)->header();
    if (header.height > arena_.get(root_)->header().height) {
      return onFinalized(hash);
    }
    return head_;
  }

  size_t ForkChoice::expireOrphans(Slot current_slot) {
    auto expired = orphans_.extract([&](const Block &orphan) {
      return orphan.header.slot + orphan_timeout_slots_ < current_slot;
    });
    if (not expired.empty()) {
      SL_DEBUG(logger_,
               "{} buffered blocks expired at slot {}",
               expired.size(),
               current_slot);
    }
    return expired.size();
  }

  bool ForkChoice::isCanonical(const BlockHash &hash) const {
    return arena_.isDescendant(hash, head_);
  }

  std::vector<BlockHash> ForkChoice::canonicalChain() const {
    std::vector<BlockHash> chain;
    auto current = head_;
    while (current != root_) {
      chain.emplace_back(current);
      current = arena_.get(current)->header().parent_hash;
    }
    std::ranges::reverse(chain);
    return chain;
  }

  BlockHash ForkChoice::computeHead() const {
    return std::visit(
        [this](const auto &strategy) {
          using S = std::decay_t<decltype(strategy)>;
          if constexpr (std::is_same_v<S, GhostRule>) {
            return computeGhostHead();
          } else {
            return computeLongestChainHead();
          }
        },
        strategy_);
  }

  BlockHash ForkChoice::computeGhostHead() const {
    const auto root_height = arena_.get(root_)->header().height;

    // Voting weight accumulated by every block of the tree
    std::unordered_map<BlockHash, VotingPower> weights;
    auto get_weight = [&](const BlockHash &hash) {
      auto it = weights.find(hash);
      return it != weights.end() ? it->second : 0;
    };

    // Every vote supports its block and all ancestors up to the root
    for (auto &[validator, vote] : latest_votes_) {
      if (not validator_registry_->isEligible(validator)) {
        continue;
      }
      auto power = validator_registry_->votingPower(validator);
      auto current = arena_.get(vote.block_hash);
      while (current != nullptr and current->header().height > root_height) {
        weights[current->hash] += power;
        current = arena_.get(current->header().parent_hash);
      }
    }

    // Greedy walk into the heaviest child, smallest hash on ties
    auto head = root_;
    while (true) {
      auto &children = arena_.get(head)->children;
      if (children.empty()) {
        return head;
      }
      head = *std::ranges::min_element(
          children, [&](const BlockHash &lhs, const BlockHash &rhs) {
            auto lhs_weight = get_weight(lhs);
            auto rhs_weight = get_weight(rhs);
            if (lhs_weight == rhs_weight) {
              return lhs < rhs;
            }
            return lhs_weight > rhs_weight;
          });
    }
  }

  BlockHash ForkChoice::computeLongestChainHead() const {
    auto best = arena_.get(root_);
    for (auto &leaf : arena_.leaves()) {
      auto entry = arena_.get(leaf);
      auto height = entry->header().height;
      auto best_height = best->header().height;
      if (height > best_height
          or (height == best_height and entry->hash < best->hash)) {
        best = entry;
      }
    }
    return best->hash;
  }

}  // namespace keel
