/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/finalized_block_stream.hpp"

#include <mutex>

namespace keel {

  std::optional<Block> FinalizedBlockStream::Cursor::next() {
    auto block = stream_->at(position_);
    if (block) {
      ++position_;
    }
    return block;
  }

  outcome::result<void> FinalizedBlockStream::append(const Block &block) {
    std::unique_lock lock{mutex_};
    auto hash = block.hash();
    auto height = block.header.height;
    if (height < hashes_.size()) {
      if (hashes_[height] == hash) {
        return outcome::success();
      }
      return Error::PARENT_MISMATCH;
    }
    if (height != hashes_.size()) {
      return Error::HEIGHT_GAP;
    }
    if (not hashes_.empty() and hashes_.back() != block.header.parent_hash) {
      return Error::PARENT_MISMATCH;
    }
    blocks_.emplace_back(block);
    hashes_.emplace_back(hash);
    return outcome::success();
  }

  FinalizedBlockStream::Cursor FinalizedBlockStream::cursor(
      Height from_height) const {
    return Cursor{shared_from_this(), from_height};
  }

  std::optional<Block> FinalizedBlockStream::at(Height height) const {
    std::shared_lock lock{mutex_};
    if (height >= blocks_.size()) {
      return std::nullopt;
    }
    return blocks_[height];
  }

  size_t FinalizedBlockStream::size() const {
    std::shared_lock lock{mutex_};
    return blocks_.size();
  }

}  // namespace keel
