/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <unordered_map>
#include <vector>

#include "types/block.hpp"

namespace keel {

  /**
   * Append-only block storage keyed by hash.
   * Parents are referenced by key, children are indexed per block. Pruning
   * keeps only the subtree of a new root.
   */
  class BlockArena {
   public:
    struct Entry {
      Block block;
      BlockHash hash;
      std::vector<BlockHash> children;

      const BlockHeader &header() const {
        return block.header;
      }
    };

    /// @return false if block is already stored
    bool insert(Block block);

    /// Same as insert, with precomputed hash
    bool insert(Block block, const BlockHash &hash);

    bool contains(const BlockHash &hash) const;

    const Entry *get(const BlockHash &hash) const;

    std::optional<BlockHash> parentOf(const BlockHash &hash) const;

    /// Ancestor of block at given height, if still stored
    std::optional<BlockHash> ancestorAt(const BlockHash &hash,
                                        Height height) const;

    /// True if `descendant` equals `ancestor` or lies in its subtree
    bool isDescendant(const BlockHash &ancestor,
                      const BlockHash &descendant) const;

    /// Blocks without children
    std::vector<BlockHash> leaves() const;

    /// Removes everything outside subtree of `root`
    size_t prune(const BlockHash &root);

    size_t size() const {
      return entries_.size();
    }

   private:
    std::unordered_map<BlockHash, Entry> entries_;
  };

}  // namespace keel
