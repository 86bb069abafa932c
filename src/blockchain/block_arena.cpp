/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/block_arena.hpp"

#include <deque>
#include <unordered_set>

namespace keel {

  bool BlockArena::insert(Block block) {
    auto hash = block.hash();
    return insert(std::move(block), hash);
  }

  bool BlockArena::insert(Block block, const BlockHash &hash) {
    auto parent_hash = block.header.parent_hash;
    auto [it, inserted] = entries_.try_emplace(
        hash, Entry{.block = std::move(block), .hash = hash, .children = {}});
    if (not inserted) {
      return false;
    }
    if (auto parent = entries_.find(parent_hash); parent != entries_.end()) {
      parent->second.children.emplace_back(hash);
    }
    return true;
  }

  bool BlockArena::contains(const BlockHash &hash) const {
    return entries_.contains(hash);
  }

  const BlockArena::Entry *BlockArena::get(const BlockHash &hash) const {
    auto it = entries_.find(hash);
    return it != entries_.end() ? &it->second : nullptr;
  }

  std::optional<BlockHash> BlockArena::parentOf(const BlockHash &hash) const {
    auto entry = get(hash);
    if (entry == nullptr or not contains(entry->header().parent_hash)) {
      return std::nullopt;
    }
    return entry->header().parent_hash;
  }

  std::optional<BlockHash> BlockArena::ancestorAt(const BlockHash &hash,
                                                  Height height) const {
    auto entry = get(hash);
    while (entry != nullptr and entry->header().height > height) {
      entry = get(entry->header().parent_hash);
    }
    if (entry == nullptr or entry->header().height != height) {
      return std::nullopt;
    }
    return entry->hash;
  }

  bool BlockArena::isDescendant(const BlockHash &ancestor,
                                const BlockHash &descendant) const {
    auto ancestor_entry = get(ancestor);
    if (ancestor_entry == nullptr) {
      return false;
    }
    auto found = ancestorAt(descendant, ancestor_entry->header().height);
    return found == ancestor;
  }

  std::vector<BlockHash> BlockArena::leaves() const {
    std::vector<BlockHash> leaves;
    for (auto &[hash, entry] : entries_) {
      if (entry.children.empty()) {
        leaves.emplace_back(hash);
      }
    }
    return leaves;
  }

  size_t BlockArena::prune(const BlockHash &root) {
    if (not contains(root)) {
      return 0;
    }
    std::unordered_set<BlockHash> keep;
    std::deque<BlockHash> queue{root};
    while (not queue.empty()) {
      auto hash = queue.front();
      queue.pop_front();
      keep.emplace(hash);
      for (auto &child : entries_.at(hash).children) {
        queue.emplace_back(child);
      }
    }
    return std::erase_if(entries_, [&](const auto &item) {
      return not keep.contains(item.first);
    });
  }

}  // namespace keel
