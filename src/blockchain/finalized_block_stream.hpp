/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <shared_mutex>
#include <vector>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

#include "types/block.hpp"

namespace keel {

  /**
   * Canonical irreversible history handed to execution layer.
   * Blocks are appended in height order starting at genesis. Readers use
   * cursors which may start from any height already observed and resume
   * after more blocks are appended.
   */
  class FinalizedBlockStream
      : public std::enable_shared_from_this<FinalizedBlockStream> {
   public:
    enum class Error {
      HEIGHT_GAP = 1,
      PARENT_MISMATCH,
    };
    Q_ENUM_ERROR_CODE_FRIEND(Error) {
      using E = decltype(e);
      switch (e) {
        case E::HEIGHT_GAP:
          return "Finalized block height does not follow stream tip";
        case E::PARENT_MISMATCH:
          return "Finalized block does not extend stream tip";
      }
      abort();
    }

    class Cursor {
     public:
      /// Next finalized block, nothing if cursor reached stream tip
      std::optional<Block> next();

      /// Height of block returned by next call
      Height position() const {
        return position_;
      }

     private:
      friend class FinalizedBlockStream;
      Cursor(std::shared_ptr<const FinalizedBlockStream> stream,
             Height position)
          : stream_{std::move(stream)}, position_{position} {}

      std::shared_ptr<const FinalizedBlockStream> stream_;
      Height position_;
    };

    /// Appends block extending current tip; re-appending tip is no-op
    outcome::result<void> append(const Block &block);

    Cursor cursor(Height from_height) const;

    std::optional<Block> at(Height height) const;

    /// Number of finalized blocks, genesis included
    size_t size() const;

   private:
    mutable std::shared_mutex mutex_;
    std::vector<Block> blocks_;
    std::vector<BlockHash> hashes_;
  };

}  // namespace keel
