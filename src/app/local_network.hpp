/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <variant>
#include <vector>

#include <qtils/shared_ref.hpp>

#include "consensus/broadcaster.hpp"
#include "log/logger.hpp"

namespace keel::consensus {
  class ConsensusEngine;
}  // namespace keel::consensus

namespace keel::app {

  /**
   * Loopback gossip between engines of one process.
   * Broadcast messages are queued and delivered by `pump` to every other
   * attached engine, in sending order or shuffled by seeded generator.
   */
  class LocalNetwork : public std::enable_shared_from_this<LocalNetwork> {
   public:
    using Message = std::variant<Block, SignedVote, CheckpointSignature>;

    LocalNetwork(qtils::SharedRef<log::LoggingSystem> logging_system,
                 std::optional<uint64_t> shuffle_seed);

    /// Broadcaster for node which is attached later under same index
    qtils::SharedRef<consensus::Broadcaster> endpoint(size_t node);

    void attach(size_t node,
                std::shared_ptr<consensus::ConsensusEngine> engine);

    /// Delivers queued messages until queue is empty
    size_t pump();

    size_t pending() const;

   private:
    class Endpoint;

    struct Envelope {
      size_t from;
      Message message;
    };

    void enqueue(size_t from, Message message);
    std::optional<Envelope> take();
    void deliver(consensus::ConsensusEngine &engine, const Message &message);

    log::Logger logger_;
    mutable std::mutex mutex_;
    std::deque<Envelope> queue_;
    std::vector<std::pair<size_t, std::shared_ptr<consensus::ConsensusEngine>>>
        engines_;
    std::optional<std::mt19937_64> random_;
  };

}  // namespace keel::app
