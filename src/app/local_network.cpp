/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/local_network.hpp"

#include "consensus/consensus_engine.hpp"

namespace keel::app {

  class LocalNetwork::Endpoint : public consensus::Broadcaster {
   public:
    Endpoint(std::weak_ptr<LocalNetwork> network, size_t node)
        : network_{std::move(network)}, node_{node} {}

    void broadcastBlock(const Block &block) override {
      send(block);
    }

    void broadcastVote(const SignedVote &vote) override {
      send(vote);
    }

    void broadcastCheckpointSignature(
        const CheckpointSignature &signature) override {
      send(signature);
    }

   private:
    void send(Message message) {
      if (auto network = network_.lock()) {
        network->enqueue(node_, std::move(message));
      }
    }

    std::weak_ptr<LocalNetwork> network_;
    size_t node_;
  };

  LocalNetwork::LocalNetwork(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      std::optional<uint64_t> shuffle_seed)
      : logger_{logging_system->getLogger("LocalNetwork", "app")} {
    if (shuffle_seed) {
      random_.emplace(*shuffle_seed);
    }
  }

  qtils::SharedRef<consensus::Broadcaster> LocalNetwork::endpoint(
      size_t node) {
    return std::make_shared<Endpoint>(weak_from_this(), node);
  }

  void LocalNetwork::attach(
      size_t node, std::shared_ptr<consensus::ConsensusEngine> engine) {
    std::unique_lock lock{mutex_};
    engines_.emplace_back(node, std::move(engine));
  }

  void LocalNetwork::enqueue(size_t from, Message message) {
    std::unique_lock lock{mutex_};
    queue_.emplace_back(Envelope{.from = from, .message = std::move(message)});
  }

  std::optional<LocalNetwork::Envelope> LocalNetwork::take() {
    std::unique_lock lock{mutex_};
    if (queue_.empty()) {
      return std::nullopt;
    }
    auto it = queue_.begin();
    if (random_) {
      std::uniform_int_distribution<size_t> index(0, queue_.size() - 1);
      it += static_cast<std::ptrdiff_t>(index(*random_));
    }
    auto envelope = std::move(*it);
    queue_.erase(it);
    return envelope;
  }

  size_t LocalNetwork::pump() {
    size_t delivered = 0;
    while (auto envelope = take()) {
      std::vector<std::shared_ptr<consensus::ConsensusEngine>> receivers;
      {
        std::unique_lock lock{mutex_};
        for (auto &[node, engine] : engines_) {
          if (node != envelope->from) {
            receivers.emplace_back(engine);
          }
        }
      }
      for (auto &engine : receivers) {
        deliver(*engine, envelope->message);
      }
      ++delivered;
    }
    return delivered;
  }

  void LocalNetwork::deliver(consensus::ConsensusEngine &engine,
                             const Message &message) {
    auto res = std::visit(
        [&](const auto &item) -> outcome::result<void> {
          using T = std::decay_t<decltype(item)>;
          if constexpr (std::is_same_v<T, Block>) {
            return engine.deliverBlock(item);
          } else if constexpr (std::is_same_v<T, SignedVote>) {
            return engine.deliverVote(item);
          } else {
            return engine.deliverCheckpointSignature(item);
          }
        },
        message);
    if (res.has_error()) {
      SL_DEBUG(logger_, "Message not accepted: {}", res.error());
    }
  }

  size_t LocalNetwork::pending() const {
    std::unique_lock lock{mutex_};
    return queue_.size();
  }

}  // namespace keel::app
