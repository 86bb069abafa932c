/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "types/config.hpp"
#include "types/slashing_evidence.hpp"

namespace keel {
  class ConsensusRecords;
  class ValidatorRegistry;
}  // namespace keel

namespace keel::consensus {

  enum class SlashingOutcome : uint8_t {
    Slashed,
    Expired,
    AlreadyProcessed,
  };

  /**
   * Verifies evidence and applies stake penalties.
   * Every evidence is consumed once, identified by its hash in the evidence
   * log of ConsensusRecords.
   */
  class SlashingManager {
   public:
    enum class Error {
      INVALID_EVIDENCE = 1,
    };
    Q_ENUM_ERROR_CODE_FRIEND(Error) {
      using E = decltype(e);
      switch (e) {
        case E::INVALID_EVIDENCE:
          return "Invalid slashing evidence";
      }
      abort();
    }

    SlashingManager(qtils::SharedRef<log::LoggingSystem> logging_system,
                    qtils::SharedRef<ValidatorRegistry> validator_registry,
                    qtils::SharedRef<ConsensusRecords> records,
                    const ConsensusConfig &config);

    outcome::result<SlashingOutcome> processEvidence(
        const SlashingEvidence &evidence, Height current_height);

    /// Penalty for evidence against given stake
    Amount penaltyFor(const SlashingEvidence &evidence, Amount stake) const;

    /// Signatures are valid and votes really conflict
    bool verify(const SlashingEvidence &evidence) const;

   private:
    log::Logger logger_;
    qtils::SharedRef<ValidatorRegistry> validator_registry_;
    qtils::SharedRef<ConsensusRecords> records_;
    SlashingParams params_;
  };

}  // namespace keel::consensus

template <>
struct fmt::formatter<keel::consensus::SlashingOutcome>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(keel::consensus::SlashingOutcome v, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    using O = keel::consensus::SlashingOutcome;
    std::string_view name = "?";
    switch (v) {
      case O::Slashed:
        name = "slashed";
        break;
      case O::Expired:
        name = "expired";
        break;
      case O::AlreadyProcessed:
        name = "already processed";
        break;
    }
    return fmt::formatter<std::string_view>::format(name, ctx);
  }
};
