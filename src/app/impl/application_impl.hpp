/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>

#include <qtils/shared_ref.hpp>

#include "app/application.hpp"
#include "app/scenario.hpp"
#include "log/logger.hpp"
#include "types/block_metadata.hpp"

namespace taiko::blockchain {
  class BlockProvenJournal;
  class ForkChoiceTable;
  class InMemoryProtocolState;
  class ProvingEngine;
}  // namespace taiko::blockchain

namespace taiko::app {
  class Configuration;
}  // namespace taiko::app

namespace taiko::app {

  /**
   * Replays a scenario of proposals, verifications and proof submissions
   * against in-memory protocol state, and reports resulting fork choices.
   */
  class ApplicationImpl final : public Application {
   public:
    ApplicationImpl(qtils::SharedRef<log::LoggingSystem> logsys,
                    qtils::SharedRef<Configuration> config,
                    qtils::SharedRef<blockchain::InMemoryProtocolState> state,
                    qtils::SharedRef<blockchain::ProvingEngine> engine,
                    qtils::SharedRef<blockchain::ForkChoiceTable> fork_choices,
                    qtils::SharedRef<blockchain::BlockProvenJournal> journal);

    outcome::result<void> run() override;

    /// Apply steps in order, stops on unexpected outcome
    outcome::result<void> replay(const Scenario &scenario);

    enum class Error {
      UNKNOWN_BLOCK,
      UNEXPECTED_OUTCOME,
      SCENARIO_FILE,
    };
    Q_ENUM_ERROR_CODE_FRIEND(Error) {
      using E = decltype(e);
      switch (e) {
        case E::UNKNOWN_BLOCK:
          return "Proof step refers to a block not proposed by scenario";
        case E::UNEXPECTED_OUTCOME:
          return "Proof submission outcome differs from expected";
        case E::SCENARIO_FILE:
          return "Scenario file can not be loaded";
      }
      abort();
    }

   private:
    outcome::result<void> apply(const ProposeStep &step);
    outcome::result<void> apply(const VerifyStep &step);
    outcome::result<void> apply(const ProveStep &step);

    void report() const;

    log::Logger logger_;
    qtils::SharedRef<Configuration> app_config_;
    qtils::SharedRef<blockchain::InMemoryProtocolState> state_;
    qtils::SharedRef<blockchain::ProvingEngine> engine_;
    qtils::SharedRef<blockchain::ForkChoiceTable> fork_choices_;
    qtils::SharedRef<blockchain::BlockProvenJournal> journal_;
    std::map<BlockId, BlockMetadata> proposals_;
  };

}  // namespace taiko::app
