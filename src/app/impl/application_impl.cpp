/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/impl/application_impl.hpp"

#include <array>
#include <variant>

#include <unistd.h>

#include "app/configuration.hpp"
#include "blockchain/fork_choice_table.hpp"
#include "blockchain/impl/block_proven_journal.hpp"
#include "blockchain/impl/in_memory_protocol_state.hpp"
#include "blockchain/proving_engine.hpp"
#include "codec/evidence_codec.hpp"

namespace taiko::app {

  ApplicationImpl::ApplicationImpl(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<Configuration> config,
      qtils::SharedRef<blockchain::InMemoryProtocolState> state,
      qtils::SharedRef<blockchain::ProvingEngine> engine,
      qtils::SharedRef<blockchain::ForkChoiceTable> fork_choices,
      qtils::SharedRef<blockchain::BlockProvenJournal> journal)
      : logger_(logsys->getLogger("Application", "application")),
        app_config_(std::move(config)),
        state_(std::move(state)),
        engine_(std::move(engine)),
        fork_choices_(std::move(fork_choices)),
        journal_(std::move(journal)) {}

  outcome::result<void> ApplicationImpl::run() {
    SL_INFO(logger_,
            "Start as node version '{}' named as '{}' with PID {}",
            app_config_->nodeVersion(),
            app_config_->nodeName(),
            getpid());

    const auto &protocol = app_config_->protocol();
    SL_INFO(logger_,
            "Chain {} on L1 chain {}, oracle prover {}, anchor validation {}",
            protocol.chain_id,
            protocol.l1_chain_id,
            protocol.enable_oracle_prover ? "enabled" : "disabled",
            protocol.enable_anchor_validation ? "enabled" : "disabled");

    const auto &path = app_config_->scenarioFile();
    if (not path.has_value()) {
      SL_INFO(logger_, "No scenario to replay");
      return outcome::success();
    }

    YAML::Node root;
    try {
      root = YAML::LoadFile(path->native());
    } catch (const YAML::Exception &e) {
      SL_ERROR(logger_, "Can't load scenario {}: {}", path->native(), e.what());
      return Error::SCENARIO_FILE;
    }
    OUTCOME_TRY(scenario, parseScenario(root));
    SL_INFO(logger_,
            "Replaying {} steps of scenario {}",
            scenario.steps.size(),
            path->native());

    auto result = replay(scenario);
    report();
    return result;
  }

  outcome::result<void> ApplicationImpl::replay(const Scenario &scenario) {
    for (const auto &step : scenario.steps) {
      OUTCOME_TRY(std::visit([&](const auto &s) { return apply(s); }, step));
    }
    return outcome::success();
  }

  outcome::result<void> ApplicationImpl::apply(const ProposeStep &step) {
    OUTCOME_TRY(state_->recordProposal(step.meta));
    proposals_.insert_or_assign(step.meta.id, step.meta);
    SL_DEBUG(logger_, "Proposed block {}", step.meta.id);
    return outcome::success();
  }

  outcome::result<void> ApplicationImpl::apply(const VerifyStep &step) {
    OUTCOME_TRY(state_->markVerified(step.id));
    SL_DEBUG(logger_, "Verified blocks up to {}", step.id);
    return outcome::success();
  }

  outcome::result<void> ApplicationImpl::apply(const ProveStep &step) {
    auto it = proposals_.find(step.id);
    if (it == proposals_.end()) {
      SL_ERROR(logger_, "Block {} was not proposed by scenario", step.id);
      return Error::UNKNOWN_BLOCK;
    }
    const auto &meta = it->second;
    const auto &protocol = app_config_->protocol();

    Evidence evidence;
    evidence.meta = meta;
    evidence.prover = step.prover;
    auto &header = evidence.header;
    header.parent_hash = step.parent_hash;
    header.beneficiary = meta.beneficiary;
    header.state_root = step.state_root;
    header.transactions_root = step.transactions_root;
    header.receipts_root = step.receipts_root;
    header.height = meta.id;
    header.gas_limit = meta.gas_limit + protocol.anchor_tx_gas_limit;
    header.gas_used = step.gas_used;
    header.timestamp = meta.timestamp;
    header.extra_data = meta.extra_data;
    header.mix_hash = meta.mix_hash;

    for (size_t i = 0; i < protocol.zk_proofs_per_block; ++i) {
      ProofBlob proof;
      proof.push_back(static_cast<uint8_t>(i));
      evidence.proofs.push_back(proof);
      evidence.circuits.push_back(step.circuit);
    }
    // Inclusion proofs
    evidence.proofs.push_back(ProofBlob{});
    if (not step.invalid) {
      evidence.proofs.push_back(ProofBlob{});
    }

    outcome::result<void> result = outcome::success();
    if (step.invalid) {
      std::array<qtils::ByteVec, PROOF_INPUT_SEGMENTS> inputs{
          codec::encodeEvidence(evidence),
          codec::encodeMetadata(meta),
          step.receipt,
      };
      result = engine_->proveBlockInvalid(step.id, inputs);
    } else {
      std::array<qtils::ByteVec, PROOF_INPUT_SEGMENTS> inputs{
          codec::encodeEvidence(evidence),
          step.anchor_tx,
          step.receipt,
      };
      result = engine_->proveBlock(step.id, inputs);
    }

    const char *kind = step.invalid ? "Invalidity proof" : "Proof";
    if (result.has_value()) {
      SL_INFO(logger_,
              "{} of block {} by {:0x} accepted",
              kind,
              step.id,
              step.prover);
    } else {
      SL_WARN(logger_,
              "{} of block {} by {:0x} rejected: {}",
              kind,
              step.id,
              step.prover,
              result.error());
    }
    if (step.expect_accepted.has_value()
        and *step.expect_accepted != result.has_value()) {
      SL_ERROR(logger_,
               "{} of block {} expected to be {}",
               kind,
               step.id,
               *step.expect_accepted ? "accepted" : "rejected");
      return Error::UNEXPECTED_OUTCOME;
    }
    return outcome::success();
  }

  void ApplicationImpl::report() const {
    SL_INFO(logger_,
            "Replay done: {} fork choices, {} events, latest verified {}, next "
            "block {}",
            fork_choices_->size(),
            journal_->events().size(),
            state_->latestVerifiedId(),
            state_->nextBlockId());
    fork_choices_->forEach([&](const ForkChoiceKey &key,
                               const ForkChoice &choice) {
      SL_INFO(logger_,
              "  {:l} -> {:0x}, proven at {}, {} provers",
              key,
              choice.block_hash,
              choice.proven_at,
              choice.provers.size());
    });
    if (engine_->isHalted()) {
      SL_CRITICAL(logger_, "Protocol is halted");
    }
  }

}  // namespace taiko::app
