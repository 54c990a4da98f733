/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/proving_engine.hpp"

#include <fmt/format.h>

#include "blockchain/anchor_verifier.hpp"
#include "blockchain/block_proven_observer.hpp"
#include "blockchain/fork_choice_table.hpp"
#include "blockchain/protocol_state.hpp"
#include "blockchain/submission_validator.hpp"
#include "clock/clock.hpp"
#include "resolver/address_resolver.hpp"
#include "serde/rlp/block_header_rlp.hpp"
#include "verifier/proof_verifier.hpp"

namespace taiko::blockchain {

  ProvingEngine::ProvingEngine(
      qtils::SharedRef<log::LoggingSystem> logsys,
      ProtocolConfig config,
      qtils::SharedRef<clock::SystemClock> clock,
      qtils::SharedRef<ProtocolState> state,
      qtils::SharedRef<ForkChoiceTable> fork_choices,
      qtils::SharedRef<SubmissionValidator> validator,
      qtils::SharedRef<AnchorVerifier> anchor_verifier,
      qtils::SharedRef<verifier::ProofVerifier> proof_verifier,
      qtils::SharedRef<resolver::AddressResolver> resolver,
      qtils::SharedRef<BlockProvenObserver> observer)
      : logger_{logsys->getLogger("ProvingEngine", "taiko")},
        config_{std::move(config)},
        clock_{std::move(clock)},
        state_{std::move(state)},
        fork_choices_{std::move(fork_choices)},
        validator_{std::move(validator)},
        anchor_verifier_{std::move(anchor_verifier)},
        proof_verifier_{std::move(proof_verifier)},
        resolver_{std::move(resolver)},
        observer_{std::move(observer)} {}

  std::string ProvingEngine::verifierId(size_t index, uint16_t circuit) {
    return fmt::format("plonk_verifier_{}_{}", index, circuit);
  }

  bool ProvingEngine::isHalted() const {
    return state_->isHalted();
  }

  const ForkChoice *ProvingEngine::getForkChoice(
      BlockId block_id, const BlockHash &parent_hash) const {
    const ForkChoiceTable &table = *fork_choices_;
    return table.find(ForkChoiceKey{
        .block_id = block_id,
        .parent_hash = parent_hash,
    });
  }

  outcome::result<void> ProvingEngine::proveBlock(
      BlockId block_id, std::span<const qtils::ByteVec> inputs) {
    if (state_->isHalted()) {
      return Error::HALTED;
    }
    auto res = validator_->validateProof(block_id, inputs);
    if (res.has_error()) {
      SL_DEBUG(logger_,
               "Proof of block #{} rejected: {}",
               block_id,
               res.error());
      return res.error();
    }
    auto &[evidence, target] = res.value();

    if (config_.enable_anchor_validation) {
      auto anchor_res = anchor_verifier_->verifyAnchor(
          evidence, target, inputs[1], inputs[2]);
      if (anchor_res.has_error()) {
        SL_DEBUG(logger_,
                 "Anchor of block #{} rejected: {}",
                 block_id,
                 anchor_res.error());
        return anchor_res.error();
      }
    }

    auto block_hash = rlp::hashBlockHeader(evidence.header);
    return admit(evidence, target, block_hash, block_hash);
  }

  outcome::result<void> ProvingEngine::proveBlockInvalid(
      BlockId block_id, std::span<const qtils::ByteVec> inputs) {
    if (state_->isHalted()) {
      return Error::HALTED;
    }
    auto res = validator_->validateInvalidityProof(block_id, inputs);
    if (res.has_error()) {
      SL_DEBUG(logger_,
               "Invalidity proof of block #{} rejected: {}",
               block_id,
               res.error());
      return res.error();
    }
    auto &[evidence, target] = res.value();

    auto invalidation_res =
        anchor_verifier_->verifyInvalidation(evidence, target, inputs[2]);
    if (invalidation_res.has_error()) {
      SL_DEBUG(logger_,
               "Invalidation of block #{} rejected: {}",
               block_id,
               invalidation_res.error());
      return invalidation_res.error();
    }

    auto block_hash = rlp::hashBlockHeader(evidence.header);
    return admit(evidence, target, block_hash, kBlockDeadendHash);
  }

  outcome::result<void> ProvingEngine::admit(const Evidence &evidence,
                                             const BlockMetadata &target,
                                             const BlockHash &block_hash,
                                             const BlockHash &accepted_hash) {
    ForkChoiceKey key{
        .block_id = target.id,
        .parent_hash = evidence.header.parent_hash,
    };

    bool skip_zk = false;
    if (config_.enable_oracle_prover) {
      OUTCOME_TRY(oracle,
                  resolver_->resolve(
                      config_.l1_chain_id, resolver::kOracleProverName, false));
      bool exists = fork_choices_->find(key) != nullptr;
      if (evidence.prover == oracle) {
        if (exists) {
          SL_DEBUG(logger_, "Oracle proof of {} is late", key);
          return Error::ORACLE_NOT_FIRST;
        }
        skip_zk = true;
      } else if (not exists) {
        SL_DEBUG(logger_, "Proof of {} precedes the oracle proof", key);
        return Error::ORACLE_PENDING;
      }
    }

    if (not skip_zk) {
      OUTCOME_TRY(verifyZeroKnowledgeProofs(evidence, block_hash));
    }

    return markBlockProven(
        key, accepted_hash, evidence.prover, target.timestamp);
  }

  outcome::result<void> ProvingEngine::verifyZeroKnowledgeProofs(
      const Evidence &evidence, const BlockHash &block_hash) const {
    for (size_t i = 0; i < config_.zk_proofs_per_block; ++i) {
      auto verifier_id = verifierId(i, evidence.circuits.data()[i]);
      if (not proof_verifier_->verifyZeroKnowledgeProof(
              verifier_id,
              evidence.proofs.data()[i].data(),
              block_hash,
              evidence.prover,
              evidence.meta.tx_list_hash)) {
        SL_DEBUG(logger_,
                 "Proof {} of block #{} by {:0xx} is invalid",
                 verifier_id,
                 evidence.meta.id,
                 evidence.prover);
        return Error::INVALID_ZK_PROOF;
      }
    }
    return outcome::success();
  }

  outcome::result<void> ProvingEngine::markBlockProven(
      const ForkChoiceKey &key,
      const BlockHash &block_hash,
      const ProverId &prover,
      TimestampSeconds timestamp) {
    auto now = clock_->nowSec();

    if (auto choice = fork_choices_->find(key)) {
      if (choice->provers.size() >= config_.max_proofs_per_fork_choice) {
        return Error::TOO_MANY_PROOFS;
      }
      if (choice->proven_at != 0
          and now >= choice->proven_at + config_.uncle_proof_window) {
        return Error::TOO_LATE;
      }
      if (choice->hasProver(prover)) {
        return Error::DUPLICATE_PROVER;
      }
      if (choice->block_hash != block_hash) {
        if (config_.enable_oracle_prover) {
          SL_DEBUG(logger_,
                   "Proof of {} by {:0xx} conflicts with oracle proof",
                   key,
                   prover);
          return Error::CONFLICT_PROOF;
        }
        SL_CRITICAL(logger_,
                    "Conflicting proofs of {}: {:0xx} by {} provers, {:0xx} "
                    "by {:0xx}. Halting",
                    key,
                    choice->block_hash,
                    choice->provers.size(),
                    block_hash,
                    prover);
        state_->halt();
        return outcome::success();
      }
      if (config_.enable_oracle_prover and choice->proven_at == 0) {
        choice->proven_at = now;
      }
      choice->provers.push_back(prover);
      SL_INFO(logger_,
              "Fork choice {} confirmed by {:0xx}, {} provers",
              key,
              prover,
              choice->provers.size());
      observer_->onBlockProven(BlockProven{
          .id = key.block_id,
          .parent_hash = key.parent_hash,
          .block_hash = choice->block_hash,
          .timestamp = timestamp,
          .proven_at = choice->proven_at,
          .prover = prover,
      });
      return outcome::success();
    }

    OUTCOME_TRY(handle, fork_choices_->getOrInsert(key));
    auto &choice = handle.choice;
    choice.block_hash = block_hash;
    choice.proven_at = config_.enable_oracle_prover ? 0 : now;
    choice.provers.push_back(prover);
    SL_INFO(logger_,
            "Fork choice {} proven by {:0xx}: {:0xx}",
            key,
            prover,
            block_hash);
    observer_->onBlockProven(BlockProven{
        .id = key.block_id,
        .parent_hash = key.parent_hash,
        .block_hash = choice.block_hash,
        .timestamp = timestamp,
        .proven_at = choice.proven_at,
        .prover = prover,
    });
    return outcome::success();
  }

}  // namespace taiko::blockchain
