/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/submission_validator.hpp"

#include "codec/evidence_codec.hpp"

namespace taiko::blockchain {

  namespace {
    // Anchor tx and anchor receipt
    constexpr size_t kValidBlockInclusionProofs = 2;
    // Invalidate receipt
    constexpr size_t kInvalidBlockInclusionProofs = 1;
  }  // namespace

  SubmissionValidator::SubmissionValidator(
      ProtocolConfig config, qtils::SharedRef<ProtocolState> state)
      : config_{std::move(config)}, state_{std::move(state)} {}

  outcome::result<ProofSubmission> SubmissionValidator::validateProof(
      BlockId block_id, std::span<const qtils::ByteVec> inputs) const {
    if (inputs.size() != PROOF_INPUT_SEGMENTS) {
      return Error::INPUT_SIZE;
    }
    OUTCOME_TRY(evidence, codec::decodeEvidence(inputs[0]));
    if (evidence.meta.id != block_id) {
      return Error::ID_MISMATCH;
    }
    OUTCOME_TRY(checkProofCounts(evidence, kValidBlockInclusionProofs));
    OUTCOME_TRY(checkTarget(evidence.meta));
    if (evidence.prover == kZeroAddress) {
      return Error::ZERO_PROVER;
    }
    OUTCOME_TRY(checkHeader(evidence.header, evidence.meta));
    auto target = evidence.meta;
    return ProofSubmission{
        .evidence = std::move(evidence),
        .target = std::move(target),
    };
  }

  outcome::result<ProofSubmission> SubmissionValidator::validateInvalidityProof(
      BlockId block_id, std::span<const qtils::ByteVec> inputs) const {
    if (inputs.size() != PROOF_INPUT_SEGMENTS) {
      return Error::INPUT_SIZE;
    }
    OUTCOME_TRY(evidence, codec::decodeEvidence(inputs[0]));
    OUTCOME_TRY(target, codec::decodeMetadata(inputs[1]));
    if (evidence.meta.id != block_id) {
      return Error::ID_MISMATCH;
    }
    if (evidence.meta.id != target.id) {
      return Error::TARGET_ID_MISMATCH;
    }
    OUTCOME_TRY(checkProofCounts(evidence, kInvalidBlockInclusionProofs));
    OUTCOME_TRY(checkTarget(target));
    if (evidence.prover == kZeroAddress) {
      return Error::ZERO_PROVER;
    }
    OUTCOME_TRY(checkHeader(evidence.header, target));
    return ProofSubmission{
        .evidence = std::move(evidence),
        .target = std::move(target),
    };
  }

  outcome::result<void> SubmissionValidator::checkProofCounts(
      const Evidence &evidence, size_t inclusion_proofs) const {
    if (evidence.proofs.size()
        != config_.zk_proofs_per_block + inclusion_proofs) {
      return Error::PROOF_COUNT;
    }
    if (evidence.circuits.size() != config_.zk_proofs_per_block) {
      return Error::CIRCUIT_COUNT;
    }
    return outcome::success();
  }

  outcome::result<void> SubmissionValidator::checkTarget(
      const BlockMetadata &target) const {
    if (target.id <= state_->latestVerifiedId()
        or target.id >= state_->nextBlockId()) {
      return Error::ID_OUT_OF_RANGE;
    }
    auto proposed = state_->getProposedBlock(target.id);
    if (not proposed.has_value()
        or proposed->meta_hash != metadataFingerprint(target)) {
      return Error::METADATA_MISMATCH;
    }
    return outcome::success();
  }

  outcome::result<void> SubmissionValidator::checkHeader(
      const BlockHeader &header, const BlockMetadata &target) const {
    if (header.parent_hash == kZeroHash
        or header.beneficiary != target.beneficiary
        or header.difficulty != 0
        or header.gas_limit != target.gas_limit + config_.anchor_tx_gas_limit
        or header.timestamp != target.timestamp
        or header.extra_data != target.extra_data
        or header.mix_hash != target.mix_hash) {
      return Error::HEADER_MISMATCH;
    }
    return outcome::success();
  }

}  // namespace taiko::blockchain
