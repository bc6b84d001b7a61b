#pragma once

#include "common/bytes.hpp"
#include "curve/bn254.hpp"
#include "groth16/errors.hpp"
#include "groth16/proof.hpp"
#include "groth16/verifier_config.hpp"
#include "groth16/verifying_key.hpp"
#include "hash/hash_to_field.hpp"
#include <optional>
#include <string>
#include <vector>

namespace groth16 {

enum class VerificationStatus {
    Verified,
    // Well-formed input, but the pairing identity does not hold
    ProofRejected,
    // Decode, shape or tag error before the pairing check could decide
    InputRejected,
};

const char* to_string(VerificationStatus status);

struct VerificationResult {
    VerificationStatus status = VerificationStatus::Verified;
    std::optional<ErrorKind> error_kind;
    std::string message;

    static VerificationResult ok() {
        return VerificationResult();
    }

    static VerificationResult error(ErrorKind kind, const std::string& msg) {
        VerificationResult r;
        r.status = kind == ErrorKind::ProofVerificationFailed
            ? VerificationStatus::ProofRejected
            : VerificationStatus::InputRejected;
        r.error_kind = kind;
        r.message = msg;
        return r;
    }

    bool verified() const { return status == VerificationStatus::Verified; }
};

/**
 * Evaluate e(-ar, bs) * e(prepared, gamma) * e(krs, delta) * e(alpha, -vk.beta)
 * as one multi-pairing and compare with 1. vk.beta is stored negated, so the
 * last term is e(alpha, beta) for beta as encoded.
 *
 * Throws PrepareInputsError on an input count mismatch; returns the outcome
 * of the pairing check otherwise.
 */
bool pairing_check(const VerifyingKey& vk, const Proof& proof, const std::vector<Fr>& inputs);

// pairing_check, throwing ProofVerificationError when it does not hold
void verify_algebraic(const VerifyingKey& vk, const Proof& proof, const std::vector<Fr>& inputs);

/**
 * Groth16Verifier - verification entry points for serialized proofs
 *
 * All methods are const and share no mutable state; one verifier may be used
 * from any number of threads.
 */
class Groth16Verifier {
public:
    explicit Groth16Verifier(VerifierConfig config = VerifierConfig());

    const VerifierConfig& config() const { return config_; }

    /**
     * Verify a proof bound to a program through vk_hash_tag.
     *
     * proof_bytes may carry the 4-byte vk-hash prefix, which must equal
     * SHA-256(vk_bytes)[0..4] (checked before any curve arithmetic). The
     * public inputs are [Fr(vk_hash_tag), hash_to_fr(public_values)], with the
     * hash chosen by config().public_values_hash.
     *
     * Throws a Groth16Error subclass; ProofVerificationError means the input
     * was well formed but the proof is invalid.
     */
    void verify(ByteSpan proof_bytes, ByteSpan public_values, ByteSpan vk_bytes,
                const Digest32& vk_hash_tag) const;

    // verify(), with Groth16Error reported in the result instead of thrown
    VerificationResult try_verify(ByteSpan proof_bytes, ByteSpan public_values, ByteSpan vk_bytes,
                                  const Digest32& vk_hash_tag) const;

    // Raw check with explicit 32-byte big-endian public inputs; no prefix allowed
    void verify_gnark_proof(ByteSpan proof_bytes, const std::vector<Digest32>& public_inputs,
                            ByteSpan vk_bytes) const;

private:
    VerifierConfig config_;

    std::vector<HashFunction> hash_candidates() const;
};

// Groth16Verifier with the default configuration (real, full checks, any hash)
void verify_groth16(ByteSpan proof_bytes, ByteSpan public_values, ByteSpan vk_bytes,
                    const Digest32& vk_hash_tag);

} // namespace groth16
