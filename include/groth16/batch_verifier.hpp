#pragma once

#include "common/bytes.hpp"
#include "groth16/verifier.hpp"
#include <vector>

namespace groth16 {

struct VerificationRequest {
    Bytes proof;
    Bytes public_values;
    Bytes vk;
    Digest32 vk_hash_tag;
};

/**
 * BatchVerifier - independent verifications run in parallel
 *
 * Each request gets its own pairing check; nothing is aggregated. Results
 * are positional and one failing request never affects another.
 */
class BatchVerifier {
public:
    explicit BatchVerifier(VerifierConfig config = VerifierConfig());

    std::vector<VerificationResult> verify_all(const std::vector<VerificationRequest>& requests) const;

private:
    Groth16Verifier verifier_;
};

} // namespace groth16
