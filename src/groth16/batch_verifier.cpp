#include "groth16/batch_verifier.hpp"
#include "common/debug_control.hpp"
#include <tbb/parallel_for.h>
#include <chrono>

namespace groth16 {

BatchVerifier::BatchVerifier(VerifierConfig config) : verifier_(config) {}

std::vector<VerificationResult> BatchVerifier::verify_all(const std::vector<VerificationRequest>& requests) const {
    std::vector<VerificationResult> results(requests.size());

    auto start = std::chrono::high_resolution_clock::now();

    tbb::parallel_for(size_t(0), requests.size(), [&](size_t i) {
        const auto& request = requests[i];
        results[i] = verifier_.try_verify(request.proof, request.public_values, request.vk, request.vk_hash_tag);
    });

    GROTH16_IF_PROFILE {
        auto end = std::chrono::high_resolution_clock::now();
        std::cerr << "[batch] " << requests.size() << " proofs in "
                  << std::chrono::duration<double, std::milli>(end - start).count() << " ms" << std::endl;
    }
    return results;
}

} // namespace groth16
