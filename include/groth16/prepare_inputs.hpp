#pragma once

#include "curve/bn254.hpp"
#include "groth16/verifying_key.hpp"
#include <vector>

namespace groth16 {

/**
 * Fold the public inputs into the verifying key's K points:
 *   k[0] + k[1]*inputs[0] + ... + k[n]*inputs[n-1]
 *
 * Throws PrepareInputsError unless inputs.size() + 1 == vk.k().size().
 */
G1 prepare_inputs(const VerifyingKey& vk, const std::vector<Fr>& inputs);

// k[0] + k[1]*input, for keys with exactly one public input
G1 prepare_single_input(const VerifyingKey& vk, const Fr& input);

} // namespace groth16
