#include "groth16/prepare_inputs.hpp"
#include "groth16/errors.hpp"

namespace groth16 {

G1 prepare_inputs(const VerifyingKey& vk, const std::vector<Fr>& inputs) {
    const auto& k = vk.k();
    if (inputs.size() + 1 != k.size()) {
        throw PrepareInputsError(inputs.size(), k.size());
    }

    G1 acc = k[0];
    for (size_t i = 0; i < inputs.size(); ++i) {
        acc = acc + bn254::mul(k[i + 1], inputs[i]);
    }
    return acc;
}

G1 prepare_single_input(const VerifyingKey& vk, const Fr& input) {
    return prepare_inputs(vk, {input});
}

} // namespace groth16
