#include "groth16/verifier.hpp"
#include "codec/field_codec.hpp"
#include "codec/hex.hpp"
#include "common/debug_control.hpp"
#include "groth16/prepare_inputs.hpp"
#include "pairing/pairing.hpp"
#include <chrono>
#include <iostream>

namespace groth16 {

const char* to_string(VerificationStatus status) {
    switch (status) {
        case VerificationStatus::Verified: return "verified";
        case VerificationStatus::ProofRejected: return "proof-rejected";
        case VerificationStatus::InputRejected: return "input-rejected";
    }
    return "unknown";
}

bool pairing_check(const VerifyingKey& vk, const Proof& proof, const std::vector<Fr>& inputs) {
    G1 prepared = prepare_inputs(vk, inputs);

    GROTH16_DEBUG_COUT("[verifier] prepared inputs: " << bn254::to_string(prepared) << "\n");

    Pairing::PairList pairs = {
        {bn254::neg(proof.ar()), proof.bs()},
        {prepared, vk.gamma()},
        {proof.krs(), vk.delta()},
        {vk.alpha(), bn254::neg(vk.beta())},
    };
    return Pairing::product_is_one(pairs);
}

void verify_algebraic(const VerifyingKey& vk, const Proof& proof, const std::vector<Fr>& inputs) {
    if (!pairing_check(vk, proof, inputs)) {
        throw ProofVerificationError();
    }
}

Groth16Verifier::Groth16Verifier(VerifierConfig config) : config_(config) {
    bn254::init();
}

std::vector<HashFunction> Groth16Verifier::hash_candidates() const {
    switch (config_.public_values_hash) {
        case PublicValuesHash::Sha256: return {HashFunction::Sha256};
        case PublicValuesHash::Blake3: return {HashFunction::Blake3};
        case PublicValuesHash::Any: return {HashFunction::Sha256, HashFunction::Blake3};
    }
    throw ConfigError("unknown public values hash");
}

void Groth16Verifier::verify(ByteSpan proof_bytes, ByteSpan public_values, ByteSpan vk_bytes,
                             const Digest32& vk_hash_tag) const {
    if (config_.mode == VerifierMode::Mock) {
        std::cerr << "[verifier] WARNING: mock mode, accepting proof without verification" << std::endl;
        return;
    }

    auto start = std::chrono::high_resolution_clock::now();

    auto [prefix, body] = split_vk_hash_prefix(proof_bytes);
    if (prefix) {
        VkHashPrefix expected = vk_hash_prefix(vk_bytes);
        if (*prefix != expected) {
            GROTH16_DEBUG_COUT("[verifier] vk hash prefix " << to_hex(*prefix)
                               << " != " << to_hex(expected) << "\n");
            throw VkeyHashMismatchError();
        }
    }

    Fr program_tag = fr_from_bytes(vk_hash_tag);
    VerifyingKey vk = VerifyingKey::from_bytes(vk_bytes, config_.point_check);
    Proof proof = Proof::from_bytes(body, config_.point_check);

    GROTH16_IF_PROFILE {
        auto decoded = std::chrono::high_resolution_clock::now();
        std::cerr << "[verifier] decode: "
                  << std::chrono::duration<double, std::milli>(decoded - start).count() << " ms" << std::endl;
    }

    bool verified = false;
    for (HashFunction function : hash_candidates()) {
        std::vector<Fr> inputs = {program_tag, hash_to_fr(function, public_values)};
        GROTH16_DEBUG_COUT("[verifier] trying " << to_string(function)
                           << " public values digest, input " << bn254::to_string(inputs[1]) << "\n");
        if (pairing_check(vk, proof, inputs)) {
            verified = true;
            break;
        }
    }

    GROTH16_IF_PROFILE {
        auto end = std::chrono::high_resolution_clock::now();
        std::cerr << "[verifier] total: "
                  << std::chrono::duration<double, std::milli>(end - start).count() << " ms" << std::endl;
    }

    if (!verified) {
        throw ProofVerificationError();
    }
}

VerificationResult Groth16Verifier::try_verify(ByteSpan proof_bytes, ByteSpan public_values,
                                               ByteSpan vk_bytes, const Digest32& vk_hash_tag) const {
    try {
        verify(proof_bytes, public_values, vk_bytes, vk_hash_tag);
        return VerificationResult::ok();
    } catch (const Groth16Error& e) {
        GROTH16_DEBUG_PRINT("[verifier] %s: %s\n", to_string(e.kind()), e.what());
        return VerificationResult::error(e.kind(), e.what());
    }
}

void Groth16Verifier::verify_gnark_proof(ByteSpan proof_bytes, const std::vector<Digest32>& public_inputs,
                                         ByteSpan vk_bytes) const {
    if (config_.mode == VerifierMode::Mock) {
        std::cerr << "[verifier] WARNING: mock mode, accepting proof without verification" << std::endl;
        return;
    }

    Proof proof = Proof::from_bytes(proof_bytes, config_.point_check);
    VerifyingKey vk = VerifyingKey::from_bytes(vk_bytes, config_.point_check);

    std::vector<Fr> inputs;
    inputs.reserve(public_inputs.size());
    for (const auto& input : public_inputs) {
        inputs.push_back(fr_from_bytes(input));
    }
    verify_algebraic(vk, proof, inputs);
}

void verify_groth16(ByteSpan proof_bytes, ByteSpan public_values, ByteSpan vk_bytes,
                    const Digest32& vk_hash_tag) {
    Groth16Verifier().verify(proof_bytes, public_values, vk_bytes, vk_hash_tag);
}

} // namespace groth16
