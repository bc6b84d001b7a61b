#pragma once

#include "codec/field_codec.hpp"
#include "curve/bn254.hpp"
#include <random>

namespace groth16 {
namespace test {

inline Bytes random_bytes(std::mt19937_64& rng, size_t size = 32) {
    Bytes bytes(size);
    for (auto& byte : bytes) {
        byte = static_cast<uint8_t>(rng());
    }
    return bytes;
}

// 32 random bytes reduced into the field
inline Fq random_fq(std::mt19937_64& rng) {
    return fq_from_bytes_mod_order(random_bytes(rng));
}

inline Fr random_fr(std::mt19937_64& rng) {
    return fr_from_bytes_mod_order(random_bytes(rng));
}

inline Fq2 random_fq2(std::mt19937_64& rng) {
    return bn254::make_fq2(random_fq(rng), random_fq(rng));
}

inline G1 random_g1(std::mt19937_64& rng) {
    return bn254::mul(bn254::g1_generator(), random_fr(rng));
}

inline G2 random_g2(std::mt19937_64& rng) {
    return bn254::mul(bn254::g2_generator(), random_fr(rng));
}

} // namespace test
} // namespace groth16
