#pragma once

#include "common/bytes.hpp"
#include "curve/bn254.hpp"

namespace groth16 {

enum class HashFunction {
    Sha256,
    Blake3,
};

const char* to_string(HashFunction function);

Digest32 hash_bytes(HashFunction function, ByteSpan input);

/**
 * Digest of the public values with the top three bits of the first
 * (most significant) byte cleared, so the big-endian value is below 2^253
 * and therefore below r.
 */
Digest32 hash_public_inputs(HashFunction function, ByteSpan public_values);

// hash_public_inputs interpreted as a big-endian Fr element
Fr hash_to_fr(HashFunction function, ByteSpan public_values);

inline Fr sha256_to_fr(ByteSpan public_values) { return hash_to_fr(HashFunction::Sha256, public_values); }
inline Fr blake3_to_fr(ByteSpan public_values) { return hash_to_fr(HashFunction::Blake3, public_values); }

} // namespace groth16
