#include "hash/hash_to_field.hpp"
#include "codec/field_codec.hpp"
#include "hash/blake3.hpp"
#include "hash/sha256.hpp"
#include <stdexcept>

namespace groth16 {

namespace {

constexpr uint8_t TOP_BYTE_MASK = 0x1F;

} // namespace

const char* to_string(HashFunction function) {
    switch (function) {
        case HashFunction::Sha256: return "sha256";
        case HashFunction::Blake3: return "blake3";
    }
    return "unknown";
}

Digest32 hash_bytes(HashFunction function, ByteSpan input) {
    switch (function) {
        case HashFunction::Sha256: return Sha256::hash(input);
        case HashFunction::Blake3: return Blake3::hash(input);
    }
    throw std::invalid_argument("unknown hash function");
}

Digest32 hash_public_inputs(HashFunction function, ByteSpan public_values) {
    Digest32 digest = hash_bytes(function, public_values);
    digest[0] &= TOP_BYTE_MASK;
    return digest;
}

Fr hash_to_fr(HashFunction function, ByteSpan public_values) {
    // Masked digest is < 2^253 < r, so the strict decoder cannot fail
    return fr_from_bytes(hash_public_inputs(function, public_values));
}

} // namespace groth16
