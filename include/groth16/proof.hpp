#pragma once

#include "codec/point_codec.hpp"
#include "common/bytes.hpp"
#include "curve/bn254.hpp"
#include <array>
#include <optional>
#include <utility>

namespace groth16 {

constexpr size_t PROOF_UNCOMPRESSED_SIZE = G1_UNCOMPRESSED_SIZE + G2_UNCOMPRESSED_SIZE + G1_UNCOMPRESSED_SIZE;
constexpr size_t PROOF_COMPRESSED_SIZE = G1_COMPRESSED_SIZE + G2_COMPRESSED_SIZE + G1_COMPRESSED_SIZE;

// First bytes of SHA-256(vk_bytes), optionally prepended to a proof
constexpr size_t VK_HASH_PREFIX_SIZE = 4;
using VkHashPrefix = std::array<uint8_t, VK_HASH_PREFIX_SIZE>;

/**
 * Proof - Groth16 proof (A, B, C), named ar / bs / krs after the prover's
 * blinding terms. Layout is ar | bs | krs in a single point format.
 */
class Proof {
public:
    Proof() = default;
    Proof(const G1& ar, const G2& bs, const G1& krs) : ar_(ar), bs_(bs), krs_(krs) {}

    static Proof from_bytes(ByteSpan bytes, PointFormat format, PointCheck check = PointCheck::Full);

    // 256 bytes -> Uncompressed, 128 bytes -> Compressed, else BufferLengthError
    static Proof from_bytes(ByteSpan bytes, PointCheck check = PointCheck::Full);

    Bytes to_bytes(PointFormat format) const;

    const G1& ar() const { return ar_; }
    const G2& bs() const { return bs_; }
    const G1& krs() const { return krs_; }

    bool operator==(const Proof& rhs) const { return ar_ == rhs.ar_ && bs_ == rhs.bs_ && krs_ == rhs.krs_; }
    bool operator!=(const Proof& rhs) const { return !(*this == rhs); }

private:
    G1 ar_;
    G2 bs_;
    G1 krs_;
};

/**
 * Separate an optional vk-hash prefix from proof bytes. A 260- or 132-byte
 * buffer carries a prefix; any other length is returned unchanged.
 */
std::pair<std::optional<VkHashPrefix>, ByteSpan> split_vk_hash_prefix(ByteSpan proof_bytes);

// SHA-256(vk_bytes)[0..4]
VkHashPrefix vk_hash_prefix(ByteSpan vk_bytes);

} // namespace groth16
