#include "groth16/proof.hpp"
#include "groth16/errors.hpp"
#include "hash/sha256.hpp"
#include <algorithm>

namespace groth16 {

Proof Proof::from_bytes(ByteSpan bytes, PointFormat format, PointCheck check) {
    const size_t g1_size = g1_encoded_size(format);
    const size_t g2_size = g2_encoded_size(format);
    const size_t expected = 2 * g1_size + g2_size;
    if (bytes.size() != expected) {
        throw BufferLengthError(std::string(to_string(format)) + " proof", expected, bytes.size());
    }

    G1 ar = PointCodec::decode_g1(bytes.subspan(0, g1_size), format, check);
    G2 bs = PointCodec::decode_g2(bytes.subspan(g1_size, g2_size), format, check);
    G1 krs = PointCodec::decode_g1(bytes.subspan(g1_size + g2_size, g1_size), format, check);
    return Proof(ar, bs, krs);
}

Proof Proof::from_bytes(ByteSpan bytes, PointCheck check) {
    switch (bytes.size()) {
        case PROOF_UNCOMPRESSED_SIZE:
            return from_bytes(bytes, PointFormat::Uncompressed, check);
        case PROOF_COMPRESSED_SIZE:
            return from_bytes(bytes, PointFormat::Compressed, check);
        default:
            throw BufferLengthError("proof", PROOF_UNCOMPRESSED_SIZE, bytes.size());
    }
}

Bytes Proof::to_bytes(PointFormat format) const {
    Bytes out = PointCodec::encode_g1(ar_, format);
    Bytes bs = PointCodec::encode_g2(bs_, format);
    Bytes krs = PointCodec::encode_g1(krs_, format);
    out.insert(out.end(), bs.begin(), bs.end());
    out.insert(out.end(), krs.begin(), krs.end());
    return out;
}

std::pair<std::optional<VkHashPrefix>, ByteSpan> split_vk_hash_prefix(ByteSpan proof_bytes) {
    if (proof_bytes.size() != PROOF_UNCOMPRESSED_SIZE + VK_HASH_PREFIX_SIZE &&
        proof_bytes.size() != PROOF_COMPRESSED_SIZE + VK_HASH_PREFIX_SIZE) {
        return {std::nullopt, proof_bytes};
    }
    VkHashPrefix prefix;
    std::copy(proof_bytes.begin(), proof_bytes.begin() + VK_HASH_PREFIX_SIZE, prefix.begin());
    return {prefix, proof_bytes.subspan(VK_HASH_PREFIX_SIZE, proof_bytes.size() - VK_HASH_PREFIX_SIZE)};
}

VkHashPrefix vk_hash_prefix(ByteSpan vk_bytes) {
    Digest32 digest = Sha256::hash(vk_bytes);
    VkHashPrefix prefix;
    std::copy(digest.begin(), digest.begin() + VK_HASH_PREFIX_SIZE, prefix.begin());
    return prefix;
}

} // namespace groth16
