#pragma once

#include "common/bytes.hpp"

namespace groth16 {

/**
 * BLAKE3 in its default (unkeyed) hash mode with a 32-byte output, computed
 * by the reference C implementation (libblake3).
 */
class Blake3 {
public:
    static constexpr size_t DIGEST_SIZE = 32;

    static Digest32 hash(ByteSpan input);
};

} // namespace groth16
