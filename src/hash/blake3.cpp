#include "hash/blake3.hpp"
#include <blake3.h>

namespace groth16 {

static_assert(Blake3::DIGEST_SIZE == BLAKE3_OUT_LEN, "libblake3 default output length changed");

Digest32 Blake3::hash(ByteSpan input) {
    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, input.data(), input.size());

    Digest32 digest{};
    blake3_hasher_finalize(&hasher, digest.data(), digest.size());
    return digest;
}

} // namespace groth16
