#pragma once

#include "common/bytes.hpp"

namespace groth16 {

/**
 * SHA-256 via OpenSSL's EVP interface.
 *
 * Throws std::runtime_error if the digest context fails; that only happens
 * when the OpenSSL runtime itself is broken.
 */
class Sha256 {
public:
    static constexpr size_t DIGEST_SIZE = 32;

    static Digest32 hash(ByteSpan input);
};

} // namespace groth16
