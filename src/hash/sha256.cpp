#include "hash/sha256.hpp"
#include <openssl/evp.h>
#include <stdexcept>

namespace groth16 {

Digest32 Sha256::hash(ByteSpan input) {
    Digest32 digest{};
    unsigned int digest_len = 0;
    if (EVP_Digest(input.data(), input.size(), digest.data(), &digest_len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(sha256) failed");
    }
    if (digest_len != DIGEST_SIZE) {
        throw std::runtime_error("EVP_Digest(sha256) returned " + std::to_string(digest_len) + " bytes");
    }
    return digest;
}

} // namespace groth16
