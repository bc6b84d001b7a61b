#pragma once

#include "common/bytes.hpp"
#include <string>

namespace groth16 {

// Lowercase, no prefix
std::string to_hex(ByteSpan bytes);

// Accepts an optional 0x prefix and either case; InvalidDataError otherwise
Bytes from_hex(const std::string& hex);

// from_hex for exactly 32 bytes (hash tags); BufferLengthError on other sizes
Digest32 digest_from_hex(const std::string& hex);

} // namespace groth16
