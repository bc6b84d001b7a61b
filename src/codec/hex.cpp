#include "codec/hex.hpp"
#include "groth16/errors.hpp"
#include <algorithm>

namespace groth16 {

namespace {

int nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string to_hex(ByteSpan bytes) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

Bytes from_hex(const std::string& hex) {
    size_t start = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        start = 2;
    }
    if ((hex.size() - start) % 2 != 0) {
        throw InvalidDataError("hex string has odd length " + std::to_string(hex.size() - start));
    }

    Bytes out;
    out.reserve((hex.size() - start) / 2);
    for (size_t i = start; i < hex.size(); i += 2) {
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw InvalidDataError("invalid hex digit at offset " + std::to_string(hi < 0 ? i : i + 1));
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

Digest32 digest_from_hex(const std::string& hex) {
    Bytes bytes = from_hex(hex);
    Digest32 out;
    if (bytes.size() != out.size()) {
        throw BufferLengthError("32-byte hex value", out.size(), bytes.size());
    }
    std::copy(bytes.begin(), bytes.end(), out.begin());
    return out;
}

} // namespace groth16
