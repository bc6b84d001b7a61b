#include "codec/field_codec.hpp"
#include "codec/hex.hpp"
#include "groth16/errors.hpp"
#include <algorithm>
#include <string>

namespace groth16 {

namespace {

// Big-endian moduli
const FieldBytes FQ_MODULUS = {
    0x30, 0x64, 0x4e, 0x72, 0xe1, 0x31, 0xa0, 0x29, 0xb8, 0x50, 0x45, 0xb6, 0x81, 0x81, 0x58, 0x5d,
    0x97, 0x81, 0x6a, 0x91, 0x68, 0x71, 0xca, 0x8d, 0x3c, 0x20, 0x8c, 0x16, 0xd8, 0x7c, 0xfd, 0x47};

const FieldBytes FR_MODULUS = {
    0x30, 0x64, 0x4e, 0x72, 0xe1, 0x31, 0xa0, 0x29, 0xb8, 0x50, 0x45, 0xb6, 0x81, 0x81, 0x58, 0x5d,
    0x28, 0x33, 0xe8, 0x48, 0x79, 0xb9, 0x70, 0x91, 0x43, 0xe1, 0xf5, 0x93, 0xf0, 0x00, 0x00, 0x01};

template <typename Field>
Field strict_from_bytes(ByteSpan bytes, const FieldBytes& modulus, const char* name) {
    bn254::init();
    if (bytes.size() != FQ_SIZE) {
        throw FieldError(std::string(name) + " encoding must be 32 bytes, got " + std::to_string(bytes.size()));
    }
    if (!std::lexicographical_compare(bytes.begin(), bytes.end(), modulus.begin(), modulus.end())) {
        throw FieldError(std::string(name) + " element is not less than the modulus");
    }
    Field value;
    bool ok = false;
    value.setStr(&ok, to_hex(bytes).c_str(), 16);
    if (!ok) {
        throw FieldError(std::string(name) + " element rejected: " + to_hex(bytes));
    }
    return value;
}

template <typename Field>
Field reduce_from_bytes(ByteSpan bytes) {
    bn254::init();
    // Horner evaluation in base 256
    const Field radix(256);
    Field acc(0);
    for (uint8_t byte : bytes) {
        acc = acc * radix + Field(byte);
    }
    return acc;
}

template <typename Field>
FieldBytes to_bytes(const Field& value) {
    Bytes decoded = from_hex(bn254::to_string(value));
    FieldBytes out;
    std::copy(decoded.begin(), decoded.end(), out.begin());
    return out;
}

} // namespace

Fq fq_from_bytes(ByteSpan bytes) {
    return strict_from_bytes<Fq>(bytes, FQ_MODULUS, "Fq");
}

FieldBytes fq_to_bytes(const Fq& value) {
    return to_bytes(value);
}

Fq fq_from_bytes_mod_order(ByteSpan bytes) {
    return reduce_from_bytes<Fq>(bytes);
}

Fr fr_from_bytes(ByteSpan bytes) {
    return strict_from_bytes<Fr>(bytes, FR_MODULUS, "Fr");
}

FieldBytes fr_to_bytes(const Fr& value) {
    return to_bytes(value);
}

Fr fr_from_bytes_mod_order(ByteSpan bytes) {
    return reduce_from_bytes<Fr>(bytes);
}

Fq2 fq2_from_bytes(ByteSpan bytes) {
    if (bytes.size() != FQ2_SIZE) {
        throw FieldError("Fq2 encoding must be 64 bytes, got " + std::to_string(bytes.size()));
    }
    Fq imaginary = fq_from_bytes(bytes.subspan(0, FQ_SIZE));
    Fq real = fq_from_bytes(bytes.subspan(FQ_SIZE, FQ_SIZE));
    return bn254::make_fq2(real, imaginary);
}

std::array<uint8_t, FQ2_SIZE> fq2_to_bytes(const Fq2& value) {
    FieldBytes imaginary = fq_to_bytes(value.b);
    FieldBytes real = fq_to_bytes(value.a);
    std::array<uint8_t, FQ2_SIZE> out;
    std::copy(imaginary.begin(), imaginary.end(), out.begin());
    std::copy(real.begin(), real.end(), out.begin() + FQ_SIZE);
    return out;
}

bool fq_less(const Fq& a, const Fq& b) {
    return fq_to_bytes(a) < fq_to_bytes(b);
}

bool fq_is_odd(const Fq& value) {
    return (fq_to_bytes(value)[FQ_SIZE - 1] & 1) != 0;
}

} // namespace groth16
