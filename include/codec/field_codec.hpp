#pragma once

#include "common/bytes.hpp"
#include "curve/bn254.hpp"
#include <array>

namespace groth16 {

constexpr size_t FQ_SIZE = 32;
constexpr size_t FQ2_SIZE = 2 * FQ_SIZE;
constexpr size_t FR_SIZE = 32;

using FieldBytes = std::array<uint8_t, FQ_SIZE>;

/**
 * Big-endian field element encoding.
 *
 * The *_from_bytes decoders are strict: exactly 32 bytes and a value below the
 * modulus, otherwise FieldError. The *_mod_order variants accept any length
 * and reduce, and never fail.
 */
Fq fq_from_bytes(ByteSpan bytes);
FieldBytes fq_to_bytes(const Fq& value);
Fq fq_from_bytes_mod_order(ByteSpan bytes);

Fr fr_from_bytes(ByteSpan bytes);
FieldBytes fr_to_bytes(const Fr& value);
Fr fr_from_bytes_mod_order(ByteSpan bytes);

// Imaginary part first, then real part
Fq2 fq2_from_bytes(ByteSpan bytes);
std::array<uint8_t, FQ2_SIZE> fq2_to_bytes(const Fq2& value);

// Order and parity of the canonical integer representative
bool fq_less(const Fq& a, const Fq& b);
bool fq_is_odd(const Fq& value);

} // namespace groth16
