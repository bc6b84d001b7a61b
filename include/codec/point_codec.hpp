#pragma once

#include "common/bytes.hpp"
#include "curve/bn254.hpp"
#include <cstdint>
#include <utility>

namespace groth16 {

// Flag bits in the top two bits of the leading byte of a compressed point
constexpr uint8_t COMPRESSED_FLAG_MASK = 0b11 << 6;
constexpr uint8_t COMPRESSED_POSITIVE = 0b10 << 6;
constexpr uint8_t COMPRESSED_NEGATIVE = 0b11 << 6;
constexpr uint8_t COMPRESSED_INFINITY = 0b01 << 6;

// Tags of the bignum library's own compressed form: root parity
constexpr uint8_t PARITY_TAG_EVEN = 0x02;
constexpr uint8_t PARITY_TAG_ODD = 0x03;

constexpr size_t G1_COMPRESSED_SIZE = 32;
constexpr size_t G1_UNCOMPRESSED_SIZE = 64;
constexpr size_t G2_COMPRESSED_SIZE = 64;
constexpr size_t G2_UNCOMPRESSED_SIZE = 128;

/**
 * Wire layouts for curve points.
 *
 * Uncompressed    x || y (G2: x_imag || x_real || y_imag || y_real)
 * Compressed      x with flag bits; POSITIVE picks the smaller root
 *                 (G2 compares imaginary parts first, then real parts)
 * GnarkCompressed same bytes as Compressed, but the flag is translated to
 *                 the bignum library's parity tag: POSITIVE -> even root,
 *                 NEGATIVE -> odd root (G2: parity of the imaginary part,
 *                 or of the real part when the imaginary part is zero)
 */
enum class PointFormat {
    Uncompressed,
    Compressed,
    GnarkCompressed,
};

/**
 * How much validation a decoded point receives.
 *
 * Full       curve equation, plus prime-order subgroup membership for G2
 * CurveOnly  curve equation only
 * Unchecked  nothing beyond what decompression implies; uncompressed input
 *            is accepted as-is. Only for inputs validated elsewhere.
 */
enum class PointCheck {
    Full,
    CurveOnly,
    Unchecked,
};

const char* to_string(PointFormat format);
const char* to_string(PointCheck check);

size_t g1_encoded_size(PointFormat format);
size_t g2_encoded_size(PointFormat format);

/**
 * PointCodec - G1/G2 <-> bytes
 *
 * Decoding runs flag extraction, coordinate recovery, then point construction
 * and validation. Errors: BufferLengthError (wrong size), InvalidDataError
 * (flag bits), FieldError (coordinate >= p), InvalidPointError (no root,
 * off curve, outside the subgroup, identity where none is allowed).
 */
class PointCodec {
public:
    static G1 decode_g1(ByteSpan bytes, PointFormat format, PointCheck check = PointCheck::Full);
    static G2 decode_g2(ByteSpan bytes, PointFormat format, PointCheck check = PointCheck::Full);

    // The G1 identity has no encoding; the G2 identity only has a compressed one
    static Bytes encode_g1(const G1& point, PointFormat format);
    static Bytes encode_g2(const G2& point, PointFormat format);

    // Both roots of y^2 = x^3 + b ordered (smaller, larger); InvalidPointError if none
    static std::pair<Fq, Fq> g1_ordered_roots(const Fq& x);
    static std::pair<Fq2, Fq2> g2_ordered_roots(const Fq2& x);

    // Imaginary parts first, then real parts
    static bool fq2_lexicographically_less(const Fq2& a, const Fq2& b);
};

} // namespace groth16
