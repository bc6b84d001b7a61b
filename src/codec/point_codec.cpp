#include "codec/point_codec.hpp"
#include "codec/field_codec.hpp"
#include "groth16/errors.hpp"
#include <cstdio>
#include <string>

namespace groth16 {

namespace {

void expect_length(ByteSpan bytes, size_t expected, const char* context) {
    if (bytes.size() != expected) {
        throw BufferLengthError(context, expected, bytes.size());
    }
}

std::string flag_hex(uint8_t flag) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02x", flag);
    return buf;
}

// Flag bits and the x bytes with the flag cleared
uint8_t split_flag(ByteSpan bytes, Bytes& x_bytes) {
    x_bytes = bytes.to_vector();
    uint8_t flag = x_bytes[0] & COMPRESSED_FLAG_MASK;
    x_bytes[0] &= static_cast<uint8_t>(~COMPRESSED_FLAG_MASK);
    return flag;
}

bool fq2_is_odd(const Fq2& value) {
    if (!value.b.isZero()) {
        return fq_is_odd(value.b);
    }
    return fq_is_odd(value.a);
}

uint8_t parity_tag_for_flag(uint8_t flag) {
    return flag == COMPRESSED_POSITIVE ? PARITY_TAG_EVEN : PARITY_TAG_ODD;
}

template <typename Field, typename IsOdd>
Field select_root(const std::pair<Field, Field>& roots, uint8_t flag, PointFormat format, IsOdd is_odd) {
    const auto& [smaller, larger] = roots;
    switch (format) {
        case PointFormat::Compressed:
            return flag == COMPRESSED_POSITIVE ? smaller : larger;
        case PointFormat::GnarkCompressed: {
            bool want_odd = parity_tag_for_flag(flag) == PARITY_TAG_ODD;
            return is_odd(smaller) == want_odd ? smaller : larger;
        }
        case PointFormat::Uncompressed:
            break;
    }
    throw InvalidDataError("uncompressed points carry no root selector");
}

void validate_g1(const G1& point, PointCheck check) {
    if (check == PointCheck::Unchecked) return;
    if (!bn254::is_on_curve(point)) {
        throw InvalidPointError("G1 point is not on the curve");
    }
}

void validate_g2(const G2& point, PointCheck check) {
    if (check == PointCheck::Unchecked) return;
    if (!bn254::is_on_curve(point)) {
        throw InvalidPointError("G2 point is not on the curve");
    }
    if (check == PointCheck::Full && !bn254::is_in_subgroup(point)) {
        throw InvalidPointError("G2 point is not in the prime-order subgroup");
    }
}

void append(Bytes& out, const uint8_t* data, size_t size) {
    out.insert(out.end(), data, data + size);
}

} // namespace

const char* to_string(PointFormat format) {
    switch (format) {
        case PointFormat::Uncompressed: return "uncompressed";
        case PointFormat::Compressed: return "compressed";
        case PointFormat::GnarkCompressed: return "gnark-compressed";
    }
    return "unknown";
}

const char* to_string(PointCheck check) {
    switch (check) {
        case PointCheck::Full: return "full";
        case PointCheck::CurveOnly: return "curve-only";
        case PointCheck::Unchecked: return "unchecked";
    }
    return "unknown";
}

size_t g1_encoded_size(PointFormat format) {
    return format == PointFormat::Uncompressed ? G1_UNCOMPRESSED_SIZE : G1_COMPRESSED_SIZE;
}

size_t g2_encoded_size(PointFormat format) {
    return format == PointFormat::Uncompressed ? G2_UNCOMPRESSED_SIZE : G2_COMPRESSED_SIZE;
}

bool PointCodec::fq2_lexicographically_less(const Fq2& a, const Fq2& b) {
    if (a.b != b.b) {
        return fq_less(a.b, b.b);
    }
    return fq_less(a.a, b.a);
}

std::pair<Fq, Fq> PointCodec::g1_ordered_roots(const Fq& x) {
    Fq y_squared = x * x * x + bn254::g1_coeff_b();
    auto y = bn254::sqrt(y_squared);
    if (!y) {
        throw InvalidPointError("x^3 + 3 has no square root in Fq");
    }
    Fq neg_y = bn254::neg(*y);
    if (fq_less(*y, neg_y)) {
        return {*y, neg_y};
    }
    return {neg_y, *y};
}

std::pair<Fq2, Fq2> PointCodec::g2_ordered_roots(const Fq2& x) {
    Fq2 y_squared = x * x * x + bn254::g2_coeff_b();
    auto y = bn254::sqrt(y_squared);
    if (!y) {
        throw InvalidPointError("x^3 + b2 has no square root in Fq2");
    }
    Fq2 neg_y = bn254::neg(*y);
    if (fq2_lexicographically_less(*y, neg_y)) {
        return {*y, neg_y};
    }
    return {neg_y, *y};
}

G1 PointCodec::decode_g1(ByteSpan bytes, PointFormat format, PointCheck check) {
    switch (format) {
        case PointFormat::Uncompressed: {
            expect_length(bytes, G1_UNCOMPRESSED_SIZE, "uncompressed G1");
            Fq x = fq_from_bytes(bytes.subspan(0, FQ_SIZE));
            Fq y = fq_from_bytes(bytes.subspan(FQ_SIZE, FQ_SIZE));
            G1 point = bn254::g1_from_affine(x, y);
            validate_g1(point, check);
            return point;
        }
        case PointFormat::Compressed:
        case PointFormat::GnarkCompressed: {
            expect_length(bytes, G1_COMPRESSED_SIZE, "compressed G1");
            Bytes x_bytes;
            uint8_t flag = split_flag(bytes, x_bytes);
            if (flag != COMPRESSED_POSITIVE && flag != COMPRESSED_NEGATIVE) {
                throw InvalidDataError("unsupported G1 compression flag " + flag_hex(flag));
            }
            Fq x = fq_from_bytes(x_bytes);
            Fq y = select_root(g1_ordered_roots(x), flag, format,
                               [](const Fq& v) { return fq_is_odd(v); });
            // On the curve by construction; G1 has cofactor one
            return bn254::g1_from_affine(x, y);
        }
    }
    throw InvalidDataError("unknown point format");
}

G2 PointCodec::decode_g2(ByteSpan bytes, PointFormat format, PointCheck check) {
    switch (format) {
        case PointFormat::Uncompressed: {
            expect_length(bytes, G2_UNCOMPRESSED_SIZE, "uncompressed G2");
            Fq2 x = fq2_from_bytes(bytes.subspan(0, FQ2_SIZE));
            Fq2 y = fq2_from_bytes(bytes.subspan(FQ2_SIZE, FQ2_SIZE));
            G2 point = bn254::g2_from_affine(x, y);
            validate_g2(point, check);
            return point;
        }
        case PointFormat::Compressed:
        case PointFormat::GnarkCompressed: {
            expect_length(bytes, G2_COMPRESSED_SIZE, "compressed G2");
            Bytes x_bytes;
            uint8_t flag = split_flag(bytes, x_bytes);
            if (flag == COMPRESSED_INFINITY) {
                return bn254::g2_identity();
            }
            if (flag != COMPRESSED_POSITIVE && flag != COMPRESSED_NEGATIVE) {
                throw InvalidDataError("unsupported G2 compression flag " + flag_hex(flag));
            }
            Fq2 x = fq2_from_bytes(x_bytes);
            Fq2 y = select_root(g2_ordered_roots(x), flag, format, fq2_is_odd);
            G2 point = bn254::g2_from_affine(x, y);
            validate_g2(point, check);
            return point;
        }
    }
    throw InvalidDataError("unknown point format");
}

Bytes PointCodec::encode_g1(const G1& point, PointFormat format) {
    auto affine = bn254::to_affine(point);
    if (!affine) {
        throw InvalidPointError("the G1 identity has no encoding");
    }
    auto x_bytes = fq_to_bytes(affine->x);

    Bytes out;
    out.reserve(g1_encoded_size(format));
    switch (format) {
        case PointFormat::Uncompressed: {
            auto y_bytes = fq_to_bytes(affine->y);
            append(out, x_bytes.data(), x_bytes.size());
            append(out, y_bytes.data(), y_bytes.size());
            return out;
        }
        case PointFormat::Compressed:
        case PointFormat::GnarkCompressed: {
            bool positive = format == PointFormat::Compressed
                ? fq_less(affine->y, bn254::neg(affine->y))
                : !fq_is_odd(affine->y);
            x_bytes[0] |= positive ? COMPRESSED_POSITIVE : COMPRESSED_NEGATIVE;
            append(out, x_bytes.data(), x_bytes.size());
            return out;
        }
    }
    throw InvalidDataError("unknown point format");
}

Bytes PointCodec::encode_g2(const G2& point, PointFormat format) {
    auto affine = bn254::to_affine(point);
    if (!affine) {
        if (format == PointFormat::Uncompressed) {
            throw InvalidPointError("the G2 identity has no uncompressed encoding");
        }
        Bytes out(G2_COMPRESSED_SIZE, 0);
        out[0] = COMPRESSED_INFINITY;
        return out;
    }
    auto x_bytes = fq2_to_bytes(affine->x);

    Bytes out;
    out.reserve(g2_encoded_size(format));
    switch (format) {
        case PointFormat::Uncompressed: {
            auto y_bytes = fq2_to_bytes(affine->y);
            append(out, x_bytes.data(), x_bytes.size());
            append(out, y_bytes.data(), y_bytes.size());
            return out;
        }
        case PointFormat::Compressed:
        case PointFormat::GnarkCompressed: {
            bool positive = format == PointFormat::Compressed
                ? fq2_lexicographically_less(affine->y, bn254::neg(affine->y))
                : !fq2_is_odd(affine->y);
            x_bytes[0] |= positive ? COMPRESSED_POSITIVE : COMPRESSED_NEGATIVE;
            append(out, x_bytes.data(), x_bytes.size());
            return out;
        }
    }
    throw InvalidDataError("unknown point format");
}

} // namespace groth16
