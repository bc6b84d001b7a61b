#include "groth16/verifying_key.hpp"
#include "common/debug_control.hpp"
#include "groth16/errors.hpp"
#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>

namespace groth16 {

namespace {

const VkLayoutInfo COMPRESSED_INFO = {
    PointFormat::Compressed, 0, 32, 96, 160, 224, 228, G1_COMPRESSED_SIZE
};

const VkLayoutInfo GNARK_PADDED_INFO = {
    PointFormat::Compressed, 0, 64, 128, 224, 288, 292, G1_COMPRESSED_SIZE
};

const VkLayoutInfo UNCOMPRESSED_INFO = {
    PointFormat::Uncompressed, 0, 64, 192, 320, 448, 452, G1_UNCOMPRESSED_SIZE
};

const std::array<VkLayout, 3> DETECTION_ORDER = {
    VkLayout::GnarkPadded, VkLayout::Uncompressed, VkLayout::Compressed
};

uint32_t read_u32_be(ByteSpan bytes, size_t offset) {
    return (static_cast<uint32_t>(bytes[offset]) << 24)
         | (static_cast<uint32_t>(bytes[offset + 1]) << 16)
         | (static_cast<uint32_t>(bytes[offset + 2]) << 8)
         | static_cast<uint32_t>(bytes[offset + 3]);
}

void write_u32_be(Bytes& out, size_t offset, uint32_t value) {
    out[offset] = static_cast<uint8_t>(value >> 24);
    out[offset + 1] = static_cast<uint8_t>(value >> 16);
    out[offset + 2] = static_cast<uint8_t>(value >> 8);
    out[offset + 3] = static_cast<uint8_t>(value);
}

// Total size implied by the num_k field, or nullopt if the header is short
std::optional<size_t> expected_size(ByteSpan bytes, const VkLayoutInfo& info) {
    if (bytes.size() < info.header_size) {
        return std::nullopt;
    }
    size_t num_k = read_u32_be(bytes, info.num_k_offset);
    return info.header_size + num_k * info.k_point_size;
}

void write_at(Bytes& out, size_t offset, const Bytes& encoded) {
    std::copy(encoded.begin(), encoded.end(), out.begin() + offset);
}

} // namespace

const char* to_string(VkLayout layout) {
    switch (layout) {
        case VkLayout::Compressed: return "compressed";
        case VkLayout::GnarkPadded: return "gnark-padded";
        case VkLayout::Uncompressed: return "uncompressed";
    }
    return "unknown";
}

const VkLayoutInfo& layout_info(VkLayout layout) {
    switch (layout) {
        case VkLayout::Compressed: return COMPRESSED_INFO;
        case VkLayout::GnarkPadded: return GNARK_PADDED_INFO;
        case VkLayout::Uncompressed: return UNCOMPRESSED_INFO;
    }
    throw std::invalid_argument("unknown verifying key layout");
}

VerifyingKey VerifyingKey::from_points(const G1& alpha, const G2& beta, const G2& gamma,
                                       const G2& delta, std::vector<G1> k) {
    VerifyingKey vk;
    vk.alpha_ = alpha;
    vk.beta_ = bn254::neg(beta);
    vk.gamma_ = gamma;
    vk.delta_ = delta;
    vk.k_ = std::move(k);
    return vk;
}

VerifyingKey VerifyingKey::from_bytes(ByteSpan bytes, VkLayout layout, PointCheck check) {
    const VkLayoutInfo& info = layout_info(layout);
    const std::string context = std::string(to_string(layout)) + " verifying key";

    if (bytes.size() < info.header_size) {
        throw BufferLengthError(context + " header", info.header_size, bytes.size());
    }
    size_t num_k = read_u32_be(bytes, info.num_k_offset);
    size_t expected = info.header_size + num_k * info.k_point_size;
    if (bytes.size() != expected) {
        throw BufferLengthError(context, expected, bytes.size());
    }

    const size_t g1_size = g1_encoded_size(info.point_format);
    const size_t g2_size = g2_encoded_size(info.point_format);

    // Padding slots are skipped, never validated
    G1 alpha = PointCodec::decode_g1(bytes.subspan(info.alpha_offset, g1_size), info.point_format, check);
    G2 beta = PointCodec::decode_g2(bytes.subspan(info.beta_offset, g2_size), info.point_format, check);
    G2 gamma = PointCodec::decode_g2(bytes.subspan(info.gamma_offset, g2_size), info.point_format, check);
    G2 delta = PointCodec::decode_g2(bytes.subspan(info.delta_offset, g2_size), info.point_format, check);

    std::vector<G1> k;
    k.reserve(num_k);
    size_t offset = info.header_size;
    for (size_t i = 0; i < num_k; ++i) {
        k.push_back(PointCodec::decode_g1(bytes.subspan(offset, info.k_point_size), info.point_format, check));
        offset += info.k_point_size;
    }

    GROTH16_DEBUG_PRINT("[vk] decoded %s layout: %zu K points, point check %s\n",
                        to_string(layout), num_k, to_string(check));

    return from_points(alpha, beta, gamma, delta, std::move(k));
}

std::optional<VkLayout> VerifyingKey::detect_layout(ByteSpan bytes) {
    for (VkLayout layout : DETECTION_ORDER) {
        auto expected = expected_size(bytes, layout_info(layout));
        if (expected && *expected == bytes.size()) {
            return layout;
        }
    }
    return std::nullopt;
}

VerifyingKey VerifyingKey::from_bytes(ByteSpan bytes, PointCheck check) {
    auto layout = detect_layout(bytes);
    if (!layout) {
        const VkLayoutInfo& gnark = layout_info(VkLayout::GnarkPadded);
        size_t expected = expected_size(bytes, gnark).value_or(gnark.header_size);
        throw BufferLengthError("gnark-padded verifying key", expected, bytes.size());
    }
    return from_bytes(bytes, *layout, check);
}

Bytes VerifyingKey::to_bytes(VkLayout layout) const {
    const VkLayoutInfo& info = layout_info(layout);
    Bytes out(info.header_size + k_.size() * info.k_point_size, 0);

    write_at(out, info.alpha_offset, PointCodec::encode_g1(alpha_, info.point_format));
    write_at(out, info.beta_offset, PointCodec::encode_g2(beta_wire(), info.point_format));
    write_at(out, info.gamma_offset, PointCodec::encode_g2(gamma_, info.point_format));
    write_at(out, info.delta_offset, PointCodec::encode_g2(delta_, info.point_format));
    write_u32_be(out, info.num_k_offset, static_cast<uint32_t>(k_.size()));

    size_t offset = info.header_size;
    for (const auto& point : k_) {
        write_at(out, offset, PointCodec::encode_g1(point, info.point_format));
        offset += info.k_point_size;
    }
    return out;
}

bool VerifyingKey::operator==(const VerifyingKey& rhs) const {
    return alpha_ == rhs.alpha_ && beta_ == rhs.beta_ && gamma_ == rhs.gamma_ &&
           delta_ == rhs.delta_ && k_ == rhs.k_;
}

} // namespace groth16
