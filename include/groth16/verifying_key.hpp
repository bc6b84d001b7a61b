#pragma once

#include "codec/point_codec.hpp"
#include "common/bytes.hpp"
#include "curve/bn254.hpp"
#include <optional>
#include <vector>

namespace groth16 {

/**
 * Serialized verifying key layouts. All points use the lexicographic
 * compressed form or the uncompressed form; the K count is a big-endian u32
 * followed by the K points.
 *
 *   Compressed    alpha | beta | gamma | delta | num_k            header 228
 *   GnarkPadded   alpha | pad32 | beta | gamma | pad32 | delta | num_k   header 292
 *   Uncompressed  alpha | beta | gamma | delta | num_k            header 452
 */
enum class VkLayout {
    Compressed,
    GnarkPadded,
    Uncompressed,
};

const char* to_string(VkLayout layout);

struct VkLayoutInfo {
    PointFormat point_format;
    size_t alpha_offset;
    size_t beta_offset;
    size_t gamma_offset;
    size_t delta_offset;
    size_t num_k_offset;
    size_t header_size;
    size_t k_point_size;
};

const VkLayoutInfo& layout_info(VkLayout layout);

/**
 * VerifyingKey - Groth16 verifying key
 *
 * beta() holds the NEGATION of the encoded beta point, ready for the pairing
 * product; to_bytes() negates it back. k()[0] is the constant term and
 * k().size() == num_public_inputs() + 1.
 */
class VerifyingKey {
public:
    // beta as it appears on the wire
    static VerifyingKey from_points(const G1& alpha, const G2& beta, const G2& gamma,
                                    const G2& delta, std::vector<G1> k);

    static VerifyingKey from_bytes(ByteSpan bytes, VkLayout layout, PointCheck check = PointCheck::Full);

    // Layout from the length rule, tried GnarkPadded, Uncompressed, Compressed
    static VerifyingKey from_bytes(ByteSpan bytes, PointCheck check = PointCheck::Full);
    static std::optional<VkLayout> detect_layout(ByteSpan bytes);

    Bytes to_bytes(VkLayout layout) const;

    const G1& alpha() const { return alpha_; }
    const G2& beta() const { return beta_; }
    const G2& gamma() const { return gamma_; }
    const G2& delta() const { return delta_; }
    const std::vector<G1>& k() const { return k_; }

    G2 beta_wire() const { return bn254::neg(beta_); }
    size_t num_public_inputs() const { return k_.empty() ? 0 : k_.size() - 1; }

    bool operator==(const VerifyingKey& rhs) const;
    bool operator!=(const VerifyingKey& rhs) const { return !(*this == rhs); }

private:
    G1 alpha_;
    G2 beta_;
    G2 gamma_;
    G2 delta_;
    std::vector<G1> k_;
};

} // namespace groth16
