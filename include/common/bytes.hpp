#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace groth16 {

using Bytes = std::vector<uint8_t>;

// 256-bit digest (SHA-256, BLAKE3) and 32-byte hash tags
using Digest32 = std::array<uint8_t, 32>;

/**
 * ByteSpan - non-owning view over a contiguous byte buffer.
 *
 * All decoders take a ByteSpan so callers can pass vectors, fixed arrays or
 * slices of a larger buffer without copying.
 */
class ByteSpan {
public:
    constexpr ByteSpan() : data_(nullptr), size_(0) {}
    constexpr ByteSpan(const uint8_t* data, size_t size) : data_(data), size_(size) {}
    ByteSpan(const Bytes& bytes) : data_(bytes.data()), size_(bytes.size()) {}
    template <size_t N>
    ByteSpan(const std::array<uint8_t, N>& bytes) : data_(bytes.data()), size_(N) {}

    constexpr const uint8_t* data() const { return data_; }
    constexpr size_t size() const { return size_; }
    constexpr bool empty() const { return size_ == 0; }

    const uint8_t* begin() const { return data_; }
    const uint8_t* end() const { return data_ + size_; }

    uint8_t operator[](size_t i) const { return data_[i]; }

    // Throws std::out_of_range if [offset, offset + count) exceeds the view
    ByteSpan subspan(size_t offset, size_t count) const {
        if (offset > size_ || count > size_ - offset) {
            throw std::out_of_range("ByteSpan::subspan out of range");
        }
        return ByteSpan(data_ + offset, count);
    }

    Bytes to_vector() const { return Bytes(begin(), end()); }

private:
    const uint8_t* data_;
    size_t size_;
};

} // namespace groth16
