#pragma once

/// \file crc32c.hpp
/// \brief CRC32C (Castagnoli) and the masked form stored in record frames.

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace terf {

/// Constant added to the rotated checksum when masking.
inline constexpr std::uint32_t kMaskDelta = 0xa282ead8u;

namespace detail {

// Reflected Castagnoli polynomial.
inline constexpr std::uint32_t kCrc32cPoly = 0x82f63b78u;

inline const std::array<std::uint32_t, 256>& crc32c_table() {
    static const std::array<std::uint32_t, 256> table = [] {
        std::array<std::uint32_t, 256> t{};
        for (std::uint32_t i = 0; i < 256; ++i) {
            std::uint32_t c = i;
            for (int k = 0; k < 8; ++k)
                c = (c & 1u) ? (c >> 1) ^ kCrc32cPoly : c >> 1;
            t[i] = c;
        }
        return t;
    }();
    return table;
}

} // namespace detail

/// Extend \p crc with \p size bytes starting at \p data.
inline std::uint32_t crc32c_extend(std::uint32_t crc, const void* data, std::size_t size) {
    const auto& table = detail::crc32c_table();
    const auto* p = static_cast<const unsigned char*>(data);
    crc = ~crc;
    for (std::size_t i = 0; i < size; ++i)
        crc = table[(crc ^ p[i]) & 0xffu] ^ (crc >> 8);
    return ~crc;
}

inline std::uint32_t crc32c(const void* data, std::size_t size) {
    return crc32c_extend(0, data, size);
}

inline std::uint32_t crc32c(std::string_view bytes) { return crc32c(bytes.data(), bytes.size()); }

/// Rotate right by 15 bits and add the mask delta.
inline constexpr std::uint32_t mask_crc(std::uint32_t crc) {
    return ((crc >> 15) | (crc << 17)) + kMaskDelta;
}

/// Inverse of @ref mask_crc.
inline constexpr std::uint32_t unmask_crc(std::uint32_t masked) {
    std::uint32_t rot = masked - kMaskDelta;
    return (rot >> 17) | (rot << 15);
}

inline std::uint32_t masked_crc32c(const void* data, std::size_t size) {
    return mask_crc(crc32c(data, size));
}

} // namespace terf
