// =============================================================================
// oligo-codec - Checksum Engine Implementation
// =============================================================================

#include "oligo/algo/checksum.h"

#include <algorithm>
#include <array>

#include <xxhash.h>
#include <zlib.h>

namespace oligo::algo {

namespace {

constexpr std::array<std::uint8_t, 256> makeCrc8Table() noexcept {
    std::array<std::uint8_t, 256> table{};
    for (unsigned i = 0; i < 256; ++i) {
        auto crc = static_cast<std::uint8_t>(i);
        for (int bit = 0; bit < 8; ++bit) {
            crc = (crc & 0x80U) != 0 ? static_cast<std::uint8_t>((crc << 1) ^ 0x07U)
                                     : static_cast<std::uint8_t>(crc << 1);
        }
        table[i] = crc;
    }
    return table;
}

constexpr std::array<std::uint16_t, 256> makeCrc16Table() noexcept {
    std::array<std::uint16_t, 256> table{};
    for (unsigned i = 0; i < 256; ++i) {
        auto crc = static_cast<std::uint16_t>(i << 8);
        for (int bit = 0; bit < 8; ++bit) {
            crc = (crc & 0x8000U) != 0 ? static_cast<std::uint16_t>((crc << 1) ^ 0x1021U)
                                       : static_cast<std::uint16_t>(crc << 1);
        }
        table[i] = crc;
    }
    return table;
}

constexpr auto kCrc8Table = makeCrc8Table();
constexpr auto kCrc16Table = makeCrc16Table();

}  // namespace

std::uint8_t crc8(std::span<const std::uint8_t> data) noexcept {
    std::uint8_t crc = 0;
    for (std::uint8_t byte : data) {
        crc = kCrc8Table[crc ^ byte];
    }
    return crc;
}

std::uint16_t crc16Ccitt(std::span<const std::uint8_t> data) noexcept {
    std::uint16_t crc = 0xFFFF;
    for (std::uint8_t byte : data) {
        crc = static_cast<std::uint16_t>((crc << 8) ^ kCrc16Table[((crc >> 8) ^ byte) & 0xFFU]);
    }
    return crc;
}

std::uint32_t crc32(std::span<const std::uint8_t> data) noexcept {
    uLong crc = ::crc32(0L, Z_NULL, 0);
    // zlib takes uInt lengths; feed large buffers in pieces
    constexpr std::size_t kMaxPiece = 1U << 30;
    std::size_t offset = 0;
    while (offset < data.size()) {
        const std::size_t piece = std::min(kMaxPiece, data.size() - offset);
        crc = ::crc32(crc, data.data() + offset, static_cast<uInt>(piece));
        offset += piece;
    }
    return static_cast<std::uint32_t>(crc);
}

Fingerprint fingerprint(std::span<const std::uint8_t> data) noexcept {
    return static_cast<Fingerprint>(XXH64(data.data(), data.size(), 0));
}

}  // namespace oligo::algo
