// =============================================================================
// oligo-codec - Checksum Engine
// =============================================================================
// Fixed-width integrity codes used across the codec:
// - crc8:        oligo header field block (poly 0x07, init 0x00)
// - crc16Ccitt:  file manifest record (poly 0x1021, init 0xFFFF)
// - crc32:       chunk payload integrity before FEC (IEEE, via zlib)
// - fingerprint: whole-buffer content hash (xxHash64, seed 0)
//
// All functions are pure. Checksums only detect; correction policy belongs
// to the caller.
// =============================================================================

#ifndef OLIGO_ALGO_CHECKSUM_H
#define OLIGO_ALGO_CHECKSUM_H

#include <cstdint>
#include <span>
#include <string_view>

#include "oligo/common/types.h"

namespace oligo::algo {

/// @brief CRC-8 (x^8 + x^2 + x + 1), MSB-first, no final XOR.
[[nodiscard]] std::uint8_t crc8(std::span<const std::uint8_t> data) noexcept;

/// @brief CRC-16/CCITT-FALSE (x^16 + x^12 + x^5 + 1, init 0xFFFF).
[[nodiscard]] std::uint16_t crc16Ccitt(std::span<const std::uint8_t> data) noexcept;

/// @brief IEEE 802.3 CRC-32 as computed by zlib.
[[nodiscard]] std::uint32_t crc32(std::span<const std::uint8_t> data) noexcept;

/// @brief xxHash64 content fingerprint (seed 0).
[[nodiscard]] Fingerprint fingerprint(std::span<const std::uint8_t> data) noexcept;

/// @brief View a string's characters as bytes.
[[nodiscard]] inline std::span<const std::uint8_t> asBytes(std::string_view text) noexcept {
    return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

}  // namespace oligo::algo

#endif  // OLIGO_ALGO_CHECKSUM_H
