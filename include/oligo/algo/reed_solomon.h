// =============================================================================
// oligo-codec - Reed-Solomon FEC Coder
// =============================================================================
// Systematic Reed-Solomon code over GF(256):
// - Field: primitive polynomial x^8 + x^4 + x^3 + x^2 + 1 (0x11D)
// - Generator element alpha = 2, first consecutive root alpha^0
// - Codeword = message || parity, at most 255 symbols
//
// Decoding corrects any combination of k substituted symbols and e erased
// symbols (positions known in advance) with 2k + e <= nsym. Beyond that bound
// decoding fails with kUncorrectableErrorBurst rather than guessing.
// =============================================================================

#ifndef OLIGO_ALGO_REED_SOLOMON_H
#define OLIGO_ALGO_REED_SOLOMON_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "oligo/common/error.h"
#include "oligo/common/types.h"

namespace oligo::algo {

// =============================================================================
// Decode Result
// =============================================================================

/// @brief Outcome of a successful Reed-Solomon decode.
struct RsDecodeResult {
    /// @brief Corrected message (codeword without parity).
    std::vector<std::uint8_t> message;

    /// @brief Number of symbol errors located and corrected.
    std::size_t correctedErrors = 0;

    /// @brief Number of erased symbols reconstructed.
    std::size_t filledErasures = 0;
};

// =============================================================================
// ReedSolomonCoder
// =============================================================================

/// @brief Reed-Solomon encoder/decoder with a fixed number of parity symbols.
///
/// Instances are immutable after construction and safe to share between
/// threads.
class ReedSolomonCoder {
public:
    /// @brief Construct a coder producing @p nsym parity symbols.
    /// @throws ConfigurationError if nsym leaves no room for a message.
    explicit ReedSolomonCoder(std::size_t nsym);

    [[nodiscard]] std::size_t paritySymbols() const noexcept { return nsym_; }

    /// @brief Longest message that fits in one codeword.
    [[nodiscard]] std::size_t maxMessageLength() const noexcept {
        return kMaxCodewordLength - nsym_;
    }

    /// @brief Compute the parity symbols for @p message.
    /// @return kConfigurationInvalid if message.size() + nsym > 255.
    [[nodiscard]] Result<std::vector<std::uint8_t>> computeParity(
        std::span<const std::uint8_t> message) const;

    /// @brief Encode to a full systematic codeword (message || parity).
    [[nodiscard]] Result<std::vector<std::uint8_t>> encode(
        std::span<const std::uint8_t> message) const;

    /// @brief Decode a codeword, correcting errors and filling erasures.
    /// @param codeword Received symbols (message || parity).
    /// @param erasures Indices into @p codeword whose symbols are unknown.
    [[nodiscard]] Result<RsDecodeResult> decode(
        std::span<const std::uint8_t> codeword,
        std::span<const std::size_t> erasures = {}) const;

private:
    std::size_t nsym_;

    /// @brief Generator polynomial, highest degree first.
    std::vector<std::uint8_t> generator_;
};

}  // namespace oligo::algo

#endif  // OLIGO_ALGO_REED_SOLOMON_H
