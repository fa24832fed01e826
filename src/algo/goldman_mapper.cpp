// =============================================================================
// oligo-codec - Goldman Symbol Mapper Implementation
// =============================================================================

#include "oligo/algo/goldman_mapper.h"

#include <algorithm>
#include <array>

#include <fmt/format.h>

namespace oligo::algo {

namespace {

/// @brief Deterministic trit keystream; seed 0 yields all zeros.
class WhiteningKeystream {
public:
    explicit WhiteningKeystream(std::uint32_t seed) noexcept
        : enabled_(seed != 0), state_(0x9E3779B97F4A7C15ULL * (seed + 1)) {}

    std::uint8_t next() noexcept {
        if (!enabled_) {
            return 0;
        }
        // 64-bit LCG (Knuth MMIX constants), high bits are the best mixed
        state_ = state_ * 6364136223846793005ULL + 1442695040888963407ULL;
        return static_cast<std::uint8_t>((state_ >> 33) % 3);
    }

private:
    bool enabled_;
    std::uint64_t state_;
};

/// @brief Appends nucleotides while tracking the previous symbol.
class RotationWriter {
public:
    RotationWriter(std::string& out, std::uint8_t anchor) : out_(out), prev_(anchor) {
        out_.push_back(kNucleotides[anchor]);
    }

    void put(std::uint8_t trit) {
        prev_ = kRotationTable[prev_][trit];
        out_.push_back(kNucleotides[prev_]);
    }

private:
    std::string& out_;
    std::uint8_t prev_;
};

/// @brief Trit encoded at @p pos given the symbol before it.
std::uint8_t readTrit(std::string_view stream, std::size_t pos) noexcept {
    const std::uint8_t prev = nucleotideIndex(stream[pos - 1]);
    const std::uint8_t cur = nucleotideIndex(stream[pos]);
    if (prev == kInvalidNucleotide || cur == kInvalidNucleotide) {
        return kInvalidTrit;
    }
    return kInverseRotationTable[prev][cur];
}

/// @brief Digit agreed on by the copies at @p digit, if any.
///
/// Two matching copies win; a lone readable copy is accepted when the other
/// two are unreadable.
std::optional<std::uint8_t> voteAttemptDigit(std::string_view stream, std::size_t digit) noexcept {
    std::array<std::uint8_t, kAttemptCopies> votes{};
    std::size_t readable = 0;
    for (std::size_t copy = 0; copy < kAttemptCopies; ++copy) {
        const std::uint8_t trit = readTrit(stream, 1 + copy * kAttemptTrits + digit);
        if (trit != kInvalidTrit) {
            votes[readable++] = trit;
        }
    }
    if (readable == 1) {
        return votes[0];
    }
    for (std::size_t i = 0; i < readable; ++i) {
        for (std::size_t j = i + 1; j < readable; ++j) {
            if (votes[i] == votes[j]) {
                return votes[i];
            }
        }
    }
    return std::nullopt;
}

bool segmentsSatisfy(std::string_view sequence,
                     const ConstraintProfile& profile,
                     std::size_t segmentNt) noexcept {
    const std::size_t count = segmentCount(sequence.size(), segmentNt);
    for (std::size_t i = 0; i < count; ++i) {
        const auto segment = sequence.substr(segmentOffset(sequence.size(), segmentNt, i),
                                             segmentLength(sequence.size(), segmentNt, i));
        if (!satisfiesConstraints(segment, profile)) {
            return false;
        }
    }
    return true;
}

}  // namespace

// =============================================================================
// ConstraintProfile
// =============================================================================

VoidResult ConstraintProfile::validate() const {
    if (!(gcMin >= 0.0 && gcMin <= 1.0) || !(gcMax >= 0.0 && gcMax <= 1.0)) {
        return makeVoidError(ErrorCode::kConfigurationInvalid,
                             fmt::format("GC bounds [{}, {}] must lie in [0, 1]", gcMin, gcMax));
    }
    if (gcMin > gcMax) {
        return makeVoidError(ErrorCode::kConfigurationInvalid,
                             fmt::format("GC minimum {} exceeds maximum {}", gcMin, gcMax));
    }
    if (maxRunLength == 0) {
        return makeVoidError(ErrorCode::kConfigurationInvalid,
                             "maximum run length must be at least 1");
    }
    if (reseedAttempts == 0 || reseedAttempts > kMaxMappingAttempts) {
        return makeVoidError(
            ErrorCode::kConfigurationInvalid,
            fmt::format("re-seed attempts {} outside [1, {}]", reseedAttempts, kMaxMappingAttempts));
    }
    return makeVoidSuccess();
}

// =============================================================================
// Constraint Helpers
// =============================================================================

double gcContent(std::string_view sequence) noexcept {
    if (sequence.empty()) {
        return 0.0;
    }
    const auto gc = std::count_if(sequence.begin(), sequence.end(), isGcNucleotide);
    return static_cast<double>(gc) / static_cast<double>(sequence.size());
}

std::size_t maxRunLength(std::string_view sequence) noexcept {
    std::size_t longest = 0;
    std::size_t current = 0;
    char prev = '\0';
    for (char c : sequence) {
        current = (c == prev) ? current + 1 : 1;
        prev = c;
        longest = std::max(longest, current);
    }
    return longest;
}

bool satisfiesConstraints(std::string_view sequence, const ConstraintProfile& profile) noexcept {
    const double gc = gcContent(sequence);
    return gc >= profile.gcMin && gc <= profile.gcMax &&
           maxRunLength(sequence) <= profile.maxRunLength;
}

// =============================================================================
// Mapping Operations
// =============================================================================

std::string mapBytes(std::span<const std::uint8_t> bytes, std::uint32_t attempt) {
    std::string out;
    out.reserve(mappedLength(bytes.size()));
    RotationWriter writer(out, static_cast<std::uint8_t>(attempt % 4));

    for (std::size_t copy = 0; copy < kAttemptCopies; ++copy) {
        std::uint32_t digits = attempt;
        for (std::size_t i = 0; i < kAttemptTrits; ++i) {
            writer.put(static_cast<std::uint8_t>(digits % 3));
            digits /= 3;
        }
    }

    WhiteningKeystream keystream(attempt / 4);
    for (std::uint8_t byte : bytes) {
        unsigned value = byte;
        for (std::size_t i = 0; i < kTritsPerByte; ++i) {
            const auto trit = static_cast<std::uint8_t>(value % 3);
            value /= 3;
            writer.put(static_cast<std::uint8_t>((trit + keystream.next()) % 3));
        }
    }
    return out;
}

std::optional<std::string> attemptMapping(std::span<const std::uint8_t> bytes,
                                          std::uint32_t attempt,
                                          const ConstraintProfile& profile,
                                          std::size_t segmentNt) {
    if (attempt >= kMaxMappingAttempts) {
        return std::nullopt;
    }
    std::string sequence = mapBytes(bytes, attempt);
    if (!satisfiesConstraints(sequence, profile)) {
        return std::nullopt;
    }
    if (segmentNt > 0 && !segmentsSatisfy(sequence, profile, segmentNt)) {
        return std::nullopt;
    }
    return sequence;
}

Result<MappedStream> encodeWithConstraints(std::span<const std::uint8_t> bytes,
                                           const ConstraintProfile& profile,
                                           std::size_t segmentNt) {
    const std::uint32_t budget = std::min(profile.reseedAttempts, kMaxMappingAttempts);
    for (std::uint32_t attempt = 0; attempt < budget; ++attempt) {
        if (auto sequence = attemptMapping(bytes, attempt, profile, segmentNt)) {
            return MappedStream{std::move(*sequence), attempt};
        }
    }
    return makeError<MappedStream>(
        ErrorCode::kConstraintExhausted,
        fmt::format("no mapping of {} bytes met GC [{}, {}] and max run {} within {} attempts",
                    bytes.size(), profile.gcMin, profile.gcMax, profile.maxRunLength, budget));
}

Result<UnmappedStream> decodeStream(std::string_view stream) {
    const auto byteCount = unmappedLength(stream.size());
    if (!byteCount) {
        return makeError<UnmappedStream>(
            ErrorCode::kFormatError,
            fmt::format("mapped stream length {} is not {} + 6n", stream.size(), kStreamPrefixNt));
    }

    std::uint32_t attempt = 0;
    std::uint32_t place = 1;
    for (std::size_t digit = 0; digit < kAttemptTrits; ++digit) {
        const auto trit = voteAttemptDigit(stream, digit);
        if (!trit) {
            return makeError<UnmappedStream>(
                ErrorCode::kCorruptedData,
                fmt::format("attempt digit {} unreadable in mapped stream", digit));
        }
        attempt += *trit * place;
        place *= 3;
    }
    if (attempt >= kMaxMappingAttempts) {
        return makeError<UnmappedStream>(
            ErrorCode::kCorruptedData,
            fmt::format("attempt index {} in mapped stream is out of range", attempt));
    }

    UnmappedStream result;
    result.attempt = attempt;
    result.bytes.assign(*byteCount, 0);

    WhiteningKeystream keystream(attempt / 4);
    for (std::size_t b = 0; b < *byteCount; ++b) {
        unsigned value = 0;
        unsigned weight = 1;
        bool valid = true;
        for (std::size_t i = 0; i < kTritsPerByte; ++i) {
            const std::uint8_t key = keystream.next();
            const std::uint8_t trit = readTrit(stream, kStreamPrefixNt + b * kTritsPerByte + i);
            if (trit == kInvalidTrit) {
                valid = false;
            } else {
                value += static_cast<unsigned>((trit + 3 - key) % 3) * weight;
            }
            weight *= 3;
        }
        if (!valid || value > 0xFF) {
            result.erasures.push_back(b);
            continue;
        }
        result.bytes[b] = static_cast<std::uint8_t>(value);
    }
    return result;
}

}  // namespace oligo::algo
