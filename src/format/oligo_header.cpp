// =============================================================================
// oligo-codec - Oligo Header Protocol Implementation
// =============================================================================

#include "oligo/format/oligo_header.h"

#include <array>

#include <fmt/format.h>

#include "oligo/algo/checksum.h"

namespace oligo::format {

namespace {

using FieldBits = std::array<std::uint8_t, kHeaderFieldBits>;

constexpr std::size_t kFieldOffset = kSyncMarker.size() + kTypeMarkerLength;
constexpr std::size_t kCrcOffset = kFieldOffset + kHeaderFieldBits;
constexpr std::size_t kPackedFieldBytes = (kHeaderFieldBits + 7) / 8;

void putBits(FieldBits& bits, std::size_t& pos, std::uint32_t value, unsigned width) {
    for (unsigned i = width; i-- > 0;) {
        bits[pos++] = static_cast<std::uint8_t>((value >> i) & 1U);
    }
}

std::uint32_t takeBits(const FieldBits& bits, std::size_t& pos, unsigned width) {
    std::uint32_t value = 0;
    for (unsigned i = 0; i < width; ++i) {
        value = (value << 1) | bits[pos++];
    }
    return value;
}

/// @brief CRC-8 over the field bits packed MSB-first (trailing bits zero).
std::uint8_t fieldCrc(const FieldBits& bits) {
    std::array<std::uint8_t, kPackedFieldBytes> packed{};
    for (std::size_t i = 0; i < bits.size(); ++i) {
        if (bits[i] != 0) {
            packed[i / 8] |= static_cast<std::uint8_t>(0x80U >> (i % 8));
        }
    }
    return algo::crc8(packed);
}

/// @brief Decode a C/T nucleotide bit; returns false for any other symbol.
bool readBit(char symbol, std::uint8_t& bit) noexcept {
    if (symbol == kBitOne) {
        bit = 1;
        return true;
    }
    if (symbol == kBitZero) {
        bit = 0;
        return true;
    }
    return false;
}

Result<OligoHeader> corrupt(std::string message) {
    return makeError<OligoHeader>(ErrorCode::kHeaderCorrupt, std::move(message));
}

}  // namespace

// =============================================================================
// Header Build / Parse
// =============================================================================

Result<std::string> buildHeader(const OligoHeader& header) {
    if (header.totalChunks == 0 || header.totalChunks > kMaxTotalChunks ||
        header.chunkIdx >= header.totalChunks) {
        return makeError<std::string>(
            ErrorCode::kCapacityExceeded,
            fmt::format("chunk {}/{} does not fit the {}-bit header fields", header.chunkIdx,
                        header.totalChunks, kChunkFieldBits));
    }
    if (header.totalSeqs == 0 || header.totalSeqs > kMaxTotalSeqs ||
        header.seqIdx >= header.totalSeqs) {
        return makeError<std::string>(
            ErrorCode::kCapacityExceeded,
            fmt::format("segment {}/{} does not fit the {}-bit header fields", header.seqIdx,
                        header.totalSeqs, kSeqFieldBits));
    }

    FieldBits bits{};
    std::size_t pos = 0;
    putBits(bits, pos, header.chunkIdx, kChunkFieldBits);
    putBits(bits, pos, header.totalChunks, kChunkFieldBits);
    putBits(bits, pos, header.seqIdx, kSeqFieldBits);
    putBits(bits, pos, header.totalSeqs, kSeqFieldBits);
    const std::uint8_t crc = fieldCrc(bits);

    std::string out;
    out.reserve(kHeaderLength);
    out.append(kSyncMarker);
    out.append(typeMarker(header.type));
    for (std::uint8_t bit : bits) {
        out.push_back(bit != 0 ? kBitOne : kBitZero);
    }
    for (unsigned i = kHeaderCrcBits; i-- > 0;) {
        out.push_back(((crc >> i) & 1U) != 0 ? kBitOne : kBitZero);
    }
    return out;
}

Result<OligoHeader> parseHeader(std::string_view oligo) {
    if (oligo.size() < kHeaderLength) {
        return corrupt(fmt::format("oligo of {} nt is shorter than the {}-nt header",
                                   oligo.size(), kHeaderLength));
    }
    if (oligo.substr(0, kSyncMarker.size()) != kSyncMarker) {
        return corrupt("sync marker mismatch");
    }

    OligoHeader header;
    const std::string_view marker = oligo.substr(kSyncMarker.size(), kTypeMarkerLength);
    if (marker == typeMarker(OligoType::kHeader)) {
        header.type = OligoType::kHeader;
    } else if (marker == typeMarker(OligoType::kData)) {
        header.type = OligoType::kData;
    } else if (marker == typeMarker(OligoType::kParity)) {
        header.type = OligoType::kParity;
    } else {
        return corrupt(fmt::format("unknown type marker '{}'", marker));
    }

    FieldBits bits{};
    for (std::size_t i = 0; i < kHeaderFieldBits; ++i) {
        if (!readBit(oligo[kFieldOffset + i], bits[i])) {
            return corrupt(fmt::format("invalid field symbol '{}' at position {}",
                                       oligo[kFieldOffset + i], kFieldOffset + i));
        }
    }

    std::uint8_t storedCrc = 0;
    for (std::size_t i = 0; i < kHeaderCrcBits; ++i) {
        std::uint8_t bit = 0;
        if (!readBit(oligo[kCrcOffset + i], bit)) {
            return corrupt(fmt::format("invalid CRC symbol '{}' at position {}",
                                       oligo[kCrcOffset + i], kCrcOffset + i));
        }
        storedCrc = static_cast<std::uint8_t>((storedCrc << 1) | bit);
    }

    const std::uint8_t computedCrc = fieldCrc(bits);
    if (storedCrc != computedCrc) {
        return corrupt(fmt::format("header CRC-8 mismatch: stored 0x{:02x}, computed 0x{:02x}",
                                   storedCrc, computedCrc));
    }

    std::size_t pos = 0;
    header.chunkIdx = takeBits(bits, pos, kChunkFieldBits);
    header.totalChunks = takeBits(bits, pos, kChunkFieldBits);
    header.seqIdx = static_cast<SeqIndex>(takeBits(bits, pos, kSeqFieldBits));
    header.totalSeqs = static_cast<SeqIndex>(takeBits(bits, pos, kSeqFieldBits));

    if (header.chunkIdx >= header.totalChunks || header.seqIdx >= header.totalSeqs) {
        return corrupt(fmt::format("inconsistent address chunk {}/{} segment {}/{}",
                                   header.chunkIdx, header.totalChunks, header.seqIdx,
                                   header.totalSeqs));
    }
    return header;
}

// =============================================================================
// OligoRecord
// =============================================================================

Result<OligoRecord> makeRecord(const OligoHeader& header, std::string payload) {
    auto prefix = buildHeader(header);
    if (!prefix) {
        return makeError<OligoRecord>(prefix.error());
    }
    return OligoRecord{header, std::move(*prefix), std::move(payload), 0};
}

}  // namespace oligo::format
