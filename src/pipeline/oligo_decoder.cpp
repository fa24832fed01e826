// =============================================================================
// oligo-codec - Oligo Decoder Implementation
// =============================================================================

#include "oligo/pipeline/oligo_decoder.h"

#include <algorithm>
#include <chrono>
#include <map>
#include <string_view>

#include <fmt/format.h>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

#include "oligo/algo/checksum.h"
#include "oligo/algo/consensus.h"
#include "oligo/algo/goldman_mapper.h"
#include "oligo/algo/reed_solomon.h"
#include "oligo/common/logger.h"
#include "oligo/format/oligo_header.h"
#include "oligo/pipeline/chunker.h"

namespace oligo::pipeline {

namespace {

using ReplicateSet = std::vector<std::string_view>;
using SegmentGroups = std::map<SeqIndex, ReplicateSet>;

/// @brief Reads addressed to one chunk.
struct ChunkGroup {
    SegmentGroups data;
    SegmentGroups parity;
    std::map<SeqIndex, std::size_t> totalSeqsVotes;
};

struct ParsedRead {
    format::OligoHeader header;
    std::string_view payload;
};

/// @brief Most voted value; ties go to the smaller value.
template <typename T>
T majority(const std::map<T, std::size_t>& votes) {
    T best{};
    std::size_t bestCount = 0;
    for (const auto& [value, count] : votes) {
        if (count > bestCount) {
            best = value;
            bestCount = count;
        }
    }
    return best;
}

/// @brief Geometry in effect for one decode.
struct Geometry {
    std::size_t chunkSize = 0;
    std::size_t nsym = 0;
    std::size_t segmentNt = 0;
    std::size_t minReplicates = 1;
    ChunkIndex totalChunks = 0;
    std::optional<format::FileManifest> manifest;

    [[nodiscard]] std::size_t paritySegments() const noexcept {
        return nsym == 0 ? 0 : algo::segmentCount(algo::mappedLength(nsym), segmentNt);
    }

    /// @brief Payload size of @p chunkIdx when it can be known up front.
    [[nodiscard]] std::optional<std::size_t> payloadSize(ChunkIndex chunkIdx) const noexcept {
        if (chunkIdx + 1 < totalChunks) {
            return chunkSize;
        }
        if (manifest) {
            return manifest->chunkPayloadSize(chunkIdx);
        }
        return std::nullopt;
    }
};

/// @brief Result of decoding one chunk; failure is set when unrecoverable.
struct ChunkOutcome {
    std::vector<std::uint8_t> payload;
    std::optional<ChunkFailure> failure;
    std::size_t discardedReplicates = 0;
    std::size_t disputedPositions = 0;
    std::size_t missingSegments = 0;
    std::size_t correctedErrors = 0;
    std::size_t filledErasures = 0;
};

/// @brief Consensus of segment @p seq, or nullopt if absent or unusable.
std::optional<std::string> segmentConsensus(const SegmentGroups& groups,
                                            SeqIndex seq,
                                            std::size_t minReplicates,
                                            ChunkOutcome& outcome) {
    auto it = groups.find(seq);
    if (it == groups.end()) {
        return std::nullopt;
    }
    auto consensus = algo::buildConsensus(it->second, minReplicates);
    if (!consensus) {
        return std::nullopt;
    }
    outcome.discardedReplicates += consensus->discardedReads;
    outcome.disputedPositions += consensus->disputedPositions;
    return std::move(consensus->sequence);
}

/// @brief Expected length of each of @p count segments; empty where neither
///        the stream length nor the surviving segments fix it.
std::vector<std::optional<std::size_t>> expectedLengths(
    std::size_t count,
    std::size_t segmentNt,
    std::optional<std::size_t> streamNt,
    const std::vector<std::optional<std::string>>& segments) {
    std::vector<std::optional<std::size_t>> lengths(count);
    if (streamNt && algo::segmentCount(*streamNt, segmentNt) == count) {
        for (std::size_t s = 0; s < count; ++s) {
            lengths[s] = algo::segmentLength(*streamNt, segmentNt, s);
        }
        return lengths;
    }

    // Lengths never increase along a stream and never exceed segmentNt
    for (std::size_t s = 0; s < count; ++s) {
        if (segments[s]) {
            lengths[s] = segments[s]->size();
            continue;
        }
        std::optional<std::size_t> before;
        std::optional<std::size_t> after;
        for (std::size_t j = s; j-- > 0;) {
            if (segments[j]) {
                before = segments[j]->size();
                break;
            }
        }
        for (std::size_t j = s + 1; j < count; ++j) {
            if (segments[j]) {
                after = segments[j]->size();
                break;
            }
        }
        if (after && (*after == segmentNt || (before && *before == *after))) {
            lengths[s] = *after;
        }
    }
    return lengths;
}

/// @brief A mapped stream rebuilt from segment consensus.
struct AssembledStream {
    std::string stream;

    /// @brief False when a missing segment could not be stood in for: the
    ///        first one carries the attempt prefix, others need a known length.
    bool placeable = true;
};

/// @brief Concatenate segments firstSeq .. firstSeq + count - 1; missing
///        segments of known length become 'N' runs.
AssembledStream assembleStream(const SegmentGroups& groups,
                               SeqIndex firstSeq,
                               std::size_t count,
                               std::size_t segmentNt,
                               std::optional<std::size_t> streamNt,
                               std::size_t minReplicates,
                               ChunkOutcome& outcome,
                               std::vector<SeqIndex>& missing) {
    std::vector<std::optional<std::string>> segments(count);
    for (std::size_t s = 0; s < count; ++s) {
        segments[s] = segmentConsensus(groups, static_cast<SeqIndex>(firstSeq + s),
                                       minReplicates, outcome);
    }
    const auto lengths = expectedLengths(count, segmentNt, streamNt, segments);

    AssembledStream out;
    for (std::size_t s = 0; s < count; ++s) {
        auto& segment = segments[s];
        if (segment && lengths[s] && segment->size() != *lengths[s]) {
            segment.reset();
        }
        if (segment) {
            out.stream += *segment;
            continue;
        }
        missing.push_back(static_cast<SeqIndex>(firstSeq + s));
        if (s == 0 || !lengths[s]) {
            out.placeable = false;
            continue;
        }
        out.stream.append(*lengths[s], kUnknownNucleotide);
    }
    return out;
}

}  // namespace

// =============================================================================
// OligoDecoderImpl
// =============================================================================

class OligoDecoderImpl {
public:
    explicit OligoDecoderImpl(CodecConfig config) : config_(std::move(config)) {}

    [[nodiscard]] Result<DecodeReport> decode(std::span<const std::string> reads) const;

    [[nodiscard]] const CodecConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] std::optional<format::FileManifest> recoverManifest(
        const SegmentGroups& groups, const std::map<SeqIndex, std::size_t>& seqVotes) const;

    [[nodiscard]] ChunkOutcome decodeChunk(ChunkIndex chunkIdx,
                                           const ChunkGroup& group,
                                           const Geometry& geometry,
                                           const algo::ReedSolomonCoder& coder) const;

    CodecConfig config_;
};

std::optional<format::FileManifest> OligoDecoderImpl::recoverManifest(
    const SegmentGroups& groups, const std::map<SeqIndex, std::size_t>& seqVotes) const {
    if (groups.empty()) {
        OLIGO_LOG_WARNING("No manifest oligos recovered; using configured geometry");
        return std::nullopt;
    }

    const SeqIndex totalSeqs = majority(seqVotes);
    ChunkOutcome scratch;
    std::string stream;
    for (SeqIndex s = 0; s < totalSeqs; ++s) {
        auto segment = segmentConsensus(groups, s, config_.minReplicates, scratch);
        if (!segment) {
            OLIGO_LOG_WARNING("Manifest segment {}/{} missing; using configured geometry", s,
                              totalSeqs);
            return std::nullopt;
        }
        stream += *segment;
    }

    auto unmapped = algo::decodeStream(stream);
    if (!unmapped || !unmapped->erasures.empty()) {
        OLIGO_LOG_WARNING("Manifest stream unreadable; using configured geometry");
        return std::nullopt;
    }

    auto manifest = format::parseFileManifest(unmapped->bytes);
    if (!manifest) {
        OLIGO_LOG_WARNING("Manifest rejected: {}", manifest.error().message());
        return std::nullopt;
    }
    return *manifest;
}

ChunkOutcome OligoDecoderImpl::decodeChunk(ChunkIndex chunkIdx,
                                           const ChunkGroup& group,
                                           const Geometry& geometry,
                                           const algo::ReedSolomonCoder& coder) const {
    ChunkOutcome outcome;
    std::vector<SeqIndex> missing;

    auto failWith = [&](ErrorCode code, std::string message) {
        outcome.missingSegments = missing.size();
        outcome.failure = ChunkFailure{chunkIdx, code, std::move(message), std::move(missing)};
        return std::move(outcome);
    };

    const std::size_t segNt = geometry.segmentNt;
    const std::size_t paritySegs = geometry.paritySegments();
    const auto expectedPayload = geometry.payloadSize(chunkIdx);

    std::optional<std::size_t> dataStreamNt;
    if (expectedPayload) {
        dataStreamNt = algo::mappedLength(*expectedPayload + kChunkCrcSize);
    }

    if (group.data.empty() && group.parity.empty()) {
        if (dataStreamNt) {
            const std::size_t total = algo::segmentCount(*dataStreamNt, segNt) + paritySegs;
            for (std::size_t s = 0; s < total; ++s) {
                missing.push_back(static_cast<SeqIndex>(s));
            }
        }
        return failWith(ErrorCode::kInsufficientReplicates, "no oligos recovered for chunk");
    }

    std::size_t totalSeqs = 0;
    if (!group.totalSeqsVotes.empty()) {
        totalSeqs = majority(group.totalSeqsVotes);
    } else if (dataStreamNt) {
        totalSeqs = algo::segmentCount(*dataStreamNt, segNt) + paritySegs;
    }
    if (totalSeqs <= paritySegs) {
        return failWith(ErrorCode::kFormatError,
                        fmt::format("{} segments cannot hold data plus {} parity segments",
                                    totalSeqs, paritySegs));
    }
    const std::size_t dataSegs = totalSeqs - paritySegs;
    if (dataStreamNt && algo::segmentCount(*dataStreamNt, segNt) != dataSegs) {
        OLIGO_LOG_DEBUG("Chunk {}: {} data segments voted, geometry implies {}", chunkIdx,
                        dataSegs, algo::segmentCount(*dataStreamNt, segNt));
        dataStreamNt.reset();
    }

    const auto data = assembleStream(group.data, 0, dataSegs, segNt, dataStreamNt,
                                     geometry.minReplicates, outcome, missing);
    if (!data.placeable) {
        return failWith(ErrorCode::kInsufficientReplicates,
                        fmt::format("{} data segment(s) missing and not placeable",
                                    missing.size()));
    }

    auto unmappedData = algo::decodeStream(data.stream);
    if (!unmappedData) {
        return failWith(unmappedData.error().code(), unmappedData.error().message());
    }

    std::vector<std::uint8_t> codeword = std::move(unmappedData->bytes);
    std::vector<std::size_t> erasures = std::move(unmappedData->erasures);
    const std::size_t messageLength = codeword.size();
    if (messageLength + geometry.nsym > kMaxCodewordLength) {
        return failWith(ErrorCode::kFormatError,
                        fmt::format("message of {} bytes does not fit a codeword with {} parity",
                                    messageLength, geometry.nsym));
    }

    // Parity stream: a lost first segment (attempt prefix) erases all parity
    if (geometry.nsym > 0) {
        const auto parityStream =
            assembleStream(group.parity, static_cast<SeqIndex>(dataSegs), paritySegs, segNt,
                           algo::mappedLength(geometry.nsym), geometry.minReplicates, outcome,
                           missing);
        bool parityLost = !parityStream.placeable;

        std::vector<std::uint8_t> parity(geometry.nsym, 0);
        std::vector<std::size_t> parityErasures;
        if (!parityLost) {
            auto unmappedParity = algo::decodeStream(parityStream.stream);
            if (unmappedParity && unmappedParity->bytes.size() == geometry.nsym) {
                parity = std::move(unmappedParity->bytes);
                parityErasures = std::move(unmappedParity->erasures);
            } else {
                parityLost = true;
            }
        }
        if (parityLost) {
            parityErasures.clear();
            for (std::size_t i = 0; i < geometry.nsym; ++i) {
                parityErasures.push_back(i);
            }
        }

        codeword.insert(codeword.end(), parity.begin(), parity.end());
        for (std::size_t pos : parityErasures) {
            erasures.push_back(messageLength + pos);
        }
    }

    auto corrected = coder.decode(codeword, erasures);
    if (!corrected) {
        return failWith(corrected.error().code(), corrected.error().message());
    }
    outcome.correctedErrors = corrected->correctedErrors;
    outcome.filledErasures = corrected->filledErasures;

    auto payload = recoverPayload(corrected->message);
    if (!payload) {
        return failWith(payload.error().code(), payload.error().message());
    }

    if (expectedPayload && payload->size() != *expectedPayload) {
        return failWith(ErrorCode::kFormatError,
                        fmt::format("payload of {} bytes, expected {}", payload->size(),
                                    *expectedPayload));
    }
    if (payload->size() > geometry.chunkSize) {
        return failWith(ErrorCode::kFormatError,
                        fmt::format("payload of {} bytes exceeds chunk size {}", payload->size(),
                                    geometry.chunkSize));
    }

    outcome.missingSegments = missing.size();
    outcome.payload = std::move(*payload);
    return outcome;
}

Result<DecodeReport> OligoDecoderImpl::decode(std::span<const std::string> reads) const {
    if (auto valid = config_.validate(); !valid) {
        return makeError<DecodeReport>(valid.error());
    }

    const auto startTime = std::chrono::steady_clock::now();
    DecodeReport report;
    report.stats.readsTotal = reads.size();

    // Pass 1: parse headers and collect votes
    std::vector<ParsedRead> parsed;
    parsed.reserve(reads.size());
    std::map<ChunkIndex, std::size_t> totalChunksVotes;
    SegmentGroups manifestGroups;
    std::map<SeqIndex, std::size_t> manifestSeqVotes;

    for (const std::string& read : reads) {
        auto header = format::parseHeader(read);
        if (!header) {
            ++report.stats.corruptHeaders;
            continue;
        }
        const std::string_view payload = std::string_view(read).substr(format::kHeaderLength);
        ++totalChunksVotes[header->totalChunks];
        if (header->type == OligoType::kHeader) {
            ++report.stats.manifestReads;
            manifestGroups[header->seqIdx].push_back(payload);
            ++manifestSeqVotes[header->totalSeqs];
            continue;
        }
        parsed.push_back(ParsedRead{*header, payload});
    }

    if (totalChunksVotes.empty()) {
        return makeError<DecodeReport>(
            ErrorCode::kInsufficientReplicates,
            fmt::format("none of {} reads carried a valid oligo header", reads.size()));
    }
    if (report.stats.corruptHeaders > 0) {
        OLIGO_LOG_DEBUG("Dropped {} reads with corrupt headers", report.stats.corruptHeaders);
    }

    // Geometry: manifest when recovered, configuration otherwise
    Geometry geometry;
    geometry.chunkSize = config_.chunkSize;
    geometry.nsym = config_.errorCorrectionSymbols;
    geometry.segmentNt = config_.segmentNt;
    geometry.minReplicates = config_.minReplicates;
    geometry.totalChunks = majority(totalChunksVotes);
    geometry.manifest = recoverManifest(manifestGroups, manifestSeqVotes);

    if (geometry.manifest) {
        const auto& manifest = *geometry.manifest;
        if (manifest.chunkSize != config_.chunkSize ||
            manifest.nsym != config_.errorCorrectionSymbols) {
            OLIGO_LOG_WARNING(
                "Manifest geometry (chunk size {}, {} parity) overrides configuration "
                "(chunk size {}, {} parity)",
                manifest.chunkSize, static_cast<unsigned>(manifest.nsym), config_.chunkSize,
                config_.errorCorrectionSymbols);
        }
        geometry.chunkSize = manifest.chunkSize;
        geometry.nsym = manifest.nsym;

        const std::uint64_t expected = manifest.expectedChunks();
        if (expected > kMaxTotalChunks) {
            return makeError<DecodeReport>(
                ErrorCode::kFormatError,
                fmt::format("manifest describes {} chunks, more than {} addressable", expected,
                            kMaxTotalChunks));
        }
        if (expected != geometry.totalChunks) {
            OLIGO_LOG_WARNING("Headers vote for {} chunks, manifest describes {}",
                              geometry.totalChunks, expected);
        }
        geometry.totalChunks = static_cast<ChunkIndex>(expected);
    }

    report.manifest = geometry.manifest;
    report.totalChunks = geometry.totalChunks;

    // Every chunk needs at least one data or parity read; a larger count is
    // incomplete up front and must not size per-chunk state
    if (geometry.totalChunks > parsed.size()) {
        return makeError<DecodeReport>(
            ErrorCode::kIncompleteDecode,
            fmt::format("{} chunks expected but only {} data and parity reads carry a valid "
                        "header",
                        geometry.totalChunks, parsed.size()));
    }

    // Pass 2: group data and parity reads by chunk
    std::vector<ChunkGroup> groups(geometry.totalChunks);
    for (const ParsedRead& read : parsed) {
        if (read.header.chunkIdx >= geometry.totalChunks) {
            ++report.stats.strayReads;
            continue;
        }
        ChunkGroup& group = groups[read.header.chunkIdx];
        if (read.header.type == OligoType::kData) {
            ++report.stats.dataReads;
            group.data[read.header.seqIdx].push_back(read.payload);
        } else {
            ++report.stats.parityReads;
            group.parity[read.header.seqIdx].push_back(read.payload);
        }
        ++group.totalSeqsVotes[read.header.totalSeqs];
    }

    const algo::ReedSolomonCoder coder(geometry.nsym);
    std::vector<ChunkOutcome> outcomes(geometry.totalChunks);

    const std::size_t threads = config_.effectiveThreads();
    report.stats.threadsUsed = threads;
    tbb::task_arena arena(static_cast<int>(threads));
    arena.execute([&] {
        tbb::parallel_for(tbb::blocked_range<std::size_t>(0, outcomes.size()),
                          [&](const tbb::blocked_range<std::size_t>& range) {
                              for (std::size_t i = range.begin(); i < range.end(); ++i) {
                                  outcomes[i] = decodeChunk(static_cast<ChunkIndex>(i),
                                                            groups[i], geometry, coder);
                              }
                          });
    });

    // Ordered reassembly
    std::vector<std::uint8_t> data;
    for (ChunkOutcome& outcome : outcomes) {
        report.stats.discardedReplicates += outcome.discardedReplicates;
        report.stats.disputedPositions += outcome.disputedPositions;
        report.stats.missingSegments += outcome.missingSegments;
        report.stats.correctedErrors += outcome.correctedErrors;
        report.stats.filledErasures += outcome.filledErasures;
        if (outcome.failure) {
            report.failures.push_back(std::move(*outcome.failure));
            continue;
        }
        ++report.stats.recoveredChunks;
        if (report.failures.empty()) {
            data.insert(data.end(), outcome.payload.begin(), outcome.payload.end());
        }
    }

    if (!report.failures.empty()) {
        OLIGO_LOG_ERROR("{} of {} chunks unrecoverable: {}", report.failures.size(),
                        report.totalChunks, describeFailures(report.failures));
    } else if (geometry.manifest) {
        const auto& manifest = *geometry.manifest;
        const Fingerprint actual = algo::fingerprint(data);
        if (data.size() != manifest.fileSize || actual != manifest.fingerprint) {
            report.integrityError = true;
            OLIGO_LOG_ERROR(
                "Reassembled {} bytes (fingerprint 0x{:016x}) disagree with manifest "
                "({} bytes, fingerprint 0x{:016x})",
                data.size(), actual, manifest.fileSize, manifest.fingerprint);
        } else {
            report.fingerprintVerified = true;
        }
    }

    report.complete = report.failures.empty() && !report.integrityError;
    if (report.complete) {
        report.data = std::move(data);
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);
    OLIGO_LOG_DEBUG("Decoded {} reads into {} of {} chunks ({} errors corrected, {} erasures "
                    "filled) in {} ms",
                    report.stats.readsTotal, report.stats.recoveredChunks, report.totalChunks,
                    report.stats.correctedErrors, report.stats.filledErasures, elapsed.count());
    return report;
}

// =============================================================================
// OligoDecoder
// =============================================================================

OligoDecoder::OligoDecoder(CodecConfig config)
    : impl_(std::make_unique<OligoDecoderImpl>(std::move(config))) {}

OligoDecoder::~OligoDecoder() = default;

OligoDecoder::OligoDecoder(OligoDecoder&&) noexcept = default;

OligoDecoder& OligoDecoder::operator=(OligoDecoder&&) noexcept = default;

Result<DecodeReport> OligoDecoder::decode(std::span<const std::string> reads) const {
    return impl_->decode(reads);
}

Result<std::vector<std::uint8_t>> OligoDecoder::decodeOrFail(
    std::span<const std::string> reads) const {
    auto report = impl_->decode(reads);
    if (!report) {
        return makeError<std::vector<std::uint8_t>>(report.error());
    }
    if (report->integrityError) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kChecksumError, "reassembled data does not match the manifest fingerprint");
    }
    if (!report->complete) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kIncompleteDecode,
            fmt::format("{} of {} chunks unrecoverable: {}", report->failures.size(),
                        report->totalChunks, describeFailures(report->failures)));
    }
    return std::move(report->data);
}

const CodecConfig& OligoDecoder::config() const noexcept {
    return impl_->config();
}

Result<DecodeReport> decode(std::span<const std::string> reads, const CodecConfig& config) {
    return OligoDecoder(config).decode(reads);
}

std::string describeFailures(const std::vector<ChunkFailure>& failures, std::size_t limit) {
    std::string out;
    const std::size_t shown = std::min(limit, failures.size());
    for (std::size_t i = 0; i < shown; ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += fmt::format("chunk {} ({})", failures[i].chunkIdx,
                           errorCodeToString(failures[i].code));
    }
    if (failures.size() > shown) {
        out += fmt::format(" and {} more", failures.size() - shown);
    }
    return out;
}

}  // namespace oligo::pipeline
