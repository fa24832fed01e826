// =============================================================================
// oligo-codec - Oligo Encoder Implementation
// =============================================================================

#include "oligo/pipeline/oligo_encoder.h"

#include <algorithm>
#include <chrono>
#include <iterator>

#include <fmt/format.h>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

#include "oligo/algo/checksum.h"
#include "oligo/algo/consensus.h"
#include "oligo/algo/goldman_mapper.h"
#include "oligo/algo/reed_solomon.h"
#include "oligo/common/logger.h"
#include "oligo/format/file_manifest.h"
#include "oligo/pipeline/chunker.h"

namespace oligo::pipeline {

namespace {

/// @brief Oligos of one mapped unit (manifest or chunk) with mapping stats.
struct StreamOligos {
    std::vector<format::OligoRecord> oligos;
    std::size_t reseeded = 0;
    std::uint32_t maxAttempt = 0;
};

/// @brief Append replicated oligos for each segment of @p stream.
VoidResult emitSegments(StreamOligos& out,
                        const std::vector<std::string>& segments,
                        format::OligoHeader header,
                        SeqIndex firstSeq,
                        std::size_t redundancy) {
    for (std::size_t i = 0; i < segments.size(); ++i) {
        header.seqIdx = static_cast<SeqIndex>(firstSeq + i);
        auto record = format::makeRecord(header, segments[i]);
        if (!record) {
            return makeVoidError(record.error().code(), record.error().message());
        }
        auto copies = algo::replicate(*record, redundancy);
        out.oligos.insert(out.oligos.end(), std::make_move_iterator(copies.begin()),
                          std::make_move_iterator(copies.end()));
    }
    return makeVoidSuccess();
}

void noteAttempt(StreamOligos& out, std::uint32_t attempt) noexcept {
    if (attempt > 0) {
        ++out.reseeded;
    }
    out.maxAttempt = std::max(out.maxAttempt, attempt);
}

}  // namespace

SourceBuffer makeSourceBuffer(std::span<const std::uint8_t> bytes) {
    return SourceBuffer{bytes, algo::fingerprint(bytes)};
}

// =============================================================================
// OligoEncoderImpl
// =============================================================================

class OligoEncoderImpl {
public:
    explicit OligoEncoderImpl(CodecConfig config) : config_(std::move(config)) {}

    [[nodiscard]] Result<EncodeResult> encode(const SourceBuffer& source) const;

    [[nodiscard]] const CodecConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] Result<StreamOligos> encodeManifest(const format::FileManifest& manifest,
                                                      ChunkIndex totalChunks) const;

    [[nodiscard]] Result<StreamOligos> encodeChunk(const Chunk& chunk,
                                                   const algo::ReedSolomonCoder& coder) const;

    CodecConfig config_;
};

Result<StreamOligos> OligoEncoderImpl::encodeManifest(const format::FileManifest& manifest,
                                                      ChunkIndex totalChunks) const {
    const auto bytes = manifest.serialize();
    auto mapped = algo::encodeWithConstraints(bytes, config_.constraints, config_.segmentNt);
    if (!mapped) {
        return makeError<StreamOligos>(
            mapped.error().code(),
            fmt::format("manifest: {}", mapped.error().message()));
    }

    StreamOligos out;
    noteAttempt(out, mapped->attempt);

    const auto segments = segmentStream(mapped->sequence, config_.segmentNt);
    format::OligoHeader header;
    header.type = OligoType::kHeader;
    header.chunkIdx = 0;
    header.totalChunks = totalChunks;
    header.totalSeqs = static_cast<SeqIndex>(segments.size());
    if (auto emitted = emitSegments(out, segments, header, 0, config_.headerRedundancy);
        !emitted) {
        return makeError<StreamOligos>(emitted.error());
    }
    return out;
}

Result<StreamOligos> OligoEncoderImpl::encodeChunk(const Chunk& chunk,
                                                   const algo::ReedSolomonCoder& coder) const {
    auto fail = [&](const Error& error) {
        return makeError<StreamOligos>(
            error.code(), fmt::format("chunk {}: {}", chunk.chunkIdx, error.message()));
    };

    auto protectedChunk = protectChunk(chunk, coder);
    if (!protectedChunk) {
        return fail(protectedChunk.error());
    }

    StreamOligos out;

    auto dataStream = algo::encodeWithConstraints(protectedChunk->message, config_.constraints,
                                                  config_.segmentNt);
    if (!dataStream) {
        return fail(dataStream.error());
    }
    noteAttempt(out, dataStream->attempt);
    const auto dataSegments = segmentStream(dataStream->sequence, config_.segmentNt);

    std::vector<std::string> paritySegments;
    if (!protectedChunk->parity.empty()) {
        auto parityStream =
            algo::encodeWithConstraints(protectedChunk->parity, config_.constraints,
                                        config_.segmentNt);
        if (!parityStream) {
            return fail(parityStream.error());
        }
        noteAttempt(out, parityStream->attempt);
        paritySegments = segmentStream(parityStream->sequence, config_.segmentNt);
    }

    const std::size_t totalSeqs = dataSegments.size() + paritySegments.size();
    if (totalSeqs > kMaxTotalSeqs) {
        return fail(Error{ErrorCode::kCapacityExceeded,
                          fmt::format("{} segments exceed the limit of {}", totalSeqs,
                                      kMaxTotalSeqs)});
    }

    format::OligoHeader header;
    header.chunkIdx = chunk.chunkIdx;
    header.totalChunks = chunk.totalChunks;
    header.totalSeqs = static_cast<SeqIndex>(totalSeqs);

    header.type = OligoType::kData;
    if (auto emitted = emitSegments(out, dataSegments, header, 0, config_.redundancy); !emitted) {
        return fail(emitted.error());
    }
    header.type = OligoType::kParity;
    if (auto emitted = emitSegments(out, paritySegments, header,
                                    static_cast<SeqIndex>(dataSegments.size()),
                                    config_.redundancy);
        !emitted) {
        return fail(emitted.error());
    }
    return out;
}

Result<EncodeResult> OligoEncoderImpl::encode(const SourceBuffer& source) const {
    if (auto valid = config_.validate(); !valid) {
        return makeError<EncodeResult>(valid.error());
    }
    if (auto fits = config_.validateCapacity(source.bytes.size()); !fits) {
        return makeError<EncodeResult>(fits.error());
    }

    const auto startTime = std::chrono::steady_clock::now();
    const algo::ReedSolomonCoder coder(config_.errorCorrectionSymbols);
    const auto chunks = splitIntoChunks(source.bytes, config_.chunkSize);
    const auto totalChunks = static_cast<ChunkIndex>(chunks.size());

    format::FileManifest manifest;
    manifest.fileSize = source.bytes.size();
    manifest.chunkSize = static_cast<std::uint16_t>(config_.chunkSize);
    manifest.nsym = static_cast<std::uint8_t>(config_.errorCorrectionSymbols);
    manifest.fingerprint = source.fingerprint;

    auto manifestOligos = encodeManifest(manifest, totalChunks);
    if (!manifestOligos) {
        return makeError<EncodeResult>(manifestOligos.error());
    }

    // Each worker fills only its own slot; order is restored by index below
    std::vector<Result<StreamOligos>> slots(
        chunks.size(), makeError<StreamOligos>(ErrorCode::kCorruptedData, "chunk not encoded"));

    const std::size_t threads = config_.effectiveThreads();
    tbb::task_arena arena(static_cast<int>(threads));
    arena.execute([&] {
        tbb::parallel_for(tbb::blocked_range<std::size_t>(0, chunks.size()),
                          [&](const tbb::blocked_range<std::size_t>& range) {
                              for (std::size_t i = range.begin(); i < range.end(); ++i) {
                                  slots[i] = encodeChunk(chunks[i], coder);
                              }
                          });
    });

    EncodeResult result;
    result.totalChunks = totalChunks;
    result.fileSize = source.bytes.size();
    result.fingerprint = source.fingerprint;
    result.stats.threadsUsed = threads;

    auto absorb = [&result](StreamOligos& unit) {
        result.stats.reseededStreams += unit.reseeded;
        result.stats.maxAttempt = std::max(result.stats.maxAttempt, unit.maxAttempt);
        for (auto& oligo : unit.oligos) {
            switch (oligo.header.type) {
                case OligoType::kHeader:
                    ++result.stats.manifestOligos;
                    break;
                case OligoType::kData:
                    ++result.stats.dataOligos;
                    break;
                case OligoType::kParity:
                    ++result.stats.parityOligos;
                    break;
            }
            result.stats.totalNucleotides += oligo.prefix.size() + oligo.payload.size();
            result.oligos.push_back(std::move(oligo));
        }
    };

    absorb(*manifestOligos);
    for (auto& slot : slots) {
        if (!slot) {
            OLIGO_LOG_ERROR("Encode failed: {}", slot.error().message());
            return makeError<EncodeResult>(slot.error());
        }
        absorb(*slot);
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);
    OLIGO_LOG_DEBUG("Encoded {} bytes into {} chunks, {} oligos ({} re-seeded streams) in {} ms",
                    result.fileSize, result.totalChunks, result.stats.totalOligos(),
                    result.stats.reseededStreams, elapsed.count());
    return result;
}

// =============================================================================
// OligoEncoder
// =============================================================================

OligoEncoder::OligoEncoder(CodecConfig config)
    : impl_(std::make_unique<OligoEncoderImpl>(std::move(config))) {}

OligoEncoder::~OligoEncoder() = default;

OligoEncoder::OligoEncoder(OligoEncoder&&) noexcept = default;

OligoEncoder& OligoEncoder::operator=(OligoEncoder&&) noexcept = default;

Result<EncodeResult> OligoEncoder::encode(const SourceBuffer& source) const {
    return impl_->encode(source);
}

const CodecConfig& OligoEncoder::config() const noexcept {
    return impl_->config();
}

Result<EncodeResult> encode(std::span<const std::uint8_t> bytes, const CodecConfig& config) {
    return OligoEncoder(config).encode(makeSourceBuffer(bytes));
}

}  // namespace oligo::pipeline
