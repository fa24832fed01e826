// =============================================================================
// oligo-codec - Encode Command
// =============================================================================
// Command handler for encoding a file into a FASTA oligo pool.
//
// This module provides:
// - EncodeOptions: Configuration for the encode operation
// - EncodeCommand: Read input, run the encoder, write FASTA, print a summary
// =============================================================================

#ifndef OLIGO_COMMANDS_ENCODE_COMMAND_H
#define OLIGO_COMMANDS_ENCODE_COMMAND_H

#include <filesystem>
#include <memory>

#include "oligo/common/error.h"
#include "oligo/pipeline/codec_config.h"
#include "oligo/pipeline/oligo_encoder.h"

namespace oligo::commands {

// =============================================================================
// Encode Options
// =============================================================================

struct EncodeOptions {
    /// @brief Input file path ("-" for stdin).
    std::filesystem::path inputPath;

    /// @brief Output FASTA path ("-" for stdout).
    std::filesystem::path outputPath;

    pipeline::CodecConfig codec;

    /// @brief Overwrite existing output file.
    bool forceOverwrite = false;

    /// @brief Print the encode summary.
    bool showSummary = true;
};

// =============================================================================
// EncodeCommand Class
// =============================================================================

class EncodeCommand {
public:
    explicit EncodeCommand(EncodeOptions options);

    ~EncodeCommand();

    // Non-copyable, movable
    EncodeCommand(const EncodeCommand&) = delete;
    EncodeCommand& operator=(const EncodeCommand&) = delete;
    EncodeCommand(EncodeCommand&&) noexcept;
    EncodeCommand& operator=(EncodeCommand&&) noexcept;

    /// @brief Execute the encode command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const EncodeOptions& options() const noexcept { return options_; }

    /// @brief Statistics of the last successful run.
    [[nodiscard]] const pipeline::EncodeStats& stats() const noexcept { return stats_; }

private:
    void validateOptions() const;

    void printSummary(const pipeline::EncodeResult& result) const;

    EncodeOptions options_;
    pipeline::EncodeStats stats_;
};

}  // namespace oligo::commands

#endif  // OLIGO_COMMANDS_ENCODE_COMMAND_H
