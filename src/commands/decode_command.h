// =============================================================================
// oligo-codec - Decode Command
// =============================================================================
// Command handler for rebuilding a file from a sequenced oligo pool.
//
// Partial decodes never write output: the unrecoverable chunks are listed and
// the command exits with kIncompleteDecode.
// =============================================================================

#ifndef OLIGO_COMMANDS_DECODE_COMMAND_H
#define OLIGO_COMMANDS_DECODE_COMMAND_H

#include <filesystem>

#include "oligo/common/error.h"
#include "oligo/pipeline/codec_config.h"
#include "oligo/pipeline/oligo_decoder.h"

namespace oligo::commands {

struct DecodeOptions {
    /// @brief Input reads (FASTA or one sequence per line, "-" for stdin).
    std::filesystem::path inputPath;

    /// @brief Output file path ("-" for stdout).
    std::filesystem::path outputPath;

    pipeline::CodecConfig codec;

    bool forceOverwrite = false;

    bool showSummary = true;
};

class DecodeCommand {
public:
    explicit DecodeCommand(DecodeOptions options);

    ~DecodeCommand();

    // Non-copyable, movable
    DecodeCommand(const DecodeCommand&) = delete;
    DecodeCommand& operator=(const DecodeCommand&) = delete;
    DecodeCommand(DecodeCommand&&) noexcept;
    DecodeCommand& operator=(DecodeCommand&&) noexcept;

    /// @brief Execute the decode command.
    /// @return Exit code (0 = success, 11 = incomplete decode).
    [[nodiscard]] int execute();

    [[nodiscard]] const DecodeOptions& options() const noexcept { return options_; }

private:
    void validateOptions() const;

    void printSummary(const pipeline::DecodeReport& report) const;

    DecodeOptions options_;
};

}  // namespace oligo::commands

#endif  // OLIGO_COMMANDS_DECODE_COMMAND_H
