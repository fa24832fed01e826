// =============================================================================
// oligo-codec - DNA Storage Oligo Codec
// =============================================================================
// Main entry point for the oligoc command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: encode, decode, verify
// - Global options: threads, verbosity, log file
// - Codec options shared by every subcommand
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "oligo/common/error.h"
#include "oligo/common/logger.h"
#include "oligo/common/types.h"
#include "oligo/pipeline/codec_config.h"

// Command implementations
#include "commands/decode_command.h"
#include "commands/encode_command.h"
#include "commands/verify_command.h"

// Forward declarations for command handlers
namespace oligo::commands {
int runEncode(CLI::App* app);
int runDecode(CLI::App* app);
int runVerify(CLI::App* app);
}  // namespace oligo::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "oligoc: encode files into synthesizable DNA oligo pools and back\n"
    "Each chunk is protected by CRC-32 and Reed-Solomon parity, mapped to\n"
    "nucleotides under GC and homopolymer constraints, and addressed by a\n"
    "self-describing header so reads may arrive shuffled and duplicated.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::size_t threads = 0;  // 0 = auto-detect
    int verbosity = 0;        // 0 = normal, 1 = verbose, 2 = trace
    bool quiet = false;
    std::string logFile;
    std::string logLevel;  // overrides -v/-q when set
};

GlobalOptions gOptions;

// =============================================================================
// Encode Command Options
// =============================================================================

struct CliEncodeOptions {
    std::string input;
    std::string output;
    oligo::pipeline::CodecConfig codec;
    bool force = false;
};

CliEncodeOptions gEncodeOpts;

// =============================================================================
// Decode Command Options
// =============================================================================

struct CliDecodeOptions {
    std::string input;
    std::string output;
    oligo::pipeline::CodecConfig codec;
    bool force = false;
};

CliDecodeOptions gDecodeOpts;

// =============================================================================
// Verify Command Options
// =============================================================================

struct CliVerifyOptions {
    std::string input;
    std::string original;
    oligo::pipeline::CodecConfig codec;
    bool verbose = false;
};

CliVerifyOptions gVerifyOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

/// @brief Options describing oligo geometry; decode must repeat the encode values
///        whenever the manifest oligos are lost.
void addCodecOptions(CLI::App* cmd, oligo::pipeline::CodecConfig& codec) {
    cmd->add_option("--chunk-size", codec.chunkSize, "Payload bytes per chunk")
        ->default_val(oligo::kDefaultChunkSize)
        ->check(CLI::Range(std::size_t{1}, std::size_t{65535}));

    cmd->add_option("--redundancy", codec.redundancy, "Copies of each data/parity oligo")
        ->default_val(oligo::kDefaultRedundancy)
        ->check(CLI::PositiveNumber);

    cmd->add_option("--ecc", codec.errorCorrectionSymbols,
                    "Reed-Solomon parity symbols per chunk")
        ->default_val(oligo::kDefaultErrorCorrectionSymbols)
        ->check(CLI::Range(std::size_t{0}, std::size_t{250}));

    cmd->add_option("--segment-nt", codec.segmentNt, "Payload nucleotides per oligo")
        ->default_val(oligo::kDefaultSegmentNt)
        ->check(CLI::PositiveNumber);

    cmd->add_option("--header-redundancy", codec.headerRedundancy,
                    "Copies of each manifest oligo")
        ->default_val(oligo::kDefaultHeaderRedundancy)
        ->check(CLI::PositiveNumber);

    cmd->add_option("--reseed-attempts", codec.constraints.reseedAttempts,
                    "Whitening seeds tried per stream before giving up")
        ->default_val(oligo::kDefaultReseedAttempts)
        ->check(CLI::Range(1, 108));

    cmd->add_option("--gc-min", codec.constraints.gcMin, "Minimum GC fraction")
        ->default_val(oligo::kDefaultGcMin)
        ->check(CLI::Range(0.0, 1.0));

    cmd->add_option("--gc-max", codec.constraints.gcMax, "Maximum GC fraction")
        ->default_val(oligo::kDefaultGcMax)
        ->check(CLI::Range(0.0, 1.0));

    cmd->add_option("--max-run", codec.constraints.maxRunLength,
                    "Longest allowed homopolymer run")
        ->default_val(oligo::kDefaultMaxRunLength)
        ->check(CLI::PositiveNumber);
}

void addMinReplicatesOption(CLI::App* cmd, oligo::pipeline::CodecConfig& codec) {
    cmd->add_option("--min-replicates", codec.minReplicates,
                    "Reads of the modal length required per segment")
        ->default_val(oligo::kDefaultMinReplicates)
        ->check(CLI::PositiveNumber);
}

void setupEncodeCommand(CLI::App& app) {
    auto* encode = app.add_subcommand("encode", "Encode a file into an oligo pool (FASTA)");
    encode->alias("e");

    encode->add_option("-i,--input", gEncodeOpts.input, "Input file (or '-' for stdin)")
        ->required()
        ->check(CLI::ExistingFile | CLI::IsMember({"-"}));

    encode->add_option("-o,--output", gEncodeOpts.output,
                       "Output FASTA file (or '-' for stdout)")
        ->required();

    addCodecOptions(encode, gEncodeOpts.codec);

    encode->add_flag("-f,--force", gEncodeOpts.force, "Overwrite existing output file");
}

void setupDecodeCommand(CLI::App& app) {
    auto* decode = app.add_subcommand("decode", "Recover a file from sequenced reads");
    decode->alias("d");

    decode->add_option("-i,--input", gDecodeOpts.input,
                       "Reads as FASTA or one per line (or '-' for stdin)")
        ->required()
        ->check(CLI::ExistingFile | CLI::IsMember({"-"}));

    decode->add_option("-o,--output", gDecodeOpts.output, "Output file (or '-' for stdout)")
        ->required();

    addCodecOptions(decode, gDecodeOpts.codec);
    addMinReplicatesOption(decode, gDecodeOpts.codec);

    decode->add_flag("-f,--force", gDecodeOpts.force, "Overwrite existing output file");
}

void setupVerifyCommand(CLI::App& app) {
    auto* verify = app.add_subcommand("verify", "Check that a read pool decodes");
    verify->alias("v");

    verify->add_option("-i,--input", gVerifyOpts.input, "Reads as FASTA or one per line")
        ->required()
        ->check(CLI::ExistingFile);

    verify->add_option("--original", gVerifyOpts.original,
                       "Compare the decoded bytes against this file")
        ->check(CLI::ExistingFile);

    addCodecOptions(verify, gVerifyOpts.codec);
    addMinReplicatesOption(verify, gVerifyOpts.codec);

    verify->add_flag("--verbose", gVerifyOpts.verbose, "Show every check, not only failures");
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    // Global options
    app.add_option("-t,--threads", gOptions.threads, "Number of threads (0 = auto-detect)")
        ->default_val(0)
        ->check(CLI::NonNegativeNumber);

    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v, -vv for trace)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Suppress non-error output");

    app.add_option("--log-file", gOptions.logFile, "Also write log messages to this file");

    app.add_option("--log-level", gOptions.logLevel,
                   "Log level (trace, debug, info, warning, error, critical)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "warning", "error", "critical",
                               "fatal"},
                              CLI::ignore_case));

    // Setup subcommands
    setupEncodeCommand(app);
    setupDecodeCommand(app);
    setupVerifyCommand(app);

    // Require a subcommand
    app.require_subcommand(1);

    // Parse arguments
    CLI11_PARSE(app, argc, argv);

    // Initialize logger
    try {
        const auto logLevel = gOptions.logLevel.empty()
                                  ? oligo::log::levelForVerbosity(gOptions.verbosity, gOptions.quiet)
                                  : oligo::log::levelFromString(gOptions.logLevel);
        oligo::log::Config logConfig;
        logConfig.logFile = gOptions.logFile;
        logConfig.level = logLevel;
        // Keep stdout clean when it carries the pool or the decoded file
        logConfig.enableConsole = !((app.got_subcommand("encode") && gEncodeOpts.output == "-") ||
                                    (app.got_subcommand("decode") && gDecodeOpts.output == "-"));
        oligo::log::init(logConfig);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("encode")) {
            exitCode = oligo::commands::runEncode(app.get_subcommand("encode"));
        } else if (app.got_subcommand("decode")) {
            exitCode = oligo::commands::runDecode(app.get_subcommand("decode"));
        } else if (app.got_subcommand("verify")) {
            exitCode = oligo::commands::runVerify(app.get_subcommand("verify"));
        }
    } catch (const oligo::OligoException& ex) {
        OLIGO_LOG_ERROR("Error: {}", ex.what());
        exitCode = oligo::toExitCode(ex.code());
    } catch (const std::exception& ex) {
        OLIGO_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = EXIT_FAILURE;
    }

    oligo::log::shutdown();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace oligo::commands {

int runEncode([[maybe_unused]] CLI::App* app) {
    EncodeOptions opts;
    opts.inputPath = gEncodeOpts.input;
    opts.outputPath = gEncodeOpts.output;
    opts.codec = gEncodeOpts.codec;
    opts.codec.threads = gOptions.threads;
    opts.forceOverwrite = gEncodeOpts.force;
    opts.showSummary = !gOptions.quiet;

    auto cmd = std::make_unique<EncodeCommand>(std::move(opts));
    return cmd->execute();
}

int runDecode([[maybe_unused]] CLI::App* app) {
    DecodeOptions opts;
    opts.inputPath = gDecodeOpts.input;
    opts.outputPath = gDecodeOpts.output;
    opts.codec = gDecodeOpts.codec;
    opts.codec.threads = gOptions.threads;
    opts.forceOverwrite = gDecodeOpts.force;
    opts.showSummary = !gOptions.quiet;

    auto cmd = std::make_unique<DecodeCommand>(std::move(opts));
    return cmd->execute();
}

int runVerify([[maybe_unused]] CLI::App* app) {
    VerifyOptions opts;
    opts.inputPath = gVerifyOpts.input;
    if (!gVerifyOpts.original.empty()) {
        opts.originalPath = gVerifyOpts.original;
    }
    opts.codec = gVerifyOpts.codec;
    opts.codec.threads = gOptions.threads;
    opts.verbose = gVerifyOpts.verbose;

    auto cmd = std::make_unique<VerifyCommand>(std::move(opts));
    return cmd->execute();
}

}  // namespace oligo::commands
