// =============================================================================
// oligo-codec - Oligo File I/O
// =============================================================================
// Text formats for oligo pools and binary helpers for the CLI.
//
// Writing produces FASTA with one record per oligo:
//   >D:3/12:0/4:r1
//   AGCC...
// (type letter, chunk/totalChunks, seq/totalSeqs, replicate).
//
// Reading accepts FASTA (multi-line sequences are joined) or one sequence
// per line. Record names are ignored: addressing comes from each oligo's own
// header, so pools may be shuffled, merged or renamed freely.
// =============================================================================

#ifndef OLIGO_IO_OLIGO_FILE_H
#define OLIGO_IO_OLIGO_FILE_H

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "oligo/format/oligo_header.h"

namespace oligo::io {

/// @brief FASTA record name for @p record (without the leading '>').
[[nodiscard]] std::string fastaName(const format::OligoRecord& record);

/// @brief Write @p records as FASTA.
/// @throws IOError if the stream fails.
void writeFasta(std::ostream& out, std::span<const format::OligoRecord> records);

/// @brief Write @p records as FASTA to @p path ("-" for stdout).
/// @throws IOError if the file cannot be written.
void writeFasta(const std::filesystem::path& path, std::span<const format::OligoRecord> records);

/// @brief Read sequences from FASTA or plain text.
/// @param sourceName Name used in error messages.
/// @throws FormatError with the line number on symbols outside ACGTN.
[[nodiscard]] std::vector<std::string> readSequences(std::istream& in,
                                                     std::string_view sourceName = "<stream>");

/// @brief Read sequences from @p path ("-" for stdin).
/// @throws IOError if the file cannot be opened.
[[nodiscard]] std::vector<std::string> readSequences(const std::filesystem::path& path);

/// @brief Read a whole file as bytes ("-" for stdin).
/// @throws IOError on failure.
[[nodiscard]] std::vector<std::uint8_t> readBinaryFile(const std::filesystem::path& path);

/// @brief Write bytes to @p path ("-" for stdout), replacing any existing file.
/// @throws IOError on failure.
void writeBinaryFile(const std::filesystem::path& path, std::span<const std::uint8_t> data);

}  // namespace oligo::io

#endif  // OLIGO_IO_OLIGO_FILE_H
