// =============================================================================
// oligo-codec - Oligo File I/O Implementation
// =============================================================================

#include "oligo/io/oligo_file.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>

#include <fmt/format.h>

#include "oligo/common/error.h"
#include "oligo/common/logger.h"

namespace oligo::io {

namespace {

bool isStdStream(const std::filesystem::path& path) {
    return path == "-";
}

bool isSequenceSymbol(char c) noexcept {
    return c == 'A' || c == 'C' || c == 'G' || c == 'T' || c == 'N';
}

/// @brief Trim surrounding whitespace (including a trailing CR).
std::string_view trim(std::string_view line) noexcept {
    while (!line.empty() && std::isspace(static_cast<unsigned char>(line.front()))) {
        line.remove_prefix(1);
    }
    while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) {
        line.remove_suffix(1);
    }
    return line;
}

}  // namespace

// =============================================================================
// FASTA Writing
// =============================================================================

std::string fastaName(const format::OligoRecord& record) {
    const auto& h = record.header;
    return fmt::format("{}:{}/{}:{}/{}:r{}", oligoTypeLetter(h.type), h.chunkIdx, h.totalChunks,
                       h.seqIdx, h.totalSeqs, record.replicateId);
}

void writeFasta(std::ostream& out, std::span<const format::OligoRecord> records) {
    for (const auto& record : records) {
        out << '>' << fastaName(record) << '\n' << record.prefix << record.payload << '\n';
    }
    out.flush();
    if (!out) {
        throw IOError("failed to write FASTA output");
    }
}

void writeFasta(const std::filesystem::path& path, std::span<const format::OligoRecord> records) {
    if (isStdStream(path)) {
        writeFasta(std::cout, records);
        return;
    }
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw IOError("cannot open output file", ErrorContext(path.string()));
    }
    writeFasta(file, records);
    OLIGO_LOG_DEBUG("Wrote {} oligos to {}", records.size(), path.string());
}

// =============================================================================
// Sequence Reading
// =============================================================================

std::vector<std::string> readSequences(std::istream& in, std::string_view sourceName) {
    std::vector<std::string> sequences;
    std::string line;
    std::uint64_t lineNumber = 0;
    bool inFastaRecord = false;

    while (std::getline(in, line)) {
        ++lineNumber;
        std::string_view view = trim(line);
        if (view.empty()) {
            continue;
        }
        if (view.front() == '>') {
            inFastaRecord = true;
            sequences.emplace_back();
            continue;
        }

        std::string symbols(view);
        std::transform(symbols.begin(), symbols.end(), symbols.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        auto bad = std::find_if_not(symbols.begin(), symbols.end(), isSequenceSymbol);
        if (bad != symbols.end()) {
            throw FormatError(
                fmt::format("invalid nucleotide '{}' at column {}", *bad,
                            std::distance(symbols.begin(), bad) + 1),
                ErrorContext(std::string(sourceName)).withLine(lineNumber));
        }

        if (inFastaRecord) {
            sequences.back() += symbols;
        } else {
            sequences.push_back(std::move(symbols));
        }
    }

    if (in.bad()) {
        throw IOError("read failure", ErrorContext(std::string(sourceName)));
    }

    // FASTA records without sequence lines carry nothing to decode
    sequences.erase(std::remove_if(sequences.begin(), sequences.end(),
                                   [](const std::string& s) { return s.empty(); }),
                    sequences.end());
    return sequences;
}

std::vector<std::string> readSequences(const std::filesystem::path& path) {
    if (isStdStream(path)) {
        return readSequences(std::cin, "<stdin>");
    }
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IOError("cannot open input file", ErrorContext(path.string()));
    }
    auto sequences = readSequences(file, path.string());
    OLIGO_LOG_DEBUG("Read {} sequences from {}", sequences.size(), path.string());
    return sequences;
}

// =============================================================================
// Binary Files
// =============================================================================

std::vector<std::uint8_t> readBinaryFile(const std::filesystem::path& path) {
    std::istream* in = &std::cin;
    std::ifstream file;
    if (!isStdStream(path)) {
        file.open(path, std::ios::binary);
        if (!file.is_open()) {
            throw IOError("cannot open input file", ErrorContext(path.string()));
        }
        in = &file;
    }

    std::vector<std::uint8_t> data{std::istreambuf_iterator<char>(*in),
                                   std::istreambuf_iterator<char>()};
    if (in->bad()) {
        throw IOError("read failure", ErrorContext(path.string()));
    }
    return data;
}

void writeBinaryFile(const std::filesystem::path& path, std::span<const std::uint8_t> data) {
    std::ostream* out = &std::cout;
    std::ofstream file;
    if (!isStdStream(path)) {
        file.open(path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw IOError("cannot open output file", ErrorContext(path.string()));
        }
        out = &file;
    }

    out->write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    out->flush();
    if (!*out) {
        throw IOError("write failure", ErrorContext(path.string()));
    }
}

}  // namespace oligo::io
