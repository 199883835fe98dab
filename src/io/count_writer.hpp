#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace seqtally {

class SequenceCounter;
struct LibraryMatch;

// Provenance written at the top of every TSV output.
struct OutputHeader {
    std::string command;
    std::string version;
};

// "##Command: ..", "##Version: ..", "#F1\tF2..." lines.
std::string format_tsv_header(const OutputHeader& header,
                              const std::vector<std::string>& fields);

// One row per unique accepted sequence, ascending by sequence:
//   SEQUENCE LENGTH COUNT
// Returns false on I/O error (error_msg set).
bool write_query_counts(const std::string& path,
                        const SequenceCounter& counts,
                        const OutputHeader& header,
                        bool compress,
                        std::string& error_msg);

// One row per library entry, in library order:
//   ID NAME SEQUENCE LENGTH COUNT UNIQUE SAMPLE
bool write_library_counts(const std::string& path,
                          const LibraryMatch& match,
                          const OutputHeader& header,
                          bool compress,
                          std::string& error_msg);

// Top-k sequences as FASTA, by count descending then sequence ascending.
// Record headers are ">seqtally|<rank>|<count>".
bool write_most_common(const std::string& path,
                       const SequenceCounter& counts,
                       size_t k,
                       bool compress,
                       std::string& error_msg);

// "<prefix>.<sample>.top<k>.fasta" (+ ".gz").
std::string most_common_path(const std::string& prefix,
                             const std::string& sample,
                             size_t k,
                             bool compress);

} // namespace seqtally
