#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace seqtally {

class Logger;

enum class ReadFileFormat { kFastq, kSam, kBam, kCram };

// Detect the input format from the file extension.
// .sam/.bam/.cram select the HTS reader, anything else is FASTQ
// (plain or gzip compressed).
ReadFileFormat detect_read_file_format(const std::string& path);

const char* read_file_format_name(ReadFileFormat fmt);

// Sequential reader of single-sample read records.
class ReadSource {
public:
    virtual ~ReadSource() = default;

    // Sample name resolved when the source was opened.
    virtual const std::string& sample_name() const = 0;

    // Replace batch with up to max_reads records.
    // An empty batch after a true return means end of input.
    // Returns false on a read error; error() then describes it.
    virtual bool read_batch(std::vector<ReadRecord>& batch, size_t max_reads) = 0;

    const std::string& error() const { return error_; }

protected:
    std::string error_;
};

struct ReadSourceOptions {
    std::string path;
    std::string sample;        // empty = take from file metadata
    std::string reference;     // reference FASTA (CRAM only)
    int threads = 1;           // decompression threads (HTS only)
};

// Open the reader matching the input format.
// Returns nullptr on failure and sets error_msg.
std::unique_ptr<ReadSource> open_read_source(const ReadSourceOptions& opts,
                                             const Logger& logger,
                                             std::string& error_msg);

} // namespace seqtally
