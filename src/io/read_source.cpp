#include "io/read_source.hpp"
#include "io/fastq_source.hpp"
#include "io/hts_source.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace seqtally {

ReadFileFormat detect_read_file_format(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".sam") return ReadFileFormat::kSam;
    if (ext == ".bam") return ReadFileFormat::kBam;
    if (ext == ".cram") return ReadFileFormat::kCram;
    return ReadFileFormat::kFastq;
}

const char* read_file_format_name(ReadFileFormat fmt) {
    switch (fmt) {
        case ReadFileFormat::kFastq: return "FASTQ";
        case ReadFileFormat::kSam:   return "SAM";
        case ReadFileFormat::kBam:   return "BAM";
        case ReadFileFormat::kCram:  return "CRAM";
    }
    return "unknown";
}

std::unique_ptr<ReadSource> open_read_source(const ReadSourceOptions& opts,
                                             const Logger& logger,
                                             std::string& error_msg) {
    ReadFileFormat fmt = detect_read_file_format(opts.path);
    logger.info("Sequence input detected as %s", read_file_format_name(fmt));

    if (fmt == ReadFileFormat::kFastq) {
        auto src = std::make_unique<FastqReadSource>();
        if (!src->open(opts.path, opts.sample, error_msg)) return nullptr;
        logger.debug("Sample name: %s", src->sample_name().c_str());
        return src;
    }

    auto src = std::make_unique<HtsReadSource>();
    if (!src->open(opts, fmt, error_msg)) return nullptr;
    logger.debug("Sample name: %s", src->sample_name().c_str());
    return src;
}

} // namespace seqtally
