#include "io/count_writer.hpp"
#include "io/output_file.hpp"
#include "core/config.hpp"
#include "count/sequence_counter.hpp"
#include "library/library_matcher.hpp"

namespace seqtally {

// Rows are buffered and flushed in blocks of roughly this many bytes
static constexpr size_t WRITE_BLOCK_SIZE = 1 << 20;

std::string format_tsv_header(const OutputHeader& header,
                              const std::vector<std::string>& fields) {
    std::string out;
    out += "##Command: " + header.command + "\n";
    out += "##Version: " + header.version + "\n";
    out += '#';
    for (size_t i = 0; i < fields.size(); i++) {
        if (i > 0) out += '\t';
        out += fields[i];
    }
    out += '\n';
    return out;
}

static bool open_output(OutputFile& out, const std::string& path, bool compress,
                        std::string& error_msg) {
    if (!out.open(path, compress)) {
        error_msg = "cannot open output file " + path;
        return false;
    }
    return true;
}

static bool write_failed(const std::string& path, std::string& error_msg) {
    error_msg = "failed writing " + path;
    return false;
}

static bool finish_output(OutputFile& out, std::string& error_msg) {
    if (!out.close()) {
        error_msg = "failed writing " + out.path();
        return false;
    }
    return true;
}

bool write_query_counts(const std::string& path,
                        const SequenceCounter& counts,
                        const OutputHeader& header,
                        bool compress,
                        std::string& error_msg) {
    OutputFile out;
    if (!open_output(out, path, compress, error_msg)) return false;

    std::string buf = format_tsv_header(header, {"SEQUENCE", "LENGTH", "COUNT"});
    for (const auto& row : counts.sorted_by_sequence()) {
        buf += row.sequence;
        buf += '\t';
        buf += std::to_string(row.length);
        buf += '\t';
        buf += std::to_string(row.count);
        buf += '\n';
        if (buf.size() >= WRITE_BLOCK_SIZE) {
            if (!out.write(buf)) return write_failed(path, error_msg);
            buf.clear();
        }
    }
    if (!out.write(buf)) return write_failed(path, error_msg);
    return finish_output(out, error_msg);
}

bool write_library_counts(const std::string& path,
                          const LibraryMatch& match,
                          const OutputHeader& header,
                          bool compress,
                          std::string& error_msg) {
    OutputFile out;
    if (!open_output(out, path, compress, error_msg)) return false;

    std::string buf = format_tsv_header(
        header, {"ID", "NAME", "SEQUENCE", "LENGTH", "COUNT", "UNIQUE", "SAMPLE"});
    for (const auto& t : match.templates) {
        const LibraryEntry& e = *t.entry;
        buf += e.id;
        buf += '\t';
        buf += e.name;
        buf += '\t';
        buf += e.sequence;
        buf += '\t';
        buf += std::to_string(e.sequence.size());
        buf += '\t';
        buf += std::to_string(t.count);
        buf += '\t';
        buf += t.unique ? '1' : '0';
        buf += '\t';
        buf += match.sample_name;
        buf += '\n';
        if (buf.size() >= WRITE_BLOCK_SIZE) {
            if (!out.write(buf)) return write_failed(path, error_msg);
            buf.clear();
        }
    }
    if (!out.write(buf)) return write_failed(path, error_msg);
    return finish_output(out, error_msg);
}

bool write_most_common(const std::string& path,
                       const SequenceCounter& counts,
                       size_t k,
                       bool compress,
                       std::string& error_msg) {
    OutputFile out;
    if (!open_output(out, path, compress, error_msg)) return false;

    std::string buf;
    size_t rank = 0;
    for (const auto& row : counts.most_common(k)) {
        rank++;
        buf += ">seqtally|" + std::to_string(rank) + "|" + std::to_string(row.count) + "\n";
        buf += row.sequence;
        buf += '\n';
    }
    if (!out.write(buf)) return write_failed(path, error_msg);
    return finish_output(out, error_msg);
}

std::string most_common_path(const std::string& prefix,
                             const std::string& sample,
                             size_t k,
                             bool compress) {
    std::string path = prefix + "." + (sample.empty() ? std::string("seqtally") : sample) +
                       ".top" + std::to_string(k) + ".fasta";
    if (compress) path += COMPRESSED_SUFFIX;
    return path;
}

} // namespace seqtally
