#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <htslib/bgzf.h>
#include <htslib/kstring.h>

#include "io/read_source.hpp"

namespace seqtally {

// Parsed FASTQ header line.
struct FastqHeader {
    std::string name;
    int pair_member = 0;     // 0 = none, 1 or 2
    bool qc_fail = false;    // CASAVA 1.8+ "Y" filter flag
};

// Parse a FASTQ header. Accepted forms:
//   @name
//   @name/1, @name/2
//   @name <0|1|2>:<Y|N>:<control>:<index>     (CASAVA 1.8+)
// Returns false for anything else.
bool parse_fastq_header(const std::string& line, FastqHeader& out);

// True if every base is an IUPAC letter in ACGTNRYKMSW (either case).
bool is_fastq_sequence(const std::string& seq);

// FASTQ reader on top of htslib BGZF, which reads plain, gzip and BGZF
// input transparently. Any lowercase base marks the read as masked.
class FastqReadSource : public ReadSource {
public:
    FastqReadSource() = default;
    ~FastqReadSource() override;

    FastqReadSource(const FastqReadSource&) = delete;
    FastqReadSource& operator=(const FastqReadSource&) = delete;

    // Open path ("-" for stdin). Returns false on error (error_msg set).
    bool open(const std::string& path, const std::string& sample,
              std::string& error_msg);

    void close();

    const std::string& sample_name() const override { return sample_; }

    bool read_batch(std::vector<ReadRecord>& batch, size_t max_reads) override;

    uint64_t records_read() const { return records_; }

private:
    // Next line without its terminator. Returns false at end of input or
    // on error (error_ is set on error).
    bool next_line(std::string& line);

    // Read one record. Returns false at end of input or on error.
    bool next_record(ReadRecord& rec);

    BGZF* fp_ = nullptr;
    kstring_t buf_ = KS_INITIALIZE;
    std::string path_;
    std::string sample_;
    uint64_t line_no_ = 0;
    uint64_t records_ = 0;
};

} // namespace seqtally
