#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <htslib/hts.h>
#include <htslib/sam.h>

#include "io/read_source.hpp"

namespace seqtally {

// Resolve the sample name of an alignment file.
// An explicit name wins; otherwise every @RG SM tag must agree.
// Returns false if no name can be determined or SM tags conflict.
bool resolve_hts_sample(sam_hdr_t* hdr, const std::string& explicit_name,
                        std::string& sample, std::string& error_msg);

// Reverse-complement an IUPAC nucleotide sequence in place.
void reverse_complement_inplace(std::string& seq);

// SAM/BAM/CRAM reader. Secondary and supplementary records are skipped;
// reverse-strand records are returned in original read orientation.
// A soft clip in the CIGAR marks the read as masked. A base outside
// ACGTNRYKMSW is a read error.
class HtsReadSource : public ReadSource {
public:
    HtsReadSource() = default;
    ~HtsReadSource() override;

    HtsReadSource(const HtsReadSource&) = delete;
    HtsReadSource& operator=(const HtsReadSource&) = delete;

    // Returns false on error (error_msg set). CRAM needs opts.reference.
    bool open(const ReadSourceOptions& opts, ReadFileFormat fmt,
              std::string& error_msg);

    void close();

    const std::string& sample_name() const override { return sample_; }

    bool read_batch(std::vector<ReadRecord>& batch, size_t max_reads) override;

    uint64_t skipped_records() const { return skipped_; }

private:
    samFile* fp_ = nullptr;
    sam_hdr_t* hdr_ = nullptr;
    bam1_t* b_ = nullptr;
    std::string path_;
    std::string sample_;
    uint64_t skipped_ = 0;
};

} // namespace seqtally
