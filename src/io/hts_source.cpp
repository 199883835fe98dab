#include "io/hts_source.hpp"
#include "core/config.hpp"
#include "io/fastq_source.hpp"

#include <algorithm>
#include <utility>

#include <htslib/kstring.h>

namespace seqtally {

// Records that repeat a read already present as a primary alignment
static constexpr uint16_t SKIP_READ_FLAGS = BAM_FSECONDARY | BAM_FSUPPLEMENTARY;

static char complement(char c) {
    switch (c) {
        case 'A': return 'T';
        case 'C': return 'G';
        case 'G': return 'C';
        case 'T': return 'A';
        case 'a': return 't';
        case 'c': return 'g';
        case 'g': return 'c';
        case 't': return 'a';
        case 'R': return 'Y';
        case 'Y': return 'R';
        case 'K': return 'M';
        case 'M': return 'K';
        case 'B': return 'V';
        case 'V': return 'B';
        case 'D': return 'H';
        case 'H': return 'D';
        default:  return c;  // N, S, W, '='
    }
}

void reverse_complement_inplace(std::string& seq) {
    std::reverse(seq.begin(), seq.end());
    for (auto& c : seq) c = complement(c);
}

bool resolve_hts_sample(sam_hdr_t* hdr, const std::string& explicit_name,
                        std::string& sample, std::string& error_msg) {
    if (!explicit_name.empty()) {
        sample = explicit_name;
        return true;
    }

    std::string found;
    int n_rg = sam_hdr_count_lines(hdr, "RG");
    kstring_t ks = KS_INITIALIZE;
    for (int i = 0; i < n_rg; i++) {
        int ret = sam_hdr_find_tag_pos(hdr, "RG", i, "SM", &ks);
        if (ret == -1) continue;   // no SM on this read group
        if (ret < -1) {
            ks_free(&ks);
            error_msg = "failed to parse @RG header line";
            return false;
        }
        std::string sm(ks.s, ks.l);
        if (found.empty()) {
            found = std::move(sm);
        } else if (found != sm) {
            ks_free(&ks);
            error_msg = "Multiple different sample names found in header ('" +
                        found + "', '" + sm + "')";
            return false;
        }
    }
    ks_free(&ks);

    if (found.empty()) {
        error_msg = "No sample name found in input file header, please provide via '--sample'";
        return false;
    }
    sample = std::move(found);
    return true;
}

HtsReadSource::~HtsReadSource() {
    close();
}

void HtsReadSource::close() {
    if (b_) {
        bam_destroy1(b_);
        b_ = nullptr;
    }
    if (hdr_) {
        sam_hdr_destroy(hdr_);
        hdr_ = nullptr;
    }
    if (fp_) {
        sam_close(fp_);
        fp_ = nullptr;
    }
}

bool HtsReadSource::open(const ReadSourceOptions& opts, ReadFileFormat fmt,
                         std::string& error_msg) {
    close();

    if (fmt == ReadFileFormat::kCram && opts.reference.empty()) {
        error_msg = "CRAM input requires a reference file (use --reference)";
        return false;
    }

    fp_ = sam_open(opts.path.c_str(), "r");
    if (!fp_) {
        error_msg = "HTS file error: cannot open " + opts.path;
        return false;
    }

    if (!opts.reference.empty()) {
        if (hts_set_fai_filename(fp_, opts.reference.c_str()) != 0) {
            error_msg = "HTS file error: cannot use reference " + opts.reference;
            close();
            return false;
        }
    }

    int threads = std::min(opts.threads, MAX_HTS_THREADS);
    if (threads > 1 && hts_set_threads(fp_, threads) != 0) {
        error_msg = "HTS file error: cannot start decompression threads";
        close();
        return false;
    }

    hdr_ = sam_hdr_read(fp_);
    if (!hdr_) {
        error_msg = "HTS file error: cannot read header of " + opts.path;
        close();
        return false;
    }

    if (!resolve_hts_sample(hdr_, opts.sample, sample_, error_msg)) {
        close();
        return false;
    }

    b_ = bam_init1();
    path_ = opts.path;
    skipped_ = 0;
    error_.clear();
    return true;
}

bool HtsReadSource::read_batch(std::vector<ReadRecord>& batch, size_t max_reads) {
    batch.clear();
    if (!fp_) {
        error_ = "HTS source is not open";
        return false;
    }

    while (batch.size() < max_reads) {
        int ret = sam_read1(fp_, hdr_, b_);
        if (ret == -1) break;
        if (ret < -1) {
            error_ = "HTS file error: failed to read record from " + path_;
            return false;
        }

        const bam1_core_t& core = b_->core;
        if (core.flag & SKIP_READ_FLAGS) {
            skipped_++;
            continue;
        }

        ReadRecord rec;
        rec.vendor_failed = (core.flag & BAM_FQCFAIL) != 0;

        const uint8_t* s = bam_get_seq(b_);
        rec.sequence.resize(static_cast<size_t>(core.l_qseq));
        for (int32_t i = 0; i < core.l_qseq; i++) {
            rec.sequence[static_cast<size_t>(i)] = seq_nt16_str[bam_seqi(s, i)];
        }
        if (!is_fastq_sequence(rec.sequence)) {
            error_ = path_ + ": invalid sequence '" + rec.sequence + "' in record " +
                     bam_get_qname(b_);
            return false;
        }
        if (core.flag & BAM_FREVERSE) reverse_complement_inplace(rec.sequence);

        const uint32_t* cigar = bam_get_cigar(b_);
        for (uint32_t i = 0; i < core.n_cigar; i++) {
            if (bam_cigar_op(cigar[i]) == BAM_CSOFT_CLIP) {
                rec.masked = true;
                break;
            }
        }

        batch.push_back(std::move(rec));
    }
    return true;
}

} // namespace seqtally
