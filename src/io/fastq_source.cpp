#include "io/fastq_source.hpp"

#include <cctype>
#include <utility>

namespace seqtally {

static bool is_all_digits_or_plus(const std::string& s, size_t begin, size_t end) {
    if (begin >= end) return false;
    for (size_t i = begin; i < end; i++) {
        char c = s[i];
        if (!std::isdigit(static_cast<unsigned char>(c)) && c != '+') return false;
    }
    return true;
}

static bool has_whitespace(const std::string& s, size_t begin, size_t end) {
    for (size_t i = begin; i < end; i++) {
        if (std::isspace(static_cast<unsigned char>(s[i]))) return true;
    }
    return false;
}

// CASAVA 1.8+ comment: <0|1|2>:<Y|N>+:<digits/+>:<non-space>
static bool parse_casava_comment(const std::string& c, FastqHeader& out) {
    if (c.size() < 2 || c[0] < '0' || c[0] > '2' || c[1] != ':') return false;

    size_t pos = 2;
    size_t flags_start = pos;
    while (pos < c.size() && (c[pos] == 'Y' || c[pos] == 'N')) pos++;
    if (pos == flags_start || pos >= c.size() || c[pos] != ':') return false;
    // With repeated flag characters the last one decides
    bool qc_fail = c[pos - 1] == 'Y';
    pos++;

    size_t control_end = c.find(':', pos);
    if (control_end == std::string::npos) return false;
    if (!is_all_digits_or_plus(c, pos, control_end)) return false;
    pos = control_end + 1;

    if (pos >= c.size() || has_whitespace(c, pos, c.size())) return false;

    out.pair_member = c[0] - '0';
    out.qc_fail = qc_fail;
    return true;
}

bool parse_fastq_header(const std::string& line, FastqHeader& out) {
    if (line.size() < 2 || line[0] != '@') return false;

    size_t ws = 1;
    while (ws < line.size() && !std::isspace(static_cast<unsigned char>(line[ws]))) ws++;

    FastqHeader h;
    if (ws == line.size()) {
        std::string id = line.substr(1);
        size_t slash = id.rfind('/');
        if (slash == std::string::npos) {
            h.name = std::move(id);
        } else if (slash == id.size() - 2 && slash > 0 &&
                   (id.back() == '1' || id.back() == '2')) {
            h.pair_member = id.back() - '0';
            h.name = id.substr(0, slash);
        } else {
            return false;
        }
        out = std::move(h);
        return true;
    }

    if (ws == 1) return false;
    h.name = line.substr(1, ws - 1);
    if (!parse_casava_comment(line.substr(ws + 1), h)) return false;
    out = std::move(h);
    return true;
}

bool is_fastq_sequence(const std::string& seq) {
    for (char c : seq) {
        switch (std::toupper(static_cast<unsigned char>(c))) {
            case 'A': case 'C': case 'G': case 'T':
            case 'N': case 'R': case 'Y': case 'K':
            case 'M': case 'S': case 'W':
                break;
            default:
                return false;
        }
    }
    return true;
}

static bool has_lowercase(const std::string& seq) {
    for (char c : seq) {
        if (std::islower(static_cast<unsigned char>(c))) return true;
    }
    return false;
}

FastqReadSource::~FastqReadSource() {
    close();
    ks_free(&buf_);
}

bool FastqReadSource::open(const std::string& path, const std::string& sample,
                           std::string& error_msg) {
    close();
    if (sample.empty()) {
        error_msg = "Sample name required for FASTQ inputs (use --sample)";
        return false;
    }
    fp_ = bgzf_open(path.c_str(), "r");
    if (!fp_) {
        error_msg = "cannot open FASTQ file " + path;
        return false;
    }
    path_ = path;
    sample_ = sample;
    line_no_ = 0;
    records_ = 0;
    error_.clear();
    return true;
}

void FastqReadSource::close() {
    if (fp_) {
        bgzf_close(fp_);
        fp_ = nullptr;
    }
}

bool FastqReadSource::next_line(std::string& line) {
    int ret = bgzf_getline(fp_, '\n', &buf_);
    if (ret == -1) return false;
    if (ret < -1) {
        error_ = path_ + ": read error near line " + std::to_string(line_no_ + 1);
        return false;
    }
    line_no_++;
    line.assign(buf_.s, buf_.l);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return true;
}

bool FastqReadSource::next_record(ReadRecord& rec) {
    std::string header;
    do {
        if (!next_line(header)) return false;
    } while (header.empty());

    uint64_t header_line = line_no_;
    FastqHeader h;
    if (!parse_fastq_header(header, h)) {
        error_ = path_ + ":" + std::to_string(header_line) +
                 ": unsupported FASTQ header format: " + header;
        return false;
    }

    std::string sep, qual;
    if (!next_line(rec.sequence) || !next_line(sep) || !next_line(qual)) {
        if (error_.empty())
            error_ = path_ + ":" + std::to_string(header_line) +
                     ": truncated FASTQ record " + h.name;
        return false;
    }
    if (sep.empty() || sep[0] != '+') {
        error_ = path_ + ":" + std::to_string(header_line + 2) +
                 ": missing '+' separator in record " + h.name;
        return false;
    }
    if (qual.size() != rec.sequence.size()) {
        error_ = path_ + ":" + std::to_string(header_line + 3) +
                 ": quality length differs from sequence length in record " + h.name;
        return false;
    }
    if (!is_fastq_sequence(rec.sequence)) {
        error_ = path_ + ":" + std::to_string(header_line + 1) +
                 ": invalid sequence '" + rec.sequence + "'";
        return false;
    }

    rec.vendor_failed = h.qc_fail;
    rec.masked = has_lowercase(rec.sequence);
    records_++;
    return true;
}

bool FastqReadSource::read_batch(std::vector<ReadRecord>& batch, size_t max_reads) {
    batch.clear();
    if (!fp_) {
        error_ = "FASTQ source is not open";
        return false;
    }
    ReadRecord rec;
    while (batch.size() < max_reads) {
        if (!next_record(rec)) {
            if (!error_.empty()) return false;
            break;
        }
        batch.push_back(std::move(rec));
        rec = ReadRecord();
    }
    return true;
}

} // namespace seqtally
