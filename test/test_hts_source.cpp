#include "test_util.hpp"

#include "io/hts_source.hpp"
#include "io/read_source.hpp"
#include "util/logger.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <htslib/hts.h>
#include <htslib/sam.h>

using namespace seqtally;

static std::string g_test_dir;

static const char* SAM_HEADER =
    "@HD\tVN:1.6\tSO:unsorted\n"
    "@SQ\tSN:chr1\tLN:1000\n";

static const char* SAM_RECORDS =
    "r1\t0\tchr1\t1\t60\t4M\t*\t0\t0\tACGT\tIIII\n"
    "r2\t16\tchr1\t10\t60\t4M\t*\t0\t0\tAACC\tIIII\n"
    "r3\t0\tchr1\t20\t60\t1S3M\t*\t0\t0\tACGT\tIIII\n"
    "r4\t512\tchr1\t30\t60\t4M\t*\t0\t0\tGGGG\tIIII\n"
    "r5\t256\tchr1\t40\t60\t4M\t*\t0\t0\tCCCC\tIIII\n"
    "r6\t2048\tchr1\t50\t60\t4M\t*\t0\t0\tTTTT\tIIII\n"
    "r7\t4\t*\t0\t0\t*\t*\t0\t0\tTTNA\tIIII\n";

static std::string write_file(const std::string& name, const std::string& content) {
    std::string path = g_test_dir + "/" + name;
    std::ofstream out(path);
    out << content;
    return path;
}

static std::string write_sam(const std::string& name, const std::string& rg_lines) {
    return write_file(name, std::string(SAM_HEADER) + rg_lines + SAM_RECORDS);
}

// Re-encode a SAM file as BAM with htslib.
static bool sam_to_bam(const std::string& sam_path, const std::string& bam_path) {
    samFile* in = sam_open(sam_path.c_str(), "r");
    if (!in) return false;
    sam_hdr_t* hdr = sam_hdr_read(in);
    samFile* out = sam_open(bam_path.c_str(), "wb");
    bool ok = hdr && out && sam_hdr_write(out, hdr) == 0;
    bam1_t* b = bam_init1();
    while (ok) {
        int ret = sam_read1(in, hdr, b);
        if (ret == -1) break;
        if (ret < -1 || sam_write1(out, hdr, b) < 0) ok = false;
    }
    bam_destroy1(b);
    if (out && sam_close(out) != 0) ok = false;
    if (hdr) sam_hdr_destroy(hdr);
    sam_close(in);
    return ok;
}

static std::vector<ReadRecord> read_all(ReadSource& src, size_t batch_size) {
    std::vector<ReadRecord> all;
    std::vector<ReadRecord> batch;
    while (src.read_batch(batch, batch_size) && !batch.empty()) {
        for (auto& r : batch) all.push_back(r);
    }
    return all;
}

static void check_records(const std::vector<ReadRecord>& recs) {
    CHECK_EQ(recs.size(), 5u);
    if (recs.size() != 5) return;

    CHECK_STR_EQ(recs[0].sequence, "ACGT");
    CHECK(!recs[0].masked);
    CHECK(!recs[0].vendor_failed);

    // reverse strand: back to read orientation
    CHECK_STR_EQ(recs[1].sequence, "GGTT");

    CHECK(recs[2].masked);
    CHECK(recs[3].vendor_failed);

    CHECK_STR_EQ(recs[4].sequence, "TTNA");
}

static void test_reverse_complement() {
    std::fprintf(stderr, "-- test_reverse_complement\n");

    std::string s = "AACGTN";
    reverse_complement_inplace(s);
    CHECK_STR_EQ(s, "NACGTT");

    s = "RYKM";
    reverse_complement_inplace(s);
    CHECK_STR_EQ(s, "KMRY");

    s.clear();
    reverse_complement_inplace(s);
    CHECK(s.empty());
}

static void test_read_sam() {
    std::fprintf(stderr, "-- test_read_sam\n");

    std::string path = write_sam("reads.sam", "@RG\tID:rg1\tSM:sampleA\n");
    HtsReadSource src;
    ReadSourceOptions opts;
    opts.path = path;
    std::string err;
    CHECK(src.open(opts, ReadFileFormat::kSam, err));
    CHECK_STR_EQ(src.sample_name(), "sampleA");

    auto recs = read_all(src, 2);
    check_records(recs);
    CHECK_EQ(src.skipped_records(), 2u);
}

static void test_read_bam() {
    std::fprintf(stderr, "-- test_read_bam\n");

    std::string sam = write_sam("for_bam.sam",
                                "@RG\tID:rg1\tSM:sampleB\n@RG\tID:rg2\tSM:sampleB\n");
    std::string bam = g_test_dir + "/reads.bam";
    CHECK(sam_to_bam(sam, bam));

    Logger logger(Logger::kError);
    ReadSourceOptions opts;
    opts.path = bam;
    opts.threads = 8;
    std::string err;
    auto src = open_read_source(opts, logger, err);
    CHECK(src != nullptr);
    if (!src) return;
    CHECK_STR_EQ(src->sample_name(), "sampleB");
    check_records(read_all(*src, 100));
}

static void test_sample_resolution() {
    std::fprintf(stderr, "-- test_sample_resolution\n");

    HtsReadSource src;
    ReadSourceOptions opts;
    std::string err;

    // explicit name wins over a conflicting header
    opts.path = write_sam("conflict.sam",
                          "@RG\tID:a\tSM:s1\n@RG\tID:b\tSM:s2\n");
    opts.sample = "chosen";
    CHECK(src.open(opts, ReadFileFormat::kSam, err));
    CHECK_STR_EQ(src.sample_name(), "chosen");

    opts.sample.clear();
    CHECK(!src.open(opts, ReadFileFormat::kSam, err));
    CHECK(err.find("Multiple different sample names") != std::string::npos);

    // read groups without SM are ignored
    opts.path = write_sam("partial_sm.sam",
                          "@RG\tID:a\n@RG\tID:b\tSM:s3\n");
    CHECK(src.open(opts, ReadFileFormat::kSam, err));
    CHECK_STR_EQ(src.sample_name(), "s3");

    opts.path = write_sam("no_rg.sam", "");
    err.clear();
    CHECK(!src.open(opts, ReadFileFormat::kSam, err));
    CHECK(err.find("No sample name") != std::string::npos);
}

static void test_invalid_sequence() {
    std::fprintf(stderr, "-- test_invalid_sequence\n");

    std::string path = write_file("bad_base.sam",
        std::string(SAM_HEADER) + "@RG\tID:rg1\tSM:s\n" +
        "r1\t0\tchr1\t1\t60\t4M\t*\t0\t0\tACGT\tIIII\n"
        "r8\t0\tchr1\t60\t60\t4M\t*\t0\t0\tACDT\tIIII\n");

    HtsReadSource src;
    ReadSourceOptions opts;
    opts.path = path;
    std::string err;
    CHECK(src.open(opts, ReadFileFormat::kSam, err));

    std::vector<ReadRecord> batch;
    CHECK(!src.read_batch(batch, 10));
    CHECK(src.error().find("invalid sequence 'ACDT'") != std::string::npos);
    CHECK(src.error().find("r8") != std::string::npos);
}

static void test_open_errors() {
    std::fprintf(stderr, "-- test_open_errors\n");

    HtsReadSource src;
    ReadSourceOptions opts;
    std::string err;

    opts.path = g_test_dir + "/reads.cram";
    opts.sample = "s";
    CHECK(!src.open(opts, ReadFileFormat::kCram, err));
    CHECK(err.find("reference") != std::string::npos);

    opts.path = g_test_dir + "/missing.bam";
    err.clear();
    CHECK(!src.open(opts, ReadFileFormat::kBam, err));
    CHECK(!err.empty());

    std::vector<ReadRecord> batch;
    CHECK(!src.read_batch(batch, 10));
}

int main() {
    g_test_dir = "/tmp/seqtally_test_hts_source";
    std::filesystem::create_directories(g_test_dir);

    test_reverse_complement();
    test_read_sam();
    test_read_bam();
    test_sample_resolution();
    test_invalid_sequence();
    test_open_errors();

    std::filesystem::remove_all(g_test_dir);

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
