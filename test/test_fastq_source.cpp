#include "test_util.hpp"

#include "io/fastq_source.hpp"
#include "io/output_file.hpp"
#include "io/read_source.hpp"
#include "util/logger.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <unistd.h>

using namespace seqtally;

static std::string g_test_dir;

static std::string write_file(const std::string& name, const std::string& content) {
    std::string path = g_test_dir + "/" + name;
    std::ofstream out(path);
    out << content;
    return path;
}

static void test_parse_headers() {
    std::fprintf(stderr, "-- test_parse_headers\n");

    FastqHeader h;
    CHECK(parse_fastq_header("@read1", h));
    CHECK_STR_EQ(h.name, "read1");
    CHECK_EQ(h.pair_member, 0);
    CHECK(!h.qc_fail);

    CHECK(parse_fastq_header("@read1/2", h));
    CHECK_STR_EQ(h.name, "read1");
    CHECK_EQ(h.pair_member, 2);

    CHECK(parse_fastq_header("@a/b/1", h));
    CHECK_STR_EQ(h.name, "a/b");
    CHECK_EQ(h.pair_member, 1);

    CHECK(parse_fastq_header("@M0:1:FC:1:1:10:20 1:N:0:ATCACG", h));
    CHECK_STR_EQ(h.name, "M0:1:FC:1:1:10:20");
    CHECK_EQ(h.pair_member, 1);
    CHECK(!h.qc_fail);

    CHECK(parse_fastq_header("@M0:1:FC:1:1:10:20 2:Y:18:ATCACG+GGTTAA", h));
    CHECK_EQ(h.pair_member, 2);
    CHECK(h.qc_fail);

    CHECK(!parse_fastq_header("read1", h));
    CHECK(!parse_fastq_header("@", h));
    CHECK(!parse_fastq_header("@read1/3", h));
    CHECK(!parse_fastq_header("@read1 free text", h));
    CHECK(!parse_fastq_header("@read1 1:X:0:ACGT", h));
    CHECK(!parse_fastq_header("@read1 1:N:abc:ACGT", h));
}

static void test_sequence_alphabet() {
    std::fprintf(stderr, "-- test_sequence_alphabet\n");

    CHECK(is_fastq_sequence("ACGTNRYKMSW"));
    CHECK(is_fastq_sequence("acgtn"));
    CHECK(is_fastq_sequence(""));
    CHECK(!is_fastq_sequence("ACGU"));
    CHECK(!is_fastq_sequence("AC-T"));
    CHECK(!is_fastq_sequence("ACBT"));
}

static void test_read_records() {
    std::fprintf(stderr, "-- test_read_records\n");

    std::string path = write_file("reads.fq",
        "@r1\nACGT\n+\nIIII\n"
        "\n"
        "@r2 1:Y:0:ACGT\nCCCC\n+r2\nIIII\n"
        "@r3/1\nacGT\n+\nIIII\r\n"
        "@r4\nNNAA\n+\nIIII\n"
        "@r5\n\n+\n\n");

    FastqReadSource src;
    std::string err;
    CHECK(src.open(path, "S1", err));
    CHECK_STR_EQ(src.sample_name(), "S1");

    std::vector<ReadRecord> batch;
    CHECK(src.read_batch(batch, 3));
    CHECK_EQ(batch.size(), 3u);
    CHECK_STR_EQ(batch[0].sequence, "ACGT");
    CHECK(!batch[0].vendor_failed);
    CHECK(!batch[0].masked);
    CHECK(batch[1].vendor_failed);
    CHECK_STR_EQ(batch[2].sequence, "acGT");
    CHECK(batch[2].masked);

    CHECK(src.read_batch(batch, 3));
    CHECK_EQ(batch.size(), 2u);
    CHECK_STR_EQ(batch[0].sequence, "NNAA");
    CHECK_EQ(batch[1].length(), 0u);

    CHECK(src.read_batch(batch, 3));
    CHECK(batch.empty());
    CHECK_EQ(src.records_read(), 5u);
}

static void test_compressed_input() {
    std::fprintf(stderr, "-- test_compressed_input\n");

    std::string path = g_test_dir + "/reads.fq.gz";
    {
        OutputFile out;
        CHECK(out.open(path, true));
        for (int i = 0; i < 100; i++)
            CHECK(out.write("@r" + std::to_string(i) + "\nGATTACA\n+\nIIIIIII\n"));
        CHECK(out.close());
    }

    FastqReadSource src;
    std::string err;
    CHECK(src.open(path, "S1", err));
    std::vector<ReadRecord> batch;
    size_t total = 0;
    for (;;) {
        CHECK(src.read_batch(batch, 32));
        if (batch.empty()) break;
        for (auto& r : batch) CHECK_STR_EQ(r.sequence, "GATTACA");
        total += batch.size();
    }
    CHECK_EQ(total, 100u);
}

static void check_read_error(const std::string& name, const std::string& content,
                             const std::string& expected_fragment) {
    std::string path = write_file(name, content);
    FastqReadSource src;
    std::string err;
    CHECK(src.open(path, "S1", err));
    std::vector<ReadRecord> batch;
    CHECK(!src.read_batch(batch, 100));
    CHECK(src.error().find(expected_fragment) != std::string::npos);
}

static void test_read_errors() {
    std::fprintf(stderr, "-- test_read_errors\n");

    check_read_error("bad_header.fq", "@r1\nACGT\n+\nIIII\nr2\nACGT\n+\nIIII\n",
                     "unsupported FASTQ header");
    check_read_error("truncated.fq", "@r1\nACGT\n+\n", "truncated");
    check_read_error("no_plus.fq", "@r1\nACGT\n-\nIIII\n", "missing '+'");
    check_read_error("qual_len.fq", "@r1\nACGT\n+\nIII\n", "quality length");
    check_read_error("bad_seq.fq", "@r1\nAC.T\n+\nIIII\n", "invalid sequence");
}

static void test_open_errors() {
    std::fprintf(stderr, "-- test_open_errors\n");

    std::string path = write_file("ok.fq", "@r1\nACGT\n+\nIIII\n");
    FastqReadSource src;
    std::string err;
    CHECK(!src.open(path, "", err));
    CHECK(err.find("Sample name required") != std::string::npos);

    err.clear();
    CHECK(!src.open(g_test_dir + "/missing.fq", "S1", err));
    CHECK(!err.empty());
}

// Run fn with stderr redirected to a file and return what was written.
template <typename Fn>
static std::string capture_stderr(Fn fn) {
    std::string path = g_test_dir + "/stderr.txt";
    std::fflush(stderr);
    int saved = dup(STDERR_FILENO);
    FILE* f = std::fopen(path.c_str(), "w");
    if (saved < 0 || !f) {
        if (f) std::fclose(f);
        if (saved >= 0) close(saved);
        return {};
    }
    dup2(fileno(f), STDERR_FILENO);
    fn();
    std::fflush(stderr);
    dup2(saved, STDERR_FILENO);
    close(saved);
    std::fclose(f);

    std::ifstream in(path);
    return std::string((std::istreambuf_iterator<char>(in)),
                       std::istreambuf_iterator<char>());
}

static void test_sample_name_logged() {
    std::fprintf(stderr, "-- test_sample_name_logged\n");

    std::string path = write_file("logged.fq", "@r1\nACGT\n+\nIIII\n");
    Logger logger(Logger::kDebug);
    ReadSourceOptions opts;
    opts.path = path;
    opts.sample = "S7";
    bool opened = false;
    std::string log = capture_stderr([&]() {
        std::string err;
        opened = open_read_source(opts, logger, err) != nullptr;
    });
    CHECK(opened);
    CHECK(log.find("INFO: Sequence input detected as FASTQ") != std::string::npos);
    CHECK(log.find("DEBUG: Sample name: S7") != std::string::npos);
}

static void test_open_read_source() {
    std::fprintf(stderr, "-- test_open_read_source\n");

    CHECK(detect_read_file_format("x.fastq.gz") == ReadFileFormat::kFastq);
    CHECK(detect_read_file_format("x.fq") == ReadFileFormat::kFastq);
    CHECK(detect_read_file_format("x.SAM") == ReadFileFormat::kSam);
    CHECK(detect_read_file_format("x.bam") == ReadFileFormat::kBam);
    CHECK(detect_read_file_format("x.cram") == ReadFileFormat::kCram);

    std::string path = write_file("via_factory.fq", "@r1\nACGT\n+\nIIII\n");
    Logger logger(Logger::kError);
    ReadSourceOptions opts;
    opts.path = path;
    opts.sample = "S9";
    std::string err;
    auto src = open_read_source(opts, logger, err);
    CHECK(src != nullptr);
    if (src) {
        CHECK_STR_EQ(src->sample_name(), "S9");
        std::vector<ReadRecord> batch;
        CHECK(src->read_batch(batch, 10));
        CHECK_EQ(batch.size(), 1u);
    }

    opts.sample.clear();
    CHECK(open_read_source(opts, logger, err) == nullptr);
}

int main() {
    g_test_dir = "/tmp/seqtally_test_fastq_source";
    std::filesystem::create_directories(g_test_dir);

    test_parse_headers();
    test_sequence_alphabet();
    test_read_records();
    test_compressed_input();
    test_read_errors();
    test_open_errors();
    test_open_read_source();
    test_sample_name_logged();

    std::filesystem::remove_all(g_test_dir);

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
