#include "seqtally/run_options.hpp"
#include "util/cli_parser.hpp"

#include <cstdio>
#include <filesystem>
#include <limits>

namespace seqtally {

static const std::set<std::string>& known_options() {
    static const std::set<std::string> opts = {
        "-o", "--output",
        "--min-length",
        "--most-common",
        "-s", "--sample",
        "-r", "--reference",
        "-l", "--library",
        "--low-count",
        "-c", "--cpus",
        "--loglevel",
        "--no-compression",
        "--version",
        "-h", "--help",
    };
    return opts;
}

const std::set<std::string>& run_option_flags() {
    static const std::set<std::string> flags = {
        "--no-compression", "--version", "-h", "--help",
    };
    return flags;
}

void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options] QUERIES\n\n"
        "Count reads and optionally map them to a library.\n\n"
        "  QUERIES                Query sequence file (fastq[.gz], sam, bam, cram)\n\n"
        "Required:\n"
        "  -o, --output <prefix>  Final output to this filename prefix\n\n"
        "Options:\n"
        "  --min-length <int>     Minimum read length (default: %u)\n"
        "  --most-common <int>    Output top X most common unique read sequences\n"
        "                         in FASTA format (%d-%d)\n\n"
        "Input sample metadata:\n"
        "  -s, --sample <name>    Sample name, required for FASTQ; read from the\n"
        "                         @RG SM header tag for other formats when not set\n"
        "  -r, --reference <path> Reference FASTA, required for CRAM\n\n"
        "Library-dependent:\n"
        "  -l, --library <path>   Library definition TSV (ID, NAME, SEQUENCE)\n"
        "  --low-count <int>      Additional low count cut-off reported in the\n"
        "                         stats next to low_count_templates_lt_{15,30}\n\n"
        "Performance:\n"
        "  -c, --cpus <int>       CPUs to use, 0 to detect (default: 1)\n\n"
        "Debug:\n"
        "  --loglevel <level>     WARNING, INFO or DEBUG (default: INFO)\n"
        "  --no-compression       Disable output compression\n"
        "  --version              Print version and exit\n"
        "  -h, --help             Show this help\n",
        prog, DEFAULT_MIN_LENGTH, MIN_MOST_COMMON, MAX_MOST_COMMON);
}

static bool check_file(const std::string& path, const char* what,
                       std::string& error_msg) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        error_msg = std::string(what) + " '" + path + "' does not exist or is not a file";
        return false;
    }
    return true;
}

bool parse_run_options(const CliParser& cli, RunOptions& opts,
                       std::string& error_msg) {
    const auto& known = known_options();
    for (const auto& key : cli.keys()) {
        if (known.count(key) == 0) {
            error_msg = "unknown option " + key;
            return false;
        }
    }

    const auto& pos = cli.positional();
    if (pos.empty()) {
        error_msg = "missing QUERIES argument";
        return false;
    }
    if (pos.size() > 1) {
        error_msg = "unexpected extra argument '" + pos[1] + "'";
        return false;
    }
    opts.queries = pos[0];
    if (opts.queries != "-" && !check_file(opts.queries, "QUERIES", error_msg))
        return false;

    opts.output = cli.get_string_any({"-o", "--output"});
    if (opts.output.empty()) {
        error_msg = "-o/--output is required";
        return false;
    }

    long long v = DEFAULT_MIN_LENGTH;
    if (!cli.get_int_any({"--min-length"}, v, error_msg)) return false;
    if (v < 1 || v > std::numeric_limits<uint32_t>::max()) {
        error_msg = "--min-length must be >= 1";
        return false;
    }
    opts.min_length = static_cast<uint32_t>(v);

    if (cli.has("--most-common")) {
        v = 0;
        if (!cli.get_int_any({"--most-common"}, v, error_msg)) return false;
        if (v < MIN_MOST_COMMON || v > MAX_MOST_COMMON) {
            error_msg = "--most-common must be between " + std::to_string(MIN_MOST_COMMON) +
                        " and " + std::to_string(MAX_MOST_COMMON);
            return false;
        }
        opts.most_common = static_cast<int>(v);
    }

    opts.sample = cli.get_string_any({"-s", "--sample"});
    opts.reference = cli.get_string_any({"-r", "--reference"});
    if (!opts.reference.empty() && !check_file(opts.reference, "reference", error_msg))
        return false;
    opts.library = cli.get_string_any({"-l", "--library"});
    if (!opts.library.empty() && !check_file(opts.library, "library", error_msg))
        return false;

    if (cli.has("--low-count")) {
        v = -1;
        if (!cli.get_int_any({"--low-count"}, v, error_msg)) return false;
        if (v < 0) {
            error_msg = "--low-count must be >= 0";
            return false;
        }
        opts.low_count = static_cast<uint64_t>(v);
    }

    v = 1;
    if (!cli.get_int_any({"-c", "--cpus"}, v, error_msg)) return false;
    if (v < 0 || v > std::numeric_limits<int>::max()) {
        error_msg = "--cpus must be >= 0";
        return false;
    }
    opts.cpus = static_cast<int>(v);

    if (cli.has("--loglevel")) {
        std::string level = cli.get_string("--loglevel");
        if (!Logger::parse_level(level, opts.log_level)) {
            error_msg = "--loglevel must be one of WARNING, INFO, DEBUG";
            return false;
        }
    }

    opts.compress = !cli.has("--no-compression");
    return true;
}

} // namespace seqtally
