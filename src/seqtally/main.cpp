#include "seqtally/run_options.hpp"
#include "count/count_coordinator.hpp"
#include "io/count_writer.hpp"
#include "io/output_file.hpp"
#include "io/read_source.hpp"
#include "io/stats_writer.hpp"
#include "library/library_matcher.hpp"
#include "library/target_library.hpp"
#include "stats/run_stats.hpp"
#include "core/config.hpp"
#include "core/version.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>

#include <tbb/global_control.h>

using namespace seqtally;

// Create the directory holding the output prefix, if any.
static bool ensure_output_dir(const std::string& prefix, std::string& error_msg) {
    std::filesystem::path parent = std::filesystem::path(prefix).parent_path();
    if (parent.empty()) return true;
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        error_msg = "cannot create output directory '" + parent.string() +
                    "': " + ec.message();
        return false;
    }
    return true;
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv, run_option_flags());

    if (check_version(cli, "seqtally")) return 0;

    if (cli.has("-h") || cli.has("--help") || argc < 2) {
        print_usage(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    RunOptions opts;
    std::string err;
    if (!parse_run_options(cli, opts, err)) {
        std::fprintf(stderr, "Error: %s\n", err.c_str());
        print_usage(argv[0]);
        return 1;
    }

    Logger logger(opts.log_level);

    if (opts.low_count && opts.library.empty())
        logger.warn("--low-count is ignored without --library");

    int threads = resolve_threads(opts.cpus);
    logger.info("Using %d CPU(s)", threads);

    // Centralized TBB thread control
    tbb::global_control gc(tbb::global_control::max_allowed_parallelism, threads);

    // Load the library up front so a bad definition fails before counting
    TargetLibrary library;
    if (!opts.library.empty()) {
        if (!library.load(opts.library, err)) {
            logger.error("%s", err.c_str());
            return 1;
        }
        logger.info("Library: %s (%zu templates, %zu distinct sequences)",
                    opts.library.c_str(), library.size(),
                    library.distinct_sequences());
    }

    if (!ensure_output_dir(opts.output, err)) {
        logger.error("%s", err.c_str());
        return 1;
    }

    ReadSourceOptions src_opts;
    src_opts.path = opts.queries;
    src_opts.sample = opts.sample;
    src_opts.reference = opts.reference;
    src_opts.threads = threads;
    std::unique_ptr<ReadSource> source = open_read_source(src_opts, logger, err);
    if (!source) {
        logger.error("%s", err.c_str());
        return 1;
    }
    const std::string sample = source->sample_name();

    CountingConfig count_config;
    count_config.min_length = opts.min_length;
    count_config.workers = threads;
    CountCoordinator coordinator(count_config, logger);

    PartialCount counted;
    if (!coordinator.count_source(*source, counted, err)) {
        logger.error("%s", err.c_str());
        return 1;
    }
    source.reset();

    OutputHeader header{cli.command_line(), SEQTALLY_VERSION};

    std::string query_path = output_path(opts.output, QUERY_COUNTS_SUFFIX, opts.compress);
    if (!write_query_counts(query_path, counted.sequences, header, opts.compress, err)) {
        logger.error("%s", err.c_str());
        return 1;
    }
    logger.info("Query counts written to %s", query_path.c_str());

    if (opts.most_common) {
        std::string top_path = most_common_path(opts.output, sample,
                                                static_cast<size_t>(*opts.most_common),
                                                opts.compress);
        if (!write_most_common(top_path, counted.sequences,
                               static_cast<size_t>(*opts.most_common),
                               opts.compress, err)) {
            logger.error("%s", err.c_str());
            return 1;
        }
        logger.info("Most common sequences written to %s", top_path.c_str());
    }

    uint64_t zero_length = counted.tally.discarded_by(DiscardReason::kZeroLength);
    if (zero_length > 0)
        logger.warn("%lu reads had zero length after filtering",
                    static_cast<unsigned long>(zero_length));

    LibraryIndependentStats independent = compute_independent_stats(sample, counted.tally);
    Json::Value stats_root;

    if (!opts.library.empty()) {
        LibraryMatch match = match_library(library, counted.sequences,
                                           opts.min_length, sample);
        if (match.short_sequences > 0)
            logger.warn("%zu library sequences are shorter than --min-length %u and were excluded",
                        match.short_sequences, opts.min_length);

        std::string lib_path = output_path(opts.output, LIB_COUNTS_SUFFIX, opts.compress);
        if (!write_library_counts(lib_path, match, header, opts.compress, err)) {
            logger.error("%s", err.c_str());
            return 1;
        }
        logger.info("Library counts written to %s", lib_path.c_str());

        LibraryDependentStats dependent = compute_dependent_stats(independent, match,
                                                                  opts.low_count);
        if (dependent.mapped_to_template_reads == 0)
            logger.warn("No library matches found for sample %s", sample.c_str());
        stats_root = stats_to_json(dependent);
    } else {
        stats_root = stats_to_json(independent);
    }

    std::string stats_path = opts.output + STATS_SUFFIX;
    if (!write_stats_json(stats_path, stats_root, err)) {
        logger.error("%s", err.c_str());
        return 1;
    }
    logger.info("Stats written to %s", stats_path.c_str());

    return 0;
}
