#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>

#include "core/config.hpp"
#include "util/logger.hpp"

namespace seqtally {

class CliParser;

// Validated command-line configuration of a counting run.
struct RunOptions {
    std::string queries;                    // read file
    std::string output;                     // output prefix
    uint32_t min_length = DEFAULT_MIN_LENGTH;
    std::optional<int> most_common;         // 1..50
    std::string sample;                     // empty = from file metadata
    std::string reference;                  // CRAM reference
    std::string library;                    // empty = library-independent
    std::optional<uint64_t> low_count;      // user low-count threshold
    int cpus = 1;                           // 0 = detect
    Logger::Level log_level = Logger::kInfo;
    bool compress = true;
};

// Options that never take a value.
const std::set<std::string>& run_option_flags();

// Fill opts from the command line. Returns false on an unknown option,
// a missing required argument or an out-of-range value (error_msg set).
bool parse_run_options(const CliParser& cli, RunOptions& opts,
                       std::string& error_msg);

void print_usage(const char* prog);

} // namespace seqtally
