#pragma once

#include "util/cli_parser.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <thread>

#include <sched.h>

// SEQTALLY_VERSION is defined in the generated core/version.hpp.
// Callers must include core/version.hpp before using check_version().

namespace seqtally {

// Print "<cmd_name> <version>" to stdout if --version is present.
// Returns true if --version was handled (caller should return 0).
inline bool check_version(const CliParser& cli, const char* cmd_name) {
    if (cli.has("--version")) {
        std::fprintf(stdout, "%s %s\n", cmd_name, SEQTALLY_VERSION);
        return true;
    }
    return false;
}

// CPUs usable by this process (affinity mask, then hardware concurrency).
inline int available_cpus() {
    cpu_set_t set;
    CPU_ZERO(&set);
    if (sched_getaffinity(0, sizeof(set), &set) == 0) {
        int n = CPU_COUNT(&set);
        if (n > 0) return n;
    }
    int n = static_cast<int>(std::thread::hardware_concurrency());
    return n > 0 ? n : 1;
}

// Resolve a requested worker count (0 or negative -> detect).
inline int resolve_threads(int requested) {
    return requested > 0 ? requested : available_cpus();
}

} // namespace seqtally
