#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "library/target_library.hpp"

namespace seqtally {

class SequenceCounter;

// A library entry joined with its exact-match read count.
struct Template {
    const LibraryEntry* entry = nullptr;
    uint64_t count = 0;            // 0 when length-excluded
    bool unique = false;           // sequence occurs in exactly one entry
    bool length_excluded = false;  // sequence shorter than the minimum read length
};

struct LibraryMatch {
    std::vector<Template> templates;   // library order
    std::string sample_name;

    uint64_t mapped_to_template_reads = 0;
    uint64_t multimap_reads = 0;
    uint64_t unmapped_reads = 0;

    // Distinct library sequences shorter than the minimum length
    size_t short_sequences = 0;
};

// Project accepted-read counts onto the library by exact sequence equality.
// The library must outlive the returned match (templates point into it).
LibraryMatch match_library(const TargetLibrary& library,
                           const SequenceCounter& counts,
                           uint32_t min_length,
                           const std::string& sample_name);

} // namespace seqtally
