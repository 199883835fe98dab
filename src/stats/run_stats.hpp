#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace seqtally {

struct ReadTally;
struct LibraryMatch;

// Statistics available for every run.
struct LibraryIndependentStats {
    std::string sample_name;
    uint64_t input_reads = 0;
    uint64_t total_reads = 0;        // accepted
    uint64_t discarded_reads = 0;
    uint64_t vendor_failed_reads = 0;
    uint64_t length_excluded_reads = 0;
    uint64_t ambiguous_nt_reads = 0;
    uint64_t masked_reads = 0;
    uint64_t zero_length_reads = 0;
};

struct LowCountThreshold {
    uint64_t lt;
    uint64_t count;
};

// Statistics computed when a library is supplied. Template figures cover
// templates that are not length-excluded.
struct LibraryDependentStats {
    LibraryIndependentStats reads;

    uint64_t mapped_to_template_reads = 0;
    uint64_t multimap_reads = 0;
    uint64_t unmapped_reads = 0;

    uint64_t total_templates = 0;
    uint64_t total_unique_templates = 0;
    uint64_t length_excluded_templates = 0;
    uint64_t zero_count_templates = 0;
    uint64_t low_count_templates_lt_15 = 0;
    uint64_t low_count_templates_lt_30 = 0;
    std::optional<LowCountThreshold> low_count_templates_user;

    double mean_count_per_template = 0.0;
    double median_count_per_template = 0.0;
    double gini_coefficient = 0.0;
};

LibraryIndependentStats compute_independent_stats(const std::string& sample_name,
                                                  const ReadTally& tally);

LibraryDependentStats compute_dependent_stats(
    const LibraryIndependentStats& independent,
    const LibraryMatch& match,
    std::optional<uint64_t> user_low_count);

// Median of an ascending vector (0 for an empty one).
double median_of_sorted(const std::vector<uint64_t>& sorted);

// Gini coefficient of an ascending count vector:
//   G = 2 * sum(i * x_i) / (n * sum(x)) - (n + 1) / n,  i = 1..n
// Defined as 0 when n <= 1 or sum(x) == 0.
double gini_coefficient(const std::vector<uint64_t>& sorted);

// Number of values strictly below threshold in an ascending vector.
uint64_t count_below(const std::vector<uint64_t>& sorted, uint64_t threshold);

} // namespace seqtally
