#include "stats/run_stats.hpp"
#include "core/config.hpp"
#include "count/read_tally.hpp"
#include "library/library_matcher.hpp"

#include <algorithm>

namespace seqtally {

LibraryIndependentStats compute_independent_stats(const std::string& sample_name,
                                                  const ReadTally& tally) {
    LibraryIndependentStats s;
    s.sample_name = sample_name;
    s.input_reads = tally.input_reads;
    s.total_reads = tally.accepted_reads;
    s.discarded_reads = tally.discarded_reads();
    s.vendor_failed_reads = tally.discarded_by(DiscardReason::kVendorFailed);
    s.length_excluded_reads = tally.discarded_by(DiscardReason::kLengthExcluded);
    s.ambiguous_nt_reads = tally.discarded_by(DiscardReason::kAmbiguousNt);
    s.masked_reads = tally.discarded_by(DiscardReason::kMasked);
    s.zero_length_reads = tally.discarded_by(DiscardReason::kZeroLength);
    return s;
}

double median_of_sorted(const std::vector<uint64_t>& sorted) {
    size_t n = sorted.size();
    if (n == 0) return 0.0;
    if (n % 2 == 1) return static_cast<double>(sorted[n / 2]);
    return (static_cast<double>(sorted[n / 2 - 1]) +
            static_cast<double>(sorted[n / 2])) / 2.0;
}

double gini_coefficient(const std::vector<uint64_t>& sorted) {
    size_t n = sorted.size();
    if (n <= 1) return 0.0;

    long double sum = 0;
    long double weighted = 0;
    for (size_t i = 0; i < n; i++) {
        sum += static_cast<long double>(sorted[i]);
        weighted += static_cast<long double>(i + 1) * static_cast<long double>(sorted[i]);
    }
    if (sum == 0) return 0.0;

    long double nd = static_cast<long double>(n);
    long double g = (2.0L * weighted) / (nd * sum) - (nd + 1.0L) / nd;

    // Rounding can leave tiny negative values for perfectly even counts
    if (g < 0) g = 0;
    if (g > 1) g = 1;
    return static_cast<double>(g);
}

uint64_t count_below(const std::vector<uint64_t>& sorted, uint64_t threshold) {
    return static_cast<uint64_t>(
        std::lower_bound(sorted.begin(), sorted.end(), threshold) - sorted.begin());
}

LibraryDependentStats compute_dependent_stats(
    const LibraryIndependentStats& independent,
    const LibraryMatch& match,
    std::optional<uint64_t> user_low_count) {

    LibraryDependentStats s;
    s.reads = independent;
    s.mapped_to_template_reads = match.mapped_to_template_reads;
    s.multimap_reads = match.multimap_reads;
    s.unmapped_reads = match.unmapped_reads;

    std::vector<uint64_t> counts;
    counts.reserve(match.templates.size());
    for (const auto& t : match.templates) {
        if (t.length_excluded) {
            s.length_excluded_templates++;
            continue;
        }
        s.total_templates++;
        if (t.unique) s.total_unique_templates++;
        counts.push_back(t.count);
    }
    std::sort(counts.begin(), counts.end());

    s.zero_count_templates = count_below(counts, 1);
    s.low_count_templates_lt_15 = count_below(counts, LOW_COUNT_THRESHOLD_15);
    s.low_count_templates_lt_30 = count_below(counts, LOW_COUNT_THRESHOLD_30);
    if (user_low_count) {
        s.low_count_templates_user = LowCountThreshold{
            *user_low_count, count_below(counts, *user_low_count)};
    }

    if (!counts.empty()) {
        long double sum = 0;
        for (uint64_t c : counts) sum += static_cast<long double>(c);
        s.mean_count_per_template =
            static_cast<double>(sum / static_cast<long double>(counts.size()));
        s.median_count_per_template = median_of_sorted(counts);
    }
    s.gini_coefficient = gini_coefficient(counts);
    return s;
}

} // namespace seqtally
