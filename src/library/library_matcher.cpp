#include "library/library_matcher.hpp"
#include "count/sequence_counter.hpp"

namespace seqtally {

LibraryMatch match_library(const TargetLibrary& library,
                           const SequenceCounter& counts,
                           uint32_t min_length,
                           const std::string& sample_name) {
    LibraryMatch match;
    match.sample_name = sample_name;
    match.templates.reserve(library.size());

    for (const auto& entry : library.entries()) {
        Template t;
        t.entry = &entry;
        t.length_excluded = entry.sequence.size() < min_length;
        t.unique = library.occurrences(entry.sequence) == 1;
        t.count = t.length_excluded ? 0 : counts.count(entry.sequence);
        match.templates.push_back(t);
    }

    // Read-level metrics: each distinct sequence contributes once, however
    // many entries carry it.
    for (const auto& kv : library.index()) {
        if (kv.first.size() < min_length) {
            match.short_sequences++;
            continue;
        }
        uint64_t n = counts.count(kv.first);
        match.mapped_to_template_reads += n;
        if (kv.second.size() > 1) match.multimap_reads += n;
    }

    uint64_t total = counts.total_count();
    match.unmapped_reads = total >= match.mapped_to_template_reads
        ? total - match.mapped_to_template_reads : 0;
    return match;
}

} // namespace seqtally
