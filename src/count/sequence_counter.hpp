#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/types.hpp"

namespace seqtally {

// Per-sequence entry of a SequenceCounter.
struct SequenceTally {
    uint32_t length = 0;
    uint64_t count = 0;
};

// Counts occurrences of canonical (upper-case) sequences.
// merge() sums shared keys and unions the rest, so counters built over
// any partition of the input merge to the same result in any order.
class SequenceCounter {
public:
    using Map = std::unordered_map<std::string, SequenceTally>;

    SequenceCounter() = default;

    // Count one occurrence of seq.
    void record(const std::string& seq);
    void record(std::string&& seq);

    // Add n occurrences of seq.
    void add(const std::string& seq, uint64_t n);

    void merge(const SequenceCounter& other);
    void merge(SequenceCounter&& other);

    // Occurrences of seq (0 if never recorded).
    uint64_t count(const std::string& seq) const;

    size_t unique_count() const { return map_.size(); }
    uint64_t total_count() const { return total_; }
    bool empty() const { return map_.empty(); }

    const Map& entries() const { return map_; }

    // All entries in ascending lexicographic sequence order.
    std::vector<SequenceCount> sorted_by_sequence() const;

    // Up to k entries, by count descending then sequence ascending.
    std::vector<SequenceCount> most_common(size_t k) const;

    bool operator==(const SequenceCounter& other) const;
    bool operator!=(const SequenceCounter& other) const { return !(*this == other); }

private:
    Map map_;
    uint64_t total_ = 0;
};

} // namespace seqtally
