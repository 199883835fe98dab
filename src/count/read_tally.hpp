#pragma once

#include <cstdint>

#include "core/types.hpp"

namespace seqtally {

// Read-level outcome counters for one partition (or the whole run).
// input_reads == accepted_reads + discarded_reads() always holds.
struct ReadTally {
    uint64_t input_reads = 0;
    uint64_t accepted_reads = 0;
    DiscardCounts discarded{};

    void add_accepted() {
        input_reads++;
        accepted_reads++;
    }

    void add_discarded(DiscardReason reason) {
        input_reads++;
        discarded[discard_index(reason)]++;
    }

    uint64_t discarded_by(DiscardReason reason) const {
        return discarded[discard_index(reason)];
    }

    uint64_t discarded_reads() const {
        uint64_t sum = 0;
        for (uint64_t n : discarded) sum += n;
        return sum;
    }

    void merge(const ReadTally& other) {
        input_reads += other.input_reads;
        accepted_reads += other.accepted_reads;
        for (size_t i = 0; i < NUM_DISCARD_REASONS; i++)
            discarded[i] += other.discarded[i];
    }

    bool operator==(const ReadTally& other) const {
        return input_reads == other.input_reads &&
               accepted_reads == other.accepted_reads &&
               discarded == other.discarded;
    }
};

} // namespace seqtally
