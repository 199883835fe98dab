#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "core/config.hpp"
#include "core/types.hpp"
#include "count/read_tally.hpp"
#include "count/sequence_counter.hpp"

namespace seqtally {

class Logger;
class ReadFilter;
class ReadSource;

// Result of counting one partition, or the merge of several.
struct PartialCount {
    SequenceCounter sequences;
    ReadTally tally;

    void merge(PartialCount&& other) {
        sequences.merge(std::move(other.sequences));
        tally.merge(other.tally);
    }
};

struct CountingConfig {
    uint32_t min_length = DEFAULT_MIN_LENGTH;
    int workers = 1;                        // >= 1
    size_t batch_size = DEFAULT_BATCH_SIZE; // records per batch
};

// Split [0, n) into `parts` contiguous ranges whose sizes differ by at
// most one. Empty ranges are omitted.
std::vector<std::pair<size_t, size_t>> partition_ranges(size_t n, int parts);

// Run the read filter and a sequence counter over reads[begin, end).
PartialCount count_partition(const std::vector<ReadRecord>& reads,
                             size_t begin, size_t end,
                             const ReadFilter& filter);

// Worker body: counts reads[begin, end) into a fresh PartialCount.
using PartitionCounter = std::function<PartialCount(const std::vector<ReadRecord>&,
                                                    size_t, size_t,
                                                    const ReadFilter&)>;

// Coordinates workers over a partitioned read stream.
// Each worker owns one contiguous chunk of a batch and hands back a
// PartialCount; partials are merged only after every worker has finished.
class CountCoordinator {
public:
    CountCoordinator(const CountingConfig& config, const Logger& logger);

    // Use counter instead of count_partition for every worker chunk.
    CountCoordinator(const CountingConfig& config, const Logger& logger,
                     PartitionCounter counter);

    // Count an in-memory read set split into config.workers chunks.
    // result is reset first. Returns false if a worker failed (error_msg
    // set); result is then left empty.
    bool count_reads(const std::vector<ReadRecord>& reads,
                     PartialCount& result,
                     std::string& error_msg) const;

    // Count every record of a read source, batch by batch. The next batch
    // is read while the workers count the current one. result is reset first.
    // Returns false on a read or worker failure (error_msg set); result
    // is then left empty.
    bool count_source(ReadSource& source,
                      PartialCount& result,
                      std::string& error_msg) const;

    const CountingConfig& config() const { return config_; }

private:
    CountingConfig config_;
    const Logger& logger_;
    PartitionCounter counter_;
};

} // namespace seqtally
