#include "count/count_coordinator.hpp"
#include "core/read_filter.hpp"
#include "io/read_source.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <utility>

#include <tbb/task_group.h>

namespace seqtally {

std::vector<std::pair<size_t, size_t>> partition_ranges(size_t n, int parts) {
    std::vector<std::pair<size_t, size_t>> ranges;
    if (n == 0) return ranges;
    size_t p = static_cast<size_t>(std::max(parts, 1));
    if (p > n) p = n;

    size_t base = n / p;
    size_t extra = n % p;
    size_t start = 0;
    for (size_t i = 0; i < p; i++) {
        size_t len = base + (i < extra ? 1 : 0);
        ranges.emplace_back(start, start + len);
        start += len;
    }
    return ranges;
}

PartialCount count_partition(const std::vector<ReadRecord>& reads,
                             size_t begin, size_t end,
                             const ReadFilter& filter) {
    PartialCount part;
    std::string canonical;
    for (size_t i = begin; i < end; i++) {
        auto reason = filter.classify(reads[i], canonical);
        if (reason) {
            part.tally.add_discarded(*reason);
        } else {
            part.tally.add_accepted();
            part.sequences.record(std::move(canonical));
            canonical.clear();
        }
    }
    return part;
}

// Launch one worker per chunk of reads. Each worker writes only its own
// slot of partials; slots are read after the task group has been waited on.
static void spawn_workers(tbb::task_group& tg,
                          const std::vector<ReadRecord>& reads,
                          const ReadFilter& filter,
                          const PartitionCounter& counter,
                          int workers,
                          std::vector<PartialCount>& partials) {
    auto ranges = partition_ranges(reads.size(), workers);
    partials.clear();
    partials.resize(ranges.size());
    for (size_t wi = 0; wi < ranges.size(); wi++) {
        size_t begin = ranges[wi].first;
        size_t end = ranges[wi].second;
        tg.run([&reads, &filter, &counter, &partials, wi, begin, end]() {
            partials[wi] = counter(reads, begin, end, filter);
        });
    }
}

// Wait for all workers. Returns false if any of them threw.
static bool join_workers(tbb::task_group& tg, std::string& error_msg) {
    try {
        tg.wait();
    } catch (const std::exception& e) {
        error_msg = std::string("counting worker failed: ") + e.what();
        return false;
    }
    return true;
}

CountCoordinator::CountCoordinator(const CountingConfig& config,
                                   const Logger& logger)
    : CountCoordinator(config, logger, count_partition) {}

CountCoordinator::CountCoordinator(const CountingConfig& config,
                                   const Logger& logger,
                                   PartitionCounter counter)
    : config_(config), logger_(logger), counter_(std::move(counter)) {
    if (config_.workers < 1) config_.workers = 1;
    if (config_.batch_size == 0) config_.batch_size = DEFAULT_BATCH_SIZE;
}

bool CountCoordinator::count_reads(const std::vector<ReadRecord>& reads,
                                   PartialCount& result,
                                   std::string& error_msg) const {
    result = PartialCount();
    ReadFilter filter(config_.min_length);
    std::vector<PartialCount> partials;

    tbb::task_group tg;
    spawn_workers(tg, reads, filter, counter_, config_.workers, partials);
    if (!join_workers(tg, error_msg)) {
        result = PartialCount();
        return false;
    }

    for (auto& p : partials) result.merge(std::move(p));
    return true;
}

bool CountCoordinator::count_source(ReadSource& source,
                                    PartialCount& result,
                                    std::string& error_msg) const {
    result = PartialCount();
    auto t_start = std::chrono::steady_clock::now();
    ReadFilter filter(config_.min_length);

    std::vector<ReadRecord> current;
    std::vector<ReadRecord> next;
    std::vector<PartialCount> partials;

    if (!source.read_batch(current, config_.batch_size)) {
        error_msg = source.error();
        return false;
    }

    uint64_t batch_no = 0;
    while (!current.empty()) {
        batch_no++;
        tbb::task_group tg;
        spawn_workers(tg, current, filter, counter_, config_.workers, partials);

        // Read ahead while the workers count the current batch.
        bool read_ok = source.read_batch(next, config_.batch_size);
        if (!read_ok) tg.cancel();

        bool workers_ok = join_workers(tg, error_msg);
        if (!read_ok) {
            error_msg = source.error();
        }
        if (!read_ok || !workers_ok) {
            result = PartialCount();
            return false;
        }

        for (auto& p : partials) result.merge(std::move(p));

        logger_.debug("Batch %lu: parsed %lu reads, %zu unique so far",
                      static_cast<unsigned long>(batch_no),
                      static_cast<unsigned long>(result.tally.input_reads),
                      result.sequences.unique_count());

        std::swap(current, next);
        next.clear();
    }

    auto t_end = std::chrono::steady_clock::now();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(t_end - t_start).count();
    logger_.info("Parsed %lu reads, %zu were unique",
                 static_cast<unsigned long>(result.tally.accepted_reads),
                 result.sequences.unique_count());
    logger_.info("Read parsing took: %lds", static_cast<long>(secs));
    return true;
}

} // namespace seqtally
