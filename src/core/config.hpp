#pragma once

#include <cstdint>
#include <cstddef>

namespace seqtally {

// Read length limits
inline constexpr uint32_t DEFAULT_MIN_LENGTH = 1;

// Top-K most common sequences report
inline constexpr int MIN_MOST_COMMON = 1;
inline constexpr int MAX_MOST_COMMON = 50;

// Fixed low-count template thresholds reported in library mode
inline constexpr uint64_t LOW_COUNT_THRESHOLD_15 = 15;
inline constexpr uint64_t LOW_COUNT_THRESHOLD_30 = 30;

// Number of read records pulled from a read source per counting batch.
// Each batch is split into one contiguous chunk per worker.
inline constexpr size_t DEFAULT_BATCH_SIZE = 1000000;

// htslib decompression threads never exceed this cap
inline constexpr int MAX_HTS_THREADS = 4;

// Decimal places kept for floating point fields of the stats report
inline constexpr int STATS_FLOAT_DECIMALS = 2;

// Output file suffixes appended to the output prefix
inline constexpr const char* QUERY_COUNTS_SUFFIX = ".query_counts.tsv";
inline constexpr const char* LIB_COUNTS_SUFFIX = ".lib_counts.tsv";
inline constexpr const char* STATS_SUFFIX = ".stats.json";
inline constexpr const char* COMPRESSED_SUFFIX = ".gz";

} // namespace seqtally
