#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace seqtally {

// A single read as produced by a read source.
// The sample name belongs to the source, not to the record.
struct ReadRecord {
    std::string sequence;
    bool vendor_failed = false;  // QCFAIL
    bool masked = false;         // soft-clipped / lowercase bases

    uint32_t length() const { return static_cast<uint32_t>(sequence.size()); }
};

// Why a read was not counted. Values index ReadTally::discarded.
enum class DiscardReason : uint8_t {
    kVendorFailed = 0,
    kMasked = 1,
    kLengthExcluded = 2,
    kAmbiguousNt = 3,
    kZeroLength = 4,
};

inline constexpr size_t NUM_DISCARD_REASONS = 5;

inline constexpr size_t discard_index(DiscardReason r) {
    return static_cast<size_t>(r);
}

inline const char* discard_reason_name(DiscardReason r) {
    switch (r) {
        case DiscardReason::kVendorFailed:   return "vendor_failed";
        case DiscardReason::kMasked:         return "masked";
        case DiscardReason::kLengthExcluded: return "length_excluded";
        case DiscardReason::kAmbiguousNt:    return "ambiguous_nt";
        case DiscardReason::kZeroLength:     return "zero_length";
    }
    return "unknown";
}

// One row of the query count table.
struct SequenceCount {
    std::string sequence;
    uint32_t length;
    uint64_t count;
};

using DiscardCounts = std::array<uint64_t, NUM_DISCARD_REASONS>;

} // namespace seqtally
