#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "core/types.hpp"

namespace seqtally {

// Classifies reads as accepted or discarded.
//
// Checks are applied in a fixed order and the first match decides:
//   1. vendor-fail flag          -> kVendorFailed
//   2. soft-mask flag            -> kMasked
//   3. length < min_length       -> kLengthExcluded
//   4. base outside A/C/G/T      -> kAmbiguousNt (case-insensitive)
//   5. empty sequence            -> kZeroLength (only when min_length == 0)
// Accepted reads are returned upper-cased.
class ReadFilter {
public:
    explicit ReadFilter(uint32_t min_length) : min_length_(min_length) {}

    // Returns the discard reason, or std::nullopt if the read is accepted.
    // On acceptance, canonical receives the upper-cased sequence.
    std::optional<DiscardReason> classify(const ReadRecord& read,
                                          std::string& canonical) const;

    uint32_t min_length() const { return min_length_; }

private:
    uint32_t min_length_;
};

// True if every base is one of A, C, G, T (either case).
bool is_unambiguous_dna(const std::string& seq);

// Upper-case a nucleotide sequence in place.
void to_upper_inplace(std::string& seq);

} // namespace seqtally
