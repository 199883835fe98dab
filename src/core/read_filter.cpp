#include "core/read_filter.hpp"

#include <cctype>

namespace seqtally {

static inline bool is_acgt(char c) {
    switch (c) {
        case 'A': case 'C': case 'G': case 'T':
        case 'a': case 'c': case 'g': case 't':
            return true;
        default:
            return false;
    }
}

bool is_unambiguous_dna(const std::string& seq) {
    for (char c : seq) {
        if (!is_acgt(c)) return false;
    }
    return true;
}

void to_upper_inplace(std::string& seq) {
    for (auto& c : seq)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

std::optional<DiscardReason> ReadFilter::classify(const ReadRecord& read,
                                                  std::string& canonical) const {
    if (read.vendor_failed) return DiscardReason::kVendorFailed;
    if (read.masked) return DiscardReason::kMasked;
    if (read.length() < min_length_) return DiscardReason::kLengthExcluded;
    if (!is_unambiguous_dna(read.sequence)) return DiscardReason::kAmbiguousNt;
    if (read.sequence.empty()) return DiscardReason::kZeroLength;

    canonical = read.sequence;
    to_upper_inplace(canonical);
    return std::nullopt;
}

} // namespace seqtally
