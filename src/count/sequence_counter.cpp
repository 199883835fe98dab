#include "count/sequence_counter.hpp"

#include <algorithm>

namespace seqtally {

void SequenceCounter::record(const std::string& seq) {
    add(seq, 1);
}

void SequenceCounter::record(std::string&& seq) {
    auto it = map_.find(seq);
    if (it != map_.end()) {
        it->second.count++;
    } else {
        uint32_t len = static_cast<uint32_t>(seq.size());
        map_.emplace(std::move(seq), SequenceTally{len, 1});
    }
    total_++;
}

void SequenceCounter::add(const std::string& seq, uint64_t n) {
    if (n == 0) return;
    auto& entry = map_[seq];
    if (entry.count == 0) entry.length = static_cast<uint32_t>(seq.size());
    entry.count += n;
    total_ += n;
}

void SequenceCounter::merge(const SequenceCounter& other) {
    for (const auto& kv : other.map_) {
        add(kv.first, kv.second.count);
    }
}

void SequenceCounter::merge(SequenceCounter&& other) {
    if (map_.empty()) {
        map_ = std::move(other.map_);
        total_ = other.total_;
    } else {
        // Fold the smaller map into the larger one
        if (other.map_.size() > map_.size()) std::swap(map_, other.map_);
        for (auto& kv : other.map_) {
            auto it = map_.find(kv.first);
            if (it != map_.end()) {
                it->second.count += kv.second.count;
            } else {
                map_.emplace(kv.first, kv.second);
            }
        }
        total_ += other.total_;
    }
    other.map_.clear();
    other.total_ = 0;
}

uint64_t SequenceCounter::count(const std::string& seq) const {
    auto it = map_.find(seq);
    return it != map_.end() ? it->second.count : 0;
}

std::vector<SequenceCount> SequenceCounter::sorted_by_sequence() const {
    std::vector<SequenceCount> rows;
    rows.reserve(map_.size());
    for (const auto& kv : map_) {
        rows.push_back({kv.first, kv.second.length, kv.second.count});
    }
    std::sort(rows.begin(), rows.end(),
              [](const SequenceCount& a, const SequenceCount& b) {
                  return a.sequence < b.sequence;
              });
    return rows;
}

std::vector<SequenceCount> SequenceCounter::most_common(size_t k) const {
    std::vector<SequenceCount> rows;
    rows.reserve(map_.size());
    for (const auto& kv : map_) {
        rows.push_back({kv.first, kv.second.length, kv.second.count});
    }
    auto by_count = [](const SequenceCount& a, const SequenceCount& b) {
        if (a.count != b.count) return a.count > b.count;
        return a.sequence < b.sequence;
    };
    if (k < rows.size()) {
        std::partial_sort(rows.begin(), rows.begin() + static_cast<std::ptrdiff_t>(k),
                          rows.end(), by_count);
        rows.resize(k);
    } else {
        std::sort(rows.begin(), rows.end(), by_count);
    }
    return rows;
}

bool SequenceCounter::operator==(const SequenceCounter& other) const {
    if (total_ != other.total_ || map_.size() != other.map_.size()) return false;
    for (const auto& kv : map_) {
        auto it = other.map_.find(kv.first);
        if (it == other.map_.end()) return false;
        if (it->second.count != kv.second.count ||
            it->second.length != kv.second.length) return false;
    }
    return true;
}

} // namespace seqtally
