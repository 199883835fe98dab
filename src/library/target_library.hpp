#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>
#include <unordered_map>
#include <vector>

namespace seqtally {

// Library TSV column positions (0-based)
inline constexpr size_t LIB_FIELD_ID = 0;
inline constexpr size_t LIB_FIELD_NAME = 1;
inline constexpr size_t LIB_FIELD_SEQ = 2;

struct LibraryEntry {
    std::string id;
    std::string name;
    std::string sequence;   // upper-case
};

// Ordered library definition plus a one-to-many sequence index.
// Entries sharing a sequence are all kept, in file order.
class TargetLibrary {
public:
    TargetLibrary() = default;

    // Append an entry (sequence is upper-cased).
    void add(LibraryEntry entry);

    // Parse a library TSV stream.
    //   "##..." lines are metadata, a single "#..." line is the column header;
    //   data rows carry ID, NAME, SEQUENCE in the first three columns.
    // Returns false on a malformed row (error_msg names the line).
    bool parse(std::istream& in, std::string& error_msg);

    // Load a library TSV file. Returns false on error (error_msg set).
    bool load(const std::string& path, std::string& error_msg);

    const std::vector<LibraryEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    // Entry indices sharing seq, in library order (nullptr if absent).
    const std::vector<size_t>* find(const std::string& seq) const;

    // Number of entries carrying seq.
    size_t occurrences(const std::string& seq) const;

    // Distinct sequences -> entry indices.
    const std::unordered_map<std::string, std::vector<size_t>>& index() const {
        return index_;
    }

    size_t distinct_sequences() const { return index_.size(); }

private:
    std::vector<LibraryEntry> entries_;
    std::unordered_map<std::string, std::vector<size_t>> index_;
};

} // namespace seqtally
