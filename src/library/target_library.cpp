#include "library/target_library.hpp"
#include "core/read_filter.hpp"

#include <fstream>

namespace seqtally {

// Split a line on tabs, keeping at most max_fields fields (the rest of the
// line is dropped).
static std::vector<std::string> split_tabs(const std::string& line,
                                           size_t max_fields) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (fields.size() < max_fields) {
        size_t tab = line.find('\t', start);
        if (tab == std::string::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, tab - start));
        start = tab + 1;
    }
    return fields;
}

void TargetLibrary::add(LibraryEntry entry) {
    to_upper_inplace(entry.sequence);
    size_t idx = entries_.size();
    index_[entry.sequence].push_back(idx);
    entries_.push_back(std::move(entry));
}

bool TargetLibrary::parse(std::istream& in, std::string& error_msg) {
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        line_no++;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        // Blank lines, "##key: value" metadata and the "#" column header
        if (line.empty() || line[0] == '#') continue;

        auto fields = split_tabs(line, LIB_FIELD_SEQ + 1);
        if (fields.size() <= LIB_FIELD_SEQ) {
            error_msg = "invalid library row at line " + std::to_string(line_no) +
                        ": expected at least 3 tab-separated columns, found " +
                        std::to_string(fields.size());
            return false;
        }
        if (fields[LIB_FIELD_SEQ].empty()) {
            error_msg = "invalid library row at line " + std::to_string(line_no) +
                        ": empty sequence";
            return false;
        }

        LibraryEntry entry;
        entry.id = std::move(fields[LIB_FIELD_ID]);
        entry.name = std::move(fields[LIB_FIELD_NAME]);
        entry.sequence = std::move(fields[LIB_FIELD_SEQ]);
        add(std::move(entry));
    }

    if (in.bad()) {
        error_msg = "I/O error while reading library";
        return false;
    }
    return true;
}

bool TargetLibrary::load(const std::string& path, std::string& error_msg) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error_msg = "cannot open library file " + path;
        return false;
    }
    if (!parse(file, error_msg)) {
        error_msg = path + ": " + error_msg;
        return false;
    }
    return true;
}

const std::vector<size_t>* TargetLibrary::find(const std::string& seq) const {
    auto it = index_.find(seq);
    return it != index_.end() ? &it->second : nullptr;
}

size_t TargetLibrary::occurrences(const std::string& seq) const {
    auto it = index_.find(seq);
    return it != index_.end() ? it->second.size() : 0;
}

} // namespace seqtally
