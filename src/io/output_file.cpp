#include "io/output_file.hpp"
#include "core/config.hpp"

namespace seqtally {

OutputFile::~OutputFile() {
    if (fp_) bgzf_close(fp_);
}

bool OutputFile::open(const std::string& path, bool compress) {
    if (fp_ && !close()) return false;
    fp_ = bgzf_open(path.c_str(), compress ? "w" : "wu");
    path_ = path;
    failed_ = (fp_ == nullptr);
    return fp_ != nullptr;
}

bool OutputFile::close() {
    if (!fp_) return !failed_;
    if (bgzf_close(fp_) != 0) failed_ = true;
    fp_ = nullptr;
    return !failed_;
}

bool OutputFile::write(const std::string& s) {
    if (!fp_) return false;
    if (s.empty()) return true;
    ssize_t n = bgzf_write(fp_, s.data(), s.size());
    if (n < 0 || static_cast<size_t>(n) != s.size()) {
        failed_ = true;
        return false;
    }
    return true;
}

std::string output_path(const std::string& prefix, const char* suffix,
                        bool compress) {
    std::string path = prefix + suffix;
    if (compress) path += COMPRESSED_SUFFIX;
    return path;
}

} // namespace seqtally
