#pragma once

#include <string>

#include <htslib/bgzf.h>

namespace seqtally {

// Text output through htslib BGZF. Compressed output is BGZF, which any
// gzip reader accepts; uncompressed output is written as plain text.
class OutputFile {
public:
    OutputFile() = default;
    ~OutputFile();

    OutputFile(const OutputFile&) = delete;
    OutputFile& operator=(const OutputFile&) = delete;

    bool open(const std::string& path, bool compress);

    // Flush and close. Returns false if any write or the close failed.
    bool close();

    bool is_open() const { return fp_ != nullptr; }

    bool write(const std::string& s);

    const std::string& path() const { return path_; }

private:
    BGZF* fp_ = nullptr;
    std::string path_;
    bool failed_ = false;
};

// "<prefix><suffix>" plus ".gz" when compressed.
std::string output_path(const std::string& prefix, const char* suffix,
                        bool compress);

} // namespace seqtally
