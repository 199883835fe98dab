#include "util/cli_parser.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>

namespace seqtally {

// "-5" is a value, "-s" is an option
static bool looks_negative_number(const char* arg) {
    return arg[0] == '-' && std::isdigit(static_cast<unsigned char>(arg[1]));
}

CliParser::CliParser(int argc, char* argv[], const std::set<std::string>& flags) {
    if (argc > 0) {
        program_ = argv[0];
        command_line_ = std::filesystem::path(program_).filename().string();
    }
    for (int i = 1; i < argc; i++) {
        command_line_ += ' ';
        command_line_ += argv[i];
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.size() >= 2 && arg[0] == '-') {
            // Handle --key=value syntax for double-dash args
            if (arg.size() >= 3 && arg[1] == '-') {
                auto eq = arg.find('=');
                if (eq != std::string::npos) {
                    std::string key = arg.substr(0, eq);
                    keys_.push_back(key);
                    opts_[key].push_back(arg.substr(eq + 1));
                    continue;
                }
            }

            keys_.push_back(arg);

            // Flags never take a value; options take the next argument
            // unless it looks like another option.
            if (flags.count(arg) == 0 && i + 1 < argc &&
                (argv[i + 1][0] != '-' || looks_negative_number(argv[i + 1]))) {
                opts_[arg].push_back(argv[i + 1]);
                i++;
            } else {
                opts_[arg].push_back("1");
            }
        } else {
            positional_.push_back(arg);
        }
    }
}

bool CliParser::has(const std::string& key) const {
    return opts_.count(key) > 0;
}

bool CliParser::has_any(std::initializer_list<const char*> keys) const {
    return find_any(keys, nullptr) != nullptr;
}

std::string CliParser::get_string(const std::string& key,
                                  const std::string& default_val) const {
    auto it = opts_.find(key);
    if (it != opts_.end() && !it->second.empty()) return it->second.back();
    return default_val;
}

std::string CliParser::get_string_any(std::initializer_list<const char*> keys,
                                      const std::string& default_val) const {
    const std::string* v = find_any(keys, nullptr);
    return v ? *v : default_val;
}

bool CliParser::get_int_any(std::initializer_list<const char*> keys, long long& out,
                            std::string& error_msg) const {
    const char* key = nullptr;
    const std::string* v = find_any(keys, &key);
    if (!v) return true;

    const char* s = v->c_str();
    char* end = nullptr;
    errno = 0;
    long long n = std::strtoll(s, &end, 10);
    if (v->empty() || *end != '\0' || errno == ERANGE) {
        error_msg = std::string("invalid integer for ") + key + ": '" + *v + "'";
        return false;
    }
    out = n;
    return true;
}

const std::string* CliParser::find_any(std::initializer_list<const char*> keys,
                                       const char** found_key) const {
    for (const char* k : keys) {
        auto it = opts_.find(k);
        if (it != opts_.end() && !it->second.empty()) {
            if (found_key) *found_key = k;
            return &it->second.back();
        }
    }
    return nullptr;
}

} // namespace seqtally
