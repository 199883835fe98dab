#pragma once

#include <initializer_list>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace seqtally {

// Command-line parser for "-k value", "--key value" and "--key=value"
// arguments. Keys listed in `flags` never consume a value.
class CliParser {
public:
    CliParser(int argc, char* argv[], const std::set<std::string>& flags = {});

    // Check if a flag/option is present.
    bool has(const std::string& key) const;

    // Check if any of several spellings (e.g. "-o", "--output") is present.
    bool has_any(std::initializer_list<const char*> keys) const;

    // Get string value for a key. Returns default_val if not found.
    std::string get_string(const std::string& key,
                           const std::string& default_val = {}) const;

    // Value of the first present spelling, or default_val.
    std::string get_string_any(std::initializer_list<const char*> keys,
                               const std::string& default_val = {}) const;

    // Parse the value of the first present spelling as an integer.
    // Returns false if the value is not a valid integer (error_msg set);
    // out is untouched when no spelling is present.
    bool get_int_any(std::initializer_list<const char*> keys, long long& out,
                     std::string& error_msg) const;

    // All option keys seen, in command-line order.
    const std::vector<std::string>& keys() const { return keys_; }

    // Get the program name (argv[0]).
    const std::string& program() const { return program_; }

    // Program basename followed by the arguments, space separated.
    const std::string& command_line() const { return command_line_; }

    // Get positional arguments (those not preceded by a -key).
    const std::vector<std::string>& positional() const { return positional_; }

private:
    const std::string* find_any(std::initializer_list<const char*> keys,
                                const char** found_key) const;

    std::string program_;
    std::string command_line_;
    std::unordered_map<std::string, std::vector<std::string>> opts_;
    std::vector<std::string> keys_;
    std::vector<std::string> positional_;
};

} // namespace seqtally
