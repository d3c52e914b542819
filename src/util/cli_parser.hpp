#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace loanrecon {

// Command-line parser for -key value style arguments.
// Also accepts --key=value. A repeated option keeps its last value.
class CliParser {
public:
    CliParser(int argc, char* argv[]);

    bool has(const std::string& key) const;

    // Returns default_val if the key is absent.
    std::string get_string(const std::string& key,
                           const std::string& default_val = {}) const;

    // Returns default_val if the key is absent or not an integer.
    int get_int(const std::string& key, int default_val = 0) const;

    const std::string& program() const { return program_; }

    // Arguments not preceded by a -key.
    const std::vector<std::string>& positional() const { return positional_; }

private:
    std::string program_;
    std::unordered_map<std::string, std::vector<std::string>> opts_;
    std::vector<std::string> positional_;
};

} // namespace loanrecon
