#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace uf2pack {

// Very small CLI parser:
//   --key value
//   --flag (treated as "true")
//   anything else is positional, kept in order
class CliParser {
public:
    void parse(int argc, char** argv);
    bool has(const std::string& key) const;
    std::string get(const std::string& key, const std::string& def = "") const;
    const std::vector<std::string>& positional() const { return positional_; }
    // Named option if given, else the idx-th positional argument, else "".
    std::string get_or_positional(const std::string& key, size_t idx) const;
private:
    std::unordered_map<std::string, std::string> kv_;
    std::vector<std::string> positional_;
};

} // namespace uf2pack
