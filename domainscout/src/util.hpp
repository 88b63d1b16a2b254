#pragma once

#include <string>
#include <vector>
#include <chrono>

namespace util {
    std::string current_iso8601();
    std::string trim(const std::string& str);
    std::string to_lower(const std::string& str);
    std::vector<std::string> split(const std::string& str, char delim);
    std::string join(const std::vector<std::string>& parts, const std::string& sep);
    bool starts_with(const std::string& str, const std::string& prefix);
    bool ends_with(const std::string& str, const std::string& suffix);
    std::string first_label(const std::string& domain);
    std::string hex_encode(const std::string& bytes);
}
