#pragma once

#include <string>
#include <vector>
#include <optional>

struct CliOptions {
    std::string domain;              // trimmed and lower-cased
    std::optional<std::string> format;
    bool offline = false;
    bool show_help = false;
    std::optional<std::string> error;

    bool is_valid() const { return !error.has_value(); }
};

class CliParser {
public:
    static CliOptions parse(const std::vector<std::string>& args);
    static CliOptions parse(int argc, char* argv[]);
    static std::string usage();

private:
    static bool split_flag(const std::string& arg, std::string& name, std::optional<std::string>& value);
};
