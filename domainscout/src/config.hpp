#pragma once

#include <string>
#include <cstdlib>

struct Config {
    // Output
    std::string output_format;  // "table" or "json"

    // Lookups
    bool network_lookups;
    int dns_timeout_ms;
    int whois_timeout_ms;

    // Valuation
    std::string valuation_tables_path;  // empty = built-in tables

    // Service
    std::string log_level;

    static Config from_env();
    void validate() const;

    static bool is_known_format(const std::string& format);

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static bool get_env_bool(const char* name, bool default_val);
};
