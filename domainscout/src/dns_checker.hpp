#pragma once

#include <string>
#include <vector>
#include <optional>

struct DnsResult {
    bool available = false;
    std::string tld;
    bool has_records = false;
    std::vector<std::string> record_types;  // subset of A, MX, NS, TXT
    std::string checked_at;
    std::optional<std::string> error;
};

// Availability heuristic over the system resolver: a name with no A/AAAA,
// MX, NS or TXT answers is reported as available.
class DnsChecker {
public:
    explicit DnsChecker(int timeout_ms = 5000);

    DnsResult check(const std::string& domain) const;

    static std::string extract_tld(const std::string& domain);

private:
    int timeout_ms_;
};
