#pragma once

#include <string>
#include <vector>
#include <optional>

struct WhoisResult {
    bool available = false;
    std::string registrar;
    std::optional<std::string> registration_date;  // YYYY-MM-DD
    std::optional<std::string> expiry_date;
    std::optional<std::string> updated_date;
    std::vector<std::string> name_servers;
    std::vector<std::string> status;
    std::string checked_at;
    std::string raw_data;
    std::optional<std::string> error;
};

class WhoisClient {
public:
    explicit WhoisClient(int timeout_ms = 10000);

    WhoisResult lookup(const std::string& domain) const;

    // Empty when no server is known for the domain's suffix
    static std::string server_for(const std::string& domain);
    static void parse(const std::string& raw, WhoisResult& result);
    static std::optional<std::string> parse_date(const std::string& value);

private:
    int timeout_ms_;

    std::string query_server(const std::string& server, const std::string& domain) const;
};
