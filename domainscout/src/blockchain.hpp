#pragma once

#include <string>
#include <map>
#include <vector>
#include <optional>

enum class NameService {
    ENS,
    UnstoppableDomains,
    Unsupported
};

struct BlockchainRecord {
    bool available = false;
    std::string type;  // "ENS" or "Unstoppable Domains"
    std::string owner;
    std::string resolver;
    std::map<std::string, std::string> records;
    std::string checked_at;
    std::optional<std::string> error;
};

// Simulated ENS / Unstoppable Domains resolution.
class BlockchainChecker {
public:
    static bool is_blockchain_domain(const std::string& domain);
    static NameService name_service(const std::string& domain);

    BlockchainRecord check(const std::string& domain) const;

private:
    void check_ens(const std::string& domain, BlockchainRecord& record) const;
    void check_unstoppable(const std::string& domain, BlockchainRecord& record) const;
    static bool simulate_available(const std::string& domain,
                                   const std::vector<std::string>& taken);
};
