#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>

struct DomaRecord {
    std::string token_id;
    std::string owner;
    std::string resolver;
    std::map<std::string, std::string> records;
    std::string registration_date;
    std::string expiration_date;
    std::string last_updated;
    std::string sync_status;
};

struct TokenRights {
    int total = 0;
    int available = 0;
    int locked = 0;
    std::map<std::string, int> rights_breakdown;
    std::vector<std::string> fractional_owners;
};

struct DeFiStatus {
    bool is_collateral = false;
    std::string lending_platform;
    double collateral_value = 0.0;
    double borrowed_amount = 0.0;
    bool yield_generation = false;
    double staking_rewards = 0.0;
};

struct ChainPresence {
    std::string chain;
    std::string contract_address;
    bool bridged = false;
    std::optional<double> bridge_fee;
    std::optional<std::string> gas_savings;  // layer-2 only
};

// Tokenization/DeFi state of a domain. Folded into the valuation rationale only.
struct TokenizationContext {
    std::string domain;
    bool is_tokenized = false;
    std::string chain;
    std::optional<DomaRecord> record;
    std::optional<TokenRights> rights;
    std::optional<DeFiStatus> defi;
    std::vector<ChainPresence> cross_chain;
    std::string checked_at;
    std::optional<std::string> error;
};

struct TokenizationEligibility {
    bool eligible;
    std::string reason;
};

class TokenizationProvider {
public:
    virtual ~TokenizationProvider() = default;

    // nullopt when the provider has nothing to say about the domain
    virtual std::optional<TokenizationContext> lookup(const std::string& domain) = 0;
};

// Stand-in for the DOMA protocol API, deterministic per domain apart from timestamps.
class SimulatedTokenizationProvider : public TokenizationProvider {
public:
    std::optional<TokenizationContext> lookup(const std::string& domain) override;

    static TokenizationEligibility eligibility(const std::string& domain);
    static bool simulate_tokenized(const std::string& domain);
    static std::string token_id(const std::string& domain);

private:
    static bool supports_suffix(const std::string& domain);
    static DomaRecord build_record(const std::string& domain);
    static TokenRights build_rights();
    static DeFiStatus build_defi_status();
    static std::vector<ChainPresence> build_cross_chain();
};
