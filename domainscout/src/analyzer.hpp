#pragma once

#include "valuation.hpp"
#include "tokenization.hpp"
#include "blockchain.hpp"
#include "dns_checker.hpp"
#include "whois_client.hpp"
#include <memory>
#include <optional>
#include <string>

struct DomainReport {
    std::string domain;
    std::string timestamp;
    std::optional<DnsResult> dns;
    std::optional<BlockchainRecord> blockchain;
    std::optional<TokenizationContext> tokenization;
    std::optional<WhoisResult> whois;
    ValuationResult valuation;
};

// Runs every lookup that applies to the domain, then values it. A failed
// lookup leaves its section empty; valuation always runs.
class DomainAnalyzer {
public:
    // Null dns/whois clients skip those lookups (offline mode).
    DomainAnalyzer(std::shared_ptr<ValuationEngine> valuator,
                   std::shared_ptr<TokenizationProvider> tokenization,
                   std::shared_ptr<BlockchainChecker> blockchain,
                   std::shared_ptr<DnsChecker> dns,
                   std::shared_ptr<WhoisClient> whois);

    DomainReport analyze(const std::string& domain) const;

private:
    std::shared_ptr<ValuationEngine> valuator_;
    std::shared_ptr<TokenizationProvider> tokenization_;
    std::shared_ptr<BlockchainChecker> blockchain_;
    std::shared_ptr<DnsChecker> dns_;
    std::shared_ptr<WhoisClient> whois_;

    std::optional<TokenizationContext> lookup_tokenization(const std::string& domain) const;
};
