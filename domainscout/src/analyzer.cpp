#include "analyzer.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

DomainAnalyzer::DomainAnalyzer(std::shared_ptr<ValuationEngine> valuator,
                               std::shared_ptr<TokenizationProvider> tokenization,
                               std::shared_ptr<BlockchainChecker> blockchain,
                               std::shared_ptr<DnsChecker> dns,
                               std::shared_ptr<WhoisClient> whois)
    : valuator_(std::move(valuator))
    , tokenization_(std::move(tokenization))
    , blockchain_(std::move(blockchain))
    , dns_(std::move(dns))
    , whois_(std::move(whois))
{
    if (!valuator_) {
        throw std::invalid_argument("DomainAnalyzer requires a valuation engine");
    }
}

std::optional<TokenizationContext> DomainAnalyzer::lookup_tokenization(const std::string& domain) const {
    if (!tokenization_) return std::nullopt;

    try {
        auto ctx = tokenization_->lookup(domain);
        if (ctx && ctx->error) {
            spdlog::warn("Tokenization lookup for {} reported: {}", domain, *ctx->error);
            return std::nullopt;
        }
        return ctx;
    } catch (const std::exception& e) {
        spdlog::warn("Tokenization lookup for {} failed: {}", domain, e.what());
        return std::nullopt;
    }
}

DomainReport DomainAnalyzer::analyze(const std::string& domain) const {
    if (domain.empty()) {
        throw std::invalid_argument("domain cannot be empty");
    }

    DomainReport report;
    report.domain = domain;
    report.timestamp = util::current_iso8601();

    report.tokenization = lookup_tokenization(domain);

    if (BlockchainChecker::is_blockchain_domain(domain)) {
        if (blockchain_) {
            try {
                auto record = blockchain_->check(domain);
                if (!record.error) {
                    report.blockchain = std::move(record);
                }
            } catch (const std::exception& e) {
                spdlog::warn("Blockchain lookup for {} failed: {}", domain, e.what());
            }
        }
    } else {
        if (dns_) {
            try {
                report.dns = dns_->check(domain);
            } catch (const std::exception& e) {
                spdlog::warn("DNS lookup for {} failed: {}", domain, e.what());
            }
        }

        if (whois_) {
            try {
                report.whois = whois_->lookup(domain);
            } catch (const std::exception& e) {
                spdlog::warn("WHOIS lookup for {} failed: {}", domain, e.what());
            }
        }
    }

    report.valuation = valuator_->evaluate(domain, report.tokenization);

    spdlog::info("Analyzed {}: ${} ({})", domain, report.valuation.estimated_value,
                 confidence_string(report.valuation.confidence));
    return report;
}
