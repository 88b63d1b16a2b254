#pragma once

#include "analyzer.hpp"
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

enum class OutputFormat {
    Table,
    Json
};

std::optional<OutputFormat> parse_output_format(const std::string& name);

class ReportFormatter {
public:
    explicit ReportFormatter(OutputFormat format);

    std::string render(const DomainReport& report) const;

    static nlohmann::json report_json(const DomainReport& report);
    static nlohmann::json valuation_json(const ValuationResult& valuation);
    static nlohmann::json tokenization_json(const TokenizationContext& ctx);
    static std::string render_table(const DomainReport& report);

private:
    OutputFormat format_;

    static void append_dns(std::string& out, const DnsResult& dns);
    static void append_blockchain(std::string& out, const BlockchainRecord& record);
    static void append_tokenization(std::string& out, const TokenizationContext& ctx);
    static void append_whois(std::string& out, const WhoisResult& whois);
    static void append_valuation(std::string& out, const ValuationResult& valuation);
};
