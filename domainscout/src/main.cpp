#include "config.hpp"
#include "cli_args.hpp"
#include "valuation.hpp"
#include "valuation_tables.hpp"
#include "tokenization.hpp"
#include "blockchain.hpp"
#include "dns_checker.hpp"
#include "whois_client.hpp"
#include "analyzer.hpp"
#include "formatter.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <memory>

void setup_logging(const std::string& log_level) {
    // stdout carries the report
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("domainscout", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "info") {
        logger->set_level(spdlog::level::info);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::warn);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

int main(int argc, char* argv[]) {
    CliOptions opts = CliParser::parse(argc, argv);

    if (opts.show_help) {
        std::cout << CliParser::usage();
        return 0;
    }

    if (!opts.is_valid()) {
        std::cerr << "Error: " << *opts.error << "\n\n" << CliParser::usage();
        return 2;
    }

    try {
        Config config = Config::from_env();
        setup_logging(config.log_level);

        if (opts.format) config.output_format = *opts.format;
        if (opts.offline) config.network_lookups = false;
        config.validate();

        auto valuator = std::make_shared<ValuationEngine>(
            config.valuation_tables_path.empty()
                ? ValuationTables::defaults()
                : ValuationTables::load_file(config.valuation_tables_path));

        auto tokenization = std::make_shared<SimulatedTokenizationProvider>();
        auto blockchain = std::make_shared<BlockchainChecker>();

        std::shared_ptr<DnsChecker> dns;
        std::shared_ptr<WhoisClient> whois;
        if (config.network_lookups) {
            dns = std::make_shared<DnsChecker>(config.dns_timeout_ms);
            whois = std::make_shared<WhoisClient>(config.whois_timeout_ms);
        }

        DomainAnalyzer analyzer(valuator, tokenization, blockchain, dns, whois);
        DomainReport report = analyzer.analyze(opts.domain);

        auto format = parse_output_format(config.output_format);
        ReportFormatter formatter(format.value_or(OutputFormat::Table));
        std::cout << formatter.render(report);

        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
