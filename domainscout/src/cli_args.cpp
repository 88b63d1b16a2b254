#include "cli_args.hpp"
#include "config.hpp"
#include "lexical.hpp"
#include "util.hpp"

bool CliParser::split_flag(const std::string& arg, std::string& name,
                           std::optional<std::string>& value) {
    if (!util::starts_with(arg, "-") || arg == "-") {
        return false;
    }

    // Accept both -flag and --flag, with an optional =value
    std::string body = arg.substr(util::starts_with(arg, "--") ? 2 : 1);
    size_t eq = body.find('=');
    if (eq == std::string::npos) {
        name = body;
        value.reset();
    } else {
        name = body.substr(0, eq);
        value = body.substr(eq + 1);
    }
    return true;
}

CliOptions CliParser::parse(const std::vector<std::string>& args) {
    CliOptions opts;
    std::vector<std::string> positional;

    for (size_t i = 0; i < args.size(); i++) {
        std::string name;
        std::optional<std::string> value;

        if (!split_flag(args[i], name, value)) {
            positional.push_back(args[i]);
            continue;
        }

        if (name == "help" || name == "h") {
            opts.show_help = true;
        } else if (name == "offline") {
            opts.offline = true;
        } else if (name == "domain" || name == "format") {
            if (!value) {
                if (i + 1 >= args.size()) {
                    opts.error = "Missing value for --" + name;
                    return opts;
                }
                value = args[++i];
            }
            if (name == "domain") {
                positional.push_back(*value);
            } else {
                opts.format = util::to_lower(util::trim(*value));
            }
        } else {
            opts.error = "Unknown option: " + args[i];
            return opts;
        }
    }

    if (opts.show_help) {
        return opts;
    }

    if (positional.size() > 1) {
        opts.error = "Expected a single domain, got " + std::to_string(positional.size());
        return opts;
    }
    if (positional.empty()) {
        opts.error = "A domain is required";
        return opts;
    }

    opts.domain = LexicalAnalyzer::to_lower(util::trim(positional[0]));
    if (opts.domain.empty()) {
        opts.error = "Domain cannot be empty";
        return opts;
    }

    if (opts.format && !Config::is_known_format(*opts.format)) {
        opts.error = "Unsupported format: " + *opts.format + " (use table or json)";
        return opts;
    }

    return opts;
}

CliOptions CliParser::parse(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; i++) {
        args.emplace_back(argv[i]);
    }
    return parse(args);
}

std::string CliParser::usage() {
    return
        "DomainScout - domain analysis and valuation\n"
        "\n"
        "Usage:\n"
        "  domainscout [--format table|json] [--offline] <domain>\n"
        "  domainscout --domain=<domain> [--format=table|json]\n"
        "\n"
        "Options:\n"
        "  --domain <domain>     Domain to analyze (or pass it positionally)\n"
        "  --format <fmt>        Output format: table (default) or json\n"
        "  --offline             Skip DNS and WHOIS lookups\n"
        "  --help                Show this message\n"
        "\n"
        "Environment:\n"
        "  LOG_LEVEL, OUTPUT_FORMAT, NETWORK_LOOKUPS, DNS_TIMEOUT_MS,\n"
        "  WHOIS_TIMEOUT_MS, VALUATION_TABLES_PATH\n"
        "\n"
        "Examples:\n"
        "  domainscout example.com\n"
        "  domainscout --format json mydomain.eth\n";
}
