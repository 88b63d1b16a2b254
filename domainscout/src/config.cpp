#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

bool Config::get_env_bool(const char* name, bool default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;

    std::string v = util::to_lower(util::trim(val));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;

    spdlog::warn("Invalid boolean for {}, using default {}", name, default_val);
    return default_val;
}

bool Config::is_known_format(const std::string& format) {
    return format == "table" || format == "json";
}

Config Config::from_env() {
    Config cfg;

    cfg.output_format = util::to_lower(get_env("OUTPUT_FORMAT", "table"));

    cfg.network_lookups = get_env_bool("NETWORK_LOOKUPS", true);
    cfg.dns_timeout_ms = get_env_int("DNS_TIMEOUT_MS", 5000);
    cfg.whois_timeout_ms = get_env_int("WHOIS_TIMEOUT_MS", 10000);

    cfg.valuation_tables_path = get_env("VALUATION_TABLES_PATH");

    cfg.log_level = get_env("LOG_LEVEL", "warn");

    return cfg;
}

void Config::validate() const {
    if (!is_known_format(output_format)) {
        throw std::runtime_error("OUTPUT_FORMAT must be 'table' or 'json', got '" + output_format + "'");
    }
    if (dns_timeout_ms <= 0) {
        throw std::runtime_error("DNS_TIMEOUT_MS must be positive");
    }
    if (whois_timeout_ms <= 0) {
        throw std::runtime_error("WHOIS_TIMEOUT_MS must be positive");
    }

    spdlog::debug("Configuration validated");
    spdlog::debug("  Network lookups: {}", network_lookups ? "on" : "off");
    spdlog::debug("  Timeouts: dns={}ms, whois={}ms", dns_timeout_ms, whois_timeout_ms);
    spdlog::debug("  Valuation tables: {}",
                  valuation_tables_path.empty() ? "built-in" : valuation_tables_path);
}
