#include "formatter.hpp"
#include "util.hpp"
#include <fmt/format.h>

namespace {

template <typename T>
nlohmann::json optional_json(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

std::string row(const std::string& label, const std::string& value) {
    return fmt::format("{:<22}{}\n", label + ":", value);
}

std::string section(const std::string& title) {
    return fmt::format("{}\n{}\n", title, std::string(title.size(), '-'));
}

std::string status_text(bool available) {
    return available ? "✅ Available" : "❌ Taken";
}

std::string tick(bool value) {
    return value ? "✅" : "❌";
}

std::string confidence_label(Confidence confidence) {
    switch (confidence) {
        case Confidence::High: return "🟢 High";
        case Confidence::Medium: return "🟡 Medium";
        case Confidence::Low: return "🔴 Low";
        default: return confidence_string(confidence);
    }
}

} // namespace

std::optional<OutputFormat> parse_output_format(const std::string& name) {
    std::string lower = util::to_lower(util::trim(name));
    if (lower == "table") return OutputFormat::Table;
    if (lower == "json") return OutputFormat::Json;
    return std::nullopt;
}

ReportFormatter::ReportFormatter(OutputFormat format) : format_(format) {}

std::string ReportFormatter::render(const DomainReport& report) const {
    if (format_ == OutputFormat::Json) {
        // Domain and reasoning come from argv and may hold malformed UTF-8
        return report_json(report).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
    }
    return render_table(report);
}

nlohmann::json ReportFormatter::valuation_json(const ValuationResult& valuation) {
    const auto& f = valuation.factors;
    return {
        {"estimated_value", valuation.estimated_value},
        {"currency", valuation.currency},
        {"confidence", confidence_string(valuation.confidence)},
        {"factors", {
            {"length", f.length},
            {"length_score", f.length_score},
            {"character_score", f.character_score},
            {"word_score", f.word_score},
            {"suffix_score", f.suffix_score},
            {"pronounceable", f.pronounceable},
            {"brandable", f.brandable},
            {"has_digits", f.has_digits},
            {"has_hyphen", f.has_hyphen}
        }},
        {"reasoning", valuation.reasoning}
    };
}

nlohmann::json ReportFormatter::tokenization_json(const TokenizationContext& ctx) {
    nlohmann::json j = {
        {"domain", ctx.domain},
        {"is_tokenized", ctx.is_tokenized},
        {"checked_at", ctx.checked_at}
    };

    if (!ctx.chain.empty()) {
        j["tokenization_chain"] = ctx.chain;
    }

    if (ctx.record) {
        j["doma_record"] = {
            {"token_id", ctx.record->token_id},
            {"owner", ctx.record->owner},
            {"resolver", ctx.record->resolver},
            {"records", ctx.record->records},
            {"registration_date", ctx.record->registration_date},
            {"expiration_date", ctx.record->expiration_date},
            {"last_updated", ctx.record->last_updated},
            {"sync_status", ctx.record->sync_status}
        };
    }

    if (ctx.rights) {
        j["token_rights"] = {
            {"total_tokens", ctx.rights->total},
            {"available_tokens", ctx.rights->available},
            {"locked_tokens", ctx.rights->locked},
            {"rights_breakdown", ctx.rights->rights_breakdown},
            {"fractional_owners", ctx.rights->fractional_owners}
        };
    }

    if (ctx.defi) {
        j["defi_status"] = {
            {"is_collateral", ctx.defi->is_collateral},
            {"lending_platform", ctx.defi->lending_platform},
            {"collateral_value", ctx.defi->collateral_value},
            {"borrowed_amount", ctx.defi->borrowed_amount},
            {"yield_generation", ctx.defi->yield_generation},
            {"staking_rewards", ctx.defi->staking_rewards}
        };
    }

    if (!ctx.cross_chain.empty()) {
        nlohmann::json chains = nlohmann::json::object();
        for (const auto& presence : ctx.cross_chain) {
            nlohmann::json c = {
                {"contract_address", presence.contract_address},
                {"bridged", presence.bridged}
            };
            if (presence.bridge_fee) c["bridge_fee"] = *presence.bridge_fee;
            if (presence.gas_savings) c["gas_savings"] = *presence.gas_savings;
            chains[presence.chain] = c;
        }
        j["cross_chain_data"] = chains;
    }

    if (ctx.error) {
        j["error"] = *ctx.error;
    }

    return j;
}

nlohmann::json ReportFormatter::report_json(const DomainReport& report) {
    nlohmann::json j;
    j["domain"] = report.domain;
    j["timestamp"] = report.timestamp;

    if (report.dns) {
        const auto& d = *report.dns;
        j["dns_availability"] = {
            {"available", d.available},
            {"tld", d.tld},
            {"has_records", d.has_records},
            {"record_types", d.record_types},
            {"checked_at", d.checked_at},
            {"error", optional_json(d.error)}
        };
    } else {
        j["dns_availability"] = nullptr;
    }

    if (report.blockchain) {
        const auto& b = *report.blockchain;
        j["blockchain_data"] = {
            {"available", b.available},
            {"type", b.type},
            {"owner", b.owner},
            {"resolver", b.resolver},
            {"records", b.records},
            {"checked_at", b.checked_at}
        };
    } else {
        j["blockchain_data"] = nullptr;
    }

    j["doma_data"] = report.tokenization ? tokenization_json(*report.tokenization)
                                         : nlohmann::json(nullptr);

    if (report.whois) {
        const auto& w = *report.whois;
        j["whois_data"] = {
            {"available", w.available},
            {"registrar", w.registrar},
            {"registration_date", optional_json(w.registration_date)},
            {"expiry_date", optional_json(w.expiry_date)},
            {"updated_date", optional_json(w.updated_date)},
            {"name_servers", w.name_servers},
            {"status", w.status},
            {"checked_at", w.checked_at},
            {"error", optional_json(w.error)}
        };
    } else {
        j["whois_data"] = nullptr;
    }

    j["valuation_data"] = valuation_json(report.valuation);
    return j;
}

void ReportFormatter::append_dns(std::string& out, const DnsResult& dns) {
    out += section("📡 DNS AVAILABILITY");
    out += row("Status", status_text(dns.available));
    out += row("TLD", dns.tld);
    if (dns.has_records) {
        out += row("Records", util::join(dns.record_types, ", "));
    }
    if (dns.error) {
        out += row("Error", *dns.error);
    }
    out += "\n";
}

void ReportFormatter::append_blockchain(std::string& out, const BlockchainRecord& record) {
    out += section("⛓️ BLOCKCHAIN DATA");
    out += row("Status", status_text(record.available));
    out += row("Type", record.type);
    if (!record.owner.empty()) out += row("Owner", record.owner);
    if (!record.resolver.empty()) out += row("Resolver", record.resolver);
    if (!record.records.empty()) {
        out += "Records:\n";
        for (const auto& [key, value] : record.records) {
            out += row("  " + key, value);
        }
    }
    out += "\n";
}

void ReportFormatter::append_tokenization(std::string& out, const TokenizationContext& ctx) {
    out += section("🪙 TOKENIZATION");
    out += row("Tokenized", tick(ctx.is_tokenized));
    if (!ctx.chain.empty()) out += row("Chain", ctx.chain);
    if (ctx.record) out += row("Token ID", ctx.record->token_id);
    if (ctx.rights) {
        out += row("Token Rights", fmt::format("{} total, {} available, {} locked",
                                               ctx.rights->total, ctx.rights->available,
                                               ctx.rights->locked));
    }
    if (ctx.defi && ctx.defi->is_collateral) {
        out += row("Collateral", fmt::format("${:.2f} on {} (${:.2f} borrowed)",
                                             ctx.defi->collateral_value,
                                             ctx.defi->lending_platform,
                                             ctx.defi->borrowed_amount));
    }
    if (!ctx.cross_chain.empty()) {
        std::vector<std::string> chains;
        for (const auto& presence : ctx.cross_chain) chains.push_back(presence.chain);
        out += row("Cross-chain", util::join(chains, ", "));
    }
    out += "\n";
}

void ReportFormatter::append_whois(std::string& out, const WhoisResult& whois) {
    out += section("📋 WHOIS DATA");
    out += row("Status", status_text(whois.available));
    if (!whois.registrar.empty()) out += row("Registrar", whois.registrar);
    if (whois.registration_date) out += row("Created", *whois.registration_date);
    if (whois.expiry_date) out += row("Expires", *whois.expiry_date);
    if (whois.updated_date) out += row("Updated", *whois.updated_date);
    if (!whois.name_servers.empty()) out += row("Name Servers", util::join(whois.name_servers, ", "));
    if (!whois.status.empty()) out += row("Domain Status", util::join(whois.status, ", "));
    if (whois.error) out += row("Error", *whois.error);
    out += "\n";
}

void ReportFormatter::append_valuation(std::string& out, const ValuationResult& valuation) {
    const auto& f = valuation.factors;

    out += section("💰 DOMAIN VALUATION");
    out += row("Estimated Value", fmt::format("${} {}", valuation.estimated_value, valuation.currency));
    out += row("Confidence", confidence_label(valuation.confidence));
    out += row("Reasoning", valuation.reasoning);

    out += "\nValuation Factors:\n";
    out += row("  Length", fmt::format("{} chars (Score: {:.1f}/10)", f.length, f.length_score));
    out += row("  Character Quality", fmt::format("{:.1f}/5", f.character_score));
    out += row("  Word Value", fmt::format("{:.1f}/10", f.word_score));
    out += row("  Suffix Value", fmt::format("{:.1f}/5", f.suffix_score));
    out += row("  Brandable", tick(f.brandable));
    out += row("  Pronounceable", tick(f.pronounceable));
    if (f.has_digits) out += row("  Contains Numbers", "❌ (reduces value)");
    if (f.has_hyphen) out += row("  Contains Hyphens", "❌ (reduces value)");
}

std::string ReportFormatter::render_table(const DomainReport& report) {
    std::string out;
    out += "\n🔍 DOMAIN ANALYSIS REPORT\n";
    out += std::string(63, '=') + "\n\n";
    out += row("Domain", report.domain);
    out += row("Analyzed", report.timestamp);
    out += "\n";

    if (report.dns) append_dns(out, *report.dns);
    if (report.blockchain) append_blockchain(out, *report.blockchain);
    if (report.tokenization) append_tokenization(out, *report.tokenization);
    if (report.whois) append_whois(out, *report.whois);
    append_valuation(out, report.valuation);

    out += "\n";
    return out;
}
