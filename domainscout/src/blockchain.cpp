#include "blockchain.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

namespace {

const std::vector<std::string> kBlockchainSuffixes = {
    ".eth", ".crypto", ".nft", ".x", ".wallet", ".bitcoin",
    ".dao", ".888", ".zil", ".blockchain"
};

const std::vector<std::string> kUnstoppableSuffixes = {
    ".crypto", ".nft", ".x", ".wallet", ".bitcoin", ".dao", ".888", ".zil"
};

const std::vector<std::string> kTakenEns = {
    "test.eth", "example.eth", "hello.eth", "world.eth"
};

const std::vector<std::string> kTakenUnstoppable = {
    "test.crypto", "example.nft", "hello.x"
};

std::string simulated_address(char fill) {
    return "0x" + std::string(40, fill);
}

std::string simulated_btc(char fill) {
    return "bc1" + std::string(39, fill);
}

} // namespace

bool BlockchainChecker::is_blockchain_domain(const std::string& domain) {
    for (const auto& suffix : kBlockchainSuffixes) {
        if (util::ends_with(domain, suffix)) return true;
    }
    return false;
}

NameService BlockchainChecker::name_service(const std::string& domain) {
    if (util::ends_with(domain, ".eth")) {
        return NameService::ENS;
    }
    for (const auto& suffix : kUnstoppableSuffixes) {
        if (util::ends_with(domain, suffix)) return NameService::UnstoppableDomains;
    }
    return NameService::Unsupported;
}

BlockchainRecord BlockchainChecker::check(const std::string& domain) const {
    BlockchainRecord record;
    record.checked_at = util::current_iso8601();

    switch (name_service(domain)) {
        case NameService::ENS:
            check_ens(domain, record);
            break;
        case NameService::UnstoppableDomains:
            check_unstoppable(domain, record);
            break;
        case NameService::Unsupported:
            record.error = "unsupported blockchain domain type";
            spdlog::warn("No name service for {}", domain);
            break;
    }

    return record;
}

void BlockchainChecker::check_ens(const std::string& domain, BlockchainRecord& record) const {
    record.type = "ENS";
    record.available = simulate_available(domain, kTakenEns);

    if (!record.available) {
        record.owner = simulated_address('a');
        record.resolver = simulated_address('b');
        record.records["ETH"] = simulated_address('c');
        record.records["BTC"] = simulated_btc('d');
    }
}

void BlockchainChecker::check_unstoppable(const std::string& domain, BlockchainRecord& record) const {
    record.type = "Unstoppable Domains";
    record.available = simulate_available(domain, kTakenUnstoppable);

    if (!record.available) {
        record.owner = simulated_address('e');
        record.records["crypto.ETH.address"] = simulated_address('f');
        record.records["crypto.BTC.address"] = simulated_btc('g');
    }
}

bool BlockchainChecker::simulate_available(const std::string& domain,
                                           const std::vector<std::string>& taken) {
    for (const auto& name : taken) {
        if (domain == name) return false;
    }
    return util::first_label(domain).size() > 3;
}
