#include <catch2/catch_test_macros.hpp>
#include "../src/tokenization.hpp"
#include "../src/blockchain.hpp"

TEST_CASE("Tokenization simulation", "[tokenization]") {
    SimulatedTokenizationProvider provider;

    SECTION("Short names are tokenized with full context") {
        auto ctx = provider.lookup("app.com");
        REQUIRE(ctx.has_value());
        REQUIRE(ctx->domain == "app.com");
        REQUIRE(ctx->is_tokenized);
        REQUIRE(ctx->chain == "ethereum");
        REQUIRE_FALSE(ctx->checked_at.empty());
        REQUIRE_FALSE(ctx->error.has_value());

        REQUIRE(ctx->record.has_value());
        REQUIRE(ctx->record->token_id == "6170702e636f6d");
        REQUIRE(ctx->record->sync_status == "synced");
        REQUIRE(ctx->record->records.count("ETH") == 1);

        REQUIRE(ctx->rights.has_value());
        REQUIRE(ctx->rights->total == ctx->rights->available + ctx->rights->locked);

        REQUIRE(ctx->defi.has_value());
        REQUIRE(ctx->defi->is_collateral);
        REQUIRE(ctx->defi->borrowed_amount < ctx->defi->collateral_value);

        REQUIRE(ctx->cross_chain.size() == 3);
        REQUIRE(ctx->cross_chain[1].bridged);
        REQUIRE(ctx->cross_chain[1].bridge_fee.has_value());
        REQUIRE(ctx->cross_chain[2].gas_savings == std::optional<std::string>("95%"));
    }

    SECTION("Untokenized names carry no details") {
        auto ctx = provider.lookup("hello.com");
        REQUIRE(ctx.has_value());
        REQUIRE_FALSE(ctx->is_tokenized);
        REQUIRE_FALSE(ctx->record.has_value());
        REQUIRE_FALSE(ctx->defi.has_value());
        REQUIRE(ctx->cross_chain.empty());
    }

    SECTION("Unsupported suffixes are never tokenized") {
        auto ctx = provider.lookup("app.xyz");
        REQUIRE(ctx.has_value());
        REQUIRE_FALSE(ctx->is_tokenized);
    }
}

TEST_CASE("Tokenized heuristic", "[tokenization]") {
    REQUIRE(SimulatedTokenizationProvider::simulate_tokenized("ai.com"));
    REQUIRE(SimulatedTokenizationProvider::simulate_tokenized("mycryptoshop.io"));
    REQUIRE(SimulatedTokenizationProvider::simulate_tokenized("test.com"));
    REQUIRE_FALSE(SimulatedTokenizationProvider::simulate_tokenized("hello.com"));
    REQUIRE_FALSE(SimulatedTokenizationProvider::simulate_tokenized("verylongname.com"));
}

TEST_CASE("Token identifiers", "[tokenization]") {
    REQUIRE(SimulatedTokenizationProvider::token_id("example.com") == "6578616d706c652e636f");
    REQUIRE(SimulatedTokenizationProvider::token_id("a.io") == "612e696f");
}

TEST_CASE("Tokenization eligibility", "[tokenization]") {
    auto traditional = SimulatedTokenizationProvider::eligibility("example.com");
    REQUIRE(traditional.eligible);
    REQUIRE(traditional.reason == "Traditional domain eligible for DOMA tokenization");

    auto bridged = SimulatedTokenizationProvider::eligibility("vitalik.eth");
    REQUIRE(bridged.eligible);
    REQUIRE(bridged.reason == "Blockchain domain eligible for DOMA bridge");

    auto rejected = SimulatedTokenizationProvider::eligibility("example.xyz");
    REQUIRE_FALSE(rejected.eligible);
}

TEST_CASE("Blockchain name services", "[blockchain]") {
    REQUIRE(BlockchainChecker::is_blockchain_domain("name.eth"));
    REQUIRE(BlockchainChecker::is_blockchain_domain("name.wallet"));
    REQUIRE_FALSE(BlockchainChecker::is_blockchain_domain("name.com"));

    REQUIRE(BlockchainChecker::name_service("name.eth") == NameService::ENS);
    REQUIRE(BlockchainChecker::name_service("name.crypto") == NameService::UnstoppableDomains);
    REQUIRE(BlockchainChecker::name_service("name.blockchain") == NameService::Unsupported);
}

TEST_CASE("Blockchain availability", "[blockchain]") {
    BlockchainChecker checker;

    SECTION("Registered ENS name") {
        auto record = checker.check("test.eth");
        REQUIRE(record.type == "ENS");
        REQUIRE_FALSE(record.available);
        REQUIRE_FALSE(record.owner.empty());
        REQUIRE(record.records.count("BTC") == 1);
    }

    SECTION("Free ENS name") {
        auto record = checker.check("myname.eth");
        REQUIRE(record.available);
        REQUIRE(record.owner.empty());
        REQUIRE(record.records.empty());
    }

    SECTION("Short names are taken") {
        REQUIRE_FALSE(checker.check("abc.eth").available);
    }

    SECTION("Unstoppable Domains") {
        auto record = checker.check("hello.x");
        REQUIRE(record.type == "Unstoppable Domains");
        REQUIRE_FALSE(record.available);
        REQUIRE(record.records.count("crypto.ETH.address") == 1);

        REQUIRE(checker.check("mywallet.nft").available);
    }

    SECTION("Unsupported suffix reports an error") {
        auto record = checker.check("example.com");
        REQUIRE(record.error.has_value());
        REQUIRE_FALSE(record.checked_at.empty());
    }
}
