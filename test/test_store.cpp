// Cellar - Configuration and Persistence Tests

#include <catch2/catch.hpp>
#include <cellar/config.hpp>
#include <cellar/store.hpp>

#include <filesystem>
#include <stdexcept>

#include "fixtures.hpp"

using namespace cellar;
using namespace cellar::test;

TEST_CASE("Cellar config parsing", "[config]") {
    SECTION("Full document") {
        auto config = CellarConfig::from_json(R"({
            "name": "usdc-core",
            "address": "0x000000000000000000000000000000000000ce11",
            "asset": "0x000000000000000000000000000000000000a001",
            "share_lock_period": 600,
            "allowed_rebalance_deviation": "0.01",
            "check_total_assets": false
        })");

        REQUIRE(config.name == "usdc-core");
        REQUIRE(config.address == CELLAR);
        REQUIRE(config.asset == USDC);
        REQUIRE(config.share_lock_period == 600);
        REQUIRE(config.allowed_rebalance_deviation_x18 == dec("0.01"));
        REQUIRE_FALSE(config.check_total_assets);
    }

    SECTION("Defaults") {
        auto config = CellarConfig::from_json(R"({
            "address": "000000000000000000000000000000000000ce11",
            "asset": "0x000000000000000000000000000000000000a001"
        })");
        REQUIRE(config.share_lock_period == MAXIMUM_SHARE_LOCK_PERIOD);
        REQUIRE(config.allowed_rebalance_deviation_x18 == DEFAULT_REBALANCE_DEVIATION_X18);
        REQUIRE(config.check_total_assets);
    }

    SECTION("Round trip through to_json") {
        CellarConfig config;
        config.name = "weth";
        config.address = CELLAR;
        config.asset = WETH;
        config.allowed_rebalance_deviation_x18 = dec("0.025");
        auto parsed = CellarConfig::from_json(config.to_json());
        REQUIRE(parsed.asset == WETH);
        REQUIRE(parsed.allowed_rebalance_deviation_x18 == dec("0.025"));
    }

    SECTION("Malformed input throws") {
        REQUIRE_THROWS_AS(CellarConfig::from_json("{ not json"), std::runtime_error);
        REQUIRE_THROWS_AS(CellarConfig::from_json(R"({"asset": "0x000000000000000000000000000000000000a001"})"),
                          std::runtime_error);
        REQUIRE_THROWS_AS(CellarConfig::from_json(R"({"address": "0x12", "asset": "0x12"})"),
                          std::runtime_error);
        REQUIRE_THROWS_AS(CellarConfig::from_json(R"({
            "address": "0x000000000000000000000000000000000000ce11",
            "asset": "0x000000000000000000000000000000000000a001",
            "allowed_rebalance_deviation": "three"
        })"), std::runtime_error);
    }
}

TEST_CASE("System config", "[config]") {
    auto config = SystemConfig::from_json(R"({
        "log_level": "warn",
        "cellars": [
            {"name": "a", "address": "0x000000000000000000000000000000000000ce21",
             "asset": "0x000000000000000000000000000000000000a001"},
            {"name": "b", "address": "0x000000000000000000000000000000000000ce22",
             "asset": "0x000000000000000000000000000000000000a002"}
        ]
    })");
    REQUIRE(config.log_level == "warn");
    REQUIRE(config.cellars.size() == 2);
    REQUIRE(config.cellars[1].asset == DAI);

    REQUIRE(SystemConfig::from_json("{}").cellars.empty());
    REQUIRE_THROWS_AS(SystemConfig::from_file("/nonexistent/cellar.json"), std::runtime_error);
}

TEST_CASE("Registry JSON snapshot", "[store]") {
    Fixture fx;
    RegistrySnapshot snap = fx.system.registry().snapshot();

    std::string text = store::registry_to_json(snap);
    auto parsed = store::registry_from_json(text);
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->next_position_id == snap.next_position_id);
    REQUIRE(parsed->trusted_adaptors == snap.trusted_adaptors);
    REQUIRE(parsed->positions.size() == snap.positions.size());
    REQUIRE(parsed->positions[3].config_data == snap.positions[3].config_data);
    REQUIRE(parsed->positions[5].is_debt);

    REQUIRE_FALSE(store::registry_from_json("[]").has_value());
    REQUIRE_FALSE(store::registry_from_json(R"({"version": 99})").has_value());
}

TEST_CASE("Cellar JSON snapshot", "[store]") {
    Fixture fx;
    REQUIRE(fx.track(fx.dai_debt, true) == errors::OK);
    REQUIRE(fx.deposit(ALICE, units(1234)) == errors::OK);
    REQUIRE(fx.cellar->approve(ALICE, BOB, AMOUNT_MAX) == errors::OK);

    std::string text = store::cellar_to_json(fx.cellar->snapshot());
    auto parsed = store::cellar_from_json(text);
    REQUIRE(parsed.has_value());

    const CellarState& state = parsed->state;
    REQUIRE(parsed->config.name == "usdc-cellar");
    REQUIRE(state.status == CellarStatus::ACTIVE);
    REQUIRE(state.total_supply == units(1234));
    REQUIRE(state.debt_positions == std::vector<PositionId>{fx.dai_debt});
    REQUIRE(state.holding_position == fx.usdc_erc20);
    REQUIRE(state.share_lock_start.at(ALICE) == START_TIME);

    // The parsed snapshot restores into the live cellar
    REQUIRE(fx.cellar->restore(*parsed) == errors::OK);
    REQUIRE(fx.cellar->allowance(ALICE, BOB) == AMOUNT_MAX);
    REQUIRE(fx.cellar->balance_of(ALICE) == units(1234));

    REQUIRE_FALSE(store::cellar_from_json("{}").has_value());
}

TEST_CASE("Snapshot files", "[store]") {
    auto dir = std::filesystem::temp_directory_path() / "cellar_store_test";
    std::filesystem::create_directories(dir);
    std::string path = (dir / "registry.json").string();

    Fixture fx;
    REQUIRE(store::save_file(path, store::registry_to_json(fx.system.registry().snapshot())));

    auto loaded = store::load_file(path);
    REQUIRE(loaded.has_value());
    auto parsed = store::registry_from_json(*loaded);
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->positions.size() == 6);

    REQUIRE_FALSE(store::load_file((dir / "missing.json").string()).has_value());
    REQUIRE_FALSE(store::save_file((dir / "no" / "such" / "dir.json").string(), "{}"));

    std::filesystem::remove_all(dir);
}
