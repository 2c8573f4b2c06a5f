// Cellar - Position Registry Tests

#include <catch2/catch.hpp>
#include <cellar/cellar.hpp>
#include <cellar/registry.hpp>

#include "fixtures.hpp"

using namespace cellar;
using namespace cellar::test;

TEST_CASE("Adaptor trust", "[registry]") {
    Fixture fx;
    auto& registry = fx.system.registry();

    SECTION("Standard adaptors are trusted at start-up") {
        REQUIRE(registry.is_adaptor_trusted(Erc20Adaptor::IDENTIFIER));
        REQUIRE(registry.is_adaptor_trusted(LendingSupplyAdaptor::IDENTIFIER));
        REQUIRE(registry.is_adaptor_trusted(LendingDebtAdaptor::IDENTIFIER));
        REQUIRE(registry.is_adaptor_trusted(NestedCellarAdaptor::IDENTIFIER));
        REQUIRE(registry.is_adaptor_trusted(SwapAdaptor::IDENTIFIER));
        REQUIRE(fx.system.initialize() == errors::ALREADY_INITIALIZED);
    }

    SECTION("Null adaptor is rejected") {
        REQUIRE(registry.trust_adaptor(nullptr) == errors::INVALID_ADAPTOR);
    }

    SECTION("A second implementation cannot take an existing identifier") {
        auto impostor = std::make_shared<Erc20Adaptor>(fx.system.tokens());
        REQUIRE(registry.trust_adaptor(impostor) == errors::INVALID_ADAPTOR);
    }

    SECTION("Distrusted adaptors stay resolvable") {
        REQUIRE(registry.distrust_adaptor(SwapAdaptor::IDENTIFIER) == errors::OK);
        REQUIRE_FALSE(registry.is_adaptor_trusted(SwapAdaptor::IDENTIFIER));
        REQUIRE(registry.get_adaptor(SwapAdaptor::IDENTIFIER) != nullptr);
        REQUIRE(registry.distrust_adaptor(SwapAdaptor::IDENTIFIER) == errors::ADAPTOR_NOT_TRUSTED);
    }
}

TEST_CASE("Position trust", "[registry]") {
    Fixture fx;
    auto& registry = fx.system.registry();

    SECTION("Ids start at 1 and increase") {
        REQUIRE(fx.usdc_erc20 == 1);
        REQUIRE(fx.dai_erc20 == 2);
        REQUIRE(fx.dai_debt == 6);
    }

    SECTION("Trusting the same position twice returns the existing id") {
        PositionId id = NO_POSITION;
        PositionId before = registry.position_count();
        REQUIRE(registry.trust_position(Erc20Adaptor::IDENTIFIER, Erc20Adaptor::encode_config(DAI), id) ==
                errors::OK);
        REQUIRE(id == fx.dai_erc20);
        REQUIRE(registry.position_count() == before);
    }

    SECTION("Hash resolves to id") {
        PositionHash hash = Registry::position_hash(LendingDebtAdaptor::IDENTIFIER, true,
                                                    encode_lending_config(DAI, 0));
        REQUIRE(registry.position_hash_to_id(hash) == fx.dai_debt);
        REQUIRE(registry.position_hash_to_id(hash + 1) == NO_POSITION);

        // Debt flag is part of the identity
        PositionHash credit_hash = Registry::position_hash(LendingDebtAdaptor::IDENTIFIER, false,
                                                           encode_lending_config(DAI, 0));
        REQUIRE(credit_hash != hash);
    }

    SECTION("A distrusted position is not re-trusted") {
        REQUIRE(registry.distrust_position(fx.weth_erc20) == errors::OK);
        REQUIRE_FALSE(registry.is_position_trusted(fx.weth_erc20));

        PositionId id = NO_POSITION;
        REQUIRE(registry.trust_position(Erc20Adaptor::IDENTIFIER, Erc20Adaptor::encode_config(WETH), id) ==
                errors::POSITION_NOT_TRUSTED);
        REQUIRE(registry.distrust_position(fx.weth_erc20) == errors::POSITION_NOT_TRUSTED);
        REQUIRE(registry.distrust_position(999) == errors::POSITION_NOT_FOUND);
    }

    SECTION("Adaptor validation and pricing") {
        PositionId id = NO_POSITION;
        Asset unpriced(addresses::from_id(0xDEAD));

        REQUIRE(registry.trust_position(Erc20Adaptor::IDENTIFIER, Erc20Adaptor::encode_config(unpriced), id) ==
                errors::ASSET_NOT_PRICED);
        REQUIRE(registry.trust_position(LendingSupplyAdaptor::IDENTIFIER, encode_lending_config(USDC, 256), id) ==
                errors::INVALID_SUB_ACCOUNT_ID);
        REQUIRE(registry.trust_position(LendingSupplyAdaptor::IDENTIFIER, encode_lending_config(unpriced, 0), id) ==
                errors::UNDERLYING_NOT_SUPPORTED);
        REQUIRE(registry.trust_position(SwapAdaptor::IDENTIFIER, Bytes{}, id) ==
                errors::ADAPTOR_HAS_NO_POSITIONS);
        REQUIRE(registry.trust_position(0x1234, Bytes{}, id) == errors::ADAPTOR_NOT_TRUSTED);
        REQUIRE(id == NO_POSITION);
    }

    SECTION("Untrusted adaptor cannot add positions") {
        registry.distrust_adaptor(Erc20Adaptor::IDENTIFIER);
        PositionId id = NO_POSITION;
        Asset other(addresses::from_id(0xBEEF));
        fx.system.prices().add_asset(other, X18_ONE);
        REQUIRE(registry.trust_position(Erc20Adaptor::IDENTIFIER, Erc20Adaptor::encode_config(other), id) ==
                errors::ADAPTOR_NOT_TRUSTED);
    }
}

TEST_CASE("Registry snapshot", "[registry]") {
    Fixture fx;
    RegistrySnapshot snap = fx.system.registry().snapshot();
    REQUIRE(snap.positions.size() == 6);
    REQUIRE(snap.next_position_id == 7);

    Registry fresh(fx.system.prices());

    SECTION("Adaptors must be re-trusted first") {
        REQUIRE(fresh.restore(snap) == errors::ADAPTOR_NOT_TRUSTED);
    }

    SECTION("Restored registry keeps ids and trust") {
        auto& tokens = fx.system.tokens();
        auto& lending = fx.system.lending();
        fresh.trust_adaptor(std::make_shared<Erc20Adaptor>(tokens));
        fresh.trust_adaptor(std::make_shared<LendingSupplyAdaptor>(lending, tokens));
        fresh.trust_adaptor(std::make_shared<LendingDebtAdaptor>(lending, tokens));

        snap.trusted_adaptors = {Erc20Adaptor::IDENTIFIER, LendingSupplyAdaptor::IDENTIFIER,
                                 LendingDebtAdaptor::IDENTIFIER};
        REQUIRE(fresh.restore(snap) == errors::OK);
        REQUIRE(fresh.is_position_trusted(fx.dai_debt));
        REQUIRE(fresh.get_position_data(fx.dai_debt)->is_debt);

        PositionId id = NO_POSITION;
        Asset other(addresses::from_id(0xBEEF));
        fx.system.prices().add_asset(other, X18_ONE);
        REQUIRE(fresh.trust_position(Erc20Adaptor::IDENTIFIER, Erc20Adaptor::encode_config(other), id) ==
                errors::OK);
        REQUIRE(id == 7);
    }

    SECTION("Tampered hash is rejected") {
        fresh.trust_adaptor(std::make_shared<Erc20Adaptor>(fx.system.tokens()));
        fresh.trust_adaptor(std::make_shared<LendingSupplyAdaptor>(fx.system.lending(), fx.system.tokens()));
        fresh.trust_adaptor(std::make_shared<LendingDebtAdaptor>(fx.system.lending(), fx.system.tokens()));
        snap.trusted_adaptors.clear();
        snap.positions[0].hash ^= 1;
        REQUIRE(fresh.restore(snap) == errors::POSITION_MISMATCH);
    }
}

TEST_CASE("Colliding position hashes", "[registry]") {
    System system;
    system.set_time_source([] { return START_TIME; });
    system.prices().add_asset(USDC, X18_ONE);
    system.prices().add_asset(DAI, X18_ONE);
    auto& registry = system.registry();

    // Every config of an adaptor lands on one hash
    const PositionHasher collapse = [](AdaptorId adaptor, bool is_debt, const Bytes&) {
        return static_cast<PositionHash>(adaptor ^ (is_debt ? 1u : 0u));
    };
    REQUIRE(registry.set_position_hasher(collapse) == errors::OK);
    REQUIRE(system.initialize() == errors::OK);

    PositionId usdc = NO_POSITION;
    PositionId dai = NO_POSITION;
    REQUIRE(registry.trust_position(Erc20Adaptor::IDENTIFIER, Erc20Adaptor::encode_config(USDC), usdc) ==
            errors::OK);
    REQUIRE(registry.trust_position(Erc20Adaptor::IDENTIFIER, Erc20Adaptor::encode_config(DAI), dai) ==
            errors::POSITION_MISMATCH);
    REQUIRE(dai == NO_POSITION);
    REQUIRE(registry.position_count() == 1);

    REQUIRE(registry.position_id_for(Erc20Adaptor::IDENTIFIER, false, Erc20Adaptor::encode_config(USDC)) == usdc);
    REQUIRE(registry.position_id_for(Erc20Adaptor::IDENTIFIER, false, Erc20Adaptor::encode_config(DAI)) ==
            NO_POSITION);
    REQUIRE(registry.set_position_hasher(&Registry::position_hash) == errors::ALREADY_INITIALIZED);

    SECTION("Tracking checks compare the full position") {
        system.tokens().mint(USDC, ALICE, units(1000));
        system.tokens().mint(DAI, system_addresses::SWAP_ROUTER, units(1000));

        CellarConfig config;
        config.name = "collision";
        config.address = CELLAR;
        config.asset = USDC;
        Cellar* cellar = nullptr;
        REQUIRE(system.create_cellar(config, &cellar) == errors::OK);
        REQUIRE(cellar->initialize(usdc) == errors::OK);
        REQUIRE(cellar->add_adaptor_to_catalogue(SwapAdaptor::IDENTIFIER) == errors::OK);

        I128 shares = 0;
        REQUIRE(cellar->deposit(ALICE, units(1000), ALICE, shares) == errors::OK);

        // DAI shares the tracked USDC position's hash but is not tracked
        SwapParams params;
        params.path = {USDC, DAI};
        params.amount_in = units(100);
        params.min_amount_out = 0;
        params.deadline = START_TIME;
        REQUIRE(cellar->call_on_adaptor({
            call(SwapAdaptor::IDENTIFIER, {SwapAdaptor::swap(Exchange::UNIV2, params)}),
        }) == errors::POSITION_MUST_BE_TRACKED);
        REQUIRE(system.tokens().balance_of(USDC, CELLAR) == units(1000));
    }

    SECTION("Restore refuses two positions on one hash") {
        RegistrySnapshot snap = registry.snapshot();
        PositionData twin = snap.positions.front();
        twin.id = usdc + 1;
        twin.config_data = Erc20Adaptor::encode_config(DAI);
        snap.positions.push_back(twin);
        snap.next_position_id = twin.id + 1;
        snap.trusted_adaptors = {Erc20Adaptor::IDENTIFIER};

        Registry fresh(system.prices());
        REQUIRE(fresh.set_position_hasher(collapse) == errors::OK);
        REQUIRE(fresh.trust_adaptor(std::make_shared<Erc20Adaptor>(system.tokens())) == errors::OK);
        REQUIRE(fresh.restore(snap) == errors::POSITION_MISMATCH);
        REQUIRE(fresh.position_count() == 0);
    }
}
