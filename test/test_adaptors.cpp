// Cellar - Adaptor Tests

#include <catch2/catch.hpp>
#include <cellar/adaptor.hpp>

#include "fixtures.hpp"

using namespace cellar;
using namespace cellar::test;

TEST_CASE("Capability table dispatch", "[adaptor]") {
    Fixture fx;
    Adaptor* supply = fx.system.registry().get_adaptor(LendingSupplyAdaptor::IDENTIFIER);
    REQUIRE(supply != nullptr);

    REQUIRE(supply->supports(LendingSupplyAdaptor::DEPOSIT_TO_MARKET));
    REQUIRE(supply->supports(LendingSupplyAdaptor::EXIT_MARKET));
    REQUIRE_FALSE(supply->supports(LendingDebtAdaptor::BORROW));
    REQUIRE(supply->selectors().size() == 5);

    SECTION("Unknown selector") {
        Bytes data = LendingDebtAdaptor::borrow(USDC, 0, units(1));
        REQUIRE(supply->call(*fx.cellar, data) == errors::UNKNOWN_SELECTOR);
    }

    SECTION("Truncated call data") {
        REQUIRE(supply->call(*fx.cellar, Bytes{0x01, 0x02}) == errors::MALFORMED_CALLDATA);

        Bytes data = LendingSupplyAdaptor::deposit_to_market(USDC, 0, units(1));
        data.pop_back();
        REQUIRE(supply->call(*fx.cellar, data) == errors::MALFORMED_CALLDATA);

        data = LendingSupplyAdaptor::deposit_to_market(USDC, 0, units(1));
        data.push_back(0);
        REQUIRE(supply->call(*fx.cellar, data) == errors::MALFORMED_CALLDATA);
    }

    SECTION("Entrypoints require tracked positions") {
        Bytes data = LendingSupplyAdaptor::deposit_to_market(USDC, 0, units(1));
        REQUIRE(supply->call(*fx.cellar, data) == errors::POSITION_MUST_BE_TRACKED);

        Adaptor* debt = fx.system.registry().get_adaptor(LendingDebtAdaptor::IDENTIFIER);
        REQUIRE(debt->call(*fx.cellar, LendingDebtAdaptor::borrow(DAI, 0, units(1))) ==
                errors::DEBT_POSITIONS_MUST_BE_TRACKED);
    }
}

TEST_CASE("ERC20 adaptor", "[adaptor]") {
    Fixture fx;
    Adaptor* erc20 = fx.system.registry().get_adaptor(Erc20Adaptor::IDENTIFIER);
    const Bytes config = Erc20Adaptor::encode_config(USDC);

    REQUIRE(fx.deposit(ALICE, units(250)) == errors::OK);
    REQUIRE(erc20->balance_of(CELLAR, config) == units(250));
    REQUIRE(erc20->withdrawable_from(CELLAR, config, {}) == units(250));
    REQUIRE(erc20->asset_of(config) == USDC);

    REQUIRE(erc20->validate_config(Bytes{0x01}) == errors::MALFORMED_CALLDATA);
    REQUIRE(erc20->validate_config(Erc20Adaptor::encode_config(Asset())) == errors::MALFORMED_CALLDATA);

    REQUIRE(erc20->withdraw(*fx.cellar, units(1), Address{}, config, {}) == errors::INVALID_RECEIVER);
    REQUIRE(erc20->withdraw(*fx.cellar, units(1), CELLAR, config, {}) == errors::INVALID_RECEIVER);
    REQUIRE(erc20->withdraw(*fx.cellar, units(50), BOB, config, {}) == errors::OK);
    REQUIRE(fx.balance(USDC, BOB) == units(1000050));
}

TEST_CASE("Debt adaptors refuse user flows", "[adaptor]") {
    Fixture fx;
    Adaptor* debt = fx.system.registry().get_adaptor(LendingDebtAdaptor::IDENTIFIER);
    const Bytes config = encode_lending_config(DAI, 0);

    REQUIRE(debt->is_debt());
    REQUIRE(debt->withdrawable_from(CELLAR, config, {}) == 0);
    REQUIRE(debt->deposit(*fx.cellar, units(1), config, {}) == errors::USER_DEPOSITS_NOT_ALLOWED);
    REQUIRE(debt->withdraw(*fx.cellar, units(1), ALICE, config, {}) == errors::USER_WITHDRAWS_NOT_ALLOWED);
}

TEST_CASE("Lending supply position withdrawability", "[adaptor]") {
    Fixture fx;
    auto& lending = fx.system.lending();
    Adaptor* supply = fx.system.registry().get_adaptor(LendingSupplyAdaptor::IDENTIFIER);
    const Bytes config = encode_lending_config(USDC, 0);

    fx.system.tokens().mint(USDC, CELLAR, units(1000));
    REQUIRE(supply->deposit(*fx.cellar, units(1000), config, {}) == errors::OK);
    REQUIRE(supply->balance_of(CELLAR, config) == units(1000));
    REQUIRE(supply->withdrawable_from(CELLAR, config, {}) == units(1000));

    SECTION("Any liability blocks user withdrawals") {
        REQUIRE(lending.enter_market(CELLAR, 0, USDC) == errors::OK);
        REQUIRE(lending.borrow(CELLAR, 0, DAI, units(10)) == errors::OK);
        REQUIRE(supply->withdrawable_from(CELLAR, config, {}) == 0);
        REQUIRE(supply->withdraw(*fx.cellar, units(1), ALICE, config, {}) == errors::WITHDRAW_EXCEEDS_LIQUIDITY);
    }

    SECTION("Debt-free withdrawal pays the receiver") {
        REQUIRE(supply->withdraw(*fx.cellar, units(400), ALICE, config, {}) == errors::OK);
        REQUIRE(fx.balance(USDC, ALICE) == units(1000400));
        REQUIRE(supply->balance_of(CELLAR, config) == units(600));
    }

    SECTION("Debt adaptor reports outstanding debt") {
        Adaptor* debt = fx.system.registry().get_adaptor(LendingDebtAdaptor::IDENTIFIER);
        REQUIRE(lending.enter_market(CELLAR, 0, USDC) == errors::OK);
        REQUIRE(lending.borrow(CELLAR, 0, DAI, units(10)) == errors::OK);
        REQUIRE(debt->balance_of(CELLAR, encode_lending_config(DAI, 0)) == units(10));
        REQUIRE(debt->balance_of(CELLAR, encode_lending_config(USDC, 0)) == 0);
    }
}

TEST_CASE("Swap adaptor holds no positions", "[adaptor]") {
    Fixture fx;
    Adaptor* swap = fx.system.registry().get_adaptor(SwapAdaptor::IDENTIFIER);

    REQUIRE(swap->validate_config(Erc20Adaptor::encode_config(USDC)) == errors::ADAPTOR_HAS_NO_POSITIONS);
    REQUIRE(swap->deposit(*fx.cellar, units(1), {}, {}) == errors::USER_DEPOSITS_NOT_ALLOWED);
    REQUIRE(swap->withdraw(*fx.cellar, units(1), ALICE, {}, {}) == errors::USER_WITHDRAWS_NOT_ALLOWED);
}

TEST_CASE("Nested cellar adaptor configuration", "[adaptor]") {
    Fixture fx;
    Adaptor* nested = fx.system.registry().get_adaptor(NestedCellarAdaptor::IDENTIFIER);

    REQUIRE(nested->validate_config(NestedCellarAdaptor::encode_config(CELLAR)) == errors::OK);
    REQUIRE(nested->validate_config(NestedCellarAdaptor::encode_config(addresses::from_id(0xCE99))) ==
            errors::CELLAR_NOT_FOUND);
    REQUIRE(nested->asset_of(NestedCellarAdaptor::encode_config(CELLAR)) == USDC);

    CellarConfig config;
    config.name = "pending";
    config.address = addresses::from_id(0xCE12);
    config.asset = USDC;
    REQUIRE(fx.system.create_cellar(config) == errors::OK);
    REQUIRE(nested->validate_config(NestedCellarAdaptor::encode_config(config.address)) ==
            errors::NOT_INITIALIZED);

    // A cellar cannot hold its own shares
    REQUIRE(nested->deposit(*fx.cellar, units(1), NestedCellarAdaptor::encode_config(CELLAR), {}) ==
            errors::INVALID_RECEIVER);
}
