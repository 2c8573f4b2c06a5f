// Cellar - Strategist Batch Tests

#include <catch2/catch.hpp>
#include <cellar/cellar.hpp>

#include "fixtures.hpp"

using namespace cellar;
using namespace cellar::test;

namespace {

// Supply the vault's USDC and borrow DAI against it from sub-account 0
std::vector<AdaptorCall> leverage_batch(I128 supplied, I128 borrowed) {
    return {
        call(LendingSupplyAdaptor::IDENTIFIER, {
            LendingSupplyAdaptor::deposit_to_market(USDC, 0, supplied),
            LendingSupplyAdaptor::enter_market(USDC, 0),
        }),
        call(LendingDebtAdaptor::IDENTIFIER, {
            LendingDebtAdaptor::borrow(DAI, 0, borrowed),
        }),
    };
}

SwapParams usdc_to_dai(I128 amount_in, uint64_t deadline) {
    SwapParams params;
    params.path = {USDC, DAI};
    params.amount_in = amount_in;
    params.min_amount_out = 0;
    params.deadline = deadline;
    return params;
}

} // namespace

TEST_CASE("Leveraged lending batch", "[strategist]") {
    Fixture fx;
    Cellar& cellar = *fx.cellar;
    auto& lending = fx.system.lending();

    REQUIRE(fx.deposit(ALICE, units(10000)) == errors::OK);
    REQUIRE(fx.track(fx.usdc_supply) == errors::OK);
    REQUIRE(fx.track(fx.dai_erc20) == errors::OK);

    SECTION("Debt position must be tracked") {
        REQUIRE(cellar.call_on_adaptor(leverage_batch(units(10000), units(8000))) ==
                errors::DEBT_POSITIONS_MUST_BE_TRACKED);
        REQUIRE(lending.balance_of_underlying({CELLAR, 0}, USDC) == 0);
        REQUIRE(fx.balance(USDC, CELLAR) == units(10000));
    }

    REQUIRE(fx.track(fx.dai_debt, true) == errors::OK);

    SECTION("Borrowing to health factor 1.1 succeeds") {
        REQUIRE(cellar.call_on_adaptor(leverage_batch(units(10000), units(8000))) == errors::OK);

        REQUIRE(lending.balance_of_underlying({CELLAR, 0}, USDC) == units(10000));
        REQUIRE(lending.debt_of({CELLAR, 0}, DAI) == units(8000));
        REQUIRE(lending.health_factor({CELLAR, 0}) == dec("1.1"));
        REQUIRE(fx.balance(DAI, CELLAR) == units(8000));
        REQUIRE(cellar.total_assets() == units(10000));
        REQUIRE(cellar.position_balance(fx.dai_debt) == units(8000));

        // Supplied collateral is locked behind the debt
        REQUIRE(cellar.total_assets_withdrawable() == units(8000));

        SECTION("Withdrawals that need the locked collateral revert") {
            fx.advance(TWO_DAYS);
            REQUIRE(cellar.max_withdraw(ALICE) == units(8000));

            I128 shares = 0;
            REQUIRE(cellar.withdraw(ALICE, units(8000) + 1, ALICE, ALICE, shares) ==
                    errors::WITHDRAW_EXCEEDS_LIQUIDITY);
            REQUIRE(cellar.redeem(ALICE, units(9000), ALICE, ALICE, shares) ==
                    errors::WITHDRAW_EXCEEDS_LIQUIDITY);
            REQUIRE(cellar.balance_of(ALICE) == units(10000));
            REQUIRE(fx.balance(DAI, CELLAR) == units(8000));
            REQUIRE(fx.balance(DAI, ALICE) == 0);

            REQUIRE(cellar.withdraw(ALICE, units(5000), ALICE, ALICE, shares) == errors::OK);
            REQUIRE(fx.balance(DAI, ALICE) == units(5000));
        }

        SECTION("Repay and unwind") {
            std::vector<AdaptorCall> unwind = {
                call(LendingDebtAdaptor::IDENTIFIER, {LendingDebtAdaptor::repay(DAI, 0, AMOUNT_MAX)}),
                call(LendingSupplyAdaptor::IDENTIFIER, {
                    LendingSupplyAdaptor::withdraw_from_market(USDC, 0, AMOUNT_MAX),
                }),
            };
            REQUIRE(cellar.call_on_adaptor(unwind) == errors::OK);
            REQUIRE(lending.debt_of({CELLAR, 0}, DAI) == 0);
            REQUIRE(fx.balance(USDC, CELLAR) == units(10000));
            REQUIRE(fx.balance(DAI, CELLAR) == 0);
        }
    }

    SECTION("One wei past the minimum health factor reverts the batch") {
        REQUIRE(cellar.call_on_adaptor(leverage_batch(units(10000), units(8000) + 1)) ==
                errors::HEALTH_FACTOR_TOO_LOW);

        REQUIRE(lending.balance_of_underlying({CELLAR, 0}, USDC) == 0);
        REQUIRE(lending.debt_of({CELLAR, 0}, DAI) == 0);
        REQUIRE_FALSE(lending.is_entered({CELLAR, 0}, USDC));
        REQUIRE(fx.balance(USDC, CELLAR) == units(10000));
        REQUIRE(fx.balance(DAI, CELLAR) == 0);
        REQUIRE(fx.system.journal().depth() == 0);
    }

    SECTION("Withdrawing supply below the minimum health factor") {
        REQUIRE(cellar.call_on_adaptor(leverage_batch(units(10000), units(7000))) == errors::OK);
        std::vector<AdaptorCall> batch = {
            call(LendingSupplyAdaptor::IDENTIFIER, {
                LendingSupplyAdaptor::withdraw_from_market(USDC, 0, units(2000)),
            }),
        };
        REQUIRE(cellar.call_on_adaptor(batch) == errors::HEALTH_FACTOR_TOO_LOW);
        REQUIRE(lending.balance_of_underlying({CELLAR, 0}, USDC) == units(10000));
    }
}

TEST_CASE("Self-borrow batch", "[strategist]") {
    Fixture fx;
    Cellar& cellar = *fx.cellar;
    REQUIRE(fx.deposit(ALICE, units(1000)) == errors::OK);
    REQUIRE(fx.track(fx.usdc_debt, true) == errors::OK);

    std::vector<AdaptorCall> batch = {
        call(LendingSupplyAdaptor::IDENTIFIER, {LendingSupplyAdaptor::deposit_to_market(USDC, 0, units(1000))}),
        call(LendingDebtAdaptor::IDENTIFIER, {LendingDebtAdaptor::self_borrow(USDC, 0, units(500))}),
    };

    SECTION("Supply position must be tracked as well") {
        REQUIRE(cellar.call_on_adaptor(batch) == errors::POSITION_MUST_BE_TRACKED);
    }

    SECTION("Self-borrow leaves net asset value unchanged") {
        REQUIRE(fx.track(fx.usdc_supply) == errors::OK);
        REQUIRE(cellar.call_on_adaptor(batch) == errors::OK);
        REQUIRE(fx.system.lending().balance_of_underlying({CELLAR, 0}, USDC) == units(1500));
        REQUIRE(fx.system.lending().debt_of({CELLAR, 0}, USDC) == units(500));
        REQUIRE(cellar.total_assets() == units(1000));

        batch = {call(LendingDebtAdaptor::IDENTIFIER, {LendingDebtAdaptor::self_repay(USDC, 0, units(500))})};
        REQUIRE(cellar.call_on_adaptor(batch) == errors::OK);
        REQUIRE(fx.system.lending().debt_of({CELLAR, 0}, USDC) == 0);
    }
}

TEST_CASE("Batch entry checks", "[strategist]") {
    Fixture fx;
    Cellar& cellar = *fx.cellar;
    REQUIRE(fx.deposit(ALICE, units(1000)) == errors::OK);
    REQUIRE(fx.track(fx.dai_erc20) == errors::OK);

    std::vector<AdaptorCall> batch = {
        call(SwapAdaptor::IDENTIFIER, {SwapAdaptor::swap(Exchange::UNIV2, usdc_to_dai(units(100), START_TIME))}),
    };

    SECTION("Adaptor must be catalogued") {
        REQUIRE(cellar.remove_adaptor_from_catalogue(SwapAdaptor::IDENTIFIER) == errors::OK);
        REQUIRE(cellar.call_on_adaptor(batch) == errors::ADAPTOR_NOT_IN_CATALOGUE);
    }

    SECTION("Adaptor must still be trusted") {
        fx.system.registry().distrust_adaptor(SwapAdaptor::IDENTIFIER);
        REQUIRE(cellar.call_on_adaptor(batch) == errors::ADAPTOR_NOT_TRUSTED);
    }

    SECTION("Failures name the first failing call") {
        batch.push_back(call(LendingSupplyAdaptor::IDENTIFIER, {Bytes{0xDE, 0xAD, 0xBE, 0xEF}}));
        REQUIRE(cellar.call_on_adaptor(batch) == errors::UNKNOWN_SELECTOR);
        REQUIRE(fx.balance(DAI, CELLAR) == 0);
        REQUIRE(fx.balance(USDC, CELLAR) == units(1000));
    }

    SECTION("Empty batch") {
        REQUIRE(cellar.call_on_adaptor({}) == errors::OK);
    }
}

TEST_CASE("Swaps against the total assets check", "[strategist]") {
    Fixture fx;
    Cellar& cellar = *fx.cellar;
    REQUIRE(fx.deposit(ALICE, units(10000)) == errors::OK);

    SECTION("Output asset must be tracked") {
        SwapParams params = usdc_to_dai(units(10000), START_TIME);
        params.path = {USDC, WETH};
        std::vector<AdaptorCall> batch = {call(SwapAdaptor::IDENTIFIER, {SwapAdaptor::swap(Exchange::UNIV2, params)})};
        REQUIRE(cellar.call_on_adaptor(batch) == errors::POSITION_MUST_BE_TRACKED);
    }

    REQUIRE(fx.track(fx.dai_erc20) == errors::OK);

    SECTION("A 0.3% fee swap stays within the default deviation") {
        std::vector<AdaptorCall> batch = {
            call(SwapAdaptor::IDENTIFIER, {SwapAdaptor::swap(Exchange::UNIV2, usdc_to_dai(units(10000), START_TIME))}),
        };
        REQUIRE(cellar.call_on_adaptor(batch) == errors::OK);
        REQUIRE(fx.balance(DAI, CELLAR) == units(9970));
        REQUIRE(fx.balance(USDC, CELLAR) == 0);
        REQUIRE(cellar.total_assets() == units(9970));
    }

    SECTION("A 1% fee swap exceeds it") {
        SwapParams params = usdc_to_dai(units(10000), START_TIME);
        params.pool_fees = {fee_tiers::FEE_100};
        std::vector<AdaptorCall> batch = {call(SwapAdaptor::IDENTIFIER, {SwapAdaptor::swap(Exchange::UNIV3, params)})};

        REQUIRE(cellar.call_on_adaptor(batch) == errors::TOTAL_ASSETS_DEVIATION);
        REQUIRE(fx.balance(USDC, CELLAR) == units(10000));
        REQUIRE(fx.balance(DAI, CELLAR) == 0);

        SECTION("Passes with the check disabled") {
            cellar.set_check_total_assets(false);
            REQUIRE(cellar.call_on_adaptor(batch) == errors::OK);
            REQUIRE(fx.balance(DAI, CELLAR) == units(9900));
        }

        SECTION("Passes with a wider deviation") {
            REQUIRE(cellar.set_rebalance_deviation(dec("0.01")) == errors::OK);
            REQUIRE(cellar.call_on_adaptor(batch) == errors::OK);
        }
    }

    SECTION("Expired deadline") {
        fx.advance(10);
        std::vector<AdaptorCall> batch = {
            call(SwapAdaptor::IDENTIFIER, {SwapAdaptor::swap(Exchange::UNIV2, usdc_to_dai(units(100), START_TIME))}),
        };
        REQUIRE(cellar.call_on_adaptor(batch) == errors::SWAP_DEADLINE_EXPIRED);
    }

    SECTION("Slippage floor") {
        SwapParams params = usdc_to_dai(units(100), START_TIME);
        params.min_amount_out = units(100);
        std::vector<AdaptorCall> batch = {call(SwapAdaptor::IDENTIFIER, {SwapAdaptor::swap(Exchange::UNIV2, params)})};
        REQUIRE(cellar.call_on_adaptor(batch) == errors::SLIPPAGE_EXCEEDED);
    }
}

TEST_CASE("Nested cellar positions", "[strategist]") {
    Fixture fx;
    Cellar& outer = *fx.cellar;

    CellarConfig config;
    config.name = "inner";
    config.address = addresses::from_id(0xCE12);
    config.asset = USDC;
    Cellar* inner = nullptr;
    REQUIRE(fx.system.create_cellar(config, &inner) == errors::OK);
    REQUIRE(inner->initialize(fx.usdc_erc20) == errors::OK);

    PositionId nested = NO_POSITION;
    REQUIRE(fx.system.registry().trust_position(NestedCellarAdaptor::IDENTIFIER,
                                                NestedCellarAdaptor::encode_config(config.address),
                                                nested) == errors::OK);
    REQUIRE(fx.track(nested) == errors::OK);
    REQUIRE(fx.deposit(ALICE, units(10000)) == errors::OK);

    std::vector<AdaptorCall> batch = {
        call(NestedCellarAdaptor::IDENTIFIER, {NestedCellarAdaptor::deposit_to_cellar(config.address, units(4000))}),
    };
    REQUIRE(outer.call_on_adaptor(batch) == errors::OK);

    REQUIRE(inner->balance_of(CELLAR) == units(4000));
    REQUIRE(inner->total_assets() == units(4000));
    REQUIRE(outer.position_balance(nested) == units(4000));
    REQUIRE(outer.total_assets() == units(10000));
    REQUIRE(fx.balance(USDC, CELLAR) == units(6000));

    SECTION("Inner shares are locked like any depositor's") {
        REQUIRE(outer.total_assets_withdrawable() == units(6000));

        batch = {call(NestedCellarAdaptor::IDENTIFIER,
                      {NestedCellarAdaptor::withdraw_from_cellar(config.address, AMOUNT_MAX)})};
        fx.advance(TWO_DAYS);
        REQUIRE(outer.call_on_adaptor(batch) == errors::OK);
        REQUIRE(inner->balance_of(CELLAR) == 0);
        REQUIRE(fx.balance(USDC, CELLAR) == units(10000));
    }

    SECTION("User withdrawals pull from the nested cellar in order") {
        fx.advance(TWO_DAYS);
        I128 shares = 0;
        REQUIRE(outer.withdraw(ALICE, units(7000), ALICE, ALICE, shares) == errors::OK);
        REQUIRE(shares == units(7000));
        REQUIRE(inner->balance_of(CELLAR) == units(3000));
        REQUIRE(fx.balance(USDC, ALICE) == units(997000));
    }
}

TEST_CASE("Lending positions of neighbouring cellars stay separate", "[strategist]") {
    Fixture fx;
    auto& lending = fx.system.lending();

    PositionId usdc_supply_sub1 = NO_POSITION;
    REQUIRE(fx.system.registry().trust_position(LendingSupplyAdaptor::IDENTIFIER,
                                                encode_lending_config(USDC, 1),
                                                usdc_supply_sub1) == errors::OK);

    // Differs from CELLAR only in the lowest bit
    const Address neighbour_address = addresses::from_id(0xCE10);
    CellarConfig config;
    config.name = "neighbour";
    config.address = neighbour_address;
    config.asset = USDC;
    Cellar* neighbour = nullptr;
    REQUIRE(fx.system.create_cellar(config, &neighbour) == errors::OK);
    REQUIRE(neighbour->initialize(fx.usdc_erc20) == errors::OK);
    REQUIRE(neighbour->add_adaptor_to_catalogue(LendingSupplyAdaptor::IDENTIFIER) == errors::OK);
    REQUIRE(neighbour->add_position_to_catalogue(usdc_supply_sub1) == errors::OK);
    REQUIRE(neighbour->add_position(1, usdc_supply_sub1, {}, false) == errors::OK);

    I128 shares = 0;
    REQUIRE(neighbour->deposit(ALICE, units(5000), ALICE, shares) == errors::OK);
    REQUIRE(neighbour->call_on_adaptor({
        call(LendingSupplyAdaptor::IDENTIFIER, {LendingSupplyAdaptor::deposit_to_market(USDC, 1, units(5000))}),
    }) == errors::OK);
    REQUIRE(lending.balance_of_underlying({neighbour_address, 1}, USDC) == units(5000));

    REQUIRE(fx.track(fx.usdc_supply) == errors::OK);
    REQUIRE(lending.balance_of_underlying({CELLAR, 0}, USDC) == 0);
    REQUIRE(fx.cellar->total_assets() == 0);

    REQUIRE(fx.cellar->call_on_adaptor({
        call(LendingSupplyAdaptor::IDENTIFIER, {LendingSupplyAdaptor::withdraw_from_market(USDC, 0, units(5000))}),
    }) == errors::INSUFFICIENT_BALANCE);
    REQUIRE(fx.balance(USDC, CELLAR) == 0);
    REQUIRE(neighbour->total_assets() == units(5000));
}
