#ifndef CELLAR_TEST_FIXTURES_HPP
#define CELLAR_TEST_FIXTURES_HPP

#include <catch2/catch.hpp>
#include <cellar/system.hpp>

#include <string>
#include <vector>

namespace Catch {
template <>
struct StringMaker<cellar::I128> {
    static std::string convert(cellar::I128 v) { return cellar::x18::to_raw_string(v); }
};
}

namespace cellar::test {

inline I128 units(int64_t n) { return x18::from_int(n); }
inline I128 dec(const char* s) { return *x18::parse(s); }

inline const Asset USDC{addresses::from_id(0xA001)};
inline const Asset DAI{addresses::from_id(0xA002)};
inline const Asset WETH{addresses::from_id(0xA003)};

constexpr Address ALICE = addresses::from_id(0x1001);
constexpr Address BOB = addresses::from_id(0x1002);
constexpr Address CELLAR = addresses::from_id(0xCE11);

constexpr uint64_t START_TIME = 1700000000;
constexpr uint64_t TWO_DAYS = 2 * 24 * 60 * 60;

// =============================================================================
// Fixture - priced assets, lending markets, router inventory and one
// initialized USDC cellar holding an ERC20 USDC position
// =============================================================================

struct Fixture {
    System system;
    uint64_t clock = START_TIME;
    Cellar* cellar = nullptr;

    PositionId usdc_erc20 = NO_POSITION;
    PositionId dai_erc20 = NO_POSITION;
    PositionId weth_erc20 = NO_POSITION;
    PositionId usdc_supply = NO_POSITION;   // sub-account 0
    PositionId usdc_debt = NO_POSITION;     // sub-account 0
    PositionId dai_debt = NO_POSITION;      // sub-account 0

    Fixture() {
        system.set_time_source([this] { return clock; });

        auto& prices = system.prices();
        prices.add_asset(USDC, X18_ONE);
        prices.add_asset(DAI, X18_ONE);
        prices.add_asset(WETH, units(2000));

        system.initialize();

        auto& lending = system.lending();
        lending.create_market({USDC, dec("0.88"), X18_ONE, true});
        lending.create_market({DAI, dec("0.88"), X18_ONE, true});
        lending.create_market({WETH, dec("0.8"), dec("0.9"), true});

        auto& tokens = system.tokens();
        tokens.mint(DAI, system_addresses::LENDING_MARKET, units(1000000));
        tokens.mint(USDC, system_addresses::LENDING_MARKET, units(1000000));
        tokens.mint(DAI, system_addresses::SWAP_ROUTER, units(1000000));
        tokens.mint(USDC, system_addresses::SWAP_ROUTER, units(1000000));
        tokens.mint(WETH, system_addresses::SWAP_ROUTER, units(1000));
        tokens.mint(USDC, ALICE, units(1000000));
        tokens.mint(USDC, BOB, units(1000000));

        auto& registry = system.registry();
        registry.trust_position(Erc20Adaptor::IDENTIFIER, Erc20Adaptor::encode_config(USDC), usdc_erc20);
        registry.trust_position(Erc20Adaptor::IDENTIFIER, Erc20Adaptor::encode_config(DAI), dai_erc20);
        registry.trust_position(Erc20Adaptor::IDENTIFIER, Erc20Adaptor::encode_config(WETH), weth_erc20);
        registry.trust_position(LendingSupplyAdaptor::IDENTIFIER, encode_lending_config(USDC, 0), usdc_supply);
        registry.trust_position(LendingDebtAdaptor::IDENTIFIER, encode_lending_config(USDC, 0), usdc_debt);
        registry.trust_position(LendingDebtAdaptor::IDENTIFIER, encode_lending_config(DAI, 0), dai_debt);

        CellarConfig config;
        config.name = "usdc-cellar";
        config.address = CELLAR;
        config.asset = USDC;
        system.create_cellar(config, &cellar);
        cellar->initialize(usdc_erc20);

        cellar->add_adaptor_to_catalogue(LendingSupplyAdaptor::IDENTIFIER);
        cellar->add_adaptor_to_catalogue(LendingDebtAdaptor::IDENTIFIER);
        cellar->add_adaptor_to_catalogue(SwapAdaptor::IDENTIFIER);
        cellar->add_adaptor_to_catalogue(NestedCellarAdaptor::IDENTIFIER);
    }

    void advance(uint64_t seconds) { clock += seconds; }

    // Catalogues the position and appends it to the matching array
    int32_t track(PositionId id, bool is_debt = false) {
        int32_t rc = cellar->add_position_to_catalogue(id);
        if (rc != errors::OK) return rc;
        auto& positions = is_debt ? cellar->debt_positions() : cellar->credit_positions();
        return cellar->add_position(static_cast<uint32_t>(positions.size()), id, {}, is_debt);
    }

    int32_t deposit(const Address& user, I128 assets) {
        I128 shares = 0;
        return cellar->deposit(user, assets, user, shares);
    }

    I128 balance(const Asset& asset, const Address& holder) const {
        return system.tokens().balance_of(asset, holder);
    }
};

inline AdaptorCall call(AdaptorId adaptor, std::vector<Bytes> call_data) {
    return AdaptorCall{adaptor, std::move(call_data)};
}

} // namespace cellar::test

#endif // CELLAR_TEST_FIXTURES_HPP
