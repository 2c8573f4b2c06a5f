#ifndef CELLAR_SYSTEM_HPP
#define CELLAR_SYSTEM_HPP

// =============================================================================
// Cellar - Vault Ledger Stack
//
//   PriceRouter    single-source asset pricing
//   TokenLedger    token balances (journaled)
//   LendingMarket  sub-account lending (journaled)
//   SwapRouter     oracle-priced swaps
//   Registry       trusted adaptors and positions
//   Cellar         share-issuing vaults (journaled)
//
// =============================================================================

#include <map>
#include <memory>
#include <vector>

#include "types.hpp"
#include "config.hpp"
#include "journal.hpp"
#include "oracle.hpp"
#include "token.hpp"
#include "lend.hpp"
#include "swap.hpp"
#include "registry.hpp"
#include "cellar.hpp"
#include "adaptors/erc20.hpp"
#include "adaptors/lending.hpp"
#include "adaptors/nested_cellar.hpp"
#include "adaptors/swap.hpp"

namespace cellar {

namespace system_addresses {
constexpr Address LENDING_MARKET = addresses::from_id(0x4C454E44);  // "LEND"
constexpr Address SWAP_ROUTER = addresses::from_id(0x53574150);     // "SWAP"
}

// =============================================================================
// System - owns every component and the standard adaptor set
// =============================================================================

class System {
public:
    System();
    ~System();

    // Non-copyable
    System(const System&) = delete;
    System& operator=(const System&) = delete;

    // =========================================================================
    // Component Access
    // =========================================================================

    PriceRouter& prices() { return prices_; }
    const PriceRouter& prices() const { return prices_; }

    TokenLedger& tokens() { return tokens_; }
    const TokenLedger& tokens() const { return tokens_; }

    LendingMarket& lending() { return lending_; }
    const LendingMarket& lending() const { return lending_; }

    SwapRouter& swap_router() { return swap_router_; }
    const SwapRouter& swap_router() const { return swap_router_; }

    Registry& registry() { return registry_; }
    const Registry& registry() const { return registry_; }

    Journal& journal() { return journal_; }

    // =========================================================================
    // Initialization
    // =========================================================================

    // Trusts the standard adaptors; ALREADY_INITIALIZED on repeat
    int32_t initialize();

    // Applies the log level, then creates every configured cellar
    int32_t initialize(const SystemConfig& config);

    bool is_initialized() const { return initialized_; }

    // =========================================================================
    // Cellars
    // =========================================================================

    int32_t create_cellar(const CellarConfig& config, Cellar** out = nullptr);
    Cellar* find_cellar(const Address& address) const;
    std::vector<Address> cellar_addresses() const;

    // =========================================================================
    // Time
    // =========================================================================

    // One clock for prices, swaps and share locks
    void set_time_source(TimeSource source);

private:
    PriceRouter prices_;
    TokenLedger tokens_;
    LendingMarket lending_;
    SwapRouter swap_router_;
    Registry registry_;
    Journal journal_;

    std::shared_ptr<Erc20Adaptor> erc20_adaptor_;
    std::shared_ptr<LendingSupplyAdaptor> lending_supply_adaptor_;
    std::shared_ptr<LendingDebtAdaptor> lending_debt_adaptor_;
    std::shared_ptr<NestedCellarAdaptor> nested_cellar_adaptor_;
    std::shared_ptr<SwapAdaptor> swap_adaptor_;

    std::map<Address, std::unique_ptr<Cellar>> cellars_;
    TimeSource time_source_;
    bool initialized_{false};
};

} // namespace cellar

#endif // CELLAR_SYSTEM_HPP
