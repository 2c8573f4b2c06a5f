#ifndef CELLAR_LEND_HPP
#define CELLAR_LEND_HPP

#include <map>
#include <set>
#include <optional>

#include "types.hpp"
#include "journal.hpp"
#include "token.hpp"
#include "oracle.hpp"
#include "health.hpp"

namespace cellar {

// =============================================================================
// Market Configuration
// =============================================================================

struct LendingMarketConfig {
    Asset underlying;
    I128 collateral_factor_x18;  // e.g., 0.8 = 80% of deposit value counts
    I128 borrow_factor_x18;      // e.g., 1.0 = debt counts at face value
    bool active;
};

// =============================================================================
// Sub-Account State
// =============================================================================

struct SubAccount {
    Address main;             // primary owner, funds move to and from it
    uint32_t sub_account_id;  // 0 = default

    bool operator==(const SubAccount& other) const {
        return main == other.main && sub_account_id == other.sub_account_id;
    }
    bool operator<(const SubAccount& other) const {
        if (main != other.main) return main < other.main;
        return sub_account_id < other.sub_account_id;
    }
};

struct SubAccountState {
    std::map<Asset, I128> deposits;
    std::map<Asset, I128> debts;
    std::set<Asset> entered;     // markets whose deposits count as collateral
};

struct LendingState {
    std::map<Asset, LendingMarketConfig> markets;
    std::map<SubAccount, SubAccountState> accounts;
    std::map<Asset, I128> total_deposits;
    std::map<Asset, I128> total_borrows;
};

constexpr uint32_t MAX_SUB_ACCOUNT_ID = 255;

// =============================================================================
// LendingMarket - pooled lending with isolated sub-accounts
//
// A primary address owns 256 sub-accounts keyed by (primary, id); no two
// primaries share one. Funds always move to and from the primary.
// Every operation refuses to leave the sub-account below health factor 1.
// =============================================================================

class LendingMarket : public JournaledState<LendingState> {
public:
    LendingMarket(TokenLedger& tokens, const PriceRouter& prices, const Address& address);

    // Non-copyable
    LendingMarket(const LendingMarket&) = delete;
    LendingMarket& operator=(const LendingMarket&) = delete;

    const Address& address() const { return address_; }

    // =========================================================================
    // Market Management
    // =========================================================================

    int32_t create_market(const LendingMarketConfig& config);
    int32_t update_market(const LendingMarketConfig& config);
    std::optional<LendingMarketConfig> get_market_config(const Asset& underlying) const;
    bool market_exists(const Asset& underlying) const;

    // nullopt when id > MAX_SUB_ACCOUNT_ID
    static std::optional<SubAccount> sub_account(const Address& primary, uint32_t sub_account_id);

    // =========================================================================
    // Account Operations
    // =========================================================================

    int32_t deposit(const Address& primary, uint32_t sub_id, const Asset& asset, I128 amount);
    int32_t withdraw(const Address& primary, uint32_t sub_id, const Asset& asset, I128 amount);
    int32_t borrow(const Address& primary, uint32_t sub_id, const Asset& asset, I128 amount);

    // Repays min(amount, debt); repaid receives the amount actually repaid
    int32_t repay(const Address& primary, uint32_t sub_id, const Asset& asset, I128 amount,
                  I128* repaid = nullptr);

    // Self-borrow: equal deposit and debt of one asset, no funds move
    int32_t mint(const Address& primary, uint32_t sub_id, const Asset& asset, I128 amount);

    // Unwinds min(amount, deposit, debt) of a self-borrow
    int32_t burn(const Address& primary, uint32_t sub_id, const Asset& asset, I128 amount);

    int32_t transfer_deposit(const Address& primary, uint32_t from_sub, uint32_t to_sub,
                             const Asset& asset, I128 amount);

    int32_t enter_market(const Address& primary, uint32_t sub_id, const Asset& asset);
    int32_t exit_market(const Address& primary, uint32_t sub_id, const Asset& asset);

    // =========================================================================
    // Queries
    // =========================================================================

    I128 balance_of_underlying(const SubAccount& account, const Asset& asset) const;
    I128 debt_of(const SubAccount& account, const Asset& asset) const;
    bool has_liabilities(const SubAccount& account) const;
    bool is_entered(const SubAccount& account, const Asset& asset) const;
    I128 cash(const Asset& asset) const;
    I128 total_deposits(const Asset& asset) const;
    I128 total_borrows(const Asset& asset) const;

    std::optional<health::Liquidity> account_liquidity(const SubAccount& account) const;
    std::optional<I128> health_factor(const SubAccount& account) const;

private:
    TokenLedger& tokens_;
    const PriceRouter& prices_;
    Address address_;

    const SubAccountState* find_account(const SubAccount& account) const;

    std::optional<health::Liquidity> liquidity_of(const SubAccountState& account) const;
    int32_t require_solvent(const SubAccountState& account) const;
    int32_t resolve(const Address& primary, uint32_t sub_id, const Asset& asset,
                    SubAccount& account) const;
};

} // namespace cellar

#endif // CELLAR_LEND_HPP
