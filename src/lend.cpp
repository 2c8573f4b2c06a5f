// =============================================================================
// lend.cpp - LendingMarket Implementation
// =============================================================================

#include "cellar/lend.hpp"
#include <algorithm>

namespace cellar {

namespace {

I128 get_or_zero(const std::map<Asset, I128>& m, const Asset& asset) {
    auto it = m.find(asset);
    return (it != m.end()) ? it->second : 0;
}

void adjust(std::map<Asset, I128>& m, const Asset& asset, I128 delta) {
    I128& value = m[asset];
    value += delta;
    if (value == 0) m.erase(asset);
}

} // namespace

LendingMarket::LendingMarket(TokenLedger& tokens, const PriceRouter& prices, const Address& address)
    : tokens_(tokens)
    , prices_(prices)
    , address_(address) {}

// =============================================================================
// Market Management
// =============================================================================

int32_t LendingMarket::create_market(const LendingMarketConfig& config) {
    if (config.collateral_factor_x18 < 0 || config.collateral_factor_x18 > X18_ONE ||
        config.borrow_factor_x18 <= 0 || config.borrow_factor_x18 > X18_ONE) {
        return errors::INVALID_AMOUNT;
    }
    if (state_.markets.find(config.underlying) != state_.markets.end()) {
        return errors::MARKET_ALREADY_EXISTS;
    }
    if (!prices_.is_supported(config.underlying)) {
        return errors::ASSET_NOT_PRICED;
    }

    state_.markets[config.underlying] = config;
    return errors::OK;
}

int32_t LendingMarket::update_market(const LendingMarketConfig& config) {
    auto it = state_.markets.find(config.underlying);
    if (it == state_.markets.end()) {
        return errors::UNDERLYING_NOT_SUPPORTED;
    }
    it->second = config;
    return errors::OK;
}

std::optional<LendingMarketConfig> LendingMarket::get_market_config(const Asset& underlying) const {
    auto it = state_.markets.find(underlying);
    if (it == state_.markets.end()) return std::nullopt;
    return it->second;
}

bool LendingMarket::market_exists(const Asset& underlying) const {
    return state_.markets.find(underlying) != state_.markets.end();
}

std::optional<SubAccount> LendingMarket::sub_account(const Address& primary, uint32_t sub_account_id) {
    if (sub_account_id > MAX_SUB_ACCOUNT_ID) return std::nullopt;
    return SubAccount{primary, sub_account_id};
}

// =============================================================================
// Account Operations
// =============================================================================

int32_t LendingMarket::deposit(const Address& primary, uint32_t sub_id, const Asset& asset, I128 amount) {
    SubAccount account;
    int32_t rc = resolve(primary, sub_id, asset, account);
    if (rc != errors::OK) return rc;
    if (amount <= 0) return errors::INVALID_AMOUNT;

    rc = tokens_.transfer(asset, primary, address_, amount);
    if (rc != errors::OK) return rc;

    adjust(state_.accounts[account].deposits, asset, amount);
    state_.total_deposits[asset] += amount;
    return errors::OK;
}

int32_t LendingMarket::withdraw(const Address& primary, uint32_t sub_id, const Asset& asset, I128 amount) {
    SubAccount account;
    int32_t rc = resolve(primary, sub_id, asset, account);
    if (rc != errors::OK) return rc;
    if (amount <= 0) return errors::INVALID_AMOUNT;

    SubAccountState next = state_.accounts[account];
    if (get_or_zero(next.deposits, asset) < amount) return errors::INSUFFICIENT_BALANCE;
    if (cash(asset) < amount) return errors::INSUFFICIENT_LIQUIDITY;

    adjust(next.deposits, asset, -amount);
    rc = require_solvent(next);
    if (rc != errors::OK) return rc;

    rc = tokens_.transfer(asset, address_, primary, amount);
    if (rc != errors::OK) return rc;

    state_.accounts[account] = std::move(next);
    state_.total_deposits[asset] -= amount;
    return errors::OK;
}

int32_t LendingMarket::borrow(const Address& primary, uint32_t sub_id, const Asset& asset, I128 amount) {
    SubAccount account;
    int32_t rc = resolve(primary, sub_id, asset, account);
    if (rc != errors::OK) return rc;
    if (amount <= 0) return errors::INVALID_AMOUNT;
    if (!state_.markets[asset].active) return errors::UNDERLYING_NOT_SUPPORTED;
    if (cash(asset) < amount) return errors::INSUFFICIENT_LIQUIDITY;

    SubAccountState next = state_.accounts[account];
    adjust(next.debts, asset, amount);
    rc = require_solvent(next);
    if (rc != errors::OK) return rc;

    rc = tokens_.transfer(asset, address_, primary, amount);
    if (rc != errors::OK) return rc;

    state_.accounts[account] = std::move(next);
    state_.total_borrows[asset] += amount;
    return errors::OK;
}

int32_t LendingMarket::repay(const Address& primary, uint32_t sub_id, const Asset& asset, I128 amount,
                             I128* repaid) {
    SubAccount account;
    int32_t rc = resolve(primary, sub_id, asset, account);
    if (rc != errors::OK) return rc;
    if (amount <= 0) return errors::INVALID_AMOUNT;

    SubAccountState& state = state_.accounts[account];
    I128 to_repay = std::min(amount, get_or_zero(state.debts, asset));
    if (to_repay > 0) {
        rc = tokens_.transfer(asset, primary, address_, to_repay);
        if (rc != errors::OK) return rc;

        adjust(state.debts, asset, -to_repay);
        state_.total_borrows[asset] -= to_repay;
    }

    if (repaid) *repaid = to_repay;
    return errors::OK;
}

int32_t LendingMarket::mint(const Address& primary, uint32_t sub_id, const Asset& asset, I128 amount) {
    SubAccount account;
    int32_t rc = resolve(primary, sub_id, asset, account);
    if (rc != errors::OK) return rc;
    if (amount <= 0) return errors::INVALID_AMOUNT;
    if (!state_.markets[asset].active) return errors::UNDERLYING_NOT_SUPPORTED;

    SubAccountState next = state_.accounts[account];
    adjust(next.deposits, asset, amount);
    adjust(next.debts, asset, amount);
    next.entered.insert(asset);
    rc = require_solvent(next);
    if (rc != errors::OK) return rc;

    state_.accounts[account] = std::move(next);
    state_.total_deposits[asset] += amount;
    state_.total_borrows[asset] += amount;
    return errors::OK;
}

int32_t LendingMarket::burn(const Address& primary, uint32_t sub_id, const Asset& asset, I128 amount) {
    SubAccount account;
    int32_t rc = resolve(primary, sub_id, asset, account);
    if (rc != errors::OK) return rc;
    if (amount <= 0) return errors::INVALID_AMOUNT;

    SubAccountState next = state_.accounts[account];
    I128 to_burn = std::min({amount, get_or_zero(next.deposits, asset), get_or_zero(next.debts, asset)});
    if (to_burn == 0) return errors::OK;

    adjust(next.deposits, asset, -to_burn);
    adjust(next.debts, asset, -to_burn);
    rc = require_solvent(next);
    if (rc != errors::OK) return rc;

    state_.accounts[account] = std::move(next);
    state_.total_deposits[asset] -= to_burn;
    state_.total_borrows[asset] -= to_burn;
    return errors::OK;
}

int32_t LendingMarket::transfer_deposit(const Address& primary, uint32_t from_sub, uint32_t to_sub,
                                        const Asset& asset, I128 amount) {
    SubAccount from;
    SubAccount to;
    int32_t rc = resolve(primary, from_sub, asset, from);
    if (rc != errors::OK) return rc;
    rc = resolve(primary, to_sub, asset, to);
    if (rc != errors::OK) return rc;
    if (amount <= 0) return errors::INVALID_AMOUNT;
    if (from == to) return errors::OK;

    SubAccountState next = state_.accounts[from];
    if (get_or_zero(next.deposits, asset) < amount) return errors::INSUFFICIENT_BALANCE;

    adjust(next.deposits, asset, -amount);
    rc = require_solvent(next);
    if (rc != errors::OK) return rc;

    state_.accounts[from] = std::move(next);
    adjust(state_.accounts[to].deposits, asset, amount);
    return errors::OK;
}

int32_t LendingMarket::enter_market(const Address& primary, uint32_t sub_id, const Asset& asset) {
    SubAccount account;
    int32_t rc = resolve(primary, sub_id, asset, account);
    if (rc != errors::OK) return rc;

    state_.accounts[account].entered.insert(asset);
    return errors::OK;
}

int32_t LendingMarket::exit_market(const Address& primary, uint32_t sub_id, const Asset& asset) {
    SubAccount account;
    int32_t rc = resolve(primary, sub_id, asset, account);
    if (rc != errors::OK) return rc;

    SubAccountState next = state_.accounts[account];
    if (next.entered.erase(asset) == 0) return errors::OK;

    rc = require_solvent(next);
    if (rc != errors::OK) return rc;

    state_.accounts[account] = std::move(next);
    return errors::OK;
}

// =============================================================================
// Queries
// =============================================================================

I128 LendingMarket::balance_of_underlying(const SubAccount& account, const Asset& asset) const {
    const SubAccountState* state = find_account(account);
    return state ? get_or_zero(state->deposits, asset) : 0;
}

I128 LendingMarket::debt_of(const SubAccount& account, const Asset& asset) const {
    const SubAccountState* state = find_account(account);
    return state ? get_or_zero(state->debts, asset) : 0;
}

bool LendingMarket::has_liabilities(const SubAccount& account) const {
    const SubAccountState* state = find_account(account);
    return state && !state->debts.empty();
}

bool LendingMarket::is_entered(const SubAccount& account, const Asset& asset) const {
    const SubAccountState* state = find_account(account);
    return state && state->entered.count(asset) > 0;
}

I128 LendingMarket::cash(const Asset& asset) const {
    return tokens_.balance_of(asset, address_);
}

I128 LendingMarket::total_deposits(const Asset& asset) const {
    return get_or_zero(state_.total_deposits, asset);
}

I128 LendingMarket::total_borrows(const Asset& asset) const {
    return get_or_zero(state_.total_borrows, asset);
}

std::optional<health::Liquidity> LendingMarket::account_liquidity(const SubAccount& account) const {
    const SubAccountState* state = find_account(account);
    if (!state) return health::Liquidity{0, 0};
    return liquidity_of(*state);
}

std::optional<I128> LendingMarket::health_factor(const SubAccount& account) const {
    auto liquidity = account_liquidity(account);
    if (!liquidity) return std::nullopt;
    return health::health_factor(*liquidity);
}

// =============================================================================
// Internal Helpers
// =============================================================================

const SubAccountState* LendingMarket::find_account(const SubAccount& account) const {
    auto it = state_.accounts.find(account);
    return (it != state_.accounts.end()) ? &it->second : nullptr;
}

std::optional<health::Liquidity> LendingMarket::liquidity_of(const SubAccountState& account) const {
    std::vector<health::RiskWeightedBalance> collateral;
    std::vector<health::RiskWeightedBalance> debt;

    std::set<Asset> assets;
    for (const auto& [asset, amount] : account.deposits) assets.insert(asset);
    for (const auto& [asset, amount] : account.debts) assets.insert(asset);

    for (const auto& asset : assets) {
        auto market_it = state_.markets.find(asset);
        if (market_it == state_.markets.end()) continue;
        const LendingMarketConfig& market = market_it->second;

        auto price = prices_.get_price(asset);
        if (!price) return std::nullopt;

        I128 deposited = get_or_zero(account.deposits, asset);
        I128 owed = get_or_zero(account.debts, asset);
        bool entered = account.entered.count(asset) > 0;

        // Same-asset overlap is self-collateralised
        I128 self_amount = entered ? std::min(deposited, owed) : 0;
        if (self_amount > 0) {
            I128 self_value = x18::mul(self_amount, *price);
            collateral.push_back({self_value, health::SELF_COLLATERAL_FACTOR_X18});
            debt.push_back({self_value, X18_ONE});
        }

        if (entered && deposited > self_amount) {
            collateral.push_back({x18::mul(deposited - self_amount, *price),
                                  market.collateral_factor_x18});
        }
        if (owed > self_amount) {
            debt.push_back({x18::mul(owed - self_amount, *price, Rounding::UP),
                            market.borrow_factor_x18});
        }
    }

    return health::aggregate(collateral, debt);
}

int32_t LendingMarket::require_solvent(const SubAccountState& account) const {
    auto liquidity = liquidity_of(account);
    if (!liquidity) return errors::PRICE_STALE;
    if (!health::meets_minimum(health::health_factor(*liquidity), X18_ONE)) {
        return errors::INSUFFICIENT_COLLATERAL;
    }
    return errors::OK;
}

int32_t LendingMarket::resolve(const Address& primary, uint32_t sub_id, const Asset& asset,
                               SubAccount& account) const {
    auto resolved = sub_account(primary, sub_id);
    if (!resolved) return errors::INVALID_SUB_ACCOUNT_ID;
    if (!market_exists(asset)) return errors::UNDERLYING_NOT_SUPPORTED;
    account = *resolved;
    return errors::OK;
}

} // namespace cellar
