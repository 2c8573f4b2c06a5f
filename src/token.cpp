// =============================================================================
// token.cpp - TokenLedger Implementation
// =============================================================================

#include "cellar/token.hpp"

namespace cellar {

int32_t TokenLedger::mint(const Asset& asset, const Address& to, I128 amount) {
    if (amount <= 0) return errors::INVALID_AMOUNT;
    if (addresses::is_zero(to)) return errors::INVALID_RECEIVER;

    state_.balances[asset][to] += amount;
    state_.total_supply[asset] += amount;
    return errors::OK;
}

int32_t TokenLedger::burn(const Asset& asset, const Address& from, I128 amount) {
    if (amount <= 0) return errors::INVALID_AMOUNT;

    auto asset_it = state_.balances.find(asset);
    if (asset_it == state_.balances.end()) return errors::INSUFFICIENT_BALANCE;
    auto it = asset_it->second.find(from);
    if (it == asset_it->second.end() || it->second < amount) {
        return errors::INSUFFICIENT_BALANCE;
    }

    it->second -= amount;
    state_.total_supply[asset] -= amount;
    return errors::OK;
}

int32_t TokenLedger::transfer(const Asset& asset, const Address& from,
                              const Address& to, I128 amount) {
    if (amount < 0) return errors::INVALID_AMOUNT;
    if (addresses::is_zero(to)) return errors::INVALID_RECEIVER;
    if (amount == 0) return errors::OK;

    auto& holders = state_.balances[asset];
    auto it = holders.find(from);
    if (it == holders.end() || it->second < amount) {
        return errors::INSUFFICIENT_BALANCE;
    }

    it->second -= amount;
    holders[to] += amount;
    return errors::OK;
}

I128 TokenLedger::balance_of(const Asset& asset, const Address& holder) const {
    auto asset_it = state_.balances.find(asset);
    if (asset_it == state_.balances.end()) return 0;
    auto it = asset_it->second.find(holder);
    return (it != asset_it->second.end()) ? it->second : 0;
}

I128 TokenLedger::total_supply(const Asset& asset) const {
    auto it = state_.total_supply.find(asset);
    return (it != state_.total_supply.end()) ? it->second : 0;
}

} // namespace cellar
