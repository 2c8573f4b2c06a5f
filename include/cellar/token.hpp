#ifndef CELLAR_TOKEN_HPP
#define CELLAR_TOKEN_HPP

#include <map>
#include <unordered_map>

#include "types.hpp"
#include "journal.hpp"

namespace cellar {

// =============================================================================
// Token Ledger State
// =============================================================================

struct TokenLedgerState {
    std::map<Asset, std::unordered_map<Address, I128, AddressHash>> balances;
    std::map<Asset, I128> total_supply;
};

// =============================================================================
// TokenLedger - fungible token balances for every holder
//
// Stands in for the token contracts the vault and the external protocols
// move funds through. Single writer; mutated only inside transactions.
// =============================================================================

class TokenLedger : public JournaledState<TokenLedgerState> {
public:
    TokenLedger() = default;

    // Non-copyable
    TokenLedger(const TokenLedger&) = delete;
    TokenLedger& operator=(const TokenLedger&) = delete;

    int32_t mint(const Asset& asset, const Address& to, I128 amount);
    int32_t burn(const Asset& asset, const Address& from, I128 amount);
    int32_t transfer(const Asset& asset, const Address& from, const Address& to, I128 amount);

    I128 balance_of(const Asset& asset, const Address& holder) const;
    I128 total_supply(const Asset& asset) const;
};

} // namespace cellar

#endif // CELLAR_TOKEN_HPP
