#ifndef CELLAR_HEALTH_HPP
#define CELLAR_HEALTH_HPP

#include <vector>

#include "types.hpp"

namespace cellar {
namespace health {

// =============================================================================
// Health Factor Evaluation
//
//   hf = sum(collateral_value * collateral_factor)
//        / sum(debt_value / borrow_factor)
//
// Zero liability yields HEALTH_FACTOR_MAX, zero collateral yields 0; neither
// is an arithmetic failure.
// =============================================================================

constexpr I128 HEALTH_FACTOR_MAX = I128_MAX;

// Same-asset deposit/debt overlap (self-borrow) counts at this factor
constexpr I128 SELF_COLLATERAL_FACTOR_X18 = 950000000000000000LL;  // 0.95

struct RiskWeightedBalance {
    I128 value_x18;   // common price unit
    I128 factor_x18;  // collateral factor or borrow factor
};

struct Liquidity {
    I128 collateral_x18;  // risk-adjusted
    I128 liability_x18;   // risk-adjusted
};

// Collateral rounds down and liability rounds up, both saturating
Liquidity aggregate(const std::vector<RiskWeightedBalance>& collateral,
                    const std::vector<RiskWeightedBalance>& debt);

I128 health_factor(const Liquidity& liquidity);

inline I128 health_factor(const std::vector<RiskWeightedBalance>& collateral,
                          const std::vector<RiskWeightedBalance>& debt) {
    return health_factor(aggregate(collateral, debt));
}

inline bool meets_minimum(I128 health_factor_x18, I128 minimum_x18) {
    return health_factor_x18 >= minimum_x18;
}

// Largest extra liability value (before the borrow factor) that keeps
// hf >= minimum; 0 when already below
I128 max_additional_liability(const Liquidity& liquidity, I128 minimum_x18, I128 borrow_factor_x18);

} // namespace health
} // namespace cellar

#endif // CELLAR_HEALTH_HPP
