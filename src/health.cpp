// =============================================================================
// health.cpp - Health factor evaluation
// =============================================================================

#include "cellar/health.hpp"

namespace cellar {
namespace health {

Liquidity aggregate(const std::vector<RiskWeightedBalance>& collateral,
                    const std::vector<RiskWeightedBalance>& debt) {
    Liquidity liquidity{0, 0};

    for (const auto& entry : collateral) {
        if (entry.value_x18 <= 0 || entry.factor_x18 <= 0) continue;
        I128 adjusted = x18::mul(entry.value_x18, entry.factor_x18, Rounding::DOWN);
        liquidity.collateral_x18 = x18::add_sat(liquidity.collateral_x18, adjusted);
    }

    for (const auto& entry : debt) {
        if (entry.value_x18 <= 0) continue;
        // A zero borrow factor makes the debt unbounded
        I128 adjusted = entry.factor_x18 > 0
            ? x18::div(entry.value_x18, entry.factor_x18, Rounding::UP)
            : I128_MAX;
        liquidity.liability_x18 = x18::add_sat(liquidity.liability_x18, adjusted);
    }

    return liquidity;
}

I128 health_factor(const Liquidity& liquidity) {
    if (liquidity.liability_x18 <= 0) return HEALTH_FACTOR_MAX;
    if (liquidity.collateral_x18 <= 0) return 0;
    return x18::div(liquidity.collateral_x18, liquidity.liability_x18, Rounding::DOWN);
}

I128 max_additional_liability(const Liquidity& liquidity, I128 minimum_x18, I128 borrow_factor_x18) {
    if (minimum_x18 <= 0 || borrow_factor_x18 <= 0) return 0;

    // collateral / (liability + extra / bf) >= minimum
    I128 allowed_liability = x18::div(liquidity.collateral_x18, minimum_x18, Rounding::DOWN);
    I128 headroom = allowed_liability - liquidity.liability_x18;
    if (headroom <= 0) return 0;
    return x18::mul(headroom, borrow_factor_x18, Rounding::DOWN);
}

} // namespace health
} // namespace cellar
