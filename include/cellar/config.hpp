#ifndef CELLAR_CONFIG_HPP
#define CELLAR_CONFIG_HPP

#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace cellar {

// =============================================================================
// Cellar Parameters
// =============================================================================

constexpr uint64_t MINIMUM_SHARE_LOCK_PERIOD = 5 * 60;              // 5 minutes
constexpr uint64_t MAXIMUM_SHARE_LOCK_PERIOD = 2 * 24 * 60 * 60;    // 2 days
constexpr I128 DEFAULT_REBALANCE_DEVIATION_X18 = 3000000000000000LL;  // 0.3%
constexpr I128 MAX_REBALANCE_DEVIATION_X18 = 50000000000000000LL;     // 5%

struct CellarConfig {
    std::string name;
    Address address{};
    Asset asset;                                   // reserve asset shares are priced in
    uint64_t share_lock_period = MAXIMUM_SHARE_LOCK_PERIOD;
    I128 allowed_rebalance_deviation_x18 = DEFAULT_REBALANCE_DEVIATION_X18;
    bool check_total_assets = true;

    // Parses a single cellar object; throws std::runtime_error on bad input
    static CellarConfig from_json(std::string_view content);

    std::string to_json() const;
};

// =============================================================================
// System Configuration
// =============================================================================

struct SystemConfig {
    std::string log_level = "info";
    std::vector<CellarConfig> cellars;

    static SystemConfig from_json(std::string_view content);
    static SystemConfig from_file(std::string_view path);
};

} // namespace cellar

#endif // CELLAR_CONFIG_HPP
