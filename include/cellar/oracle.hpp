#ifndef CELLAR_ORACLE_HPP
#define CELLAR_ORACLE_HPP

#include <map>
#include <shared_mutex>
#include <optional>
#include <vector>
#include <atomic>

#include "types.hpp"

namespace cellar {

// =============================================================================
// Price Data
// =============================================================================

struct AssetPriceData {
    Asset asset;
    I128 price_x18;          // USD per unit
    uint64_t timestamp;
    uint64_t max_staleness;  // seconds, 0 = never stale
};

// =============================================================================
// PriceRouter - converts amounts between supported assets
//
// Every valuation pass reads all prices under one shared lock, so a pass
// never observes a price update halfway through.
// =============================================================================

class PriceRouter {
public:
    PriceRouter();
    ~PriceRouter() = default;

    // Non-copyable
    PriceRouter(const PriceRouter&) = delete;
    PriceRouter& operator=(const PriceRouter&) = delete;

    // =========================================================================
    // Configuration
    // =========================================================================

    int32_t add_asset(const Asset& asset, I128 price_x18, uint64_t max_staleness = 0);
    int32_t update_price(const Asset& asset, I128 price_x18, uint64_t timestamp = 0);
    int32_t remove_asset(const Asset& asset);

    void set_time_source(TimeSource source);

    // =========================================================================
    // Queries
    // =========================================================================

    bool is_supported(const Asset& asset) const;
    std::optional<I128> get_price(const Asset& asset) const;
    std::optional<AssetPriceData> get_price_data(const Asset& asset) const;
    bool is_price_fresh(const Asset& asset) const;

    // amount of asset_in expressed in asset_out, rounded down
    std::optional<I128> get_value(const Asset& asset_in, I128 amount, const Asset& asset_out) const;

    // sum of every (asset, amount) pair expressed in asset_out; negative
    // amounts are debts and round away from zero
    std::optional<I128> get_values(const std::vector<Asset>& assets,
                                   const std::vector<I128>& amounts,
                                   const Asset& asset_out) const;

    struct Stats {
        uint64_t total_assets;
        uint64_t total_updates;
        uint64_t stale_prices;
    };
    Stats get_stats() const;

private:
    std::map<Asset, AssetPriceData> prices_;
    mutable std::shared_mutex prices_mutex_;

    TimeSource time_source_;
    std::atomic<uint64_t> total_updates_{0};

    // Caller holds prices_mutex_
    std::optional<I128> usable_price(const Asset& asset, uint64_t now) const;
    uint64_t current_timestamp() const;
};

} // namespace cellar

#endif // CELLAR_ORACLE_HPP
