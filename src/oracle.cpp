// =============================================================================
// oracle.cpp - PriceRouter Implementation
// =============================================================================

#include "cellar/oracle.hpp"
#include <mutex>

namespace cellar {

PriceRouter::PriceRouter() : time_source_(system_time) {}

// =============================================================================
// Configuration
// =============================================================================

int32_t PriceRouter::add_asset(const Asset& asset, I128 price_x18, uint64_t max_staleness) {
    if (price_x18 <= 0) {
        return errors::INVALID_PRICE;
    }

    std::unique_lock lock(prices_mutex_);

    if (prices_.find(asset) != prices_.end()) {
        return errors::MARKET_ALREADY_EXISTS;
    }

    AssetPriceData data;
    data.asset = asset;
    data.price_x18 = price_x18;
    data.timestamp = current_timestamp();
    data.max_staleness = max_staleness;
    prices_[asset] = data;

    total_updates_.fetch_add(1, std::memory_order_relaxed);
    return errors::OK;
}

int32_t PriceRouter::update_price(const Asset& asset, I128 price_x18, uint64_t timestamp) {
    if (price_x18 <= 0) {
        return errors::INVALID_PRICE;
    }

    if (timestamp == 0) {
        timestamp = current_timestamp();
    }

    std::unique_lock lock(prices_mutex_);

    auto it = prices_.find(asset);
    if (it == prices_.end()) {
        return errors::ASSET_NOT_PRICED;
    }

    it->second.price_x18 = price_x18;
    it->second.timestamp = timestamp;

    total_updates_.fetch_add(1, std::memory_order_relaxed);
    return errors::OK;
}

int32_t PriceRouter::remove_asset(const Asset& asset) {
    std::unique_lock lock(prices_mutex_);
    if (prices_.erase(asset) == 0) {
        return errors::ASSET_NOT_PRICED;
    }
    return errors::OK;
}

void PriceRouter::set_time_source(TimeSource source) {
    std::unique_lock lock(prices_mutex_);
    time_source_ = std::move(source);
}

// =============================================================================
// Queries
// =============================================================================

bool PriceRouter::is_supported(const Asset& asset) const {
    std::shared_lock lock(prices_mutex_);
    return prices_.find(asset) != prices_.end();
}

std::optional<I128> PriceRouter::get_price(const Asset& asset) const {
    std::shared_lock lock(prices_mutex_);
    return usable_price(asset, current_timestamp());
}

std::optional<AssetPriceData> PriceRouter::get_price_data(const Asset& asset) const {
    std::shared_lock lock(prices_mutex_);
    auto it = prices_.find(asset);
    if (it == prices_.end()) return std::nullopt;
    return it->second;
}

bool PriceRouter::is_price_fresh(const Asset& asset) const {
    return get_price(asset).has_value();
}

std::optional<I128> PriceRouter::get_value(const Asset& asset_in, I128 amount,
                                           const Asset& asset_out) const {
    std::shared_lock lock(prices_mutex_);
    uint64_t now = current_timestamp();

    auto price_in = usable_price(asset_in, now);
    auto price_out = usable_price(asset_out, now);
    if (!price_in || !price_out) return std::nullopt;

    if (asset_in == asset_out) return amount;
    return x18::mul_div(amount, *price_in, *price_out, Rounding::DOWN);
}

std::optional<I128> PriceRouter::get_values(const std::vector<Asset>& assets,
                                            const std::vector<I128>& amounts,
                                            const Asset& asset_out) const {
    if (assets.size() != amounts.size()) return std::nullopt;

    std::shared_lock lock(prices_mutex_);
    uint64_t now = current_timestamp();

    auto price_out = usable_price(asset_out, now);
    if (!price_out) return std::nullopt;

    // Accumulate in USD first so per-asset rounding happens once. Credits
    // round down and debts (negative amounts) round up in magnitude.
    I128 total_usd = 0;
    for (size_t i = 0; i < assets.size(); ++i) {
        if (amounts[i] == 0) continue;
        Rounding rounding = amounts[i] < 0 ? Rounding::UP : Rounding::DOWN;
        if (assets[i] == asset_out) {
            total_usd = x18::add_sat(total_usd, x18::mul(amounts[i], *price_out, rounding));
            continue;
        }
        auto price = usable_price(assets[i], now);
        if (!price) return std::nullopt;
        total_usd = x18::add_sat(total_usd, x18::mul(amounts[i], *price, rounding));
    }

    return x18::div(total_usd, *price_out, total_usd < 0 ? Rounding::UP : Rounding::DOWN);
}

PriceRouter::Stats PriceRouter::get_stats() const {
    std::shared_lock lock(prices_mutex_);
    uint64_t now = current_timestamp();

    uint64_t stale = 0;
    for (const auto& [asset, data] : prices_) {
        if (!usable_price(asset, now)) ++stale;
    }

    return Stats{
        prices_.size(),
        total_updates_.load(std::memory_order_relaxed),
        stale
    };
}

// =============================================================================
// Helpers
// =============================================================================

std::optional<I128> PriceRouter::usable_price(const Asset& asset, uint64_t now) const {
    auto it = prices_.find(asset);
    if (it == prices_.end()) return std::nullopt;

    const AssetPriceData& data = it->second;
    if (data.max_staleness != 0 && now > data.timestamp + data.max_staleness) {
        return std::nullopt;
    }
    return data.price_x18;
}

uint64_t PriceRouter::current_timestamp() const {
    return time_source_ ? time_source_() : system_time();
}

} // namespace cellar
