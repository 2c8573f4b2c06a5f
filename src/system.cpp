// =============================================================================
// system.cpp - System Wiring
// =============================================================================

#include "cellar/system.hpp"
#include "cellar/log.hpp"
#include <spdlog/spdlog.h>
#include <iterator>

namespace cellar {

System::System()
    : lending_(tokens_, prices_, system_addresses::LENDING_MARKET)
    , swap_router_(tokens_, prices_, system_addresses::SWAP_ROUTER)
    , registry_(prices_) {
    erc20_adaptor_ = std::make_shared<Erc20Adaptor>(tokens_);
    lending_supply_adaptor_ = std::make_shared<LendingSupplyAdaptor>(lending_, tokens_);
    lending_debt_adaptor_ = std::make_shared<LendingDebtAdaptor>(lending_, tokens_);
    nested_cellar_adaptor_ = std::make_shared<NestedCellarAdaptor>(
        [this](const Address& address) { return find_cellar(address); }, tokens_);
    swap_adaptor_ = std::make_shared<SwapAdaptor>(swap_router_);
}

System::~System() {
    for (auto& [address, cellar] : cellars_) {
        journal_.detach(cellar.get());
    }
}

// =============================================================================
// Initialization
// =============================================================================

int32_t System::initialize() {
    if (initialized_) {
        return errors::ALREADY_INITIALIZED;
    }
    if (!journal_.attach(&tokens_) || !journal_.attach(&lending_)) {
        return errors::REENTRANCY;
    }

    const std::shared_ptr<Adaptor> standard[] = {
        erc20_adaptor_, lending_supply_adaptor_, lending_debt_adaptor_,
        nested_cellar_adaptor_, swap_adaptor_
    };
    for (const auto& adaptor : standard) {
        int32_t rc = registry_.trust_adaptor(adaptor);
        if (rc != errors::OK) return rc;
    }

    initialized_ = true;
    log::logger()->info("system: initialized with {} adaptors", std::size(standard));
    return errors::OK;
}

int32_t System::initialize(const SystemConfig& config) {
    if (!log::set_level(config.log_level)) {
        log::logger()->warn("system: unknown log level '{}', keeping current", config.log_level);
    }

    int32_t rc = initialize();
    if (rc != errors::OK) return rc;

    for (const auto& cellar_config : config.cellars) {
        rc = create_cellar(cellar_config);
        if (rc != errors::OK) {
            log::logger()->error("system: cellar {} not created ({})",
                                 cellar_config.name, errors::name(rc));
            return rc;
        }
    }
    return errors::OK;
}

// =============================================================================
// Cellars
// =============================================================================

int32_t System::create_cellar(const CellarConfig& config, Cellar** out) {
    if (!initialized_) {
        return errors::NOT_INITIALIZED;
    }
    if (addresses::is_zero(config.address) || config.asset.is_null()) {
        return errors::INVALID_RECEIVER;
    }
    if (cellars_.find(config.address) != cellars_.end()) {
        return errors::ALREADY_INITIALIZED;
    }
    if (!prices_.is_supported(config.asset)) {
        return errors::ASSET_NOT_PRICED;
    }
    if (config.share_lock_period < MINIMUM_SHARE_LOCK_PERIOD ||
        config.share_lock_period > MAXIMUM_SHARE_LOCK_PERIOD) {
        return errors::INVALID_SHARE_LOCK_PERIOD;
    }
    if (config.allowed_rebalance_deviation_x18 < 0 ||
        config.allowed_rebalance_deviation_x18 > MAX_REBALANCE_DEVIATION_X18) {
        return errors::INVALID_REBALANCE_DEVIATION;
    }

    auto cellar = std::make_unique<Cellar>(config, registry_, prices_, tokens_, journal_);
    if (!journal_.attach(cellar.get())) {
        // Cellars cannot join while a transaction is open
        return errors::REENTRANCY;
    }
    if (time_source_) {
        cellar->set_time_source(time_source_);
    }

    Cellar* created = cellar.get();
    cellars_[config.address] = std::move(cellar);
    if (out) *out = created;

    log::logger()->info("system: created cellar {} at {}", config.name, addresses::to_hex(config.address));
    return errors::OK;
}

Cellar* System::find_cellar(const Address& address) const {
    auto it = cellars_.find(address);
    return (it != cellars_.end()) ? it->second.get() : nullptr;
}

std::vector<Address> System::cellar_addresses() const {
    std::vector<Address> out;
    out.reserve(cellars_.size());
    for (const auto& [address, cellar] : cellars_) out.push_back(address);
    return out;
}

// =============================================================================
// Time
// =============================================================================

void System::set_time_source(TimeSource source) {
    time_source_ = std::move(source);
    prices_.set_time_source(time_source_);
    swap_router_.set_time_source(time_source_);
    for (auto& [address, cellar] : cellars_) {
        cellar->set_time_source(time_source_);
    }
}

} // namespace cellar
