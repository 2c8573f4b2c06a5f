// =============================================================================
// cellar.cpp - Cellar Vault Ledger Implementation
// =============================================================================

#include "cellar/cellar.hpp"
#include "cellar/log.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>

namespace cellar {

namespace {

// Scoped flag; a second acquisition while held fails
class ScopedFlag {
public:
    explicit ScopedFlag(bool& flag) : flag_(flag), acquired_(!flag) {
        if (acquired_) flag_ = true;
    }
    ~ScopedFlag() {
        if (acquired_) flag_ = false;
    }

    ScopedFlag(const ScopedFlag&) = delete;
    ScopedFlag& operator=(const ScopedFlag&) = delete;

    bool acquired() const { return acquired_; }

private:
    bool& flag_;
    bool acquired_;
};

I128 get_or_zero(const std::unordered_map<Address, I128, AddressHash>& balances, const Address& owner) {
    auto it = balances.find(owner);
    return (it != balances.end()) ? it->second : 0;
}

} // namespace

// =============================================================================
// Constructor
// =============================================================================

Cellar::Cellar(const CellarConfig& config, const Registry& registry, const PriceRouter& prices,
               TokenLedger& tokens, Journal& journal)
    : config_(config)
    , registry_(registry)
    , prices_(prices)
    , tokens_(tokens)
    , journal_(journal) {
    state_.share_lock_period = config.share_lock_period;
    state_.allowed_rebalance_deviation_x18 = config.allowed_rebalance_deviation_x18;
    state_.check_total_assets = config.check_total_assets;
}

bool Cellar::is_position_used(PositionId id) const {
    return state_.positions.find(id) != state_.positions.end();
}

void Cellar::set_time_source(TimeSource source) {
    time_source_ = std::move(source);
}

uint64_t Cellar::now() const {
    return time_source_ ? time_source_() : system_time();
}

int32_t Cellar::require_active() const {
    switch (state_.status) {
        case CellarStatus::UNINITIALIZED: return errors::NOT_INITIALIZED;
        case CellarStatus::SHUTDOWN:      return errors::SHUTDOWN;
        case CellarStatus::ACTIVE:        return errors::OK;
    }
    return errors::NOT_INITIALIZED;
}

// =============================================================================
// Lifecycle
// =============================================================================

int32_t Cellar::initialize(PositionId holding_position, const Bytes& config_data) {
    ScopedFlag guard(entered_);
    if (!guard.acquired()) return errors::REENTRANCY;

    if (state_.status != CellarStatus::UNINITIALIZED) {
        return errors::ALREADY_INITIALIZED;
    }
    if (state_.share_lock_period < MINIMUM_SHARE_LOCK_PERIOD ||
        state_.share_lock_period > MAXIMUM_SHARE_LOCK_PERIOD) {
        return errors::INVALID_SHARE_LOCK_PERIOD;
    }
    if (state_.allowed_rebalance_deviation_x18 < 0 ||
        state_.allowed_rebalance_deviation_x18 > MAX_REBALANCE_DEVIATION_X18) {
        return errors::INVALID_REBALANCE_DEVIATION;
    }
    if (addresses::is_zero(config_.address) || config_.asset.is_null()) {
        return errors::INVALID_RECEIVER;
    }

    if (!registry_.is_position_trusted(holding_position)) {
        return errors::POSITION_NOT_TRUSTED;
    }
    auto data = registry_.get_position_data(holding_position);
    if (!data) return errors::POSITION_NOT_FOUND;
    if (!registry_.is_adaptor_trusted(data->adaptor)) {
        return errors::ADAPTOR_NOT_TRUSTED;
    }
    if (data->is_debt) {
        return errors::DEBT_MISMATCH;
    }

    const Adaptor* adaptor = registry_.get_adaptor(data->adaptor);
    if (!adaptor) return errors::INVALID_ADAPTOR;
    auto holding_asset = adaptor->asset_of(data->config_data);
    if (!holding_asset || *holding_asset != config_.asset) {
        return errors::ASSET_MISMATCH;
    }

    state_.adaptor_catalogue.insert(data->adaptor);
    state_.position_catalogue.insert(holding_position);
    state_.credit_positions.push_back(holding_position);
    state_.positions[holding_position] =
        ActivePosition{holding_position, data->adaptor, false, data->config_data, config_data};
    state_.holding_position = holding_position;
    state_.status = CellarStatus::ACTIVE;

    log::logger()->info("cellar {}: initialized at {} with holding position {}",
                        config_.name, addresses::to_hex(config_.address), holding_position);
    return errors::OK;
}

int32_t Cellar::initiate_shutdown() {
    ScopedFlag guard(entered_);
    if (!guard.acquired()) return errors::REENTRANCY;

    int32_t rc = require_active();
    if (rc != errors::OK) return rc;

    state_.status = CellarStatus::SHUTDOWN;
    log::logger()->warn("cellar {}: shutdown initiated", config_.name);
    return errors::OK;
}

int32_t Cellar::lift_shutdown() {
    ScopedFlag guard(entered_);
    if (!guard.acquired()) return errors::REENTRANCY;

    if (state_.status != CellarStatus::SHUTDOWN) {
        return errors::NOT_SHUTDOWN;
    }

    state_.status = CellarStatus::ACTIVE;
    log::logger()->info("cellar {}: shutdown lifted", config_.name);
    return errors::OK;
}

// =============================================================================
// Catalogue
// =============================================================================

int32_t Cellar::add_adaptor_to_catalogue(AdaptorId adaptor) {
    ScopedFlag guard(entered_);
    if (!guard.acquired()) return errors::REENTRANCY;

    if (!registry_.is_adaptor_trusted(adaptor)) {
        return errors::ADAPTOR_NOT_TRUSTED;
    }
    if (state_.adaptor_catalogue.insert(adaptor).second) {
        log::logger()->info("cellar {}: catalogued adaptor {:#018x}", config_.name, adaptor);
    }
    return errors::OK;
}

int32_t Cellar::remove_adaptor_from_catalogue(AdaptorId adaptor) {
    ScopedFlag guard(entered_);
    if (!guard.acquired()) return errors::REENTRANCY;

    if (state_.adaptor_catalogue.erase(adaptor) == 0) {
        return errors::ADAPTOR_NOT_IN_CATALOGUE;
    }
    log::logger()->info("cellar {}: removed adaptor {:#018x} from catalogue", config_.name, adaptor);
    return errors::OK;
}

int32_t Cellar::add_position_to_catalogue(PositionId id) {
    ScopedFlag guard(entered_);
    if (!guard.acquired()) return errors::REENTRANCY;

    if (!registry_.is_position_trusted(id)) {
        return errors::POSITION_NOT_TRUSTED;
    }
    if (state_.position_catalogue.insert(id).second) {
        log::logger()->info("cellar {}: catalogued position {}", config_.name, id);
    }
    return errors::OK;
}

int32_t Cellar::remove_position_from_catalogue(PositionId id) {
    ScopedFlag guard(entered_);
    if (!guard.acquired()) return errors::REENTRANCY;

    if (is_position_used(id)) {
        return errors::POSITION_IN_USE;
    }
    if (state_.position_catalogue.erase(id) == 0) {
        return errors::POSITION_NOT_IN_CATALOGUE;
    }
    log::logger()->info("cellar {}: removed position {} from catalogue", config_.name, id);
    return errors::OK;
}

bool Cellar::is_adaptor_in_catalogue(AdaptorId adaptor) const {
    return state_.adaptor_catalogue.count(adaptor) > 0;
}

bool Cellar::is_position_in_catalogue(PositionId id) const {
    return state_.position_catalogue.count(id) > 0;
}

// =============================================================================
// Active Positions
// =============================================================================

std::vector<PositionId>& Cellar::position_array(bool in_debt_array) {
    return in_debt_array ? state_.debt_positions : state_.credit_positions;
}

int32_t Cellar::remove_at(uint32_t index, bool in_debt_array) {
    auto& positions = position_array(in_debt_array);
    PositionId id = positions[index];
    positions.erase(positions.begin() + index);
    state_.positions.erase(id);
    return errors::OK;
}

int32_t Cellar::add_position(uint32_t index, PositionId id, const Bytes& config_data, bool in_debt_array) {
    ScopedFlag guard(entered_);
    if (!guard.acquired()) return errors::REENTRANCY;

    int32_t rc = require_active();
    if (rc != errors::OK) return rc;

    if (!is_position_in_catalogue(id)) {
        return errors::POSITION_NOT_IN_CATALOGUE;
    }
    if (!registry_.is_position_trusted(id)) {
        return errors::POSITION_NOT_TRUSTED;
    }
    if (is_position_used(id)) {
        return errors::POSITION_ALREADY_USED;
    }

    auto data = registry_.get_position_data(id);
    if (!data) return errors::POSITION_NOT_FOUND;
    if (data->is_debt != in_debt_array) {
        return errors::DEBT_MISMATCH;
    }

    auto& positions = position_array(in_debt_array);
    if (positions.size() >= MAX_POSITIONS) {
        return errors::POSITION_ARRAY_FULL;
    }
    if (index > positions.size()) {
        return errors::INVALID_INDEX;
    }

    positions.insert(positions.begin() + index, id);
    state_.positions[id] = ActivePosition{id, data->adaptor, data->is_debt, data->config_data, config_data};

    log::logger()->info("cellar {}: added {} position {} at index {}",
                        config_.name, in_debt_array ? "debt" : "credit", id, index);
    return errors::OK;
}

int32_t Cellar::remove_position(uint32_t index, bool in_debt_array) {
    ScopedFlag guard(entered_);
    if (!guard.acquired()) return errors::REENTRANCY;

    auto& positions = position_array(in_debt_array);
    if (index >= positions.size()) {
        return errors::INVALID_INDEX;
    }

    PositionId id = positions[index];
    if (id == state_.holding_position) {
        return errors::REMOVING_HOLDING_POSITION;
    }

    auto balance = position_balance(id);
    if (!balance) return errors::POSITION_NOT_FOUND;
    if (*balance != 0) {
        return errors::POSITION_NOT_EMPTY;
    }

    remove_at(index, in_debt_array);
    log::logger()->info("cellar {}: removed position {}", config_.name, id);
    return errors::OK;
}

int32_t Cellar::force_position_out(uint32_t index, PositionId id, bool in_debt_array) {
    ScopedFlag guard(entered_);
    if (!guard.acquired()) return errors::REENTRANCY;

    auto& positions = position_array(in_debt_array);
    if (index >= positions.size()) {
        return errors::INVALID_INDEX;
    }
    if (positions[index] != id) {
        return errors::POSITION_MISMATCH;
    }
    if (registry_.is_position_trusted(id)) {
        return errors::POSITION_STILL_TRUSTED;
    }
    if (id == state_.holding_position) {
        return errors::REMOVING_HOLDING_POSITION;
    }

    remove_at(index, in_debt_array);
    state_.position_catalogue.erase(id);
    log::logger()->warn("cellar {}: forced distrusted position {} out", config_.name, id);
    return errors::OK;
}

int32_t Cellar::swap_positions(uint32_t index1, uint32_t index2, bool in_debt_array) {
    ScopedFlag guard(entered_);
    if (!guard.acquired()) return errors::REENTRANCY;

    auto& positions = position_array(in_debt_array);
    if (index1 >= positions.size() || index2 >= positions.size()) {
        return errors::INVALID_INDEX;
    }
    std::swap(positions[index1], positions[index2]);
    return errors::OK;
}

int32_t Cellar::set_holding_position(PositionId id) {
    ScopedFlag guard(entered_);
    if (!guard.acquired()) return errors::REENTRANCY;

    auto it = state_.positions.find(id);
    if (it == state_.positions.end()) {
        return errors::POSITION_NOT_FOUND;
    }
    if (it->second.is_debt) {
        return errors::DEBT_MISMATCH;
    }

    const Adaptor* adaptor = registry_.get_adaptor(it->second.adaptor);
    if (!adaptor) return errors::INVALID_ADAPTOR;
    auto asset = adaptor->asset_of(it->second.adaptor_data);
    if (!asset || *asset != config_.asset) {
        return errors::ASSET_MISMATCH;
    }

    state_.holding_position = id;
    log::logger()->info("cellar {}: holding position set to {}", config_.name, id);
    return errors::OK;
}

std::optional<ActivePosition> Cellar::get_position(PositionId id) const {
    auto it = state_.positions.find(id);
    if (it == state_.positions.end()) return std::nullopt;
    return it->second;
}

std::optional<I128> Cellar::position_balance(PositionId id) const {
    auto it = state_.positions.find(id);
    if (it == state_.positions.end()) return std::nullopt;
    const Adaptor* adaptor = registry_.get_adaptor(it->second.adaptor);
    if (!adaptor) return std::nullopt;
    return adaptor->balance_of(address(), it->second.adaptor_data);
}

// =============================================================================
// Parameters
// =============================================================================

int32_t Cellar::set_share_lock_period(uint64_t period) {
    if (period < MINIMUM_SHARE_LOCK_PERIOD || period > MAXIMUM_SHARE_LOCK_PERIOD) {
        return errors::INVALID_SHARE_LOCK_PERIOD;
    }
    state_.share_lock_period = period;
    log::logger()->info("cellar {}: share lock period {}s", config_.name, period);
    return errors::OK;
}

int32_t Cellar::set_rebalance_deviation(I128 deviation_x18) {
    if (deviation_x18 < 0 || deviation_x18 > MAX_REBALANCE_DEVIATION_X18) {
        return errors::INVALID_REBALANCE_DEVIATION;
    }
    state_.allowed_rebalance_deviation_x18 = deviation_x18;
    log::logger()->info("cellar {}: rebalance deviation {}", config_.name, x18::to_string(deviation_x18));
    return errors::OK;
}

void Cellar::set_check_total_assets(bool enabled) {
    state_.check_total_assets = enabled;
    log::logger()->info("cellar {}: total assets check {}", config_.name, enabled ? "on" : "off");
}

// =============================================================================
// Valuation
// =============================================================================

std::optional<I128> Cellar::value_positions(bool withdrawable_only) const {
    ScopedFlag guard(valuing_);
    if (!guard.acquired()) return std::nullopt;

    std::vector<Asset> assets;
    std::vector<I128> amounts;

    auto collect = [&](PositionId id, bool negate) -> bool {
        const ActivePosition& pos = state_.positions.at(id);
        const Adaptor* adaptor = registry_.get_adaptor(pos.adaptor);
        if (!adaptor) return false;
        auto asset = adaptor->asset_of(pos.adaptor_data);
        if (!asset) return false;

        I128 amount = withdrawable_only
            ? adaptor->withdrawable_from(address(), pos.adaptor_data, pos.config_data)
            : adaptor->balance_of(address(), pos.adaptor_data);
        assets.push_back(*asset);
        amounts.push_back(negate ? -amount : amount);
        return true;
    };

    for (PositionId id : state_.credit_positions) {
        if (!collect(id, false)) return std::nullopt;
    }
    if (!withdrawable_only) {
        for (PositionId id : state_.debt_positions) {
            if (!collect(id, true)) return std::nullopt;
        }
    }

    // One pricing pass over credits and debts together
    auto total = prices_.get_values(assets, amounts, config_.asset);
    if (!total) return std::nullopt;
    return std::max<I128>(*total, 0);
}

std::optional<I128> Cellar::total_assets() const {
    return value_positions(false);
}

std::optional<I128> Cellar::total_assets_withdrawable() const {
    return value_positions(true);
}

// =============================================================================
// Share Conversion
// =============================================================================

int32_t Cellar::convert(I128 amount, bool to_shares, Rounding rounding, I128& out) const {
    if (state_.total_supply == 0) {
        out = amount;
        return errors::OK;
    }

    auto assets = total_assets();
    if (!assets) return errors::PRICE_STALE;

    if (to_shares) {
        if (*assets == 0) return errors::VAULT_INSOLVENT;
        out = x18::mul_div(amount, state_.total_supply, *assets, rounding);
    } else {
        out = x18::mul_div(amount, *assets, state_.total_supply, rounding);
    }
    return errors::OK;
}

std::optional<I128> Cellar::preview_deposit(I128 assets) const {
    I128 shares = 0;
    if (convert(assets, true, Rounding::DOWN, shares) != errors::OK) return std::nullopt;
    return shares;
}

std::optional<I128> Cellar::preview_mint(I128 shares) const {
    I128 assets = 0;
    if (convert(shares, false, Rounding::UP, assets) != errors::OK) return std::nullopt;
    return assets;
}

std::optional<I128> Cellar::preview_withdraw(I128 assets) const {
    I128 shares = 0;
    if (convert(assets, true, Rounding::UP, shares) != errors::OK) return std::nullopt;
    return shares;
}

std::optional<I128> Cellar::preview_redeem(I128 shares) const {
    I128 assets = 0;
    if (convert(shares, false, Rounding::DOWN, assets) != errors::OK) return std::nullopt;
    return assets;
}

std::optional<I128> Cellar::convert_to_shares(I128 assets) const {
    return preview_deposit(assets);
}

std::optional<I128> Cellar::convert_to_assets(I128 shares) const {
    return preview_redeem(shares);
}

I128 Cellar::max_deposit(const Address&) const {
    return state_.status == CellarStatus::ACTIVE ? AMOUNT_MAX : 0;
}

I128 Cellar::max_mint(const Address&) const {
    return state_.status == CellarStatus::ACTIVE ? AMOUNT_MAX : 0;
}

I128 Cellar::max_withdraw(const Address& owner) const {
    if (state_.status == CellarStatus::UNINITIALIZED || shares_locked(owner)) return 0;

    I128 shares = get_or_zero(state_.balances, owner);
    if (shares == 0) return 0;

    auto assets = convert_to_assets(shares);
    auto withdrawable = total_assets_withdrawable();
    if (!assets || !withdrawable) return 0;
    return std::min(*assets, *withdrawable);
}

I128 Cellar::max_redeem(const Address& owner) const {
    if (state_.status == CellarStatus::UNINITIALIZED || shares_locked(owner)) return 0;

    I128 shares = get_or_zero(state_.balances, owner);
    if (shares == 0) return 0;

    auto withdrawable = total_assets_withdrawable();
    if (!withdrawable) return 0;
    auto withdrawable_shares = convert_to_shares(*withdrawable);
    if (!withdrawable_shares) return 0;
    return std::min(shares, *withdrawable_shares);
}

// =============================================================================
// Deposit / Mint
// =============================================================================

int32_t Cellar::deposit(const Address& caller, I128 assets, const Address& receiver, I128& shares_out) {
    ScopedFlag guard(entered_);
    if (!guard.acquired()) return errors::REENTRANCY;

    int32_t rc = require_active();
    if (rc != errors::OK) return rc;
    if (assets <= 0) return errors::ZERO_ASSETS;

    I128 shares = 0;
    rc = convert(assets, true, Rounding::DOWN, shares);
    if (rc != errors::OK) return rc;
    if (shares == 0) return errors::ZERO_SHARES;

    rc = enter_shares(caller, assets, shares, receiver);
    if (rc != errors::OK) return rc;

    shares_out = shares;
    log::logger()->debug("cellar {}: deposit {} assets for {} shares",
                         config_.name, x18::to_string(assets), x18::to_string(shares));
    return errors::OK;
}

int32_t Cellar::mint(const Address& caller, I128 shares, const Address& receiver, I128& assets_out) {
    ScopedFlag guard(entered_);
    if (!guard.acquired()) return errors::REENTRANCY;

    int32_t rc = require_active();
    if (rc != errors::OK) return rc;
    if (shares <= 0) return errors::ZERO_SHARES;

    I128 assets = 0;
    rc = convert(shares, false, Rounding::UP, assets);
    if (rc != errors::OK) return rc;
    if (assets == 0) return errors::ZERO_ASSETS;

    rc = enter_shares(caller, assets, shares, receiver);
    if (rc != errors::OK) return rc;

    assets_out = assets;
    log::logger()->debug("cellar {}: mint {} shares for {} assets",
                         config_.name, x18::to_string(shares), x18::to_string(assets));
    return errors::OK;
}

int32_t Cellar::enter_shares(const Address& caller, I128 assets, I128 shares, const Address& receiver) {
    if (addresses::is_zero(receiver) || receiver == address()) {
        return errors::INVALID_RECEIVER;
    }

    auto holding = state_.positions.find(state_.holding_position);
    if (holding == state_.positions.end()) return errors::POSITION_NOT_FOUND;
    const ActivePosition position = holding->second;

    Adaptor* adaptor = registry_.get_adaptor(position.adaptor);
    if (!adaptor) return errors::INVALID_ADAPTOR;

    Transaction tx(journal_);

    int32_t rc = tokens_.transfer(config_.asset, caller, address(), assets);
    if (rc != errors::OK) return rc;

    rc = adaptor->deposit(*this, assets, position.adaptor_data, position.config_data);
    if (rc != errors::OK) return rc;

    rc = mint_shares(receiver, shares);
    if (rc != errors::OK) return rc;

    tx.commit();
    return errors::OK;
}

int32_t Cellar::mint_shares(const Address& receiver, I128 shares) {
    if (state_.total_supply > I128_MAX - shares) {
        return errors::INVALID_AMOUNT;
    }
    state_.balances[receiver] += shares;
    state_.total_supply += shares;

    // Every deposit restarts the receiver's lock
    state_.share_lock_start[receiver] = now();
    return errors::OK;
}

// =============================================================================
// Withdraw / Redeem
// =============================================================================

int32_t Cellar::withdraw(const Address& caller, I128 assets, const Address& receiver,
                         const Address& owner, I128& shares_out) {
    ScopedFlag guard(entered_);
    if (!guard.acquired()) return errors::REENTRANCY;

    if (state_.status == CellarStatus::UNINITIALIZED) return errors::NOT_INITIALIZED;
    if (assets <= 0) return errors::ZERO_ASSETS;

    I128 shares = 0;
    int32_t rc = convert(assets, true, Rounding::UP, shares);
    if (rc != errors::OK) return rc;
    if (shares == 0) return errors::ZERO_SHARES;

    rc = exit_shares(caller, assets, shares, receiver, owner);
    if (rc != errors::OK) return rc;

    shares_out = shares;
    log::logger()->debug("cellar {}: withdraw {} assets for {} shares",
                         config_.name, x18::to_string(assets), x18::to_string(shares));
    return errors::OK;
}

int32_t Cellar::redeem(const Address& caller, I128 shares, const Address& receiver,
                       const Address& owner, I128& assets_out) {
    ScopedFlag guard(entered_);
    if (!guard.acquired()) return errors::REENTRANCY;

    if (state_.status == CellarStatus::UNINITIALIZED) return errors::NOT_INITIALIZED;
    if (shares <= 0) return errors::ZERO_SHARES;

    I128 assets = 0;
    int32_t rc = convert(shares, false, Rounding::DOWN, assets);
    if (rc != errors::OK) return rc;
    if (assets == 0) return errors::ZERO_ASSETS;

    rc = exit_shares(caller, assets, shares, receiver, owner);
    if (rc != errors::OK) return rc;

    assets_out = assets;
    log::logger()->debug("cellar {}: redeem {} shares for {} assets",
                         config_.name, x18::to_string(shares), x18::to_string(assets));
    return errors::OK;
}

int32_t Cellar::exit_shares(const Address& caller, I128 assets, I128 shares,
                            const Address& receiver, const Address& owner) {
    if (addresses::is_zero(receiver) || receiver == address()) {
        return errors::INVALID_RECEIVER;
    }
    if (shares_locked(owner)) {
        return errors::SHARES_ARE_LOCKED;
    }
    if (get_or_zero(state_.balances, owner) < shares) {
        return errors::INSUFFICIENT_BALANCE;
    }

    // With the owner able to exit, this is the max_withdraw bound
    auto withdrawable = total_assets_withdrawable();
    if (!withdrawable) return errors::PRICE_STALE;
    if (assets > *withdrawable) {
        return errors::WITHDRAW_EXCEEDS_LIQUIDITY;
    }

    Transaction tx(journal_);

    if (caller != owner) {
        int32_t rc = spend_allowance(owner, caller, shares);
        if (rc != errors::OK) return rc;
    }

    I128& balance = state_.balances[owner];
    balance -= shares;
    if (balance == 0) state_.balances.erase(owner);
    state_.total_supply -= shares;

    int32_t rc = pull_liquidity(assets, receiver);
    if (rc != errors::OK) return rc;

    tx.commit();
    return errors::OK;
}

int32_t Cellar::pull_liquidity(I128 assets, const Address& receiver) {
    I128 remaining = assets;
    const std::vector<PositionId> order = state_.credit_positions;

    for (PositionId id : order) {
        if (remaining == 0) break;

        const ActivePosition position = state_.positions.at(id);
        Adaptor* adaptor = registry_.get_adaptor(position.adaptor);
        if (!adaptor) return errors::INVALID_ADAPTOR;

        I128 available = adaptor->withdrawable_from(address(), position.adaptor_data, position.config_data);
        if (available <= 0) continue;

        auto position_asset = adaptor->asset_of(position.adaptor_data);
        if (!position_asset) return errors::ASSET_MISMATCH;
        auto available_value = prices_.get_value(*position_asset, available, config_.asset);
        if (!available_value) return errors::PRICE_STALE;
        if (*available_value <= 0) continue;

        // Paid in kind: convert what is still owed into the position's asset
        I128 amount = available;
        if (*available_value > remaining) {
            amount = std::min(available, x18::mul_div(remaining, available, *available_value, Rounding::DOWN));
            remaining = 0;
        } else {
            remaining -= *available_value;
        }
        if (amount == 0) continue;

        int32_t rc = adaptor->withdraw(*this, amount, receiver, position.adaptor_data, position.config_data);
        if (rc != errors::OK) return rc;
    }

    if (remaining > 0) {
        return errors::INCOMPLETE_WITHDRAW;
    }
    return errors::OK;
}

// =============================================================================
// Share Transfers
// =============================================================================

int32_t Cellar::transfer(const Address& from, const Address& to, I128 shares) {
    return transfer_from(from, from, to, shares);
}

int32_t Cellar::transfer_from(const Address& spender, const Address& from, const Address& to, I128 shares) {
    ScopedFlag guard(entered_);
    if (!guard.acquired()) return errors::REENTRANCY;

    if (addresses::is_zero(to) || to == address()) return errors::INVALID_RECEIVER;
    if (shares < 0) return errors::INVALID_AMOUNT;
    if (shares_locked(from)) return errors::SHARES_ARE_LOCKED;
    if (get_or_zero(state_.balances, from) < shares) return errors::INSUFFICIENT_BALANCE;

    if (spender != from) {
        int32_t rc = spend_allowance(from, spender, shares);
        if (rc != errors::OK) return rc;
    }
    if (shares == 0 || from == to) return errors::OK;

    I128& balance = state_.balances[from];
    balance -= shares;
    if (balance == 0) state_.balances.erase(from);
    state_.balances[to] += shares;
    return errors::OK;
}

int32_t Cellar::approve(const Address& owner, const Address& spender, I128 shares) {
    if (shares < 0) return errors::INVALID_AMOUNT;
    if (shares == 0) {
        state_.allowances.erase(std::make_pair(owner, spender));
    } else {
        state_.allowances[std::make_pair(owner, spender)] = shares;
    }
    return errors::OK;
}

int32_t Cellar::spend_allowance(const Address& owner, const Address& spender, I128 shares) {
    auto it = state_.allowances.find(std::make_pair(owner, spender));
    if (it == state_.allowances.end() || it->second < shares) {
        return errors::UNAUTHORIZED;
    }
    if (it->second != AMOUNT_MAX) {
        it->second -= shares;
        if (it->second == 0) state_.allowances.erase(it);
    }
    return errors::OK;
}

I128 Cellar::balance_of(const Address& owner) const {
    return get_or_zero(state_.balances, owner);
}

I128 Cellar::allowance(const Address& owner, const Address& spender) const {
    auto it = state_.allowances.find(std::make_pair(owner, spender));
    return (it != state_.allowances.end()) ? it->second : 0;
}

uint64_t Cellar::share_unlock_time(const Address& owner) const {
    auto it = state_.share_lock_start.find(owner);
    if (it == state_.share_lock_start.end()) return 0;
    return it->second + state_.share_lock_period;
}

bool Cellar::shares_locked(const Address& owner) const {
    uint64_t unlock = share_unlock_time(owner);
    return unlock != 0 && now() < unlock;
}

// =============================================================================
// Strategist
// =============================================================================

int32_t Cellar::call_on_adaptor(const std::vector<AdaptorCall>& batch) {
    ScopedFlag guard(entered_);
    if (!guard.acquired()) return errors::REENTRANCY;

    int32_t rc = require_active();
    if (rc != errors::OK) return rc;

    std::vector<Adaptor*> adaptors;
    adaptors.reserve(batch.size());
    for (const auto& call : batch) {
        if (!is_adaptor_in_catalogue(call.adaptor)) return errors::ADAPTOR_NOT_IN_CATALOGUE;
        if (!registry_.is_adaptor_trusted(call.adaptor)) return errors::ADAPTOR_NOT_TRUSTED;
        Adaptor* adaptor = registry_.get_adaptor(call.adaptor);
        if (!adaptor) return errors::INVALID_ADAPTOR;
        adaptors.push_back(adaptor);
    }

    I128 assets_before = 0;
    if (state_.check_total_assets) {
        auto before = total_assets();
        if (!before) return errors::PRICE_STALE;
        assets_before = *before;
    }
    const I128 supply_before = state_.total_supply;

    Transaction tx(journal_);

    size_t index = 0;
    for (size_t i = 0; i < batch.size(); ++i) {
        for (const auto& data : batch[i].call_data) {
            rc = adaptors[i]->call(*this, data);
            if (rc != errors::OK) {
                log::logger()->warn("cellar {}: call {} on {} failed ({}), batch reverted",
                                    config_.name, index, adaptors[i]->name(), errors::name(rc));
                return rc;
            }
            ++index;
        }
    }

    if (state_.total_supply != supply_before) {
        log::logger()->warn("cellar {}: total supply changed, batch reverted", config_.name);
        return errors::TOTAL_SUPPLY_CHANGED;
    }

    if (state_.check_total_assets) {
        auto after = total_assets();
        if (!after) return errors::PRICE_STALE;

        const I128 deviation = state_.allowed_rebalance_deviation_x18;
        I128 minimum = x18::mul_div(assets_before, X18_ONE - deviation, X18_ONE, Rounding::UP);
        I128 maximum = x18::mul_div(assets_before, X18_ONE + deviation, X18_ONE, Rounding::UP);
        if (*after < minimum || *after > maximum) {
            log::logger()->warn("cellar {}: total assets moved {} -> {}, batch reverted",
                                config_.name, x18::to_string(assets_before), x18::to_string(*after));
            return errors::TOTAL_ASSETS_DEVIATION;
        }
    }

    tx.commit();
    log::logger()->debug("cellar {}: committed batch of {} calls", config_.name, index);
    return errors::OK;
}

// =============================================================================
// Persistence
// =============================================================================

CellarSnapshot Cellar::snapshot() const {
    CellarSnapshot snap;
    snap.config = config_;
    snap.state = state_;
    return snap;
}

int32_t Cellar::restore(const CellarSnapshot& snapshot) {
    ScopedFlag guard(entered_);
    if (!guard.acquired()) return errors::REENTRANCY;

    if (snapshot.config.address != config_.address) return errors::CELLAR_NOT_FOUND;
    if (snapshot.config.asset != config_.asset) return errors::ASSET_MISMATCH;

    const CellarState& next = snapshot.state;
    if (next.credit_positions.size() > MAX_POSITIONS || next.debt_positions.size() > MAX_POSITIONS) {
        return errors::POSITION_ARRAY_FULL;
    }
    if (next.share_lock_period < MINIMUM_SHARE_LOCK_PERIOD ||
        next.share_lock_period > MAXIMUM_SHARE_LOCK_PERIOD) {
        return errors::INVALID_SHARE_LOCK_PERIOD;
    }
    if (next.allowed_rebalance_deviation_x18 < 0 ||
        next.allowed_rebalance_deviation_x18 > MAX_REBALANCE_DEVIATION_X18) {
        return errors::INVALID_REBALANCE_DEVIATION;
    }
    if (next.credit_positions.size() + next.debt_positions.size() != next.positions.size()) {
        return errors::POSITION_MISMATCH;
    }

    auto check = [&](PositionId id, bool is_debt) -> int32_t {
        auto it = next.positions.find(id);
        if (it == next.positions.end()) return errors::POSITION_NOT_FOUND;
        auto data = registry_.get_position_data(id);
        if (!data) return errors::POSITION_NOT_FOUND;
        const ActivePosition& pos = it->second;
        if (pos.is_debt != is_debt || data->is_debt != is_debt || data->adaptor != pos.adaptor ||
            data->config_data != pos.adaptor_data) {
            return errors::POSITION_MISMATCH;
        }
        return errors::OK;
    };
    for (PositionId id : next.credit_positions) {
        int32_t rc = check(id, false);
        if (rc != errors::OK) return rc;
    }
    for (PositionId id : next.debt_positions) {
        int32_t rc = check(id, true);
        if (rc != errors::OK) return rc;
    }
    if (next.status != CellarStatus::UNINITIALIZED &&
        std::find(next.credit_positions.begin(), next.credit_positions.end(),
                  next.holding_position) == next.credit_positions.end()) {
        return errors::POSITION_NOT_FOUND;
    }

    state_ = next;
    config_.name = snapshot.config.name;
    log::logger()->info("cellar {}: restored {} positions, supply {}",
                        config_.name, state_.positions.size(), x18::to_string(state_.total_supply));
    return errors::OK;
}

} // namespace cellar
