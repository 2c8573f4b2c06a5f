#ifndef CELLAR_CELLAR_HPP
#define CELLAR_CELLAR_HPP

#include <map>
#include <set>
#include <unordered_map>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"
#include "config.hpp"
#include "journal.hpp"
#include "adaptor.hpp"
#include "registry.hpp"
#include "oracle.hpp"
#include "token.hpp"

namespace cellar {

constexpr size_t MAX_POSITIONS = 16;  // per credit / debt array

enum class CellarStatus : uint8_t {
    UNINITIALIZED = 0,
    ACTIVE = 1,
    SHUTDOWN = 2
};

// =============================================================================
// Active Position (per-vault view of a registry position)
// =============================================================================

struct ActivePosition {
    PositionId id;
    AdaptorId adaptor;
    bool is_debt;
    Bytes adaptor_data;   // registry config, fixed per position
    Bytes config_data;    // vault-specific config
};

// =============================================================================
// Cellar State
// =============================================================================

struct CellarState {
    CellarStatus status = CellarStatus::UNINITIALIZED;

    std::set<AdaptorId> adaptor_catalogue;
    std::set<PositionId> position_catalogue;

    std::vector<PositionId> credit_positions;   // withdraw order
    std::vector<PositionId> debt_positions;
    std::map<PositionId, ActivePosition> positions;
    PositionId holding_position = NO_POSITION;

    I128 total_supply = 0;
    std::unordered_map<Address, I128, AddressHash> balances;
    std::map<std::pair<Address, Address>, I128> allowances;  // (owner, spender)
    std::unordered_map<Address, uint64_t, AddressHash> share_lock_start;

    uint64_t share_lock_period = MAXIMUM_SHARE_LOCK_PERIOD;
    I128 allowed_rebalance_deviation_x18 = DEFAULT_REBALANCE_DEVIATION_X18;
    bool check_total_assets = true;
};

struct CellarSnapshot {
    CellarConfig config;
    CellarState state;
};

// =============================================================================
// Cellar - multi-position vault issuing shares over its net asset value
//
// Net asset value = sum of credit positions - sum of debt positions, priced
// in the reserve asset. Strategist adaptor batches, deposits and withdrawals
// run inside one journal transaction: a failure at any step reverts the
// vault, the token ledger and every external protocol together.
//
// The owner attaches the cellar to the journal it is constructed with.
// =============================================================================

class Cellar : public JournaledState<CellarState>, public AdaptorContext {
public:
    Cellar(const CellarConfig& config, const Registry& registry, const PriceRouter& prices,
           TokenLedger& tokens, Journal& journal);
    ~Cellar() override = default;

    // Non-copyable
    Cellar(const Cellar&) = delete;
    Cellar& operator=(const Cellar&) = delete;

    // AdaptorContext
    const Address& address() const override { return config_.address; }
    const Registry& registry() const override { return registry_; }
    bool is_position_used(PositionId id) const override;

    const std::string& name() const { return config_.name; }
    const Asset& asset() const { return config_.asset; }
    const CellarConfig& config() const { return config_; }
    CellarStatus status() const { return state_.status; }

    void set_time_source(TimeSource source);

    // =========================================================================
    // Lifecycle
    // =========================================================================

    // Holding position must be a trusted credit position in the reserve asset
    int32_t initialize(PositionId holding_position, const Bytes& config_data = {});
    int32_t initiate_shutdown();
    int32_t lift_shutdown();

    // =========================================================================
    // Catalogue
    // =========================================================================

    int32_t add_adaptor_to_catalogue(AdaptorId adaptor);
    int32_t remove_adaptor_from_catalogue(AdaptorId adaptor);
    int32_t add_position_to_catalogue(PositionId id);
    int32_t remove_position_from_catalogue(PositionId id);

    bool is_adaptor_in_catalogue(AdaptorId adaptor) const;
    bool is_position_in_catalogue(PositionId id) const;

    // =========================================================================
    // Active Positions
    // =========================================================================

    int32_t add_position(uint32_t index, PositionId id, const Bytes& config_data, bool in_debt_array);
    int32_t remove_position(uint32_t index, bool in_debt_array);

    // Removes a position the registry distrusted, regardless of its balance
    int32_t force_position_out(uint32_t index, PositionId id, bool in_debt_array);

    int32_t swap_positions(uint32_t index1, uint32_t index2, bool in_debt_array);
    int32_t set_holding_position(PositionId id);

    const std::vector<PositionId>& credit_positions() const { return state_.credit_positions; }
    const std::vector<PositionId>& debt_positions() const { return state_.debt_positions; }
    PositionId holding_position() const { return state_.holding_position; }
    std::optional<ActivePosition> get_position(PositionId id) const;

    // Position size as its adaptor reports it, in the position's asset
    std::optional<I128> position_balance(PositionId id) const;

    // =========================================================================
    // Parameters
    // =========================================================================

    int32_t set_share_lock_period(uint64_t period);
    int32_t set_rebalance_deviation(I128 deviation_x18);
    void set_check_total_assets(bool enabled);

    uint64_t share_lock_period() const { return state_.share_lock_period; }
    I128 allowed_rebalance_deviation() const { return state_.allowed_rebalance_deviation_x18; }
    bool check_total_assets() const { return state_.check_total_assets; }

    // =========================================================================
    // Valuation (reserve asset units, nullopt when pricing fails)
    // =========================================================================

    std::optional<I128> total_assets() const;
    std::optional<I128> total_assets_withdrawable() const;

    // =========================================================================
    // Shares
    // =========================================================================

    int32_t deposit(const Address& caller, I128 assets, const Address& receiver, I128& shares_out);
    int32_t mint(const Address& caller, I128 shares, const Address& receiver, I128& assets_out);
    int32_t withdraw(const Address& caller, I128 assets, const Address& receiver,
                     const Address& owner, I128& shares_out);
    int32_t redeem(const Address& caller, I128 shares, const Address& receiver,
                   const Address& owner, I128& assets_out);

    std::optional<I128> preview_deposit(I128 assets) const;    // shares, round down
    std::optional<I128> preview_mint(I128 shares) const;       // assets, round up
    std::optional<I128> preview_withdraw(I128 assets) const;   // shares, round up
    std::optional<I128> preview_redeem(I128 shares) const;     // assets, round down

    std::optional<I128> convert_to_shares(I128 assets) const;
    std::optional<I128> convert_to_assets(I128 shares) const;

    I128 max_deposit(const Address& receiver) const;
    I128 max_mint(const Address& receiver) const;
    I128 max_withdraw(const Address& owner) const;
    I128 max_redeem(const Address& owner) const;

    int32_t transfer(const Address& from, const Address& to, I128 shares);
    int32_t transfer_from(const Address& spender, const Address& from, const Address& to, I128 shares);
    int32_t approve(const Address& owner, const Address& spender, I128 shares);

    I128 balance_of(const Address& owner) const;
    I128 allowance(const Address& owner, const Address& spender) const;
    I128 total_supply() const { return state_.total_supply; }

    // Seconds since epoch when owner's shares unlock; 0 if never locked
    uint64_t share_unlock_time(const Address& owner) const;
    bool shares_locked(const Address& owner) const;

    // =========================================================================
    // Strategist
    // =========================================================================

    int32_t call_on_adaptor(const std::vector<AdaptorCall>& batch);

    // =========================================================================
    // Persistence
    // =========================================================================

    CellarSnapshot snapshot() const;
    int32_t restore(const CellarSnapshot& snapshot);

private:
    CellarConfig config_;
    const Registry& registry_;
    const PriceRouter& prices_;
    TokenLedger& tokens_;
    Journal& journal_;
    TimeSource time_source_;

    bool entered_{false};            // reentrancy guard
    mutable bool valuing_{false};    // breaks nested cellar valuation cycles

    uint64_t now() const;

    int32_t require_active() const;
    int32_t convert(I128 amount, bool to_shares, Rounding rounding, I128& out) const;
    std::optional<I128> value_positions(bool withdrawable_only) const;

    int32_t mint_shares(const Address& receiver, I128 shares);
    int32_t spend_allowance(const Address& owner, const Address& spender, I128 shares);
    int32_t enter_shares(const Address& caller, I128 assets, I128 shares, const Address& receiver);
    int32_t exit_shares(const Address& caller, I128 assets, I128 shares,
                        const Address& receiver, const Address& owner);
    int32_t pull_liquidity(I128 assets, const Address& receiver);

    std::vector<PositionId>& position_array(bool in_debt_array);
    int32_t remove_at(uint32_t index, bool in_debt_array);
};

} // namespace cellar

#endif // CELLAR_CELLAR_HPP
