#ifndef CELLAR_ADAPTORS_LENDING_HPP
#define CELLAR_ADAPTORS_LENDING_HPP

#include "../adaptor.hpp"
#include "../lend.hpp"
#include "../token.hpp"

namespace cellar {

// Position config shared by both lending adaptors: [asset][sub_account:u32]
struct LendingPositionConfig {
    Asset asset;
    uint32_t sub_account;
};

Bytes encode_lending_config(const Asset& asset, uint32_t sub_account);
std::optional<LendingPositionConfig> decode_lending_config(const Bytes& config);

// Minimum health factor an adaptor leaves a sub-account with
constexpr I128 LENDING_MIN_HEALTH_FACTOR_X18 = 1100000000000000000LL;       // 1.10
constexpr I128 LENDING_MIN_SELF_HEALTH_FACTOR_X18 = 1050000000000000000LL;  // 1.05

// =============================================================================
// LendingSupplyAdaptor - deposits in a lending market sub-account
// =============================================================================

class LendingSupplyAdaptor : public Adaptor {
public:
    static constexpr AdaptorId IDENTIFIER = hash::fnv1a64("Cellar Lending Supply Adaptor V 1.0");

    static constexpr uint32_t DEPOSIT_TO_MARKET =
        abi::selector("depositToMarket(address,uint32,int128)");
    static constexpr uint32_t WITHDRAW_FROM_MARKET =
        abi::selector("withdrawFromMarket(address,uint32,int128)");
    static constexpr uint32_t TRANSFER_BETWEEN_SUB_ACCOUNTS =
        abi::selector("transferBetweenSubAccounts(address,uint32,uint32,int128)");
    static constexpr uint32_t ENTER_MARKET = abi::selector("enterMarket(address,uint32)");
    static constexpr uint32_t EXIT_MARKET = abi::selector("exitMarket(address,uint32)");

    LendingSupplyAdaptor(LendingMarket& market, TokenLedger& tokens,
                         I128 min_health_factor_x18 = LENDING_MIN_HEALTH_FACTOR_X18);

    AdaptorId identifier() const override { return IDENTIFIER; }
    const char* name() const override { return "Lending Supply Adaptor"; }
    bool is_debt() const override { return false; }

    int32_t validate_config(const Bytes& config) const override;
    I128 balance_of(const Address& owner, const Bytes& config) const override;
    std::optional<Asset> asset_of(const Bytes& config) const override;

    // Only debt-free sub-accounts are user withdrawable, capped by market cash
    I128 withdrawable_from(const Address& owner, const Bytes& config,
                           const Bytes& user_config) const override;

    int32_t deposit(const AdaptorContext& ctx, I128 assets,
                    const Bytes& config, const Bytes& user_config) override;
    int32_t withdraw(const AdaptorContext& ctx, I128 assets, const Address& receiver,
                     const Bytes& config, const Bytes& user_config) override;

    // Call data builders
    static Bytes deposit_to_market(const Asset& asset, uint32_t sub_account, I128 amount);
    static Bytes withdraw_from_market(const Asset& asset, uint32_t sub_account, I128 amount);
    static Bytes transfer_between_sub_accounts(const Asset& asset, uint32_t from_sub,
                                               uint32_t to_sub, I128 amount);
    static Bytes enter_market(const Asset& asset, uint32_t sub_account);
    static Bytes exit_market(const Asset& asset, uint32_t sub_account);

private:
    LendingMarket& market_;
    TokenLedger& tokens_;
    I128 min_health_factor_x18_;

    int32_t on_deposit(const AdaptorContext& ctx, abi::Reader& args);
    int32_t on_withdraw(const AdaptorContext& ctx, abi::Reader& args);
    int32_t on_transfer(const AdaptorContext& ctx, abi::Reader& args);
    int32_t on_enter(const AdaptorContext& ctx, abi::Reader& args);
    int32_t on_exit(const AdaptorContext& ctx, abi::Reader& args);
};

// =============================================================================
// LendingDebtAdaptor - borrows from a lending market sub-account
// =============================================================================

class LendingDebtAdaptor : public DebtAdaptor {
public:
    static constexpr AdaptorId IDENTIFIER = hash::fnv1a64("Cellar Lending Debt Adaptor V 1.0");

    static constexpr uint32_t BORROW = abi::selector("borrowFromMarket(address,uint32,int128)");
    static constexpr uint32_t REPAY = abi::selector("repayMarketDebt(address,uint32,int128)");
    static constexpr uint32_t SELF_BORROW = abi::selector("selfBorrow(address,uint32,int128)");
    static constexpr uint32_t SELF_REPAY = abi::selector("selfRepay(address,uint32,int128)");

    LendingDebtAdaptor(LendingMarket& market, TokenLedger& tokens,
                       I128 min_health_factor_x18 = LENDING_MIN_HEALTH_FACTOR_X18,
                       I128 min_self_health_factor_x18 = LENDING_MIN_SELF_HEALTH_FACTOR_X18);

    AdaptorId identifier() const override { return IDENTIFIER; }
    const char* name() const override { return "Lending Debt Adaptor"; }

    int32_t validate_config(const Bytes& config) const override;

    // Outstanding debt of the sub-account
    I128 balance_of(const Address& owner, const Bytes& config) const override;
    std::optional<Asset> asset_of(const Bytes& config) const override;

    static Bytes borrow(const Asset& asset, uint32_t sub_account, I128 amount);
    static Bytes repay(const Asset& asset, uint32_t sub_account, I128 amount);
    static Bytes self_borrow(const Asset& asset, uint32_t sub_account, I128 amount);
    static Bytes self_repay(const Asset& asset, uint32_t sub_account, I128 amount);

private:
    LendingMarket& market_;
    TokenLedger& tokens_;
    I128 min_health_factor_x18_;
    I128 min_self_health_factor_x18_;

    int32_t on_borrow(const AdaptorContext& ctx, abi::Reader& args);
    int32_t on_repay(const AdaptorContext& ctx, abi::Reader& args);
    int32_t on_self_borrow(const AdaptorContext& ctx, abi::Reader& args);
    int32_t on_self_repay(const AdaptorContext& ctx, abi::Reader& args);
};

} // namespace cellar

#endif // CELLAR_ADAPTORS_LENDING_HPP
