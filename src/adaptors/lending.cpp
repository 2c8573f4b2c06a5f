// =============================================================================
// lending.cpp - Lending Market Supply / Debt Adaptors
// =============================================================================

#include "cellar/adaptors/lending.hpp"
#include <algorithm>

namespace cellar {

Bytes encode_lending_config(const Asset& asset, uint32_t sub_account) {
    return abi::Writer().put_asset(asset).put_u32(sub_account).take();
}

std::optional<LendingPositionConfig> decode_lending_config(const Bytes& config) {
    abi::Reader reader(config);
    LendingPositionConfig out;
    if (!reader.get_asset(out.asset) || !reader.get_u32(out.sub_account) || !reader.at_end()) {
        return std::nullopt;
    }
    return out;
}

namespace {

int32_t validate_lending_config(const LendingMarket& market, const Bytes& config) {
    auto cfg = decode_lending_config(config);
    if (!cfg) return errors::MALFORMED_CALLDATA;
    if (cfg->sub_account > MAX_SUB_ACCOUNT_ID) return errors::INVALID_SUB_ACCOUNT_ID;
    if (!market.market_exists(cfg->asset)) return errors::UNDERLYING_NOT_SUPPORTED;
    return errors::OK;
}

// [asset][sub_account] prefix of every lending entrypoint
bool read_target(abi::Reader& args, Asset& asset, uint32_t& sub_account) {
    return args.get_asset(asset) && args.get_u32(sub_account);
}

bool read_amount(abi::Reader& args, I128& amount) {
    return args.get_i128(amount) && args.at_end();
}

int32_t require_health(const LendingMarket& market, const SubAccount& account, I128 minimum_x18) {
    auto hf = market.health_factor(account);
    if (!hf) return errors::PRICE_STALE;
    if (!health::meets_minimum(*hf, minimum_x18)) return errors::HEALTH_FACTOR_TOO_LOW;
    return errors::OK;
}

// Health check only matters once the sub-account owes something
int32_t require_health_if_borrowing(const LendingMarket& market, const Address& primary,
                                    uint32_t sub_account, I128 minimum_x18) {
    auto account = LendingMarket::sub_account(primary, sub_account);
    if (!account) return errors::INVALID_SUB_ACCOUNT_ID;
    if (!market.has_liabilities(*account)) return errors::OK;
    return require_health(market, *account, minimum_x18);
}

Bytes encode_call(uint32_t selector, const Asset& asset, uint32_t sub_account, I128 amount) {
    return abi::Writer(selector).put_asset(asset).put_u32(sub_account).put_i128(amount).take();
}

} // namespace

// =============================================================================
// LendingSupplyAdaptor
// =============================================================================

LendingSupplyAdaptor::LendingSupplyAdaptor(LendingMarket& market, TokenLedger& tokens,
                                           I128 min_health_factor_x18)
    : market_(market)
    , tokens_(tokens)
    , min_health_factor_x18_(min_health_factor_x18) {
    register_entrypoint(DEPOSIT_TO_MARKET, [this](const AdaptorContext& ctx, abi::Reader& args) {
        return on_deposit(ctx, args);
    });
    register_entrypoint(WITHDRAW_FROM_MARKET, [this](const AdaptorContext& ctx, abi::Reader& args) {
        return on_withdraw(ctx, args);
    });
    register_entrypoint(TRANSFER_BETWEEN_SUB_ACCOUNTS, [this](const AdaptorContext& ctx, abi::Reader& args) {
        return on_transfer(ctx, args);
    });
    register_entrypoint(ENTER_MARKET, [this](const AdaptorContext& ctx, abi::Reader& args) {
        return on_enter(ctx, args);
    });
    register_entrypoint(EXIT_MARKET, [this](const AdaptorContext& ctx, abi::Reader& args) {
        return on_exit(ctx, args);
    });
}

int32_t LendingSupplyAdaptor::validate_config(const Bytes& config) const {
    return validate_lending_config(market_, config);
}

I128 LendingSupplyAdaptor::balance_of(const Address& owner, const Bytes& config) const {
    auto cfg = decode_lending_config(config);
    if (!cfg) return 0;
    auto account = LendingMarket::sub_account(owner, cfg->sub_account);
    if (!account) return 0;
    return market_.balance_of_underlying(*account, cfg->asset);
}

std::optional<Asset> LendingSupplyAdaptor::asset_of(const Bytes& config) const {
    auto cfg = decode_lending_config(config);
    if (!cfg) return std::nullopt;
    return cfg->asset;
}

I128 LendingSupplyAdaptor::withdrawable_from(const Address& owner, const Bytes& config,
                                             const Bytes&) const {
    auto cfg = decode_lending_config(config);
    if (!cfg) return 0;
    auto account = LendingMarket::sub_account(owner, cfg->sub_account);
    if (!account || market_.has_liabilities(*account)) return 0;
    return std::min(market_.balance_of_underlying(*account, cfg->asset), market_.cash(cfg->asset));
}

int32_t LendingSupplyAdaptor::deposit(const AdaptorContext& ctx, I128 assets,
                                      const Bytes& config, const Bytes&) {
    auto cfg = decode_lending_config(config);
    if (!cfg) return errors::MALFORMED_CALLDATA;
    return market_.deposit(ctx.address(), cfg->sub_account, cfg->asset, assets);
}

int32_t LendingSupplyAdaptor::withdraw(const AdaptorContext& ctx, I128 assets, const Address& receiver,
                                       const Bytes& config, const Bytes&) {
    auto cfg = decode_lending_config(config);
    if (!cfg) return errors::MALFORMED_CALLDATA;
    if (addresses::is_zero(receiver)) return errors::INVALID_RECEIVER;

    auto account = LendingMarket::sub_account(ctx.address(), cfg->sub_account);
    if (!account) return errors::INVALID_SUB_ACCOUNT_ID;
    if (market_.has_liabilities(*account)) return errors::WITHDRAW_EXCEEDS_LIQUIDITY;

    int32_t rc = market_.withdraw(ctx.address(), cfg->sub_account, cfg->asset, assets);
    if (rc != errors::OK) return rc;
    return tokens_.transfer(cfg->asset, ctx.address(), receiver, assets);
}

// =============================================================================
// Strategist Entrypoints
// =============================================================================

int32_t LendingSupplyAdaptor::on_deposit(const AdaptorContext& ctx, abi::Reader& args) {
    Asset asset;
    uint32_t sub = 0;
    I128 amount = 0;
    if (!read_target(args, asset, sub) || !read_amount(args, amount)) {
        return errors::MALFORMED_CALLDATA;
    }

    int32_t rc = require_tracked(ctx, IDENTIFIER, false, encode_lending_config(asset, sub));
    if (rc != errors::OK) return rc;

    if (amount == AMOUNT_MAX) {
        amount = tokens_.balance_of(asset, ctx.address());
    }
    return market_.deposit(ctx.address(), sub, asset, amount);
}

int32_t LendingSupplyAdaptor::on_withdraw(const AdaptorContext& ctx, abi::Reader& args) {
    Asset asset;
    uint32_t sub = 0;
    I128 amount = 0;
    if (!read_target(args, asset, sub) || !read_amount(args, amount)) {
        return errors::MALFORMED_CALLDATA;
    }

    if (amount == AMOUNT_MAX) {
        auto account = LendingMarket::sub_account(ctx.address(), sub);
        if (!account) return errors::INVALID_SUB_ACCOUNT_ID;
        amount = market_.balance_of_underlying(*account, asset);
    }

    int32_t rc = market_.withdraw(ctx.address(), sub, asset, amount);
    if (rc != errors::OK) return rc;
    return require_health_if_borrowing(market_, ctx.address(), sub, min_health_factor_x18_);
}

int32_t LendingSupplyAdaptor::on_transfer(const AdaptorContext& ctx, abi::Reader& args) {
    Asset asset;
    uint32_t from_sub = 0;
    uint32_t to_sub = 0;
    I128 amount = 0;
    if (!args.get_asset(asset) || !args.get_u32(from_sub) || !args.get_u32(to_sub) ||
        !read_amount(args, amount)) {
        return errors::MALFORMED_CALLDATA;
    }

    // Destination must be a position the vault values
    int32_t rc = require_tracked(ctx, IDENTIFIER, false, encode_lending_config(asset, to_sub));
    if (rc != errors::OK) return rc;

    if (amount == AMOUNT_MAX) {
        auto account = LendingMarket::sub_account(ctx.address(), from_sub);
        if (!account) return errors::INVALID_SUB_ACCOUNT_ID;
        amount = market_.balance_of_underlying(*account, asset);
    }

    rc = market_.transfer_deposit(ctx.address(), from_sub, to_sub, asset, amount);
    if (rc != errors::OK) return rc;
    return require_health_if_borrowing(market_, ctx.address(), from_sub, min_health_factor_x18_);
}

int32_t LendingSupplyAdaptor::on_enter(const AdaptorContext& ctx, abi::Reader& args) {
    Asset asset;
    uint32_t sub = 0;
    if (!read_target(args, asset, sub) || !args.at_end()) {
        return errors::MALFORMED_CALLDATA;
    }
    return market_.enter_market(ctx.address(), sub, asset);
}

int32_t LendingSupplyAdaptor::on_exit(const AdaptorContext& ctx, abi::Reader& args) {
    Asset asset;
    uint32_t sub = 0;
    if (!read_target(args, asset, sub) || !args.at_end()) {
        return errors::MALFORMED_CALLDATA;
    }

    int32_t rc = market_.exit_market(ctx.address(), sub, asset);
    if (rc != errors::OK) return rc;
    return require_health_if_borrowing(market_, ctx.address(), sub, min_health_factor_x18_);
}

Bytes LendingSupplyAdaptor::deposit_to_market(const Asset& asset, uint32_t sub_account, I128 amount) {
    return encode_call(DEPOSIT_TO_MARKET, asset, sub_account, amount);
}

Bytes LendingSupplyAdaptor::withdraw_from_market(const Asset& asset, uint32_t sub_account, I128 amount) {
    return encode_call(WITHDRAW_FROM_MARKET, asset, sub_account, amount);
}

Bytes LendingSupplyAdaptor::transfer_between_sub_accounts(const Asset& asset, uint32_t from_sub,
                                                          uint32_t to_sub, I128 amount) {
    return abi::Writer(TRANSFER_BETWEEN_SUB_ACCOUNTS)
        .put_asset(asset)
        .put_u32(from_sub)
        .put_u32(to_sub)
        .put_i128(amount)
        .take();
}

Bytes LendingSupplyAdaptor::enter_market(const Asset& asset, uint32_t sub_account) {
    return abi::Writer(ENTER_MARKET).put_asset(asset).put_u32(sub_account).take();
}

Bytes LendingSupplyAdaptor::exit_market(const Asset& asset, uint32_t sub_account) {
    return abi::Writer(EXIT_MARKET).put_asset(asset).put_u32(sub_account).take();
}

// =============================================================================
// LendingDebtAdaptor
// =============================================================================

LendingDebtAdaptor::LendingDebtAdaptor(LendingMarket& market, TokenLedger& tokens,
                                       I128 min_health_factor_x18,
                                       I128 min_self_health_factor_x18)
    : market_(market)
    , tokens_(tokens)
    , min_health_factor_x18_(min_health_factor_x18)
    , min_self_health_factor_x18_(min_self_health_factor_x18) {
    register_entrypoint(BORROW, [this](const AdaptorContext& ctx, abi::Reader& args) {
        return on_borrow(ctx, args);
    });
    register_entrypoint(REPAY, [this](const AdaptorContext& ctx, abi::Reader& args) {
        return on_repay(ctx, args);
    });
    register_entrypoint(SELF_BORROW, [this](const AdaptorContext& ctx, abi::Reader& args) {
        return on_self_borrow(ctx, args);
    });
    register_entrypoint(SELF_REPAY, [this](const AdaptorContext& ctx, abi::Reader& args) {
        return on_self_repay(ctx, args);
    });
}

int32_t LendingDebtAdaptor::validate_config(const Bytes& config) const {
    return validate_lending_config(market_, config);
}

I128 LendingDebtAdaptor::balance_of(const Address& owner, const Bytes& config) const {
    auto cfg = decode_lending_config(config);
    if (!cfg) return 0;
    auto account = LendingMarket::sub_account(owner, cfg->sub_account);
    if (!account) return 0;
    return market_.debt_of(*account, cfg->asset);
}

std::optional<Asset> LendingDebtAdaptor::asset_of(const Bytes& config) const {
    auto cfg = decode_lending_config(config);
    if (!cfg) return std::nullopt;
    return cfg->asset;
}

int32_t LendingDebtAdaptor::on_borrow(const AdaptorContext& ctx, abi::Reader& args) {
    Asset asset;
    uint32_t sub = 0;
    I128 amount = 0;
    if (!read_target(args, asset, sub) || !read_amount(args, amount)) {
        return errors::MALFORMED_CALLDATA;
    }

    int32_t rc = require_tracked(ctx, IDENTIFIER, true, encode_lending_config(asset, sub));
    if (rc != errors::OK) return rc;

    rc = market_.borrow(ctx.address(), sub, asset, amount);
    if (rc != errors::OK) return rc;

    auto account = LendingMarket::sub_account(ctx.address(), sub);
    if (!account) return errors::INVALID_SUB_ACCOUNT_ID;
    return require_health(market_, *account, min_health_factor_x18_);
}

int32_t LendingDebtAdaptor::on_repay(const AdaptorContext& ctx, abi::Reader& args) {
    Asset asset;
    uint32_t sub = 0;
    I128 amount = 0;
    if (!read_target(args, asset, sub) || !read_amount(args, amount)) {
        return errors::MALFORMED_CALLDATA;
    }

    if (amount == AMOUNT_MAX) {
        auto account = LendingMarket::sub_account(ctx.address(), sub);
        if (!account) return errors::INVALID_SUB_ACCOUNT_ID;
        amount = std::min(tokens_.balance_of(asset, ctx.address()), market_.debt_of(*account, asset));
        if (amount == 0) return errors::OK;
    }

    // The market caps the repayment at the outstanding debt
    return market_.repay(ctx.address(), sub, asset, amount);
}

int32_t LendingDebtAdaptor::on_self_borrow(const AdaptorContext& ctx, abi::Reader& args) {
    Asset asset;
    uint32_t sub = 0;
    I128 amount = 0;
    if (!read_target(args, asset, sub) || !read_amount(args, amount)) {
        return errors::MALFORMED_CALLDATA;
    }

    Bytes config = encode_lending_config(asset, sub);
    int32_t rc = require_tracked(ctx, IDENTIFIER, true, config);
    if (rc != errors::OK) return rc;
    rc = require_tracked(ctx, LendingSupplyAdaptor::IDENTIFIER, false, config);
    if (rc != errors::OK) return rc;

    rc = market_.mint(ctx.address(), sub, asset, amount);
    if (rc != errors::OK) return rc;

    auto account = LendingMarket::sub_account(ctx.address(), sub);
    if (!account) return errors::INVALID_SUB_ACCOUNT_ID;
    return require_health(market_, *account, min_self_health_factor_x18_);
}

int32_t LendingDebtAdaptor::on_self_repay(const AdaptorContext& ctx, abi::Reader& args) {
    Asset asset;
    uint32_t sub = 0;
    I128 amount = 0;
    if (!read_target(args, asset, sub) || !read_amount(args, amount)) {
        return errors::MALFORMED_CALLDATA;
    }
    return market_.burn(ctx.address(), sub, asset, amount);
}

Bytes LendingDebtAdaptor::borrow(const Asset& asset, uint32_t sub_account, I128 amount) {
    return encode_call(BORROW, asset, sub_account, amount);
}

Bytes LendingDebtAdaptor::repay(const Asset& asset, uint32_t sub_account, I128 amount) {
    return encode_call(REPAY, asset, sub_account, amount);
}

Bytes LendingDebtAdaptor::self_borrow(const Asset& asset, uint32_t sub_account, I128 amount) {
    return encode_call(SELF_BORROW, asset, sub_account, amount);
}

Bytes LendingDebtAdaptor::self_repay(const Asset& asset, uint32_t sub_account, I128 amount) {
    return encode_call(SELF_REPAY, asset, sub_account, amount);
}

} // namespace cellar
