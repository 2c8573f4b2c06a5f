// =============================================================================
// nested_cellar.cpp - NestedCellarAdaptor Implementation
// =============================================================================

#include "cellar/adaptors/nested_cellar.hpp"
#include "cellar/cellar.hpp"

namespace cellar {

NestedCellarAdaptor::NestedCellarAdaptor(CellarResolver resolver, TokenLedger& tokens)
    : resolver_(std::move(resolver))
    , tokens_(tokens) {
    register_entrypoint(DEPOSIT_TO_CELLAR, [this](const AdaptorContext& ctx, abi::Reader& args) {
        return on_deposit(ctx, args);
    });
    register_entrypoint(WITHDRAW_FROM_CELLAR, [this](const AdaptorContext& ctx, abi::Reader& args) {
        return on_withdraw(ctx, args);
    });
}

Cellar* NestedCellarAdaptor::target(const Bytes& config) const {
    auto addr = decode_config(config);
    if (!addr || !resolver_) return nullptr;
    return resolver_(*addr);
}

int32_t NestedCellarAdaptor::validate_config(const Bytes& config) const {
    auto addr = decode_config(config);
    if (!addr) return errors::MALFORMED_CALLDATA;
    Cellar* cellar = resolver_ ? resolver_(*addr) : nullptr;
    if (!cellar) return errors::CELLAR_NOT_FOUND;
    if (cellar->status() == CellarStatus::UNINITIALIZED) return errors::NOT_INITIALIZED;
    return errors::OK;
}

I128 NestedCellarAdaptor::balance_of(const Address& owner, const Bytes& config) const {
    Cellar* cellar = target(config);
    if (!cellar) return 0;
    I128 shares = cellar->balance_of(owner);
    if (shares == 0) return 0;
    return cellar->preview_redeem(shares).value_or(0);
}

std::optional<Asset> NestedCellarAdaptor::asset_of(const Bytes& config) const {
    Cellar* cellar = target(config);
    if (!cellar) return std::nullopt;
    return cellar->asset();
}

I128 NestedCellarAdaptor::withdrawable_from(const Address& owner, const Bytes& config,
                                            const Bytes&) const {
    Cellar* cellar = target(config);
    if (!cellar) return 0;
    return cellar->max_withdraw(owner);
}

int32_t NestedCellarAdaptor::deposit(const AdaptorContext& ctx, I128 assets,
                                     const Bytes& config, const Bytes&) {
    Cellar* cellar = target(config);
    if (!cellar) return errors::CELLAR_NOT_FOUND;
    if (cellar->address() == ctx.address()) return errors::INVALID_RECEIVER;

    I128 shares = 0;
    return cellar->deposit(ctx.address(), assets, ctx.address(), shares);
}

int32_t NestedCellarAdaptor::withdraw(const AdaptorContext& ctx, I128 assets, const Address& receiver,
                                      const Bytes& config, const Bytes&) {
    Cellar* cellar = target(config);
    if (!cellar) return errors::CELLAR_NOT_FOUND;

    I128 shares = 0;
    return cellar->withdraw(ctx.address(), assets, receiver, ctx.address(), shares);
}

// =============================================================================
// Strategist Entrypoints
// =============================================================================

int32_t NestedCellarAdaptor::on_deposit(const AdaptorContext& ctx, abi::Reader& args) {
    Address target_addr{};
    I128 assets = 0;
    if (!args.get_address(target_addr) || !args.get_i128(assets) || !args.at_end()) {
        return errors::MALFORMED_CALLDATA;
    }

    Bytes config = encode_config(target_addr);
    int32_t rc = require_tracked(ctx, IDENTIFIER, false, config);
    if (rc != errors::OK) return rc;

    Cellar* cellar = target(config);
    if (!cellar) return errors::CELLAR_NOT_FOUND;
    if (cellar->address() == ctx.address()) return errors::INVALID_RECEIVER;

    if (assets == AMOUNT_MAX) {
        assets = tokens_.balance_of(cellar->asset(), ctx.address());
    }

    I128 shares = 0;
    return cellar->deposit(ctx.address(), assets, ctx.address(), shares);
}

int32_t NestedCellarAdaptor::on_withdraw(const AdaptorContext& ctx, abi::Reader& args) {
    Address target_addr{};
    I128 assets = 0;
    if (!args.get_address(target_addr) || !args.get_i128(assets) || !args.at_end()) {
        return errors::MALFORMED_CALLDATA;
    }

    Cellar* cellar = target(encode_config(target_addr));
    if (!cellar) return errors::CELLAR_NOT_FOUND;

    if (assets == AMOUNT_MAX) {
        assets = cellar->max_withdraw(ctx.address());
    }

    I128 shares = 0;
    return cellar->withdraw(ctx.address(), assets, ctx.address(), ctx.address(), shares);
}

Bytes NestedCellarAdaptor::encode_config(const Address& cellar) {
    return abi::Writer().put_address(cellar).take();
}

std::optional<Address> NestedCellarAdaptor::decode_config(const Bytes& config) {
    abi::Reader reader(config);
    Address addr{};
    if (!reader.get_address(addr) || !reader.at_end()) return std::nullopt;
    return addr;
}

Bytes NestedCellarAdaptor::deposit_to_cellar(const Address& cellar, I128 assets) {
    return abi::Writer(DEPOSIT_TO_CELLAR).put_address(cellar).put_i128(assets).take();
}

Bytes NestedCellarAdaptor::withdraw_from_cellar(const Address& cellar, I128 assets) {
    return abi::Writer(WITHDRAW_FROM_CELLAR).put_address(cellar).put_i128(assets).take();
}

} // namespace cellar
