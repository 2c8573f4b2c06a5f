// =============================================================================
// erc20.cpp - Erc20Adaptor Implementation
// =============================================================================

#include "cellar/adaptors/erc20.hpp"

namespace cellar {

Erc20Adaptor::Erc20Adaptor(TokenLedger& tokens) : tokens_(tokens) {}

int32_t Erc20Adaptor::validate_config(const Bytes& config) const {
    auto asset = decode_config(config);
    if (!asset || asset->is_null()) return errors::MALFORMED_CALLDATA;
    return errors::OK;
}

I128 Erc20Adaptor::balance_of(const Address& owner, const Bytes& config) const {
    auto asset = decode_config(config);
    if (!asset) return 0;
    return tokens_.balance_of(*asset, owner);
}

std::optional<Asset> Erc20Adaptor::asset_of(const Bytes& config) const {
    return decode_config(config);
}

I128 Erc20Adaptor::withdrawable_from(const Address& owner, const Bytes& config,
                                     const Bytes&) const {
    return balance_of(owner, config);
}

// Funds already sit at the vault address
int32_t Erc20Adaptor::deposit(const AdaptorContext&, I128, const Bytes&, const Bytes&) {
    return errors::OK;
}

int32_t Erc20Adaptor::withdraw(const AdaptorContext& ctx, I128 assets, const Address& receiver,
                               const Bytes& config, const Bytes&) {
    auto asset = decode_config(config);
    if (!asset) return errors::MALFORMED_CALLDATA;
    if (addresses::is_zero(receiver) || receiver == ctx.address()) return errors::INVALID_RECEIVER;
    return tokens_.transfer(*asset, ctx.address(), receiver, assets);
}

Bytes Erc20Adaptor::encode_config(const Asset& asset) {
    return abi::Writer().put_asset(asset).take();
}

std::optional<Asset> Erc20Adaptor::decode_config(const Bytes& config) {
    abi::Reader reader(config);
    Asset asset;
    if (!reader.get_asset(asset) || !reader.at_end()) return std::nullopt;
    return asset;
}

} // namespace cellar
