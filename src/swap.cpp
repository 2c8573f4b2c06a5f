// =============================================================================
// swap.cpp - SwapRouter Implementation
// =============================================================================

#include "cellar/swap.hpp"
#include "cellar/codec.hpp"

namespace cellar {

// =============================================================================
// Parameter Encoding
// =============================================================================

Bytes encode_swap_params(const SwapParams& params) {
    abi::Writer writer;
    writer.put_u8(static_cast<uint8_t>(params.path.size()));
    for (const auto& asset : params.path) writer.put_asset(asset);
    writer.put_u8(static_cast<uint8_t>(params.pool_fees.size()));
    for (auto fee : params.pool_fees) writer.put_u32(fee);
    writer.put_i128(params.amount_in);
    writer.put_i128(params.min_amount_out);
    writer.put_u64(params.deadline);
    return writer.take();
}

std::optional<SwapParams> decode_swap_params(const Bytes& data) {
    abi::Reader reader(data);
    SwapParams params;

    uint8_t path_len = 0;
    if (!reader.get_u8(path_len)) return std::nullopt;
    params.path.resize(path_len);
    for (auto& asset : params.path) {
        if (!reader.get_asset(asset)) return std::nullopt;
    }

    uint8_t fee_len = 0;
    if (!reader.get_u8(fee_len)) return std::nullopt;
    params.pool_fees.resize(fee_len);
    for (auto& fee : params.pool_fees) {
        if (!reader.get_u32(fee)) return std::nullopt;
    }

    if (!reader.get_i128(params.amount_in) ||
        !reader.get_i128(params.min_amount_out) ||
        !reader.get_u64(params.deadline) ||
        !reader.at_end()) {
        return std::nullopt;
    }
    return params;
}

// =============================================================================
// SwapRouter
// =============================================================================

SwapRouter::SwapRouter(TokenLedger& tokens, const PriceRouter& prices, const Address& address)
    : tokens_(tokens)
    , prices_(prices)
    , address_(address)
    , time_source_(system_time) {}

int32_t SwapRouter::validate_path(Exchange exchange, const SwapParams& params) const {
    if (params.path.size() < 2) return errors::INVALID_SWAP_PATH;

    for (size_t i = 1; i < params.path.size(); ++i) {
        if (params.path[i] == params.path[i - 1]) return errors::INVALID_SWAP_PATH;
    }

    size_t hops = params.path.size() - 1;
    if (exchange == Exchange::UNIV3) {
        if (params.pool_fees.size() != hops) return errors::INVALID_SWAP_PATH;
        for (auto fee : params.pool_fees) {
            if (fee >= fee_tiers::FEE_DENOMINATOR) return errors::INVALID_SWAP_PATH;
        }
    } else if (!params.pool_fees.empty()) {
        return errors::INVALID_SWAP_PATH;
    }

    for (const auto& asset : params.path) {
        if (!prices_.is_supported(asset)) return errors::ASSET_NOT_PRICED;
    }
    return errors::OK;
}

std::optional<I128> SwapRouter::quote(Exchange exchange, const SwapParams& params) const {
    if (validate_path(exchange, params) != errors::OK) return std::nullopt;
    if (params.amount_in <= 0) return std::nullopt;

    I128 amount = params.amount_in;
    for (size_t hop = 0; hop + 1 < params.path.size(); ++hop) {
        auto out = prices_.get_value(params.path[hop], amount, params.path[hop + 1]);
        if (!out) return std::nullopt;

        uint32_t fee = (exchange == Exchange::UNIV3) ? params.pool_fees[hop] : v2_fee_;
        amount = x18::mul_div(*out, fee_tiers::FEE_DENOMINATOR - fee,
                              fee_tiers::FEE_DENOMINATOR, Rounding::DOWN);
    }
    return amount;
}

int32_t SwapRouter::execute_swap(const Address& sender, Exchange exchange,
                                 const Bytes& encoded_params, I128& amount_out) {
    auto params = decode_swap_params(encoded_params);
    if (!params) return errors::MALFORMED_CALLDATA;

    uint64_t now = time_source_ ? time_source_() : system_time();
    if (now > params->deadline) return errors::SWAP_DEADLINE_EXPIRED;

    int32_t rc = validate_path(exchange, *params);
    if (rc != errors::OK) return rc;
    if (params->amount_in <= 0) return errors::INVALID_AMOUNT;

    auto out = quote(exchange, *params);
    if (!out) return errors::PRICE_STALE;
    if (*out < params->min_amount_out) return errors::SLIPPAGE_EXCEEDED;

    const Asset& token_in = params->path.front();
    const Asset& token_out = params->path.back();
    if (tokens_.balance_of(token_out, address_) < *out) {
        return errors::INSUFFICIENT_LIQUIDITY;
    }

    rc = tokens_.transfer(token_in, sender, address_, params->amount_in);
    if (rc != errors::OK) return rc;

    rc = tokens_.transfer(token_out, address_, sender, *out);
    if (rc != errors::OK) return rc;

    amount_out = *out;
    return errors::OK;
}

} // namespace cellar
