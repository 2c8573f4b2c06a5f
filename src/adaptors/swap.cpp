// =============================================================================
// swap.cpp - SwapAdaptor Implementation
// =============================================================================

#include "cellar/adaptors/swap.hpp"
#include "cellar/adaptors/erc20.hpp"

namespace cellar {

SwapAdaptor::SwapAdaptor(SwapRouter& router) : router_(router) {
    register_entrypoint(SWAP, [this](const AdaptorContext& ctx, abi::Reader& args) {
        return on_swap(ctx, args);
    });
}

int32_t SwapAdaptor::on_swap(const AdaptorContext& ctx, abi::Reader& args) {
    uint8_t exchange = 0;
    Bytes params;
    if (!args.get_u8(exchange) || !args.get_bytes(params) || !args.at_end()) {
        return errors::MALFORMED_CALLDATA;
    }
    if (exchange > static_cast<uint8_t>(Exchange::UNIV3)) {
        return errors::MALFORMED_CALLDATA;
    }

    auto decoded = decode_swap_params(params);
    if (!decoded || decoded->path.empty()) {
        return errors::MALFORMED_CALLDATA;
    }

    // Swap output must land in a position the vault values
    const Asset& token_out = decoded->path.back();
    int32_t rc = require_tracked(ctx, Erc20Adaptor::IDENTIFIER, false,
                                 Erc20Adaptor::encode_config(token_out));
    if (rc != errors::OK) return rc;

    I128 amount_out = 0;
    return router_.execute_swap(ctx.address(), static_cast<Exchange>(exchange), params, amount_out);
}

Bytes SwapAdaptor::swap(Exchange exchange, const SwapParams& params) {
    return abi::Writer(SWAP)
        .put_u8(static_cast<uint8_t>(exchange))
        .put_bytes(encode_swap_params(params))
        .take();
}

} // namespace cellar
