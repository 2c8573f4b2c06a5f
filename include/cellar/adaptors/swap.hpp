#ifndef CELLAR_ADAPTORS_SWAP_HPP
#define CELLAR_ADAPTORS_SWAP_HPP

#include "../adaptor.hpp"
#include "../swap.hpp"

namespace cellar {

// =============================================================================
// SwapAdaptor - strategist swaps through the swap router; holds no positions
// =============================================================================

class SwapAdaptor : public Adaptor {
public:
    static constexpr AdaptorId IDENTIFIER = hash::fnv1a64("Cellar Swap Adaptor V 1.0");

    static constexpr uint32_t SWAP = abi::selector("swap(uint8,bytes)");

    explicit SwapAdaptor(SwapRouter& router);

    AdaptorId identifier() const override { return IDENTIFIER; }
    const char* name() const override { return "Swap Adaptor"; }
    bool is_debt() const override { return false; }

    int32_t validate_config(const Bytes&) const override { return errors::ADAPTOR_HAS_NO_POSITIONS; }
    I128 balance_of(const Address&, const Bytes&) const override { return 0; }
    std::optional<Asset> asset_of(const Bytes&) const override { return std::nullopt; }
    I128 withdrawable_from(const Address&, const Bytes&, const Bytes&) const override { return 0; }

    static Bytes swap(Exchange exchange, const SwapParams& params);

private:
    SwapRouter& router_;

    int32_t on_swap(const AdaptorContext& ctx, abi::Reader& args);
};

} // namespace cellar

#endif // CELLAR_ADAPTORS_SWAP_HPP
