#ifndef CELLAR_ADAPTORS_ERC20_HPP
#define CELLAR_ADAPTORS_ERC20_HPP

#include "../adaptor.hpp"
#include "../token.hpp"

namespace cellar {

// =============================================================================
// Erc20Adaptor - plain token balance held at the vault address
//
// config: [asset]
// =============================================================================

class Erc20Adaptor : public Adaptor {
public:
    static constexpr AdaptorId IDENTIFIER = hash::fnv1a64("Cellar ERC20 Adaptor V 1.0");

    explicit Erc20Adaptor(TokenLedger& tokens);

    AdaptorId identifier() const override { return IDENTIFIER; }
    const char* name() const override { return "ERC20 Adaptor"; }
    bool is_debt() const override { return false; }

    int32_t validate_config(const Bytes& config) const override;
    I128 balance_of(const Address& owner, const Bytes& config) const override;
    std::optional<Asset> asset_of(const Bytes& config) const override;
    I128 withdrawable_from(const Address& owner, const Bytes& config,
                           const Bytes& user_config) const override;

    int32_t deposit(const AdaptorContext& ctx, I128 assets,
                    const Bytes& config, const Bytes& user_config) override;
    int32_t withdraw(const AdaptorContext& ctx, I128 assets, const Address& receiver,
                     const Bytes& config, const Bytes& user_config) override;

    static Bytes encode_config(const Asset& asset);
    static std::optional<Asset> decode_config(const Bytes& config);

private:
    TokenLedger& tokens_;
};

} // namespace cellar

#endif // CELLAR_ADAPTORS_ERC20_HPP
