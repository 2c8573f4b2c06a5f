#ifndef CELLAR_ADAPTORS_NESTED_CELLAR_HPP
#define CELLAR_ADAPTORS_NESTED_CELLAR_HPP

#include <functional>

#include "../adaptor.hpp"
#include "../token.hpp"

namespace cellar {

class Cellar;

// Looks a cellar up by address; nullptr if unknown
using CellarResolver = std::function<Cellar*(const Address&)>;

// =============================================================================
// NestedCellarAdaptor - shares of another cellar held by the vault
//
// config: [cellar address]
// =============================================================================

class NestedCellarAdaptor : public Adaptor {
public:
    static constexpr AdaptorId IDENTIFIER = hash::fnv1a64("Cellar Nested Cellar Adaptor V 1.0");

    static constexpr uint32_t DEPOSIT_TO_CELLAR = abi::selector("depositToCellar(address,int128)");
    static constexpr uint32_t WITHDRAW_FROM_CELLAR = abi::selector("withdrawFromCellar(address,int128)");

    NestedCellarAdaptor(CellarResolver resolver, TokenLedger& tokens);

    AdaptorId identifier() const override { return IDENTIFIER; }
    const char* name() const override { return "Nested Cellar Adaptor"; }
    bool is_debt() const override { return false; }

    int32_t validate_config(const Bytes& config) const override;

    // Redemption value of owner's shares in the nested cellar's asset
    I128 balance_of(const Address& owner, const Bytes& config) const override;
    std::optional<Asset> asset_of(const Bytes& config) const override;
    I128 withdrawable_from(const Address& owner, const Bytes& config,
                           const Bytes& user_config) const override;

    int32_t deposit(const AdaptorContext& ctx, I128 assets,
                    const Bytes& config, const Bytes& user_config) override;
    int32_t withdraw(const AdaptorContext& ctx, I128 assets, const Address& receiver,
                     const Bytes& config, const Bytes& user_config) override;

    static Bytes encode_config(const Address& cellar);
    static std::optional<Address> decode_config(const Bytes& config);

    static Bytes deposit_to_cellar(const Address& cellar, I128 assets);
    static Bytes withdraw_from_cellar(const Address& cellar, I128 assets);

private:
    CellarResolver resolver_;
    TokenLedger& tokens_;

    Cellar* target(const Bytes& config) const;

    int32_t on_deposit(const AdaptorContext& ctx, abi::Reader& args);
    int32_t on_withdraw(const AdaptorContext& ctx, abi::Reader& args);
};

} // namespace cellar

#endif // CELLAR_ADAPTORS_NESTED_CELLAR_HPP
