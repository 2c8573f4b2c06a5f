#ifndef CELLAR_ADAPTOR_HPP
#define CELLAR_ADAPTOR_HPP

#include <functional>
#include <optional>
#include <unordered_map>
#include <vector>

#include "types.hpp"
#include "codec.hpp"

namespace cellar {

class Registry;

// =============================================================================
// AdaptorContext - the calling vault as adaptors see it
//
// Read-only: adaptors move funds through external protocols but never touch
// the vault's own position list or share accounting.
// =============================================================================

class AdaptorContext {
public:
    virtual ~AdaptorContext() = default;

    virtual const Address& address() const = 0;
    virtual const Registry& registry() const = 0;
    virtual bool is_position_used(PositionId id) const = 0;
};

// =============================================================================
// Adaptor Call (one entry of a strategist batch)
// =============================================================================

struct AdaptorCall {
    AdaptorId adaptor;
    std::vector<Bytes> call_data;   // each: [selector:4][arguments...]
};

// =============================================================================
// Adaptor - integration with one external protocol
//
// Adaptors are stateless with respect to vaults: one instance serves every
// position and every vault that references it. Strategist entrypoints are
// looked up by selector in a capability table filled by the constructor.
// =============================================================================

class Adaptor {
public:
    virtual ~Adaptor() = default;

    // Constant per implementation; part of every position hash
    virtual AdaptorId identifier() const = 0;
    virtual const char* name() const = 0;
    virtual bool is_debt() const = 0;

    // Checks position configuration before the registry trusts it
    virtual int32_t validate_config(const Bytes& config) const = 0;

    // Position size for owner, in units of asset_of(config). Read-only.
    virtual I128 balance_of(const Address& owner, const Bytes& config) const = 0;
    virtual std::optional<Asset> asset_of(const Bytes& config) const = 0;

    // Every asset that must be priced for the position to be trusted
    virtual std::vector<Asset> assets_used(const Bytes& config) const;

    // Portion of the position a user withdrawal can take right now
    virtual I128 withdrawable_from(const Address& owner, const Bytes& config,
                                   const Bytes& user_config) const = 0;

    // User deposit flow: assets already sit at the vault address
    virtual int32_t deposit(const AdaptorContext& ctx, I128 assets,
                            const Bytes& config, const Bytes& user_config);

    // User withdrawal flow: pay assets of this position to receiver
    virtual int32_t withdraw(const AdaptorContext& ctx, I128 assets, const Address& receiver,
                             const Bytes& config, const Bytes& user_config);

    // =========================================================================
    // Strategist Entrypoints
    // =========================================================================

    int32_t call(const AdaptorContext& ctx, const Bytes& call_data);
    bool supports(uint32_t selector) const;
    std::vector<uint32_t> selectors() const;

    // Position hash for (adaptor, is_debt, config) must map to a position the
    // calling vault currently holds
    static int32_t require_tracked(const AdaptorContext& ctx, AdaptorId adaptor,
                                   bool is_debt, const Bytes& config);

protected:
    using Handler = std::function<int32_t(const AdaptorContext&, abi::Reader&)>;

    void register_entrypoint(uint32_t selector, Handler handler);

private:
    std::unordered_map<uint32_t, Handler> entrypoints_;
};

// =============================================================================
// DebtAdaptor - liabilities are never user-withdrawable
// =============================================================================

class DebtAdaptor : public Adaptor {
public:
    bool is_debt() const final { return true; }

    I128 withdrawable_from(const Address&, const Bytes&, const Bytes&) const final { return 0; }

    int32_t deposit(const AdaptorContext&, I128, const Bytes&, const Bytes&) final {
        return errors::USER_DEPOSITS_NOT_ALLOWED;
    }

    int32_t withdraw(const AdaptorContext&, I128, const Address&, const Bytes&, const Bytes&) final {
        return errors::USER_WITHDRAWS_NOT_ALLOWED;
    }
};

} // namespace cellar

#endif // CELLAR_ADAPTOR_HPP
