// =============================================================================
// adaptor.cpp - Adaptor dispatch and tracking checks
// =============================================================================

#include "cellar/adaptor.hpp"
#include "cellar/registry.hpp"

namespace cellar {

std::vector<Asset> Adaptor::assets_used(const Bytes& config) const {
    auto asset = asset_of(config);
    if (!asset) return {};
    return {*asset};
}

int32_t Adaptor::deposit(const AdaptorContext&, I128, const Bytes&, const Bytes&) {
    return errors::USER_DEPOSITS_NOT_ALLOWED;
}

int32_t Adaptor::withdraw(const AdaptorContext&, I128, const Address&, const Bytes&, const Bytes&) {
    return errors::USER_WITHDRAWS_NOT_ALLOWED;
}

int32_t Adaptor::call(const AdaptorContext& ctx, const Bytes& call_data) {
    abi::Reader reader(call_data);
    uint32_t selector = 0;
    if (!reader.get_u32(selector)) {
        return errors::MALFORMED_CALLDATA;
    }

    auto it = entrypoints_.find(selector);
    if (it == entrypoints_.end()) {
        return errors::UNKNOWN_SELECTOR;
    }
    return it->second(ctx, reader);
}

bool Adaptor::supports(uint32_t selector) const {
    return entrypoints_.find(selector) != entrypoints_.end();
}

std::vector<uint32_t> Adaptor::selectors() const {
    std::vector<uint32_t> out;
    out.reserve(entrypoints_.size());
    for (const auto& [selector, handler] : entrypoints_) out.push_back(selector);
    return out;
}

int32_t Adaptor::require_tracked(const AdaptorContext& ctx, AdaptorId adaptor,
                                 bool is_debt, const Bytes& config) {
    PositionId id = ctx.registry().position_id_for(adaptor, is_debt, config);
    if (id == NO_POSITION || !ctx.is_position_used(id)) {
        return is_debt ? errors::DEBT_POSITIONS_MUST_BE_TRACKED
                       : errors::POSITION_MUST_BE_TRACKED;
    }
    return errors::OK;
}

void Adaptor::register_entrypoint(uint32_t selector, Handler handler) {
    entrypoints_[selector] = std::move(handler);
}

} // namespace cellar
