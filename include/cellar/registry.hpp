#ifndef CELLAR_REGISTRY_HPP
#define CELLAR_REGISTRY_HPP

#include <functional>
#include <map>
#include <set>
#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <optional>
#include <vector>

#include "types.hpp"
#include "adaptor.hpp"
#include "oracle.hpp"

namespace cellar {

// =============================================================================
// Position Data
// =============================================================================

struct PositionData {
    PositionId id;
    AdaptorId adaptor;
    bool is_debt;
    Bytes config_data;
    PositionHash hash;
    bool trusted;
};

using PositionHasher = std::function<PositionHash(AdaptorId, bool, const Bytes&)>;

struct RegistrySnapshot {
    std::vector<AdaptorId> trusted_adaptors;
    std::vector<PositionData> positions;
    PositionId next_position_id;
};

// =============================================================================
// Registry - global trust list for adaptors and positions
//
// Positions are content-addressed by hash(adaptor, is_debt, config); the
// integer id is an alias allocated once and never reused. A hash hit only
// counts when the stored (adaptor, is_debt, config) matches exactly.
// Distrust only blocks new use, vaults that already hold a position keep
// valuing it.
// =============================================================================

class Registry {
public:
    explicit Registry(const PriceRouter& prices);
    ~Registry() = default;

    // Non-copyable
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // =========================================================================
    // Adaptors
    // =========================================================================

    int32_t trust_adaptor(std::shared_ptr<Adaptor> adaptor);
    int32_t distrust_adaptor(AdaptorId adaptor);
    bool is_adaptor_trusted(AdaptorId adaptor) const;

    // Any adaptor ever trusted, including distrusted ones; nullptr if unknown
    Adaptor* get_adaptor(AdaptorId adaptor) const;

    // =========================================================================
    // Positions
    // =========================================================================

    // Returns the existing id for an already trusted (adaptor, config) pair;
    // POSITION_MISMATCH when a different position owns the hash
    int32_t trust_position(AdaptorId adaptor, const Bytes& config, PositionId& id_out);
    int32_t distrust_position(PositionId id);
    bool is_position_trusted(PositionId id) const;

    std::optional<PositionData> get_position_data(PositionId id) const;

    // NO_POSITION if absent
    PositionId position_hash_to_id(PositionHash hash) const;

    // Exact lookup; NO_POSITION if absent or if the hash belongs to another position
    PositionId position_id_for(AdaptorId adaptor, bool is_debt, const Bytes& config) const;

    // FNV-1a over the encoded (adaptor, is_debt, config)
    static PositionHash position_hash(AdaptorId adaptor, bool is_debt, const Bytes& config);

    // Only before the first position is trusted
    int32_t set_position_hasher(PositionHasher hasher);

    PositionId position_count() const;

    // =========================================================================
    // Persistence
    // =========================================================================

    RegistrySnapshot snapshot() const;

    // Adaptors named in the snapshot must already be trusted
    int32_t restore(const RegistrySnapshot& snapshot);

private:
    const PriceRouter& prices_;

    std::unordered_map<AdaptorId, std::shared_ptr<Adaptor>> adaptors_;
    std::set<AdaptorId> trusted_adaptors_;

    PositionHasher hasher_;

    std::map<PositionId, PositionData> positions_;
    std::unordered_map<PositionHash, PositionId> hash_to_id_;
    PositionId next_position_id_{1};

    mutable std::shared_mutex mutex_;
};

} // namespace cellar

#endif // CELLAR_REGISTRY_HPP
