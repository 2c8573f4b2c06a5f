// =============================================================================
// registry.cpp - Registry Implementation
// =============================================================================

#include "cellar/registry.hpp"
#include "cellar/codec.hpp"
#include "cellar/log.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <mutex>

namespace cellar {

namespace {

bool same_position(const PositionData& data, AdaptorId adaptor, bool is_debt, const Bytes& config) {
    return data.adaptor == adaptor && data.is_debt == is_debt && data.config_data == config;
}

} // namespace

Registry::Registry(const PriceRouter& prices)
    : prices_(prices)
    , hasher_(&Registry::position_hash) {}

// =============================================================================
// Adaptors
// =============================================================================

int32_t Registry::trust_adaptor(std::shared_ptr<Adaptor> adaptor) {
    if (!adaptor) {
        return errors::INVALID_ADAPTOR;
    }

    std::unique_lock lock(mutex_);

    AdaptorId id = adaptor->identifier();
    auto it = adaptors_.find(id);
    if (it != adaptors_.end() && it->second != adaptor) {
        // Same identifier, different implementation instance
        return errors::INVALID_ADAPTOR;
    }

    adaptors_[id] = std::move(adaptor);
    if (trusted_adaptors_.insert(id).second) {
        log::logger()->info("registry: trusted adaptor {} ({:#018x})", adaptors_[id]->name(), id);
    }
    return errors::OK;
}

int32_t Registry::distrust_adaptor(AdaptorId adaptor) {
    std::unique_lock lock(mutex_);

    if (trusted_adaptors_.erase(adaptor) == 0) {
        return errors::ADAPTOR_NOT_TRUSTED;
    }
    log::logger()->warn("registry: distrusted adaptor {:#018x}", adaptor);
    return errors::OK;
}

bool Registry::is_adaptor_trusted(AdaptorId adaptor) const {
    std::shared_lock lock(mutex_);
    return trusted_adaptors_.count(adaptor) > 0;
}

Adaptor* Registry::get_adaptor(AdaptorId adaptor) const {
    std::shared_lock lock(mutex_);
    auto it = adaptors_.find(adaptor);
    return (it != adaptors_.end()) ? it->second.get() : nullptr;
}

// =============================================================================
// Positions
// =============================================================================

int32_t Registry::trust_position(AdaptorId adaptor, const Bytes& config, PositionId& id_out) {
    std::unique_lock lock(mutex_);

    if (trusted_adaptors_.count(adaptor) == 0) {
        return errors::ADAPTOR_NOT_TRUSTED;
    }
    const Adaptor& impl = *adaptors_.at(adaptor);

    PositionHash hash = hasher_(adaptor, impl.is_debt(), config);
    auto existing = hash_to_id_.find(hash);
    if (existing != hash_to_id_.end()) {
        const PositionData& data = positions_.at(existing->second);
        if (!same_position(data, adaptor, impl.is_debt(), config)) {
            log::logger()->error("registry: position hash {:#018x} already taken by position {}",
                                 hash, data.id);
            return errors::POSITION_MISMATCH;
        }
        if (!data.trusted) {
            return errors::POSITION_NOT_TRUSTED;
        }
        id_out = data.id;
        return errors::OK;
    }

    int32_t rc = impl.validate_config(config);
    if (rc != errors::OK) {
        return rc;
    }

    for (const auto& asset : impl.assets_used(config)) {
        if (!prices_.is_supported(asset)) {
            return errors::ASSET_NOT_PRICED;
        }
    }

    PositionData data;
    data.id = next_position_id_++;
    data.adaptor = adaptor;
    data.is_debt = impl.is_debt();
    data.config_data = config;
    data.hash = hash;
    data.trusted = true;

    positions_[data.id] = data;
    hash_to_id_[hash] = data.id;
    id_out = data.id;

    log::logger()->info("registry: trusted position {} via {} (debt={})",
                        data.id, impl.name(), data.is_debt);
    return errors::OK;
}

int32_t Registry::distrust_position(PositionId id) {
    std::unique_lock lock(mutex_);

    auto it = positions_.find(id);
    if (it == positions_.end()) {
        return errors::POSITION_NOT_FOUND;
    }
    if (!it->second.trusted) {
        return errors::POSITION_NOT_TRUSTED;
    }

    it->second.trusted = false;
    log::logger()->warn("registry: distrusted position {}", id);
    return errors::OK;
}

bool Registry::is_position_trusted(PositionId id) const {
    std::shared_lock lock(mutex_);
    auto it = positions_.find(id);
    return it != positions_.end() && it->second.trusted;
}

std::optional<PositionData> Registry::get_position_data(PositionId id) const {
    std::shared_lock lock(mutex_);
    auto it = positions_.find(id);
    if (it == positions_.end()) return std::nullopt;
    return it->second;
}

PositionId Registry::position_hash_to_id(PositionHash hash) const {
    std::shared_lock lock(mutex_);
    auto it = hash_to_id_.find(hash);
    return (it != hash_to_id_.end()) ? it->second : NO_POSITION;
}

PositionId Registry::position_id_for(AdaptorId adaptor, bool is_debt, const Bytes& config) const {
    std::shared_lock lock(mutex_);
    auto it = hash_to_id_.find(hasher_(adaptor, is_debt, config));
    if (it == hash_to_id_.end()) return NO_POSITION;
    const PositionData& data = positions_.at(it->second);
    return same_position(data, adaptor, is_debt, config) ? data.id : NO_POSITION;
}

PositionHash Registry::position_hash(AdaptorId adaptor, bool is_debt, const Bytes& config) {
    abi::Writer writer;
    writer.put_u64(adaptor);
    writer.put_bool(is_debt);
    writer.put_bytes(config);
    return hash::fnv1a64(writer.bytes());
}

int32_t Registry::set_position_hasher(PositionHasher hasher) {
    std::unique_lock lock(mutex_);
    if (!positions_.empty()) return errors::ALREADY_INITIALIZED;
    hasher_ = std::move(hasher);
    return errors::OK;
}

PositionId Registry::position_count() const {
    std::shared_lock lock(mutex_);
    return static_cast<PositionId>(positions_.size());
}

// =============================================================================
// Persistence
// =============================================================================

RegistrySnapshot Registry::snapshot() const {
    std::shared_lock lock(mutex_);

    RegistrySnapshot snap;
    snap.trusted_adaptors.assign(trusted_adaptors_.begin(), trusted_adaptors_.end());
    for (const auto& [id, data] : positions_) {
        snap.positions.push_back(data);
    }
    snap.next_position_id = next_position_id_;
    return snap;
}

int32_t Registry::restore(const RegistrySnapshot& snapshot) {
    std::unique_lock lock(mutex_);

    for (AdaptorId id : snapshot.trusted_adaptors) {
        if (adaptors_.find(id) == adaptors_.end()) {
            return errors::ADAPTOR_NOT_TRUSTED;
        }
    }

    std::map<PositionId, PositionData> positions;
    std::unordered_map<PositionHash, PositionId> hash_to_id;
    PositionId max_id = 0;
    for (const auto& data : snapshot.positions) {
        if (data.id == NO_POSITION || adaptors_.find(data.adaptor) == adaptors_.end()) {
            return errors::ADAPTOR_NOT_TRUSTED;
        }
        if (hasher_(data.adaptor, data.is_debt, data.config_data) != data.hash) {
            return errors::POSITION_MISMATCH;
        }
        if (!positions.emplace(data.id, data).second ||
            !hash_to_id.emplace(data.hash, data.id).second) {
            return errors::POSITION_MISMATCH;
        }
        max_id = std::max(max_id, data.id);
    }
    if (snapshot.next_position_id <= max_id) {
        return errors::POSITION_MISMATCH;
    }

    trusted_adaptors_ = std::set<AdaptorId>(snapshot.trusted_adaptors.begin(),
                                            snapshot.trusted_adaptors.end());
    positions_ = std::move(positions);
    hash_to_id_ = std::move(hash_to_id);
    next_position_id_ = snapshot.next_position_id;

    log::logger()->info("registry: restored {} positions", positions_.size());
    return errors::OK;
}

} // namespace cellar
