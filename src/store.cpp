// =============================================================================
// store.cpp - JSON snapshot persistence
// =============================================================================

#include "cellar/store.hpp"
#include "cellar/log.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace cellar {
namespace store {

using json = nlohmann::json;

namespace {

constexpr int SNAPSHOT_VERSION = 1;

std::string bytes_to_hex(const Bytes& data) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + data.size() * 2);
    for (uint8_t b : data) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

Bytes hex_to_bytes(const std::string& hex) {
    std::string_view digits(hex);
    if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits.remove_prefix(2);
    }
    if (digits.size() % 2 != 0) throw std::invalid_argument("odd hex length");

    Bytes out;
    out.reserve(digits.size() / 2);
    for (size_t i = 0; i < digits.size(); i += 2) {
        int hi = hex_digit(digits[i]);
        int lo = hex_digit(digits[i + 1]);
        if (hi < 0 || lo < 0) throw std::invalid_argument("bad hex digit");
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

Address address_from(const json& j) {
    auto addr = addresses::from_hex(j.get<std::string>());
    if (!addr) throw std::invalid_argument("bad address");
    return *addr;
}

I128 amount_from(const json& j) {
    auto value = x18::parse_raw(j.get<std::string>());
    if (!value) throw std::invalid_argument("bad amount");
    return *value;
}

json config_to(const CellarConfig& config) {
    return json::parse(config.to_json());
}

} // namespace

// =============================================================================
// Registry
// =============================================================================

std::string registry_to_json(const RegistrySnapshot& snapshot) {
    json positions = json::array();
    for (const auto& p : snapshot.positions) {
        positions.push_back({
            {"id", p.id},
            {"adaptor", p.adaptor},
            {"is_debt", p.is_debt},
            {"config", bytes_to_hex(p.config_data)},
            {"hash", p.hash},
            {"trusted", p.trusted}
        });
    }

    json j = {
        {"version", SNAPSHOT_VERSION},
        {"trusted_adaptors", snapshot.trusted_adaptors},
        {"positions", positions},
        {"next_position_id", snapshot.next_position_id}
    };
    return j.dump(2);
}

std::optional<RegistrySnapshot> registry_from_json(std::string_view content) {
    try {
        json j = json::parse(content);
        if (j.at("version").get<int>() != SNAPSHOT_VERSION) return std::nullopt;

        RegistrySnapshot snapshot;
        snapshot.trusted_adaptors = j.at("trusted_adaptors").get<std::vector<AdaptorId>>();
        for (const auto& p : j.at("positions")) {
            PositionData data;
            data.id = p.at("id").get<PositionId>();
            data.adaptor = p.at("adaptor").get<AdaptorId>();
            data.is_debt = p.at("is_debt").get<bool>();
            data.config_data = hex_to_bytes(p.at("config").get<std::string>());
            data.hash = p.at("hash").get<PositionHash>();
            data.trusted = p.at("trusted").get<bool>();
            snapshot.positions.push_back(std::move(data));
        }
        snapshot.next_position_id = j.at("next_position_id").get<PositionId>();
        return snapshot;
    } catch (const json::exception& e) {
        log::logger()->error("store: malformed registry snapshot: {}", e.what());
    } catch (const std::invalid_argument& e) {
        log::logger()->error("store: malformed registry snapshot: {}", e.what());
    }
    return std::nullopt;
}

// =============================================================================
// Cellar
// =============================================================================

std::string cellar_to_json(const CellarSnapshot& snapshot) {
    const CellarState& s = snapshot.state;

    json positions = json::array();
    for (const auto& [id, p] : s.positions) {
        positions.push_back({
            {"id", p.id},
            {"adaptor", p.adaptor},
            {"is_debt", p.is_debt},
            {"adaptor_data", bytes_to_hex(p.adaptor_data)},
            {"config_data", bytes_to_hex(p.config_data)}
        });
    }

    json balances = json::array();
    for (const auto& [owner, shares] : s.balances) {
        balances.push_back({{"owner", addresses::to_hex(owner)}, {"shares", x18::to_raw_string(shares)}});
    }

    json allowances = json::array();
    for (const auto& [key, shares] : s.allowances) {
        allowances.push_back({
            {"owner", addresses::to_hex(key.first)},
            {"spender", addresses::to_hex(key.second)},
            {"shares", x18::to_raw_string(shares)}
        });
    }

    json locks = json::array();
    for (const auto& [owner, start] : s.share_lock_start) {
        locks.push_back({{"owner", addresses::to_hex(owner)}, {"start", start}});
    }

    json j = {
        {"version", SNAPSHOT_VERSION},
        {"config", config_to(snapshot.config)},
        {"status", static_cast<int>(s.status)},
        {"adaptor_catalogue", s.adaptor_catalogue},
        {"position_catalogue", s.position_catalogue},
        {"credit_positions", s.credit_positions},
        {"debt_positions", s.debt_positions},
        {"positions", positions},
        {"holding_position", s.holding_position},
        {"total_supply", x18::to_raw_string(s.total_supply)},
        {"balances", balances},
        {"allowances", allowances},
        {"share_lock_start", locks},
        {"share_lock_period", s.share_lock_period},
        {"allowed_rebalance_deviation", x18::to_string(s.allowed_rebalance_deviation_x18)},
        {"check_total_assets", s.check_total_assets}
    };
    return j.dump(2);
}

std::optional<CellarSnapshot> cellar_from_json(std::string_view content) {
    try {
        json j = json::parse(content);
        if (j.at("version").get<int>() != SNAPSHOT_VERSION) return std::nullopt;

        CellarSnapshot snapshot;
        snapshot.config = CellarConfig::from_json(j.at("config").dump());

        CellarState& s = snapshot.state;
        int status = j.at("status").get<int>();
        if (status < 0 || status > static_cast<int>(CellarStatus::SHUTDOWN)) return std::nullopt;
        s.status = static_cast<CellarStatus>(status);

        s.adaptor_catalogue = j.at("adaptor_catalogue").get<std::set<AdaptorId>>();
        s.position_catalogue = j.at("position_catalogue").get<std::set<PositionId>>();
        s.credit_positions = j.at("credit_positions").get<std::vector<PositionId>>();
        s.debt_positions = j.at("debt_positions").get<std::vector<PositionId>>();

        for (const auto& p : j.at("positions")) {
            ActivePosition pos;
            pos.id = p.at("id").get<PositionId>();
            pos.adaptor = p.at("adaptor").get<AdaptorId>();
            pos.is_debt = p.at("is_debt").get<bool>();
            pos.adaptor_data = hex_to_bytes(p.at("adaptor_data").get<std::string>());
            pos.config_data = hex_to_bytes(p.at("config_data").get<std::string>());
            s.positions[pos.id] = std::move(pos);
        }

        s.holding_position = j.at("holding_position").get<PositionId>();
        s.total_supply = amount_from(j.at("total_supply"));

        for (const auto& b : j.at("balances")) {
            s.balances[address_from(b.at("owner"))] = amount_from(b.at("shares"));
        }
        for (const auto& a : j.at("allowances")) {
            s.allowances[std::make_pair(address_from(a.at("owner")), address_from(a.at("spender")))] =
                amount_from(a.at("shares"));
        }
        for (const auto& l : j.at("share_lock_start")) {
            s.share_lock_start[address_from(l.at("owner"))] = l.at("start").get<uint64_t>();
        }

        s.share_lock_period = j.at("share_lock_period").get<uint64_t>();
        auto deviation = x18::parse(j.at("allowed_rebalance_deviation").get<std::string>());
        if (!deviation) return std::nullopt;
        s.allowed_rebalance_deviation_x18 = *deviation;
        s.check_total_assets = j.at("check_total_assets").get<bool>();
        return snapshot;
    } catch (const json::exception& e) {
        log::logger()->error("store: malformed cellar snapshot: {}", e.what());
    } catch (const std::invalid_argument& e) {
        log::logger()->error("store: malformed cellar snapshot: {}", e.what());
    } catch (const std::runtime_error& e) {
        log::logger()->error("store: malformed cellar snapshot: {}", e.what());
    }
    return std::nullopt;
}

// =============================================================================
// Files
// =============================================================================

bool save_file(const std::string& path, std::string_view content) {
    std::ofstream file{path, std::ios::trunc};
    if (!file.is_open()) {
        log::logger()->error("store: cannot open {} for writing", path);
        return false;
    }
    file << content;
    return static_cast<bool>(file);
}

std::optional<std::string> load_file(const std::string& path) {
    std::ifstream file{path};
    if (!file.is_open()) {
        log::logger()->error("store: cannot open {}", path);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace store
} // namespace cellar
