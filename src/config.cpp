// =============================================================================
// config.cpp - JSON Configuration
// =============================================================================

#include "cellar/config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace cellar {

using json = nlohmann::json;

namespace {

Address parse_address(const json& j, const char* key) {
    auto addr = addresses::from_hex(j.at(key).get<std::string>());
    if (!addr) {
        throw std::runtime_error(std::string("Invalid address for ") + key);
    }
    return *addr;
}

// X18 values travel as decimal strings so no precision is lost
I128 parse_x18(const json& j, const char* key) {
    auto value = x18::parse(j.at(key).get<std::string>());
    if (!value) {
        throw std::runtime_error(std::string("Invalid decimal for ") + key);
    }
    return *value;
}

CellarConfig cellar_from(const json& j) {
    CellarConfig config;
    config.name = j.value("name", std::string{});
    config.address = parse_address(j, "address");
    config.asset = Asset(parse_address(j, "asset"));
    config.share_lock_period = j.value("share_lock_period", MAXIMUM_SHARE_LOCK_PERIOD);
    if (j.contains("allowed_rebalance_deviation")) {
        config.allowed_rebalance_deviation_x18 = parse_x18(j, "allowed_rebalance_deviation");
    }
    config.check_total_assets = j.value("check_total_assets", true);
    return config;
}

json parse_document(std::string_view content) {
    try {
        return json::parse(content);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Malformed config: ") + e.what());
    }
}

} // namespace

CellarConfig CellarConfig::from_json(std::string_view content) {
    json j = parse_document(content);
    try {
        return cellar_from(j);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid cellar config: ") + e.what());
    }
}

std::string CellarConfig::to_json() const {
    json j;
    j["name"] = name;
    j["address"] = addresses::to_hex(address);
    j["asset"] = addresses::to_hex(asset.addr);
    j["share_lock_period"] = share_lock_period;
    j["allowed_rebalance_deviation"] = x18::to_string(allowed_rebalance_deviation_x18);
    j["check_total_assets"] = check_total_assets;
    return j.dump(2);
}

SystemConfig SystemConfig::from_json(std::string_view content) {
    json j = parse_document(content);

    SystemConfig config;
    try {
        config.log_level = j.value("log_level", std::string("info"));
        if (j.contains("cellars")) {
            for (const auto& c : j.at("cellars")) {
                config.cellars.push_back(cellar_from(c));
            }
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid system config: ") + e.what());
    }
    return config;
}

SystemConfig SystemConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

} // namespace cellar
