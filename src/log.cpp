// =============================================================================
// log.cpp - spdlog wiring
// =============================================================================

#include "cellar/log.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>

namespace cellar {
namespace log {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto existing = spdlog::get("cellar");
        if (existing) return existing;
        auto created = spdlog::stderr_color_mt("cellar");
        created->set_level(spdlog::level::info);
        return created;
    }();
    return instance;
}

bool set_level(std::string_view level) {
    auto parsed = spdlog::level::from_str(std::string(level));
    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off") return false;
    logger()->set_level(parsed);
    return true;
}

} // namespace log
} // namespace cellar
