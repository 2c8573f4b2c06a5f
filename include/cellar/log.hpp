#ifndef CELLAR_LOG_HPP
#define CELLAR_LOG_HPP

#include <memory>
#include <string_view>

// spdlog included only in implementation files
namespace spdlog {
class logger;
}

namespace cellar {
namespace log {

// Shared "cellar" logger, created on first use
std::shared_ptr<spdlog::logger> logger();

// "trace", "debug", "info", "warn", "error", "off"; false if unrecognised
bool set_level(std::string_view level);

} // namespace log
} // namespace cellar

#endif // CELLAR_LOG_HPP
