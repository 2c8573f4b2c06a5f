#ifndef CELLAR_STORE_HPP
#define CELLAR_STORE_HPP

#include <optional>
#include <string>
#include <string_view>

#include "registry.hpp"
#include "cellar.hpp"

namespace cellar {
namespace store {

// =============================================================================
// JSON Snapshots
//
// Amounts are raw X18 integers as decimal strings, byte strings are 0x-hex.
// Parsers return nullopt on malformed documents.
// =============================================================================

std::string registry_to_json(const RegistrySnapshot& snapshot);
std::optional<RegistrySnapshot> registry_from_json(std::string_view content);

std::string cellar_to_json(const CellarSnapshot& snapshot);
std::optional<CellarSnapshot> cellar_from_json(std::string_view content);

// =============================================================================
// Files
// =============================================================================

bool save_file(const std::string& path, std::string_view content);
std::optional<std::string> load_file(const std::string& path);

} // namespace store
} // namespace cellar

#endif // CELLAR_STORE_HPP
