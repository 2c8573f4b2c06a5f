#ifndef CELLAR_TYPES_HPP
#define CELLAR_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <optional>
#include <vector>
#include <functional>
#include <limits>

namespace cellar {

// =============================================================================
// Addresses (20-byte account / token identifiers)
// =============================================================================

using Address = std::array<uint8_t, 20>;
using Bytes = std::vector<uint8_t>;

namespace addresses {

// Helper to create a deterministic address from a small integer
constexpr Address from_id(uint32_t id) {
    Address addr = {};
    addr[16] = static_cast<uint8_t>((id >> 24) & 0xFF);
    addr[17] = static_cast<uint8_t>((id >> 16) & 0xFF);
    addr[18] = static_cast<uint8_t>((id >> 8) & 0xFF);
    addr[19] = static_cast<uint8_t>(id & 0xFF);
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (auto b : addr) {
        if (b != 0) return false;
    }
    return true;
}

// "0x" + 40 lowercase hex digits
std::string to_hex(const Address& addr);

// Accepts with or without "0x" prefix; nullopt on bad length or digit
std::optional<Address> from_hex(std::string_view hex);

} // namespace addresses

struct AddressHash {
    size_t operator()(const Address& addr) const {
        uint64_t h = 1469598103934665603ULL;
        for (auto b : addr) {
            h ^= b;
            h *= 1099511628211ULL;
        }
        return static_cast<size_t>(h);
    }
};

// =============================================================================
// Fixed-Point Arithmetic (X18 = 18 decimal places)
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

constexpr I128 X18_ONE = 1000000000000000000LL;  // 1e18
constexpr I128 X18_HALF = 500000000000000000LL;  // 0.5e18
constexpr I128 I128_MAX = static_cast<I128>(~static_cast<U128>(0) >> 1);

// Sentinel for "use the whole available balance" in strategist calls
constexpr I128 AMOUNT_MAX = I128_MAX;

enum class Rounding : uint8_t {
    DOWN = 0,   // toward zero
    UP = 1      // away from zero
};

namespace x18 {

// a * b / c with a 256-bit intermediate. Saturates at +/-I128_MAX,
// including when c == 0.
I128 mul_div(I128 a, I128 b, I128 c, Rounding rounding = Rounding::DOWN);

inline I128 mul(I128 a, I128 b, Rounding rounding = Rounding::DOWN) {
    return mul_div(a, b, X18_ONE, rounding);
}

inline I128 div(I128 a, I128 b, Rounding rounding = Rounding::DOWN) {
    return mul_div(a, X18_ONE, b, rounding);
}

inline I128 add_sat(I128 a, I128 b) {
    if (b > 0 && a > I128_MAX - b) return I128_MAX;
    if (b < 0 && a < -I128_MAX - b) return -I128_MAX;
    return a + b;
}

inline I128 from_double(double v) {
    return static_cast<I128>(v * static_cast<double>(X18_ONE));
}

inline double to_double(I128 v) {
    return static_cast<double>(v) / static_cast<double>(X18_ONE);
}

inline I128 from_int(int64_t v) {
    return static_cast<I128>(v) * X18_ONE;
}

inline int64_t to_int(I128 v) {
    return static_cast<int64_t>(v / X18_ONE);
}

// Exact decimal parsing ("12.5", "-0.003"); nullopt on malformed input
std::optional<I128> parse(std::string_view s);

// Decimal rendering with trailing zeros trimmed ("12.5", "0.003")
std::string to_string(I128 v);

// Raw integer rendering of the scaled value
std::string to_raw_string(I128 v);
std::optional<I128> parse_raw(std::string_view s);

} // namespace x18

// =============================================================================
// Asset (Token Address)
// =============================================================================

struct Asset {
    Address addr;

    Asset() : addr{} {}
    explicit Asset(const Address& a) : addr(a) {}

    bool is_null() const { return addresses::is_zero(addr); }

    bool operator==(const Asset& other) const { return addr == other.addr; }
    bool operator!=(const Asset& other) const { return addr != other.addr; }
    bool operator<(const Asset& other) const { return addr < other.addr; }
};

struct AssetHash {
    size_t operator()(const Asset& asset) const { return AddressHash{}(asset.addr); }
};

// =============================================================================
// Identifiers
// =============================================================================

using PositionId = uint32_t;    // 0 = absent
using PositionHash = uint64_t;
using AdaptorId = uint64_t;

constexpr PositionId NO_POSITION = 0;

// =============================================================================
// Time
// =============================================================================

using TimeSource = std::function<uint64_t()>;

// Seconds since epoch from the system clock
uint64_t system_time();

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;

// Trust / authorization
constexpr int32_t INVALID_ADAPTOR = -1;
constexpr int32_t ADAPTOR_NOT_TRUSTED = -2;
constexpr int32_t POSITION_NOT_TRUSTED = -3;
constexpr int32_t POSITION_NOT_FOUND = -4;
constexpr int32_t ADAPTOR_NOT_IN_CATALOGUE = -5;
constexpr int32_t POSITION_NOT_IN_CATALOGUE = -6;
constexpr int32_t DEBT_POSITIONS_MUST_BE_TRACKED = -7;
constexpr int32_t POSITION_MUST_BE_TRACKED = -8;
constexpr int32_t UNAUTHORIZED = -9;
constexpr int32_t REENTRANCY = -10;
constexpr int32_t POSITION_STILL_TRUSTED = -11;

// Ledger structure
constexpr int32_t NOT_INITIALIZED = -20;
constexpr int32_t ALREADY_INITIALIZED = -21;
constexpr int32_t POSITION_ALREADY_USED = -22;
constexpr int32_t POSITION_IN_USE = -23;
constexpr int32_t POSITION_ARRAY_FULL = -24;
constexpr int32_t INVALID_INDEX = -25;
constexpr int32_t DEBT_MISMATCH = -26;
constexpr int32_t ASSET_MISMATCH = -27;
constexpr int32_t POSITION_MISMATCH = -28;
constexpr int32_t REMOVING_HOLDING_POSITION = -29;
constexpr int32_t INVALID_SHARE_LOCK_PERIOD = -30;
constexpr int32_t INVALID_REBALANCE_DEVIATION = -31;
constexpr int32_t SHUTDOWN = -32;
constexpr int32_t NOT_SHUTDOWN = -33;
constexpr int32_t INVALID_RECEIVER = -34;

// Invariant violations
constexpr int32_t HEALTH_FACTOR_TOO_LOW = -40;
constexpr int32_t INSUFFICIENT_COLLATERAL = -41;
constexpr int32_t WITHDRAW_EXCEEDS_LIQUIDITY = -42;
constexpr int32_t INCOMPLETE_WITHDRAW = -43;
constexpr int32_t SHARES_ARE_LOCKED = -44;
constexpr int32_t TOTAL_ASSETS_DEVIATION = -45;
constexpr int32_t TOTAL_SUPPLY_CHANGED = -46;
constexpr int32_t POSITION_NOT_EMPTY = -47;
constexpr int32_t VAULT_INSOLVENT = -48;
constexpr int32_t ZERO_SHARES = -49;
constexpr int32_t ZERO_ASSETS = -50;
constexpr int32_t INVALID_AMOUNT = -51;

// External protocol
constexpr int32_t UNDERLYING_NOT_SUPPORTED = -60;
constexpr int32_t INSUFFICIENT_BALANCE = -61;
constexpr int32_t INSUFFICIENT_LIQUIDITY = -62;
constexpr int32_t SLIPPAGE_EXCEEDED = -63;
constexpr int32_t SWAP_DEADLINE_EXPIRED = -64;
constexpr int32_t INVALID_SWAP_PATH = -65;
constexpr int32_t ASSET_NOT_PRICED = -66;
constexpr int32_t PRICE_STALE = -67;
constexpr int32_t INVALID_PRICE = -68;
constexpr int32_t MARKET_ALREADY_EXISTS = -69;
constexpr int32_t CELLAR_NOT_FOUND = -70;

// Structural capability refusals
constexpr int32_t USER_DEPOSITS_NOT_ALLOWED = -80;
constexpr int32_t USER_WITHDRAWS_NOT_ALLOWED = -81;
constexpr int32_t ADAPTOR_HAS_NO_POSITIONS = -82;
constexpr int32_t UNKNOWN_SELECTOR = -83;
constexpr int32_t MALFORMED_CALLDATA = -84;
constexpr int32_t INVALID_SUB_ACCOUNT_ID = -85;

const char* name(int32_t code);
} // namespace errors

} // namespace cellar

#endif // CELLAR_TYPES_HPP
