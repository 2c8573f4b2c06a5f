// =============================================================================
// types.cpp - Fixed-point helpers, address encoding, error names
// =============================================================================

#include "cellar/types.hpp"
#include <chrono>
#include <algorithm>

namespace cellar {

namespace {

constexpr U128 MASK64 = 0xFFFFFFFFFFFFFFFFULL;

struct U256 {
    U128 hi;
    U128 lo;
};

U256 mul_wide(U128 a, U128 b) {
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);

    U256 r;
    r.lo = (p0 & MASK64) | (mid << 64);
    r.hi = p3 + (p1 >> 64) + (p2 >> 64) + (mid >> 64);
    return r;
}

// Restoring long division; false when the quotient needs more than 128 bits
bool div_wide(const U256& n, U128 d, U128& quotient, U128& remainder) {
    if (n.hi >= d) return false;

    U128 r = n.hi;
    U128 q = 0;
    for (int i = 127; i >= 0; --i) {
        bool carry = (r >> 127) != 0;
        r = (r << 1) | ((n.lo >> i) & 1);
        q <<= 1;
        if (carry || r >= d) {
            r -= d;
            q |= 1;
        }
    }
    quotient = q;
    remainder = r;
    return true;
}

U128 magnitude(I128 v) {
    return v < 0 ? static_cast<U128>(0) - static_cast<U128>(v) : static_cast<U128>(v);
}

std::string u128_to_string(U128 v) {
    if (v == 0) return "0";
    std::string out;
    while (v > 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

// Parse unsigned decimal digits into an I128, refusing overflow
bool parse_digits(std::string_view digits, I128& out) {
    I128 value = 0;
    for (char c : digits) {
        if (c < '0' || c > '9') return false;
        int d = c - '0';
        if (value > (I128_MAX - d) / 10) return false;
        value = value * 10 + d;
    }
    out = value;
    return true;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

// =============================================================================
// Addresses
// =============================================================================

namespace addresses {

std::string to_hex(const Address& addr) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(42);
    for (auto b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

std::optional<Address> from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() != 40) return std::nullopt;

    Address addr{};
    for (size_t i = 0; i < 20; ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

} // namespace addresses

// =============================================================================
// X18
// =============================================================================

namespace x18 {

I128 mul_div(I128 a, I128 b, I128 c, Rounding rounding) {
    bool negative = ((a < 0) != (b < 0)) != (c < 0);
    if (a == 0 || b == 0) return 0;
    if (c == 0) return ((a < 0) != (b < 0)) ? -I128_MAX : I128_MAX;

    U128 q = 0;
    U128 rem = 0;
    if (!div_wide(mul_wide(magnitude(a), magnitude(b)), magnitude(c), q, rem)) {
        return negative ? -I128_MAX : I128_MAX;
    }
    if (rounding == Rounding::UP && rem != 0) {
        if (q >= static_cast<U128>(I128_MAX)) {
            return negative ? -I128_MAX : I128_MAX;
        }
        ++q;
    }
    if (q > static_cast<U128>(I128_MAX)) {
        return negative ? -I128_MAX : I128_MAX;
    }
    return negative ? -static_cast<I128>(q) : static_cast<I128>(q);
}

std::optional<I128> parse(std::string_view s) {
    if (s.empty()) return std::nullopt;

    bool negative = false;
    if (s[0] == '-' || s[0] == '+') {
        negative = (s[0] == '-');
        s.remove_prefix(1);
    }
    if (s.empty()) return std::nullopt;

    std::string_view int_part = s;
    std::string_view frac_part;
    auto dot = s.find('.');
    if (dot != std::string_view::npos) {
        int_part = s.substr(0, dot);
        frac_part = s.substr(dot + 1);
    }
    if (int_part.empty() && frac_part.empty()) return std::nullopt;

    I128 int_val = 0;
    if (!int_part.empty() && !parse_digits(int_part, int_val)) return std::nullopt;
    if (int_val > I128_MAX / X18_ONE) return std::nullopt;

    // Pad or truncate to 18 digits
    std::string frac_str(frac_part);
    if (frac_str.size() < 18) {
        frac_str.append(18 - frac_str.size(), '0');
    } else if (frac_str.size() > 18) {
        frac_str = frac_str.substr(0, 18);
    }
    I128 frac_val = 0;
    if (!parse_digits(frac_str, frac_val)) return std::nullopt;

    I128 result = int_val * X18_ONE;
    if (result > I128_MAX - frac_val) return std::nullopt;
    result += frac_val;
    return negative ? -result : result;
}

std::string to_string(I128 v) {
    U128 abs_val = magnitude(v);
    U128 scale = static_cast<U128>(X18_ONE);

    std::string result = v < 0 ? "-" : "";
    result += u128_to_string(abs_val / scale);

    std::string frac = u128_to_string(abs_val % scale);
    frac.insert(0, 18 - frac.size(), '0');
    size_t last_non_zero = frac.find_last_not_of('0');
    if (last_non_zero != std::string::npos) {
        result += '.';
        result += frac.substr(0, last_non_zero + 1);
    }
    return result;
}

std::string to_raw_string(I128 v) {
    return (v < 0 ? "-" : "") + u128_to_string(magnitude(v));
}

std::optional<I128> parse_raw(std::string_view s) {
    if (s.empty()) return std::nullopt;
    bool negative = s[0] == '-';
    if (negative) s.remove_prefix(1);
    if (s.empty()) return std::nullopt;
    I128 value = 0;
    if (!parse_digits(s, value)) return std::nullopt;
    return negative ? -value : value;
}

} // namespace x18

// =============================================================================
// Time
// =============================================================================

uint64_t system_time() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

// =============================================================================
// Error Names
// =============================================================================

namespace errors {

const char* name(int32_t code) {
    switch (code) {
        case OK: return "OK";
        case INVALID_ADAPTOR: return "INVALID_ADAPTOR";
        case ADAPTOR_NOT_TRUSTED: return "ADAPTOR_NOT_TRUSTED";
        case POSITION_NOT_TRUSTED: return "POSITION_NOT_TRUSTED";
        case POSITION_NOT_FOUND: return "POSITION_NOT_FOUND";
        case ADAPTOR_NOT_IN_CATALOGUE: return "ADAPTOR_NOT_IN_CATALOGUE";
        case POSITION_NOT_IN_CATALOGUE: return "POSITION_NOT_IN_CATALOGUE";
        case DEBT_POSITIONS_MUST_BE_TRACKED: return "DEBT_POSITIONS_MUST_BE_TRACKED";
        case POSITION_MUST_BE_TRACKED: return "POSITION_MUST_BE_TRACKED";
        case UNAUTHORIZED: return "UNAUTHORIZED";
        case REENTRANCY: return "REENTRANCY";
        case POSITION_STILL_TRUSTED: return "POSITION_STILL_TRUSTED";
        case NOT_INITIALIZED: return "NOT_INITIALIZED";
        case ALREADY_INITIALIZED: return "ALREADY_INITIALIZED";
        case POSITION_ALREADY_USED: return "POSITION_ALREADY_USED";
        case POSITION_IN_USE: return "POSITION_IN_USE";
        case POSITION_ARRAY_FULL: return "POSITION_ARRAY_FULL";
        case INVALID_INDEX: return "INVALID_INDEX";
        case DEBT_MISMATCH: return "DEBT_MISMATCH";
        case ASSET_MISMATCH: return "ASSET_MISMATCH";
        case POSITION_MISMATCH: return "POSITION_MISMATCH";
        case REMOVING_HOLDING_POSITION: return "REMOVING_HOLDING_POSITION";
        case INVALID_SHARE_LOCK_PERIOD: return "INVALID_SHARE_LOCK_PERIOD";
        case INVALID_REBALANCE_DEVIATION: return "INVALID_REBALANCE_DEVIATION";
        case SHUTDOWN: return "SHUTDOWN";
        case NOT_SHUTDOWN: return "NOT_SHUTDOWN";
        case INVALID_RECEIVER: return "INVALID_RECEIVER";
        case HEALTH_FACTOR_TOO_LOW: return "HEALTH_FACTOR_TOO_LOW";
        case INSUFFICIENT_COLLATERAL: return "INSUFFICIENT_COLLATERAL";
        case WITHDRAW_EXCEEDS_LIQUIDITY: return "WITHDRAW_EXCEEDS_LIQUIDITY";
        case INCOMPLETE_WITHDRAW: return "INCOMPLETE_WITHDRAW";
        case SHARES_ARE_LOCKED: return "SHARES_ARE_LOCKED";
        case TOTAL_ASSETS_DEVIATION: return "TOTAL_ASSETS_DEVIATION";
        case TOTAL_SUPPLY_CHANGED: return "TOTAL_SUPPLY_CHANGED";
        case POSITION_NOT_EMPTY: return "POSITION_NOT_EMPTY";
        case VAULT_INSOLVENT: return "VAULT_INSOLVENT";
        case ZERO_SHARES: return "ZERO_SHARES";
        case ZERO_ASSETS: return "ZERO_ASSETS";
        case INVALID_AMOUNT: return "INVALID_AMOUNT";
        case UNDERLYING_NOT_SUPPORTED: return "UNDERLYING_NOT_SUPPORTED";
        case INSUFFICIENT_BALANCE: return "INSUFFICIENT_BALANCE";
        case INSUFFICIENT_LIQUIDITY: return "INSUFFICIENT_LIQUIDITY";
        case SLIPPAGE_EXCEEDED: return "SLIPPAGE_EXCEEDED";
        case SWAP_DEADLINE_EXPIRED: return "SWAP_DEADLINE_EXPIRED";
        case INVALID_SWAP_PATH: return "INVALID_SWAP_PATH";
        case ASSET_NOT_PRICED: return "ASSET_NOT_PRICED";
        case PRICE_STALE: return "PRICE_STALE";
        case INVALID_PRICE: return "INVALID_PRICE";
        case MARKET_ALREADY_EXISTS: return "MARKET_ALREADY_EXISTS";
        case CELLAR_NOT_FOUND: return "CELLAR_NOT_FOUND";
        case USER_DEPOSITS_NOT_ALLOWED: return "USER_DEPOSITS_NOT_ALLOWED";
        case USER_WITHDRAWS_NOT_ALLOWED: return "USER_WITHDRAWS_NOT_ALLOWED";
        case ADAPTOR_HAS_NO_POSITIONS: return "ADAPTOR_HAS_NO_POSITIONS";
        case UNKNOWN_SELECTOR: return "UNKNOWN_SELECTOR";
        case MALFORMED_CALLDATA: return "MALFORMED_CALLDATA";
        case INVALID_SUB_ACCOUNT_ID: return "INVALID_SUB_ACCOUNT_ID";
        default: return "UNKNOWN_ERROR";
    }
}

} // namespace errors

} // namespace cellar
