#ifndef CELLAR_SWAP_HPP
#define CELLAR_SWAP_HPP

#include <map>
#include <optional>
#include <vector>

#include "types.hpp"
#include "token.hpp"
#include "oracle.hpp"

namespace cellar {

// =============================================================================
// Exchange Selection
// =============================================================================

enum class Exchange : uint8_t {
    UNIV2 = 0,   // flat fee per hop
    UNIV3 = 1    // fee tier chosen per hop
};

// Fee tiers in hundredths of a bip (3000 = 0.30%)
namespace fee_tiers {
constexpr uint32_t FEE_001 = 100;
constexpr uint32_t FEE_005 = 500;
constexpr uint32_t FEE_030 = 3000;
constexpr uint32_t FEE_100 = 10000;
constexpr uint32_t FEE_DENOMINATOR = 1000000;
}

// =============================================================================
// Swap Parameters
// =============================================================================

struct SwapParams {
    std::vector<Asset> path;         // token_in ... token_out
    std::vector<uint32_t> pool_fees; // UNIV3: one per hop; UNIV2: empty
    I128 amount_in;
    I128 min_amount_out;
    uint64_t deadline;               // seconds since epoch
};

Bytes encode_swap_params(const SwapParams& params);
std::optional<SwapParams> decode_swap_params(const Bytes& data);

// =============================================================================
// SwapRouter - oracle-priced swap execution against router inventory
// =============================================================================

class SwapRouter {
public:
    SwapRouter(TokenLedger& tokens, const PriceRouter& prices, const Address& address);
    ~SwapRouter() = default;

    // Non-copyable
    SwapRouter(const SwapRouter&) = delete;
    SwapRouter& operator=(const SwapRouter&) = delete;

    const Address& address() const { return address_; }

    // Pulls amount_in from sender and pays the output asset back to sender
    int32_t execute_swap(const Address& sender, Exchange exchange,
                         const Bytes& encoded_params, I128& amount_out);

    // Output for params without moving funds
    std::optional<I128> quote(Exchange exchange, const SwapParams& params) const;

    void set_v2_fee(uint32_t fee) { v2_fee_ = fee; }
    uint32_t v2_fee() const { return v2_fee_; }

    void set_time_source(TimeSource source) { time_source_ = std::move(source); }

private:
    TokenLedger& tokens_;
    const PriceRouter& prices_;
    Address address_;
    uint32_t v2_fee_{fee_tiers::FEE_030};
    TimeSource time_source_;

    int32_t validate_path(Exchange exchange, const SwapParams& params) const;
};

} // namespace cellar

#endif // CELLAR_SWAP_HPP
