#ifndef CELLAR_CODEC_HPP
#define CELLAR_CODEC_HPP

#include <cstdint>
#include <string_view>
#include <utility>

#include "types.hpp"

namespace cellar {

// =============================================================================
// Hashing
// =============================================================================

namespace hash {

constexpr uint64_t FNV64_OFFSET = 1469598103934665603ULL;
constexpr uint64_t FNV64_PRIME = 1099511628211ULL;
constexpr uint32_t FNV32_OFFSET = 2166136261U;
constexpr uint32_t FNV32_PRIME = 16777619U;

constexpr uint64_t fnv1a64(std::string_view s, uint64_t h = FNV64_OFFSET) {
    for (char c : s) {
        h ^= static_cast<uint8_t>(c);
        h *= FNV64_PRIME;
    }
    return h;
}

inline uint64_t fnv1a64(const Bytes& data, uint64_t h = FNV64_OFFSET) {
    for (auto b : data) {
        h ^= b;
        h *= FNV64_PRIME;
    }
    return h;
}

constexpr uint32_t fnv1a32(std::string_view s) {
    uint32_t h = FNV32_OFFSET;
    for (char c : s) {
        h ^= static_cast<uint8_t>(c);
        h *= FNV32_PRIME;
    }
    return h;
}

} // namespace hash

// =============================================================================
// Call Data Encoding (big-endian, fixed width)
//
// Call data layout: [selector:4][arguments...]
// =============================================================================

namespace abi {

// Entrypoint selector from its signature, e.g. "borrow(address,uint32,int128)"
constexpr uint32_t selector(std::string_view signature) {
    return hash::fnv1a32(signature);
}

class Writer {
public:
    Writer() = default;
    explicit Writer(uint32_t selector) { put_u32(selector); }

    Writer& put_u8(uint8_t v);
    Writer& put_u16(uint16_t v);
    Writer& put_u32(uint32_t v);
    Writer& put_u64(uint64_t v);
    Writer& put_i128(I128 v);
    Writer& put_bool(bool v);
    Writer& put_address(const Address& addr);
    Writer& put_asset(const Asset& asset) { return put_address(asset.addr); }

    // u32 length prefix followed by raw bytes
    Writer& put_bytes(const Bytes& data);

    const Bytes& bytes() const { return out_; }
    Bytes take() { return std::move(out_); }

private:
    Bytes out_;
};

// Every getter returns false on underflow and leaves the output untouched
class Reader {
public:
    explicit Reader(const Bytes& data, size_t offset = 0) : data_(data), pos_(offset) {}

    bool get_u8(uint8_t& out);
    bool get_u16(uint16_t& out);
    bool get_u32(uint32_t& out);
    bool get_u64(uint64_t& out);
    bool get_i128(I128& out);
    bool get_bool(bool& out);
    bool get_address(Address& out);
    bool get_asset(Asset& out) { return get_address(out.addr); }
    bool get_bytes(Bytes& out);

    size_t remaining() const { return data_.size() - pos_; }
    bool at_end() const { return pos_ == data_.size(); }

private:
    const Bytes& data_;
    size_t pos_;
};

// Selector of encoded call data; nullopt when shorter than 4 bytes
std::optional<uint32_t> selector_of(const Bytes& call_data);

} // namespace abi

} // namespace cellar

#endif // CELLAR_CODEC_HPP
