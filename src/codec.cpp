// =============================================================================
// codec.cpp - Call data encoding/decoding
// =============================================================================

#include "cellar/codec.hpp"
#include <cstring>

namespace cellar {
namespace abi {

// =============================================================================
// Writer
// =============================================================================

Writer& Writer::put_u8(uint8_t v) {
    out_.push_back(v);
    return *this;
}

Writer& Writer::put_u16(uint16_t v) {
    out_.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    out_.push_back(static_cast<uint8_t>(v & 0xFF));
    return *this;
}

Writer& Writer::put_u32(uint32_t v) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        out_.push_back(static_cast<uint8_t>((v >> shift) & 0xFF));
    }
    return *this;
}

Writer& Writer::put_u64(uint64_t v) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out_.push_back(static_cast<uint8_t>((v >> shift) & 0xFF));
    }
    return *this;
}

// Two's complement, 16 bytes
Writer& Writer::put_i128(I128 v) {
    U128 u = static_cast<U128>(v);
    for (int shift = 120; shift >= 0; shift -= 8) {
        out_.push_back(static_cast<uint8_t>((u >> shift) & 0xFF));
    }
    return *this;
}

Writer& Writer::put_bool(bool v) {
    return put_u8(v ? 1 : 0);
}

Writer& Writer::put_address(const Address& addr) {
    out_.insert(out_.end(), addr.begin(), addr.end());
    return *this;
}

Writer& Writer::put_bytes(const Bytes& data) {
    put_u32(static_cast<uint32_t>(data.size()));
    out_.insert(out_.end(), data.begin(), data.end());
    return *this;
}

// =============================================================================
// Reader
// =============================================================================

bool Reader::get_u8(uint8_t& out) {
    if (remaining() < 1) return false;
    out = data_[pos_++];
    return true;
}

bool Reader::get_u16(uint16_t& out) {
    if (remaining() < 2) return false;
    out = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
    pos_ += 2;
    return true;
}

bool Reader::get_u32(uint32_t& out) {
    if (remaining() < 4) return false;
    uint32_t v = 0;
    for (int i = 0; i < 4; ++i) {
        v = (v << 8) | data_[pos_ + i];
    }
    out = v;
    pos_ += 4;
    return true;
}

bool Reader::get_u64(uint64_t& out) {
    if (remaining() < 8) return false;
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v = (v << 8) | data_[pos_ + i];
    }
    out = v;
    pos_ += 8;
    return true;
}

bool Reader::get_i128(I128& out) {
    if (remaining() < 16) return false;
    U128 v = 0;
    for (int i = 0; i < 16; ++i) {
        v = (v << 8) | data_[pos_ + i];
    }
    out = static_cast<I128>(v);
    pos_ += 16;
    return true;
}

bool Reader::get_bool(bool& out) {
    uint8_t v = 0;
    if (!get_u8(v) || v > 1) return false;
    out = (v == 1);
    return true;
}

bool Reader::get_address(Address& out) {
    if (remaining() < 20) return false;
    std::memcpy(out.data(), data_.data() + pos_, 20);
    pos_ += 20;
    return true;
}

bool Reader::get_bytes(Bytes& out) {
    size_t start = pos_;
    uint32_t len = 0;
    if (!get_u32(len)) return false;
    if (remaining() < len) {
        pos_ = start;
        return false;
    }
    out.assign(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
               data_.begin() + static_cast<std::ptrdiff_t>(pos_ + len));
    pos_ += len;
    return true;
}

std::optional<uint32_t> selector_of(const Bytes& call_data) {
    Reader reader(call_data);
    uint32_t sel = 0;
    if (!reader.get_u32(sel)) return std::nullopt;
    return sel;
}

} // namespace abi
} // namespace cellar
