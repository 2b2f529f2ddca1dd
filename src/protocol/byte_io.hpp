#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include "protocol/wire_schema.hpp"

namespace hmmdc {

// Big-endian loads/stores of unsigned integers.
inline uint64_t load_be(const uint8_t* p, uint32_t width) {
    uint64_t v = 0;
    for (uint32_t i = 0; i < width; i++) {
        v = (v << 8) | p[i];
    }
    return v;
}

inline void store_be(uint8_t* p, uint64_t v, uint32_t width) {
    for (uint32_t i = width; i > 0; i--) {
        p[i - 1] = static_cast<uint8_t>(v);
        v >>= 8;
    }
}

// Read-only view of one fixed-size block; fields are addressed through
// the schema tables, never through a native struct.
class FixedBlock {
public:
    FixedBlock() = default;
    explicit FixedBlock(const uint8_t* base) : base_(base) {}

    uint64_t raw(const WireField& f) const {
        return load_be(base_ + f.offset, wire_width(f.type));
    }

    uint8_t  u8(const WireField& f) const  { return static_cast<uint8_t>(raw(f)); }
    uint32_t u32(const WireField& f) const { return static_cast<uint32_t>(raw(f)); }
    int32_t  i32(const WireField& f) const { return static_cast<int32_t>(static_cast<uint32_t>(raw(f))); }
    uint64_t u64(const WireField& f) const { return raw(f); }
    int64_t  i64(const WireField& f) const { return static_cast<int64_t>(raw(f)); }
    float    f32(const WireField& f) const { return std::bit_cast<float>(u32(f)); }
    double   f64(const WireField& f) const { return std::bit_cast<double>(raw(f)); }

private:
    const uint8_t* base_ = nullptr;
};

// Writable fixed-size block appended to a buffer.
class FixedBlockWriter {
public:
    FixedBlockWriter(std::vector<uint8_t>& buf, size_t size)
        : buf_(buf), start_(buf.size()) {
        buf_.resize(start_ + size, 0);
    }

    void put(const WireField& f, uint64_t v) {
        store_be(buf_.data() + start_ + f.offset, v, wire_width(f.type));
    }
    void put_f32(const WireField& f, float v) { put(f, std::bit_cast<uint32_t>(v)); }
    void put_f64(const WireField& f, double v) { put(f, std::bit_cast<uint64_t>(v)); }

    size_t start() const { return start_; }

private:
    std::vector<uint8_t>& buf_;
    size_t start_;
};

// Cursor over an untrusted buffer. Every read is bounds-checked; on
// failure the cursor does not move.
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size), pos_(0) {}

    bool has(size_t n) const { return n <= size_ - pos_; }
    size_t remaining() const { return size_ - pos_; }
    size_t pos() const { return pos_; }
    size_t size() const { return size_; }

    bool get_block(size_t n, FixedBlock& out) {
        if (!has(n)) return false;
        out = FixedBlock(data_ + pos_);
        pos_ += n;
        return true;
    }

    bool get_u64(uint64_t& v) {
        if (!has(8)) return false;
        v = load_be(data_ + pos_, 8);
        pos_ += 8;
        return true;
    }

    bool get_f32(float& v) {
        if (!has(4)) return false;
        v = std::bit_cast<float>(static_cast<uint32_t>(load_be(data_ + pos_, 4)));
        pos_ += 4;
        return true;
    }

    // NUL-terminated string; fails if no terminator before the end.
    bool get_cstr(std::string& s) {
        const void* nul = std::memchr(data_ + pos_, 0, size_ - pos_);
        if (nul == nullptr) return false;
        size_t len = static_cast<size_t>(static_cast<const uint8_t*>(nul) - (data_ + pos_));
        s.assign(reinterpret_cast<const char*>(data_ + pos_), len);
        pos_ += len + 1;
        return true;
    }

    bool skip(size_t n) {
        if (!has(n)) return false;
        pos_ += n;
        return true;
    }

private:
    const uint8_t* data_;
    size_t size_;
    size_t pos_;
};

// Helpers: append big-endian values to a buffer
inline void put_u32(std::vector<uint8_t>& buf, uint32_t v) {
    size_t at = buf.size();
    buf.resize(at + 4);
    store_be(buf.data() + at, v, 4);
}

inline void put_u64(std::vector<uint8_t>& buf, uint64_t v) {
    size_t at = buf.size();
    buf.resize(at + 8);
    store_be(buf.data() + at, v, 8);
}

inline void put_f32(std::vector<uint8_t>& buf, float v) {
    put_u32(buf, std::bit_cast<uint32_t>(v));
}

inline void put_cstr(std::vector<uint8_t>& buf, const std::string& s) {
    buf.insert(buf.end(), s.begin(), s.end());
    buf.push_back(0);
}

// Patch a big-endian u32 at an absolute buffer position.
inline void patch_u32(std::vector<uint8_t>& buf, size_t at, uint32_t v) {
    store_be(buf.data() + at, v, 4);
}

} // namespace hmmdc
