#pragma once

#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>

#include "format/uf2_format.hpp"

namespace uf2pack {

class ByteWriter {
public:
    void reserve(size_t n) { buf_.reserve(n); }
    void write_u8(uint8_t v) { buf_.push_back(v); }
    void write_u16_le(uint16_t v) {
        buf_.push_back(static_cast<uint8_t>(v & 0xFF));
        buf_.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    }
    void write_u32_le(uint32_t v) {
        write_u16_le(static_cast<uint16_t>(v & 0xFFFF));
        write_u16_le(static_cast<uint16_t>((v >> 16) & 0xFFFF));
    }
    void write_bytes(const void* p, size_t n) {
        const uint8_t* b = static_cast<const uint8_t*>(p);
        buf_.insert(buf_.end(), b, b + n);
    }
    void write_zeros(size_t n) { buf_.insert(buf_.end(), n, 0); }
    size_t size() const { return buf_.size(); }
    const std::vector<uint8_t>& bytes() const { return buf_; }
    std::vector<uint8_t> take() { return std::move(buf_); }
private:
    std::vector<uint8_t> buf_;
};

class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}
    explicit ByteReader(const std::vector<uint8_t>& data) : ByteReader(data.data(), data.size()) {}

    uint8_t read_u8() {
        need(1);
        return data_[pos_++];
    }
    uint16_t read_u16_le() {
        uint16_t lo = read_u8();
        uint16_t hi = read_u8();
        return static_cast<uint16_t>(lo | (hi << 8));
    }
    uint32_t read_u32_le() {
        uint32_t a = read_u16_le();
        uint32_t b = read_u16_le();
        return a | (b << 16);
    }
    void skip(size_t n) {
        need(n);
        pos_ += n;
    }
    bool eof() const { return pos_ >= size_; }
private:
    void need(size_t n) {
        if (pos_ + n > size_) throw std::runtime_error("byte_stream: premature EOF");
    }
    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
};

// Write the eight header words in declared order.
void write_block_header(ByteWriter& w, const Uf2BlockHeader& hdr);

// Read the header words of the block starting at `offset` in `bytes`.
// Only the size is checked; magic values are returned as found.
Uf2BlockHeader read_block_header(const std::vector<uint8_t>& bytes, size_t offset = 0);

} // namespace uf2pack
