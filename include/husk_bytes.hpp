#pragma once

/**
 * @file husk_bytes.hpp
 * @brief Little-endian readers and writers shared by the binary codecs
 */

#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace husk {

/**
 * @brief Thrown when a read runs past the end of a buffer
 */
class TruncatedInput : public std::runtime_error {
public:
    explicit TruncatedInput(const std::string& what) : std::runtime_error(what) {}
};

class ByteWriter {
public:
    ByteWriter() = default;
    explicit ByteWriter(std::vector<uint8_t>& out) : out_(&out) {}

    void u8(uint8_t v) { buf().push_back(v); }

    void u16(uint16_t v) {
        buf().push_back(static_cast<uint8_t>(v));
        buf().push_back(static_cast<uint8_t>(v >> 8));
    }

    void u32(uint32_t v) {
        for (int i = 0; i < 4; ++i) {
            buf().push_back(static_cast<uint8_t>(v >> (8 * i)));
        }
    }

    void u64(uint64_t v) {
        for (int i = 0; i < 8; ++i) {
            buf().push_back(static_cast<uint8_t>(v >> (8 * i)));
        }
    }

    void bytes(std::span<const uint8_t> data) {
        buf().insert(buf().end(), data.begin(), data.end());
    }

    void str(std::string_view s) {
        buf().insert(buf().end(), s.begin(), s.end());
    }

    void zeros(size_t count) { buf().insert(buf().end(), count, 0); }

    void pad_to(size_t alignment) {
        while (buf().size() % alignment != 0) {
            buf().push_back(0);
        }
    }

    void put_u16_at(size_t offset, uint16_t v) {
        buf()[offset] = static_cast<uint8_t>(v);
        buf()[offset + 1] = static_cast<uint8_t>(v >> 8);
    }

    void put_u32_at(size_t offset, uint32_t v) {
        for (int i = 0; i < 4; ++i) {
            buf()[offset + i] = static_cast<uint8_t>(v >> (8 * i));
        }
    }

    size_t size() const { return out_ ? out_->size() : own_.size(); }
    std::vector<uint8_t>& buffer() { return buf(); }
    std::vector<uint8_t> take() { return std::move(buf()); }

private:
    std::vector<uint8_t>& buf() { return out_ ? *out_ : own_; }

    std::vector<uint8_t>* out_ = nullptr;
    std::vector<uint8_t> own_;
};

class ByteReader {
public:
    explicit ByteReader(std::span<const uint8_t> data, size_t offset = 0)
        : data_(data), pos_(offset) {
        if (offset > data_.size()) {
            throw TruncatedInput("start offset " + std::to_string(offset) + " past end of buffer");
        }
    }

    uint8_t u8() {
        need(1);
        return data_[pos_++];
    }

    uint16_t u16() {
        need(2);
        uint16_t v = static_cast<uint16_t>(data_[pos_] | (data_[pos_ + 1] << 8));
        pos_ += 2;
        return v;
    }

    uint32_t u32() {
        need(4);
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) {
            v |= static_cast<uint32_t>(data_[pos_ + i]) << (8 * i);
        }
        pos_ += 4;
        return v;
    }

    uint64_t u64() {
        need(8);
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i) {
            v |= static_cast<uint64_t>(data_[pos_ + i]) << (8 * i);
        }
        pos_ += 8;
        return v;
    }

    std::span<const uint8_t> bytes(size_t count) {
        need(count);
        auto out = data_.subspan(pos_, count);
        pos_ += count;
        return out;
    }

    std::string str(size_t count) {
        auto raw = bytes(count);
        return std::string(reinterpret_cast<const char*>(raw.data()), raw.size());
    }

    template <size_t N>
    void copy_to(uint8_t (&out)[N]) {
        auto raw = bytes(N);
        std::memcpy(out, raw.data(), N);
    }

    void skip(size_t count) {
        need(count);
        pos_ += count;
    }

    void seek(size_t offset) {
        if (offset > data_.size()) {
            throw TruncatedInput("seek past end of buffer");
        }
        pos_ = offset;
    }

    size_t position() const { return pos_; }
    size_t remaining() const { return data_.size() - pos_; }
    bool at_end() const { return pos_ >= data_.size(); }

private:
    void need(size_t count) const {
        if (pos_ > data_.size() || count > data_.size() - pos_) {
            throw TruncatedInput("unexpected end of data at offset " + std::to_string(pos_));
        }
    }

    std::span<const uint8_t> data_;
    size_t pos_;
};

} // namespace husk
