#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ostream>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace ktextools::binutil {

// Assumes little-endian (x86/x64). Fail at compile time otherwise.
static_assert(std::endian::native == std::endian::little,
              "ktextools requires a little-endian platform");

// Thrown when a read runs past the end of the underlying buffer.
class eof_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// --- In-memory cursor (throws eof_error on short reads) ---

class ByteReader {
public:
    explicit ByteReader(std::span<const uint8_t> data) : data_(data) {}

    [[nodiscard]] size_t position() const { return pos_; }
    [[nodiscard]] size_t size() const { return data_.size(); }
    [[nodiscard]] size_t remaining() const { return data_.size() - pos_; }

    std::vector<uint8_t> read_bytes(size_t n) {
        require(n, "bytes");
        std::vector<uint8_t> out(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                                 data_.begin() + static_cast<std::ptrdiff_t>(pos_ + n));
        pos_ += n;
        return out;
    }

    // Fixed-length text, taken verbatim (no NUL trimming).
    std::string read_string(size_t n) {
        require(n, "string");
        std::string out(reinterpret_cast<const char*>(data_.data() + pos_), n);
        pos_ += n;
        return out;
    }

    uint8_t read_u8() {
        require(1, "u8");
        return data_[pos_++];
    }

    uint16_t read_u16() {
        require(2, "u16");
        uint16_t v;
        std::memcpy(&v, data_.data() + pos_, 2);
        pos_ += 2;
        return v;
    }

    uint32_t read_u32() {
        require(4, "u32");
        uint32_t v;
        std::memcpy(&v, data_.data() + pos_, 4);
        pos_ += 4;
        return v;
    }

private:
    void require(size_t n, const char* what) const {
        if (n > remaining())
            throw eof_error("binutil: failed to read " + std::string(what) + " (need " +
                            std::to_string(n) + " bytes at offset " + std::to_string(pos_) +
                            ", " + std::to_string(remaining()) + " left)");
    }

    std::span<const uint8_t> data_;
    size_t pos_ = 0;
};

// --- Write helpers (throw on failure) ---

inline void write_u8(std::ostream& w, uint8_t v) {
    if (!w.write(reinterpret_cast<const char*>(&v), 1))
        throw std::runtime_error("binutil: failed to write u8");
}

inline void write_u16(std::ostream& w, uint16_t v) {
    if (!w.write(reinterpret_cast<const char*>(&v), 2))
        throw std::runtime_error("binutil: failed to write u16");
}

inline void write_u32(std::ostream& w, uint32_t v) {
    if (!w.write(reinterpret_cast<const char*>(&v), 4))
        throw std::runtime_error("binutil: failed to write u32");
}

inline void write_bytes(std::ostream& w, std::span<const uint8_t> data) {
    if (!data.empty() && !w.write(reinterpret_cast<const char*>(data.data()),
                                  static_cast<std::streamsize>(data.size())))
        throw std::runtime_error("binutil: failed to write bytes");
}

inline void write_signature(std::ostream& w, const char (&sig)[5]) {
    if (!w.write(sig, 4))
        throw std::runtime_error("binutil: failed to write signature");
}

} // namespace ktextools::binutil
