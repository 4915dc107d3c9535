#ifndef WEBIMG_CODEC_BYTE_ORDER_HPP
#define WEBIMG_CODEC_BYTE_ORDER_HPP

#include <cstdint>
#include <cstddef>
#include <array>
#include <algorithm>
#include <cstring>
#include "utils/bytes.hpp"

namespace webimg::codec {

// Reads fixed width integers out of image headers, which mix big endian
// (PNG, JPEG) and little endian (GIF, WebP, BMP) fields.
class ByteOrder {
public:
    // Detects if system is little endian
    static bool isLittleEndian() {
        static const uint16_t value = 0x0001;
        return *reinterpret_cast<const uint8_t*>(&value) == 0x01;
    }

    // Reads a big endian T at offset, false if it would run past the end
    template<typename T>
    static bool readBigEndian(const Bytes& data, std::size_t offset, T& out) {
        if (!read(data, offset, out)) {
            return false;
        }
        if (isLittleEndian()) {
            out = byteSwap(out);
        }
        return true;
    }

    // Reads a little endian T at offset, false if it would run past the end
    template<typename T>
    static bool readLittleEndian(const Bytes& data, std::size_t offset, T& out) {
        if (!read(data, offset, out)) {
            return false;
        }
        if (!isLittleEndian()) {
            out = byteSwap(out);
        }
        return true;
    }

    // Reads a 24 bit little endian value (WebP VP8X canvas size)
    static bool readLittleEndian24(const Bytes& data, std::size_t offset, uint32_t& out) {
        if (offset + 3 > data.size()) {
            return false;
        }
        out = static_cast<uint32_t>(data[offset]) |
              (static_cast<uint32_t>(data[offset + 1]) << 8) |
              (static_cast<uint32_t>(data[offset + 2]) << 16);
        return true;
    }

private:
    template<typename T>
    static bool read(const Bytes& data, std::size_t offset, T& out) {
        if (offset + sizeof(T) > data.size()) {
            return false;
        }
        std::memcpy(&out, data.data() + offset, sizeof(T));
        return true;
    }

    // Generic byte swap implementation that works for any size T
    template<typename T>
    static T byteSwap(T value) {
        std::array<uint8_t, sizeof(T)> bytes;
        std::memcpy(bytes.data(), &value, sizeof(T));
        std::reverse(bytes.begin(), bytes.end());
        T result;
        std::memcpy(&result, bytes.data(), sizeof(T));
        return result;
    }
};

} // namespace webimg::codec

#endif // WEBIMG_CODEC_BYTE_ORDER_HPP
