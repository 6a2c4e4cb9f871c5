#ifndef BYTE_STREAM_HPP
#define BYTE_STREAM_HPP
#include <stdint.h>
#include <stddef.h>

namespace cpp_rtmp
{
union AV_INT_FLOAT64 {
    uint64_t i;
    double   f;
};

// network order (big-endian) unless the name ends with _le
class ByteStream
{
public:
    static double ByteInt2Double(uint64_t i) {
        union AV_INT_FLOAT64 v;
        v.i = i;
        return v.f;
    }
    static uint64_t ByteDouble2Int(double f) {
        union AV_INT_FLOAT64 v;
        v.f = f;
        return v.i;
    }

    static uint64_t Read8Bytes(const uint8_t* data) {
        uint64_t value = 0;

        for (int i = 0; i < 8; i++) {
            value = (value << 8) | data[i];
        }
        return value;
    }
    static uint32_t Read4Bytes(const uint8_t* data) {
        return ((uint32_t)data[0] << 24) | ((uint32_t)data[1] << 16)
            | ((uint32_t)data[2] << 8) | (uint32_t)data[3];
    }
    static uint32_t Read4Bytes_le(const uint8_t* data) {
        return ((uint32_t)data[3] << 24) | ((uint32_t)data[2] << 16)
            | ((uint32_t)data[1] << 8) | (uint32_t)data[0];
    }
    static uint32_t Read3Bytes(const uint8_t* data) {
        return ((uint32_t)data[0] << 16) | ((uint32_t)data[1] << 8) | (uint32_t)data[2];
    }
    static uint16_t Read2Bytes(const uint8_t* data) {
        return (uint16_t)(((uint16_t)data[0] << 8) | data[1]);
    }

    static void Write8Bytes(uint8_t* data, uint64_t value) {
        for (int i = 7; i >= 0; i--) {
            data[i] = (uint8_t)(value & 0xff);
            value >>= 8;
        }
    }
    static void Write4Bytes(uint8_t* data, uint32_t value) {
        data[0] = (uint8_t)(value >> 24);
        data[1] = (uint8_t)(value >> 16);
        data[2] = (uint8_t)(value >> 8);
        data[3] = (uint8_t)value;
    }
    static void Write4Bytes_le(uint8_t* data, uint32_t value) {
        data[0] = (uint8_t)value;
        data[1] = (uint8_t)(value >> 8);
        data[2] = (uint8_t)(value >> 16);
        data[3] = (uint8_t)(value >> 24);
    }
    static void Write3Bytes(uint8_t* data, uint32_t value) {
        data[0] = (uint8_t)(value >> 16);
        data[1] = (uint8_t)(value >> 8);
        data[2] = (uint8_t)value;
    }
    static void Write2Bytes(uint8_t* data, uint16_t value) {
        data[0] = (uint8_t)(value >> 8);
        data[1] = (uint8_t)value;
    }

    static bool BytesIsEqual(const char* p1, const char* p2, size_t len) {
        for (size_t index = 0; index < len; index++) {
            if (p1[index] != p2[index]) {
                return false;
            }
        }
        return true;
    }
};

}
#endif //BYTE_STREAM_HPP
