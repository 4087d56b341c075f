#pragma once
// Fixed little-endian field access for the .dat layouts, independent of host order.
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

namespace dat_toolkit::le {

inline std::uint16_t readU16(const char* p) {
    auto b = reinterpret_cast<const unsigned char*>(p);
    return static_cast<std::uint16_t>(b[0] | (b[1] << 8));
}

inline std::uint32_t readU32(const char* p) {
    auto b = reinterpret_cast<const unsigned char*>(p);
    return  static_cast<std::uint32_t>(b[0])
         | (static_cast<std::uint32_t>(b[1]) << 8)
         | (static_cast<std::uint32_t>(b[2]) << 16)
         | (static_cast<std::uint32_t>(b[3]) << 24);
}

inline std::int16_t readI16(const char* p) {
    return static_cast<std::int16_t>(readU16(p));
}

inline float readF32(const char* p) {
    std::uint32_t bits = readU32(p);
    float f;
    std::memcpy(&f, &bits, sizeof(f));
    return f;
}

inline void putU8(std::vector<char>& out, std::uint8_t v) {
    out.push_back(static_cast<char>(v));
}

inline void putU16(std::vector<char>& out, std::uint16_t v) {
    out.push_back(static_cast<char>(v & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
}

inline void putI16(std::vector<char>& out, std::int16_t v) {
    putU16(out, static_cast<std::uint16_t>(v));
}

inline void putU32(std::vector<char>& out, std::uint32_t v) {
    for (int i = 0; i < 4; ++i)
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
}

} // namespace dat_toolkit::le
