//
// Little-endian field access for archive headers
//

#pragma once

#include <apigen/archive.hh>

#include <cstdint>

namespace apigen::archive::detail {

inline void put_u16(bytes& out, std::uint16_t value) {
    out.push_back(static_cast<std::uint8_t>(value & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
}

inline void put_u32(bytes& out, std::uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
        out.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFF));
    }
}

inline void put_string(bytes& out, const std::string& s) {
    out.insert(out.end(), s.begin(), s.end());
}

/// Bounds-checked reads; offsets past the end throw archive_error
inline std::uint16_t get_u16(const bytes& in, std::size_t offset) {
    if (offset + 2 > in.size()) {
        throw archive_error("Unexpected end of archive");
    }
    return static_cast<std::uint16_t>(in[offset] | (in[offset + 1] << 8));
}

inline std::uint32_t get_u32(const bytes& in, std::size_t offset) {
    if (offset + 4 > in.size()) {
        throw archive_error("Unexpected end of archive");
    }
    return static_cast<std::uint32_t>(in[offset]) |
           (static_cast<std::uint32_t>(in[offset + 1]) << 8) |
           (static_cast<std::uint32_t>(in[offset + 2]) << 16) |
           (static_cast<std::uint32_t>(in[offset + 3]) << 24);
}

} // namespace apigen::archive::detail
