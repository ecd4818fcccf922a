#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace imginfo {

// Little-endian readers, offset relative to the start of a header buffer
inline std::uint16_t read_le16(std::span<const std::uint8_t> buf, std::size_t off) {
    return static_cast<std::uint16_t>(buf[off]) |
           static_cast<std::uint16_t>(buf[off + 1] << 8);
}

inline std::int32_t read_le32(std::span<const std::uint8_t> buf, std::size_t off) {
    return static_cast<std::int32_t>(static_cast<std::uint32_t>(buf[off]) |
                                     (static_cast<std::uint32_t>(buf[off + 1]) << 8) |
                                     (static_cast<std::uint32_t>(buf[off + 2]) << 16) |
                                     (static_cast<std::uint32_t>(buf[off + 3]) << 24));
}

// Big-endian readers
inline std::uint16_t read_be16(std::span<const std::uint8_t> buf, std::size_t off) {
    return static_cast<std::uint16_t>(buf[off] << 8) |
           static_cast<std::uint16_t>(buf[off + 1]);
}

inline std::uint32_t read_be32(std::span<const std::uint8_t> buf, std::size_t off) {
    return (static_cast<std::uint32_t>(buf[off]) << 24) |
           (static_cast<std::uint32_t>(buf[off + 1]) << 16) |
           (static_cast<std::uint32_t>(buf[off + 2]) << 8) |
           static_cast<std::uint32_t>(buf[off + 3]);
}

inline std::int32_t read_be32_signed(std::span<const std::uint8_t> buf, std::size_t off) {
    return static_cast<std::int32_t>(read_be32(buf, off));
}

// Compare a run of header bytes against a signature
template <std::size_t N>
inline bool matches(std::span<const std::uint8_t> buf, std::size_t off,
                    const std::uint8_t (&signature)[N]) {
    if (off + N > buf.size()) {
        return false;
    }
    for (std::size_t i = 0; i < N; ++i) {
        if (buf[off + i] != signature[i]) {
            return false;
        }
    }
    return true;
}

} // namespace imginfo
