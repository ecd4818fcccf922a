#pragma once

#include <imginfo/types.hpp>
#include <imginfo/image_metadata.hpp>
#include <imginfo/byte_source.hpp>

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace imginfo {

inline detect_result malformed(std::string msg) {
    return detect_result::failure(detect_error::malformed_header, std::move(msg));
}

inline detect_result truncated(std::string msg) {
    return detect_result::failure(detect_error::truncated, std::move(msg));
}

// Final gate shared by all checkers: a record is complete only with
// positive dimensions and depth
inline detect_result finish(image_metadata::fields& info) {
    if (info.width < 1 || info.height < 1) {
        return malformed("Invalid image dimensions");
    }
    if (info.bits_per_pixel < 1) {
        return malformed("Invalid bit depth");
    }
    return detect_result::success(std::move(info));
}

// Skip a chain of length-prefixed sub-blocks up to the zero-length terminator.
// Returns false if the input ends before the terminator.
inline bool skip_sub_blocks(byte_source& src) {
    while (true) {
        auto n = src.read_byte();
        if (!n) {
            return false;
        }
        if (*n == 0) {
            return true;
        }
        if (!src.try_skip(*n)) {
            return false;
        }
    }
}

// Strip leading and trailing control characters and spaces
inline std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && static_cast<unsigned char>(s.front()) <= ' ') {
        s.remove_prefix(1);
    }
    while (!s.empty() && static_cast<unsigned char>(s.back()) <= ' ') {
        s.remove_suffix(1);
    }
    return s;
}

// Parse a decimal integer that must span the whole token
inline bool parse_int(std::string_view token, int& value) noexcept {
    if (!token.empty() && token.front() == '+') {
        token.remove_prefix(1);
        if (!token.empty() && token.front() == '-') {
            return false;
        }
    }
    if (token.empty()) {
        return false;
    }
    const char* end = token.data() + token.size();
    auto result = std::from_chars(token.data(), end, value);
    return result.ec == std::errc{} && result.ptr == end;
}

} // namespace imginfo
