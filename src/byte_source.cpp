#include <imginfo/byte_source.hpp>

#include <algorithm>
#include <cstring>
#include <istream>
#include <limits>

namespace imginfo {

// ============================================================================
// byte_source
// ============================================================================

std::optional<std::uint8_t> byte_source::read_byte() {
    std::uint8_t value = 0;
    if (read(&value, 1) != 1) {
        return std::nullopt;
    }
    return value;
}

bool byte_source::read_exact(std::span<std::uint8_t> buffer) {
    std::size_t filled = 0;
    while (filled < buffer.size()) {
        const std::size_t n = read(buffer.data() + filled, buffer.size() - filled);
        if (n == 0) {
            return false;
        }
        filled += n;
    }
    return true;
}

void byte_source::skip(std::uint64_t count) {
    if (!try_skip(count)) {
        throw premature_end_of_input();
    }
}

bool byte_source::try_skip(std::uint64_t count) {
    constexpr auto MAX_CHUNK = static_cast<std::uint64_t>(std::numeric_limits<std::size_t>::max());

    while (count > 0) {
        const std::size_t skipped = skip_some(static_cast<std::size_t>(std::min(count, MAX_CHUNK)));
        if (skipped > 0) {
            count -= skipped;
            continue;
        }
        // Bulk skip stalled, consume one byte to make progress
        if (!read_byte()) {
            return false;
        }
        --count;
    }
    return true;
}

std::optional<std::string> byte_source::read_line() {
    bool terminated = false;
    return read_line(terminated);
}

std::optional<std::string> byte_source::read_line(bool& terminated, std::size_t max_length) {
    terminated = false;
    auto value = read_byte();
    if (!value) {
        return std::nullopt;
    }

    std::string line;
    while (value && *value != '\n') {
        line.push_back(static_cast<char>(*value));
        if (line.size() >= max_length) {
            return line;
        }
        value = read_byte();
    }
    terminated = value.has_value();
    return line;
}

// ============================================================================
// stream_byte_source
// ============================================================================

std::size_t stream_byte_source::read(std::uint8_t* buffer, std::size_t size) {
    const auto max_chunk = static_cast<std::size_t>(std::numeric_limits<std::streamsize>::max());
    in_.read(reinterpret_cast<char*>(buffer),
             static_cast<std::streamsize>(std::min(size, max_chunk)));
    return static_cast<std::size_t>(in_.gcount());
}

std::size_t stream_byte_source::skip_some(std::size_t count) {
    const auto max_chunk = static_cast<std::size_t>(std::numeric_limits<std::streamsize>::max() - 1);
    in_.ignore(static_cast<std::streamsize>(std::min(count, max_chunk)));
    return static_cast<std::size_t>(in_.gcount());
}

// ============================================================================
// memory_byte_source
// ============================================================================

std::size_t memory_byte_source::read(std::uint8_t* buffer, std::size_t size) {
    const std::size_t n = std::min(size, remaining());
    if (n > 0) {
        std::memcpy(buffer, data_.data() + pos_, n);
        pos_ += n;
    }
    return n;
}

std::size_t memory_byte_source::skip_some(std::size_t count) {
    const std::size_t n = std::min(count, remaining());
    pos_ += n;
    return n;
}

} // namespace imginfo
