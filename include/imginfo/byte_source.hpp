#ifndef IMGINFO_BYTE_SOURCE_HPP_
#define IMGINFO_BYTE_SOURCE_HPP_

#include <imginfo/imginfo_export.h>

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <limits>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>

namespace imginfo {

/**
 * Thrown by byte_source::skip() when the input ends before the requested
 * number of bytes could be skipped.
 */
class IMGINFO_EXPORT premature_end_of_input : public std::runtime_error {
public:
    premature_end_of_input()
        : std::runtime_error("Premature end of input") {}
};

// ============================================================================
// Byte Source Interface
// ============================================================================

/**
 * Finite, forward-only byte stream.
 * There is no way to seek back: every reader is a single forward pass.
 */
class IMGINFO_EXPORT byte_source {
public:
    virtual ~byte_source() = default;

    /**
     * Read up to size bytes.
     * @return Number of bytes stored in buffer, 0 at end of input
     */
    [[nodiscard]] virtual std::size_t read(std::uint8_t* buffer, std::size_t size) = 0;

    /**
     * Skip up to count bytes using the medium's bulk skip.
     * @return Number of bytes actually skipped, may be less than count
     */
    [[nodiscard]] virtual std::size_t skip_some(std::size_t count) = 0;

    /**
     * Read a single byte.
     * @return The byte, or nullopt at end of input
     */
    [[nodiscard]] std::optional<std::uint8_t> read_byte();

    /**
     * Fill the whole buffer.
     * @return false if the input ended before the buffer was full
     */
    [[nodiscard]] bool read_exact(std::span<std::uint8_t> buffer);

    /**
     * Advance exactly count bytes.
     * Falls back to single byte reads when the bulk skip stalls.
     * @throws premature_end_of_input if the input ends first
     */
    void skip(std::uint64_t count);

    /**
     * Same as skip(), reporting end of input instead of throwing.
     * @return false if the input ended before count bytes were skipped
     */
    [[nodiscard]] bool try_skip(std::uint64_t count);

    /**
     * Read bytes up to the next line feed (0x0A) or end of input.
     * The line feed is consumed but not returned; each byte becomes one char.
     * @return The line, or nullopt if the input was already exhausted
     */
    [[nodiscard]] std::optional<std::string> read_line();

    /**
     * Same as read_line(), also reporting whether a line feed ended the line.
     * At most max_length bytes are read; a line cut at that length is
     * reported as not terminated.
     */
    [[nodiscard]] std::optional<std::string> read_line(
        bool& terminated,
        std::size_t max_length = std::numeric_limits<std::size_t>::max());
};

// ============================================================================
// Stream Source
// ============================================================================

/**
 * Byte source over a std::istream. The stream is borrowed, not owned.
 */
class IMGINFO_EXPORT stream_byte_source : public byte_source {
public:
    explicit stream_byte_source(std::istream& in) noexcept
        : in_(in) {}

    [[nodiscard]] std::size_t read(std::uint8_t* buffer, std::size_t size) override;
    [[nodiscard]] std::size_t skip_some(std::size_t count) override;

private:
    std::istream& in_;
};

// ============================================================================
// Memory Source
// ============================================================================

/**
 * Byte source over an in-memory buffer. The buffer must outlive the source.
 */
class IMGINFO_EXPORT memory_byte_source : public byte_source {
public:
    explicit memory_byte_source(std::span<const std::uint8_t> data) noexcept
        : data_(data) {}

    [[nodiscard]] std::size_t read(std::uint8_t* buffer, std::size_t size) override;
    [[nodiscard]] std::size_t skip_some(std::size_t count) override;

    [[nodiscard]] std::size_t position() const noexcept { return pos_; }
    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - pos_; }

private:
    std::span<const std::uint8_t> data_;
    std::size_t pos_ = 0;
};

} // namespace imginfo

#endif // IMGINFO_BYTE_SOURCE_HPP_
