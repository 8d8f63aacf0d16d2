#pragma once

#include <optional>
#include <span>
#include <string>
#include <vector>

#include <cstddef>
#include <cstdint>
#include <cstdio>

namespace pktstack::detail {

// ============================================================================
// Unchecked big-endian field access
// Callers validate the buffer size first; offsets are in bytes.
// ============================================================================

inline uint8_t read_u8(const uint8_t* buf, size_t offset) noexcept {
    return buf[offset];
}

inline uint16_t read_u16(const uint8_t* buf, size_t offset) noexcept {
    return static_cast<uint16_t>((static_cast<uint16_t>(buf[offset]) << 8) | buf[offset + 1]);
}

inline uint32_t read_u32(const uint8_t* buf, size_t offset) noexcept {
    return (static_cast<uint32_t>(buf[offset]) << 24) |
           (static_cast<uint32_t>(buf[offset + 1]) << 16) |
           (static_cast<uint32_t>(buf[offset + 2]) << 8) | static_cast<uint32_t>(buf[offset + 3]);
}

inline void write_u16(uint8_t* buf, size_t offset, uint16_t value) noexcept {
    buf[offset] = static_cast<uint8_t>(value >> 8);
    buf[offset + 1] = static_cast<uint8_t>(value);
}

inline void write_u32(uint8_t* buf, size_t offset, uint32_t value) noexcept {
    buf[offset] = static_cast<uint8_t>(value >> 24);
    buf[offset + 1] = static_cast<uint8_t>(value >> 16);
    buf[offset + 2] = static_cast<uint8_t>(value >> 8);
    buf[offset + 3] = static_cast<uint8_t>(value);
}

// ============================================================================
// Bounds-checked helpers
// ============================================================================

/// True if [offset, offset + length) lies inside a buffer of `size` bytes
constexpr bool in_bounds(size_t size, size_t offset, size_t length) noexcept {
    return offset <= size && length <= size - offset;
}

/**
 * @brief Slice a sub-range without copying
 * @return The sub-span, or std::nullopt if the range exceeds the buffer
 */
inline std::optional<std::span<const uint8_t>> slice(std::span<const uint8_t> bytes, size_t offset,
                                                     size_t length) noexcept {
    if (!in_bounds(bytes.size(), offset, length)) {
        return std::nullopt;
    }
    return bytes.subspan(offset, length);
}

/// Slice from offset to end (empty if offset is past the end)
inline std::span<const uint8_t> slice_from(std::span<const uint8_t> bytes, size_t offset) noexcept {
    if (offset >= bytes.size()) {
        return {};
    }
    return bytes.subspan(offset);
}

/// Owning copy of a byte range
inline std::vector<uint8_t> copy_bytes(std::span<const uint8_t> bytes) {
    return std::vector<uint8_t>(bytes.begin(), bytes.end());
}

/// Big-endian encodings for Header::raw_fields()
inline std::vector<uint8_t> u8_field(uint8_t value) {
    return std::vector<uint8_t>{value};
}

inline std::vector<uint8_t> u16_field(uint16_t value) {
    std::vector<uint8_t> out(2);
    write_u16(out.data(), 0, value);
    return out;
}

inline std::vector<uint8_t> u32_field(uint32_t value) {
    std::vector<uint8_t> out(4);
    write_u32(out.data(), 0, value);
    return out;
}

/**
 * @brief Render bytes as lowercase hex
 *
 * @param bytes Bytes to render
 * @param separator Inserted between bytes (default " ")
 * @return e.g. "04 06 00 00" for separator " "
 */
inline std::string to_hex_string(std::span<const uint8_t> bytes, const char* separator = " ") {
    std::string out;
    out.reserve(bytes.size() * 3);
    char buf[4];
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i > 0) {
            out += separator;
        }
        std::snprintf(buf, sizeof(buf), "%02x", bytes[i]);
        out += buf;
    }
    return out;
}

} // namespace pktstack::detail
