#pragma once

#include <span>
#include <string>

#include <cstdint>
#include <pktstack/types.hpp>

#include "buffer_io.hpp"

namespace pktstack {

/**
 * @brief Error information from a failed decode or build
 *
 * Carries the failure category, the layer that reported it, and a
 * description. Decode errors end their description with the offending
 * bytes rendered as hex ("... data: 04 06 00 ..."), so an error stays
 * meaningful after the input buffer is gone.
 */
struct CodecError {
    ErrorCode code;     ///< The failure category
    LayerKind layer;    ///< Layer that reported the failure
    std::string detail; ///< Human-readable description

    /**
     * @brief Get a human-readable error message
     * @return Static string describing the failure category
     */
    [[nodiscard]] const char* message() const noexcept { return error_code_string(code); }

    /**
     * @brief Full diagnostic line
     * @return "<layer>: <message>: <detail>"
     */
    [[nodiscard]] std::string describe() const {
        std::string out = layer_kind_string(layer);
        out += ": ";
        out += message();
        if (!detail.empty()) {
            out += ": ";
            out += detail;
        }
        return out;
    }
};

namespace detail {

/// Append " data: <hex>" to a decode error description
inline std::string with_data(std::string text, std::span<const uint8_t> bytes) {
    text += " data: ";
    text += to_hex_string(bytes);
    return text;
}

} // namespace detail

} // namespace pktstack
