#pragma once

#include <span>
#include <string>
#include <utility>

#include "../expected.hpp"
#include "codec_error.hpp"

namespace pktstack {

/**
 * @brief Result type for decode and build operations
 *
 * Alias for expected<T, CodecError>. Holds either the decoded or built
 * value, or a CodecError describing what went wrong.
 *
 * Usage:
 * @code
 *   auto result = Ssh2BinaryPacket::decode(bytes);
 *   if (result.has_value()) {
 *       auto payload = (*result)->payload();
 *   } else {
 *       std::cerr << result.error().describe() << "\n";
 *   }
 * @endcode
 *
 * @tparam T The type of the successful value
 */
template <typename T>
using CodecResult = expected<T, CodecError>;

/**
 * @brief Factory for decode errors
 *
 * Appends the hex rendering of the offending bytes to the description.
 *
 * @param code The failure category
 * @param layer The layer being decoded
 * @param text Description without the data suffix
 * @param bytes The bytes that failed to decode
 * @return unexpected<CodecError> suitable for returning from decode functions
 */
inline auto make_decode_error(ErrorCode code, LayerKind layer, std::string text,
                              std::span<const uint8_t> bytes) {
    return unexpected(CodecError{code, layer, detail::with_data(std::move(text), bytes)});
}

/**
 * @brief Factory for build errors
 *
 * @param code The failure category
 * @param layer The layer being built
 * @param text Description
 * @return unexpected<CodecError> suitable for returning from build()
 */
inline auto make_build_error(ErrorCode code, LayerKind layer, std::string text) {
    return unexpected(CodecError{code, layer, std::move(text)});
}

} // namespace pktstack
