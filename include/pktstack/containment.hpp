#pragma once

#include <memory>

#include <pktstack/types.hpp>

#include "builder.hpp"
#include "detail/codec_result.hpp"
#include "layer.hpp"
#include "layers/malformed_layer.hpp"
#include "layers/raw_layer.hpp"

namespace pktstack {

/**
 * @brief Neutralize a malformed sentinel buried in a decoded chain
 *
 * If `layer` has a MalformedLayer somewhere below its top:
 * 1. the chain is snapshotted into builders,
 * 2. the sentinel's slot is refilled with a RawLayer builder holding the
 *    same bytes,
 * 3. length and checksum correction are disabled on every builder in the
 *    chain,
 * 4. the chain is rebuilt.
 *
 * The result serializes to the same bytes as the input, but no builder
 * derived from it will recompute fields over data already known to be bad.
 * A chain without a sentinel, or whose top is the sentinel, is returned
 * unchanged.
 *
 * @param layer Decoded chain (may be null)
 * @return The neutralized chain, or the error from rebuilding it
 */
[[nodiscard]] inline CodecResult<LayerPtr> contain_malformed(const LayerPtr& layer) {
    if (!layer || layer->is_malformed() || !layer->contains_malformed()) {
        return layer;
    }

    auto root = layer->to_builder();
    LayerBuilder* outer = find_outer_of(*root, LayerKind::malformed);
    if (outer == nullptr) {
        return layer;
    }

    const auto* sentinel = static_cast<const MalformedLayer::Builder*>(outer->payload_builder());
    outer->replace_payload_builder(std::make_unique<RawLayer::Builder>(sentinel->data()));

    disable_corrections(*root);
    return root->build();
}

} // namespace pktstack
