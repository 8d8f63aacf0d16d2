#pragma once

#include <algorithm>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <cstddef>
#include <cstdint>
#include <pktstack/types.hpp>

namespace pktstack {

class Layer;
class LayerBuilder;

/// Layers are immutable and shared read-only
using LayerPtr = std::shared_ptr<const Layer>;

/**
 * @brief Fixed-layout prefix of a layer
 *
 * A header is an ordered list of fields. Its size is the sum of the field
 * sizes and is the same for every instance of a protocol; only the field
 * values vary.
 */
class Header {
public:
    virtual ~Header() = default;

    /**
     * Get the header fields in wire order
     * @return One owning byte vector per field, big-endian encoded
     */
    virtual std::vector<std::vector<uint8_t>> raw_fields() const = 0;

    /// Header size in bytes (constant per protocol)
    virtual size_t size_bytes() const noexcept = 0;

    /// Multi-line human-readable rendering
    virtual std::string to_string() const = 0;

    /// Serialized header
    std::vector<uint8_t> to_bytes() const {
        std::vector<uint8_t> out;
        out.reserve(size_bytes());
        for (const auto& field : raw_fields()) {
            out.insert(out.end(), field.begin(), field.end());
        }
        return out;
    }
};

/**
 * @brief Immutable decoded protocol layer
 *
 * A layer is produced by a decoder or by LayerBuilder::build() and never
 * changes afterwards. It has a classification tag, an optional fixed header
 * and zero or one nested payload layer. Some protocols also carry trailing
 * fields after the payload (see Ssh2BinaryPacket).
 *
 * Value semantics: two layers are equal iff their serialized bytes are equal.
 *
 * Byte accessors on concrete layers return copies; nothing handed out to a
 * caller aliases the layer's own storage.
 */
class Layer {
public:
    virtual ~Layer() = default;

    /// Classification tag
    virtual LayerKind kind() const noexcept = 0;

    /// Fixed header, or nullptr for headerless layers (raw, malformed)
    virtual const Header* header() const noexcept { return nullptr; }

    /// Nested payload layer, or nullptr for terminal layers
    virtual LayerPtr payload() const noexcept { return nullptr; }

    /// Serialized size in bytes
    virtual size_t size_bytes() const noexcept {
        size_t size = header() ? header()->size_bytes() : 0;
        if (auto p = payload()) {
            size += p->size_bytes();
        }
        return size;
    }

    /**
     * @brief Serialize into a caller-provided buffer
     *
     * Writes the header fields at their fixed offsets followed by the
     * payload's serialization.
     *
     * @param out Destination, at least size_bytes() long
     */
    virtual void write_to(std::span<uint8_t> out) const {
        size_t offset = 0;
        if (const Header* h = header()) {
            for (const auto& field : h->raw_fields()) {
                std::copy(field.begin(), field.end(), out.begin() + offset);
                offset += field.size();
            }
        }
        if (auto p = payload()) {
            p->write_to(out.subspan(offset));
        }
    }

    /**
     * @brief Snapshot this layer into a fresh builder
     *
     * The builder's payload slot holds the payload's own snapshot.
     * Correction flags start disabled, so building the unmodified snapshot
     * reproduces this layer byte for byte.
     */
    virtual std::unique_ptr<LayerBuilder> to_builder() const = 0;

    /// Multi-line human-readable rendering of this layer and its payload
    virtual std::string to_string() const = 0;

    /// True only for the malformed-layer sentinel
    virtual bool is_malformed() const noexcept { return false; }

    /// Serialized bytes; size is exactly size_bytes()
    std::vector<uint8_t> to_bytes() const {
        std::vector<uint8_t> out(size_bytes());
        write_to(out);
        return out;
    }

    /**
     * @brief Find the first layer of a kind along the payload chain
     * @return This layer or a nested one, or nullptr if absent
     */
    const Layer* find(LayerKind k) const noexcept {
        for (const Layer* layer = this; layer != nullptr; layer = layer->payload().get()) {
            if (layer->kind() == k) {
                return layer;
            }
        }
        return nullptr;
    }

    /// True if this layer or any nested layer is a malformed sentinel
    bool contains_malformed() const noexcept {
        for (const Layer* layer = this; layer != nullptr; layer = layer->payload().get()) {
            if (layer->is_malformed()) {
                return true;
            }
        }
        return false;
    }

    /// Number of layers in the chain starting here
    size_t depth() const noexcept {
        size_t n = 0;
        for (const Layer* layer = this; layer != nullptr; layer = layer->payload().get()) {
            ++n;
        }
        return n;
    }
};

inline bool operator==(const Layer& lhs, const Layer& rhs) {
    if (&lhs == &rhs) {
        return true;
    }
    return lhs.size_bytes() == rhs.size_bytes() && lhs.to_bytes() == rhs.to_bytes();
}

/**
 * @brief Checked downcast by classification tag
 *
 * @tparam T Concrete layer type exposing `static constexpr LayerKind layer_kind`
 * @return The layer as T, or nullptr if the pointer is null or of another kind
 */
template <typename T>
std::shared_ptr<const T> layer_cast(const LayerPtr& layer) noexcept {
    if (!layer || layer->kind() != T::layer_kind) {
        return nullptr;
    }
    return std::static_pointer_cast<const T>(layer);
}

} // namespace pktstack

template <>
struct std::hash<pktstack::Layer> {
    size_t operator()(const pktstack::Layer& layer) const {
        auto bytes = layer.to_bytes();
        return std::hash<std::string_view>{}(
            std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
    }
};
