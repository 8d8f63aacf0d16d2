#pragma once

#include <memory>
#include <utility>

#include <pktstack/types.hpp>

#include "detail/codec_result.hpp"
#include "layer.hpp"

namespace pktstack {

/**
 * @brief Derived-field capabilities of a builder
 *
 * When a flag is set, build() derives the field from the built payload
 * instead of using the value stored in the builder. When clear, the stored
 * value is written verbatim, even if it disagrees with the payload.
 */
struct CorrectionPolicy {
    bool correct_length_at_build = false;
    bool correct_checksum_at_build = false;

    void disable_all() noexcept {
        correct_length_at_build = false;
        correct_checksum_at_build = false;
    }
};

/**
 * @brief Mutable staging object for one layer
 *
 * Each builder owns the builder of its nested payload (if the layer type has
 * one), so a stack of builders is a chain that can be walked structurally
 * with for_each_builder().
 *
 * Builders are single-owner and not thread-safe. build() copies every byte
 * buffer into the produced layer; mutating the builder afterwards never
 * affects layers it already built.
 */
class LayerBuilder {
public:
    virtual ~LayerBuilder() = default;

    /// Kind of layer this builder produces
    virtual LayerKind kind() const noexcept = 0;

    /**
     * @brief Build an immutable layer
     *
     * Builds the nested payload first, then applies the correction policy.
     * @return The layer, or InvalidBuilderState / InconsistentLength
     */
    virtual CodecResult<LayerPtr> build() const = 0;

    /// Builder of the nested payload, or nullptr
    virtual LayerBuilder* payload_builder() noexcept { return nullptr; }

    const LayerBuilder* payload_builder() const noexcept {
        return const_cast<LayerBuilder*>(this)->payload_builder();
    }

    /**
     * @brief Replace the nested payload builder
     * @return false if this layer type has no payload slot
     */
    virtual bool replace_payload_builder(std::unique_ptr<LayerBuilder> builder) {
        (void)builder;
        return false;
    }

    virtual bool supports_length_correction() const noexcept { return false; }
    virtual bool supports_checksum_correction() const noexcept { return false; }

    const CorrectionPolicy& correction() const noexcept { return correction_; }

    /// Set the policy; flags for unsupported capabilities are dropped
    void set_correction(CorrectionPolicy policy) noexcept {
        correction_.correct_length_at_build =
            policy.correct_length_at_build && supports_length_correction();
        correction_.correct_checksum_at_build =
            policy.correct_checksum_at_build && supports_checksum_correction();
    }

protected:
    LayerBuilder() = default;

    CorrectionPolicy correction_;
};

namespace detail {

/**
 * CRTP base for concrete builders
 *
 * Supplies the chaining setters common to all builders and the payload slot.
 * The derived builder declares:
 *   - static constexpr LayerKind layer_kind
 *   - static constexpr bool has_payload_slot
 *   - static constexpr bool length_correction
 *   - static constexpr bool checksum_correction
 *
 * @tparam Derived The concrete builder (CRTP)
 */
template <typename Derived>
class BuilderBase : public LayerBuilder {
public:
    using LayerBuilder::payload_builder;

    LayerKind kind() const noexcept override { return Derived::layer_kind; }

    bool supports_length_correction() const noexcept override {
        return Derived::length_correction;
    }

    bool supports_checksum_correction() const noexcept override {
        return Derived::checksum_correction;
    }

    LayerBuilder* payload_builder() noexcept override { return payload_builder_.get(); }

    bool replace_payload_builder(std::unique_ptr<LayerBuilder> builder) override {
        if constexpr (!Derived::has_payload_slot) {
            return false;
        } else {
            payload_builder_ = std::move(builder);
            return true;
        }
    }

    // ========================================================================
    // Chaining setters
    // ========================================================================

    Derived& payload_builder(std::unique_ptr<LayerBuilder> builder) {
        replace_payload_builder(std::move(builder));
        return self();
    }

    /// Stage an already-built layer as the payload (snapshotted via to_builder())
    Derived& payload(const LayerPtr& layer) {
        replace_payload_builder(layer ? layer->to_builder() : nullptr);
        return self();
    }

    Derived& correct_length_at_build(bool enable) noexcept {
        correction_.correct_length_at_build = enable && Derived::length_correction;
        return self();
    }

    Derived& correct_checksum_at_build(bool enable) noexcept {
        correction_.correct_checksum_at_build = enable && Derived::checksum_correction;
        return self();
    }

protected:
    BuilderBase() = default;

    Derived& self() noexcept { return static_cast<Derived&>(*this); }

    /// Build the payload, or return nullptr when the slot is empty
    CodecResult<LayerPtr> build_payload() const {
        if (!payload_builder_) {
            return LayerPtr{};
        }
        return payload_builder_->build();
    }

    std::unique_ptr<LayerBuilder> payload_builder_;
};

} // namespace detail

// ============================================================================
// Structural traversal
// ============================================================================

/**
 * @brief Visit every builder in a chain, outermost first
 *
 * Follows payload_builder() links, so builders nested inside builders
 * (an option's embedded packet, the packet's own payload) are all visited.
 *
 * @param root First builder of the chain
 * @param fn Callable taking LayerBuilder&
 */
template <typename Fn>
void for_each_builder(LayerBuilder& root, Fn&& fn) {
    for (LayerBuilder* builder = &root; builder != nullptr; builder = builder->payload_builder()) {
        fn(*builder);
    }
}

/**
 * @brief Find the builder whose payload slot holds a builder of a kind
 * @return The enclosing builder, or nullptr if no builder in the chain
 *         (other than possibly the root) is of that kind
 */
inline LayerBuilder* find_outer_of(LayerBuilder& root, LayerKind kind) noexcept {
    for (LayerBuilder* builder = &root; builder != nullptr; builder = builder->payload_builder()) {
        LayerBuilder* inner = builder->payload_builder();
        if (inner != nullptr && inner->kind() == kind) {
            return builder;
        }
    }
    return nullptr;
}

/// Clear length and checksum correction on every builder in the chain
inline void disable_corrections(LayerBuilder& root) {
    for_each_builder(root, [](LayerBuilder& builder) { builder.set_correction({}); });
}

} // namespace pktstack
