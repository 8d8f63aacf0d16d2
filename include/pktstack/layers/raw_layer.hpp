#pragma once

#include <algorithm>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <pktstack/types.hpp>

#include "../builder.hpp"
#include "../detail/buffer_io.hpp"
#include "../detail/codec_result.hpp"
#include "../layer.hpp"

namespace pktstack {

/**
 * @brief Opaque terminal layer
 *
 * Holds bytes whose protocol is unknown or not interpreted. This is what the
 * registry decodes to when no decoder is registered for a discriminator, and
 * what a malformed sentinel is rewritten into during containment.
 */
class RawLayer final : public Layer {
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    static constexpr LayerKind layer_kind = LayerKind::raw;

    class Builder;

    /// Wrap bytes (never fails; any length including zero is accepted)
    static CodecResult<LayerPtr> decode(std::span<const uint8_t> bytes) {
        return std::make_shared<const RawLayer>(Passkey{}, detail::copy_bytes(bytes));
    }

    LayerKind kind() const noexcept override { return layer_kind; }

    size_t size_bytes() const noexcept override { return data_.size(); }

    void write_to(std::span<uint8_t> out) const override {
        std::copy(data_.begin(), data_.end(), out.begin());
    }

    std::unique_ptr<LayerBuilder> to_builder() const override;

    std::string to_string() const override {
        std::string out = "[Raw Data (";
        out += std::to_string(data_.size());
        out += " bytes)]\n  Hex stream: ";
        out += detail::to_hex_string(data_, "");
        out += "\n";
        return out;
    }

    /// Copy of the wrapped bytes
    std::vector<uint8_t> data() const { return data_; }

    RawLayer(Passkey, std::vector<uint8_t> data) : data_(std::move(data)) {}

private:
    std::vector<uint8_t> data_;
};

class RawLayer::Builder final : public detail::BuilderBase<RawLayer::Builder> {
public:
    static constexpr LayerKind layer_kind = LayerKind::raw;
    static constexpr bool has_payload_slot = false;
    static constexpr bool length_correction = false;
    static constexpr bool checksum_correction = false;

    Builder() = default;
    explicit Builder(std::vector<uint8_t> data) : data_(std::move(data)) {}

    Builder& data(std::span<const uint8_t> bytes) {
        data_ = detail::copy_bytes(bytes);
        return *this;
    }

    CodecResult<LayerPtr> build() const override {
        return std::make_shared<const RawLayer>(Passkey{}, data_);
    }

private:
    std::vector<uint8_t> data_;
};

inline std::unique_ptr<LayerBuilder> RawLayer::to_builder() const {
    return std::make_unique<Builder>(data_);
}

} // namespace pktstack
