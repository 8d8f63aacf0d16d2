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
 * @brief Sentinel for a nested layer that failed to decode
 *
 * Holds exactly the bytes the nested decoder rejected, together with the
 * error it reported. Serializes back to those bytes unchanged, so the
 * enclosing layer still round-trips. Fields derived from a subtree that
 * contains this sentinel must not be auto-corrected (see contain_malformed()).
 */
class MalformedLayer final : public Layer {
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    static constexpr LayerKind layer_kind = LayerKind::malformed;

    class Builder;

    /**
     * @brief Wrap rejected bytes
     * @param bytes The undecodable byte range (copied)
     * @param cause Error reported by the nested decoder
     */
    static LayerPtr wrap(std::span<const uint8_t> bytes, CodecError cause) {
        return std::make_shared<const MalformedLayer>(Passkey{}, detail::copy_bytes(bytes),
                                                      std::move(cause));
    }

    LayerKind kind() const noexcept override { return layer_kind; }

    bool is_malformed() const noexcept override { return true; }

    size_t size_bytes() const noexcept override { return data_.size(); }

    void write_to(std::span<uint8_t> out) const override {
        std::copy(data_.begin(), data_.end(), out.begin());
    }

    std::unique_ptr<LayerBuilder> to_builder() const override;

    std::string to_string() const override {
        std::string out = "[Malformed Data (";
        out += std::to_string(data_.size());
        out += " bytes)]\n  Hex stream: ";
        out += detail::to_hex_string(data_, "");
        out += "\n  Cause: ";
        out += cause_.describe();
        out += "\n";
        return out;
    }

    /// Copy of the rejected bytes
    std::vector<uint8_t> data() const { return data_; }

    /// Error reported by the nested decoder
    const CodecError& cause() const noexcept { return cause_; }

    MalformedLayer(Passkey, std::vector<uint8_t> data, CodecError cause)
        : data_(std::move(data)),
          cause_(std::move(cause)) {}

private:
    std::vector<uint8_t> data_;
    CodecError cause_;
};

class MalformedLayer::Builder final : public detail::BuilderBase<MalformedLayer::Builder> {
public:
    static constexpr LayerKind layer_kind = LayerKind::malformed;
    static constexpr bool has_payload_slot = false;
    static constexpr bool length_correction = false;
    static constexpr bool checksum_correction = false;

    Builder(std::vector<uint8_t> data, CodecError cause)
        : data_(std::move(data)),
          cause_(std::move(cause)) {}

    const std::vector<uint8_t>& data() const noexcept { return data_; }

    CodecResult<LayerPtr> build() const override {
        return std::make_shared<const MalformedLayer>(Passkey{}, data_, cause_);
    }

private:
    std::vector<uint8_t> data_;
    CodecError cause_;
};

inline std::unique_ptr<LayerBuilder> MalformedLayer::to_builder() const {
    return std::make_unique<Builder>(data_, cause_);
}

} // namespace pktstack
