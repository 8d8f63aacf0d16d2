#pragma once

#include <functional>
#include <mutex>
#include <shared_mutex>
#include <span>
#include <unordered_map>
#include <utility>

#include <cstdint>
#include <cstdio>
#include <pktstack/types.hpp>

#include "detail/codec_result.hpp"
#include "layer.hpp"
#include "layers/malformed_layer.hpp"
#include "layers/raw_layer.hpp"

namespace pktstack {

/// Decoder for one (contract, discriminator) pair
using DecodeFn = std::function<CodecResult<LayerPtr>(std::span<const uint8_t>)>;

/**
 * @brief Process-wide table from (Contract, discriminator) to decoder
 *
 * Protocol modules register their decoders once at start-up; decoders look
 * up the next layer's decoder by the discriminator they read from their own
 * header. Adding a protocol means registering an entry, never changing the
 * dispatch code.
 *
 * Thread safety: lookup() takes a shared lock and returns a copy of the
 * decoder, so concurrent lookups never block each other and no lock is held
 * while decoding. register_decoder() takes an exclusive lock, so late
 * registration while other threads decode is safe.
 */
class DecoderRegistry {
public:
    DecoderRegistry() = default;

    DecoderRegistry(const DecoderRegistry&) = delete;
    DecoderRegistry& operator=(const DecoderRegistry&) = delete;

    /// The process-wide registry used when no other registry is given
    static DecoderRegistry& global() {
        static DecoderRegistry registry;
        return registry;
    }

    /**
     * @brief Register (or replace) the decoder for a discriminator
     * @param contract Namespace of the discriminator
     * @param value Discriminator value
     * @param fn Decoder; an empty function removes the entry
     */
    void register_decoder(Contract contract, uint32_t value, DecodeFn fn) {
        std::unique_lock lock(mutex_);
        auto key = make_key(contract, value);
        if (!fn) {
            table_.erase(key);
            return;
        }
#ifndef NDEBUG
        if (table_.contains(key)) {
            std::fprintf(stderr,
                         "WARNING: replacing decoder for %s value %u. "
                         "Decoders should be registered once at start-up.\n",
                         contract_string(contract), static_cast<unsigned>(value));
        }
#endif
        table_.insert_or_assign(key, std::move(fn));
    }

    /**
     * @brief Register a decoder unless one is already present
     * @return true if the entry was added
     */
    bool try_register_decoder(Contract contract, uint32_t value, DecodeFn fn) {
        if (!fn) {
            return false;
        }
        std::unique_lock lock(mutex_);
        return table_.try_emplace(make_key(contract, value), std::move(fn)).second;
    }

    /**
     * @brief Get the decoder for a discriminator
     *
     * Never fails: returns RawLayer::decode when nothing is registered.
     */
    DecodeFn lookup(Contract contract, uint32_t value) const {
        std::shared_lock lock(mutex_);
        auto it = table_.find(make_key(contract, value));
        if (it == table_.end()) {
            return &RawLayer::decode;
        }
        return it->second;
    }

    bool contains(Contract contract, uint32_t value) const {
        std::shared_lock lock(mutex_);
        return table_.contains(make_key(contract, value));
    }

    size_t size() const {
        std::shared_lock lock(mutex_);
        return table_.size();
    }

private:
    static constexpr uint64_t make_key(Contract contract, uint32_t value) noexcept {
        return (static_cast<uint64_t>(contract) << 32) | value;
    }

    mutable std::shared_mutex mutex_;
    std::unordered_map<uint64_t, DecodeFn> table_;
};

namespace detail {

/// Registry that nested decodes on this thread dispatch through (null: global)
inline const DecoderRegistry*& active_registry() noexcept {
    thread_local const DecoderRegistry* registry = nullptr;
    return registry;
}

/// Makes a registry active for the current thread until destroyed
class ActiveRegistryScope {
public:
    explicit ActiveRegistryScope(const DecoderRegistry& registry) noexcept
        : previous_(active_registry()) {
        active_registry() = &registry;
    }

    ~ActiveRegistryScope() { active_registry() = previous_; }

    ActiveRegistryScope(const ActiveRegistryScope&) = delete;
    ActiveRegistryScope& operator=(const ActiveRegistryScope&) = delete;

private:
    const DecoderRegistry* previous_;
};

} // namespace detail

// ============================================================================
// Decode entry points
// ============================================================================

/**
 * @brief Decode an outermost layer through a registry
 *
 * Errors from the selected decoder are returned to the caller. The registry
 * stays active on this thread while the decoder runs, so nested layers are
 * dispatched through it as well.
 *
 * @param registry Registry to dispatch through
 * @param contract Namespace of the initial discriminator
 * @param value Initial discriminator
 * @param bytes Raw bytes
 */
[[nodiscard]] inline CodecResult<LayerPtr> decode(const DecoderRegistry& registry,
                                                  Contract contract, uint32_t value,
                                                  std::span<const uint8_t> bytes) {
    auto fn = registry.lookup(contract, value);
    detail::ActiveRegistryScope scope(registry);
    return fn(bytes);
}

/// decode() through the global registry
[[nodiscard]] inline CodecResult<LayerPtr> decode(Contract contract, uint32_t value,
                                                  std::span<const uint8_t> bytes) {
    return decode(DecoderRegistry::global(), contract, value, bytes);
}

/**
 * @brief Decode a nested layer, containing failures
 *
 * Used by decoders for their payload. Never fails: when the selected
 * decoder rejects the bytes, the result is a MalformedLayer holding exactly
 * those bytes and the error, and the enclosing decode carries on.
 */
[[nodiscard]] inline LayerPtr decode_nested(const DecoderRegistry& registry, Contract contract,
                                            uint32_t value, std::span<const uint8_t> bytes) {
    auto result = decode(registry, contract, value, bytes);
    if (!result.has_value()) {
        return MalformedLayer::wrap(bytes, std::move(result.error()));
    }
    return std::move(*result);
}

/**
 * decode_nested() through the registry active on this thread: the one passed
 * to the enclosing decode(), or the global registry when a decoder is called
 * directly
 */
[[nodiscard]] inline LayerPtr decode_nested(Contract contract, uint32_t value,
                                            std::span<const uint8_t> bytes) {
    const DecoderRegistry* active = detail::active_registry();
    return decode_nested(active ? *active : DecoderRegistry::global(), contract, value, bytes);
}

} // namespace pktstack
