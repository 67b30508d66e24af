#pragma once

#include <array>
#include <optional>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <cstddef>
#include <cstdint>

#include "../core/result.hpp"
#include "../core/types.hpp"
#include "air_track.hpp"

namespace jseries {

/**
 * @brief Tagged union of all supported message bodies
 *
 * Each alternative carries a static `kind` tag that identifies it on the
 * wire. New kinds are added as new alternatives plus a registered codec.
 */
using Message = std::variant<AirTrackReport>;

/**
 * @brief Get the kind tag of a message
 * @param msg The message
 * @return The one-byte tag written ahead of its body
 */
inline uint8_t message_kind(const Message& msg) noexcept {
    return std::visit([](const auto& body) -> uint8_t { return std::decay_t<decltype(body)>::kind; },
                      msg);
}

/**
 * @brief Capability pair for one message kind
 *
 * encode receives the whole message and produces the body only (no tag);
 * decode receives the bytes after the tag.
 */
struct BodyCodec {
    using EncodeFn = Result<std::vector<uint8_t>> (*)(const Message&);
    using DecodeFn = Result<Message> (*)(std::span<const uint8_t>);

    uint8_t kind;
    std::string_view name;
    EncodeFn encode;
    DecodeFn decode;
};

/**
 * @brief Adapt a typed body codec to the registry's BodyCodec shape
 *
 * @tparam Codec Type with `message_type`, `kind`, static `encode(const message_type&)`
 *         and static `decode(std::span<const uint8_t>)`
 */
template <typename Codec>
BodyCodec make_body_codec() noexcept {
    using Body = typename Codec::message_type;
    return BodyCodec{
        Codec::kind,
        Body::name,
        [](const Message& msg) -> Result<std::vector<uint8_t>> {
            const auto* body = std::get_if<Body>(&msg);
            if (body == nullptr) {
                return CodecFailure::unsupported_kind(message_kind(msg));
            }
            return Codec::encode(*body);
        },
        [](std::span<const uint8_t> bytes) -> Result<Message> {
            auto decoded = Codec::decode(bytes);
            if (!is_ok(decoded)) {
                return failure_of(decoded);
            }
            return Message{std::get<Body>(std::move(decoded))};
        },
    };
}

/**
 * @brief Registry mapping kind tags to body codecs
 *
 * Encoding writes the message's kind byte followed by the body produced by
 * the codec registered for that kind. Decoding reads the kind byte and
 * hands the remaining bytes to the matching codec.
 *
 * Registration happens during setup; a populated registry is only read, so
 * a const instance can be shared between threads.
 *
 * Example usage:
 * @code
 * auto registry = CodecRegistry::with_builtin_kinds();
 * auto frame = registry.encode(Message{report});
 * auto parsed = registry.decode(std::get<std::vector<uint8_t>>(frame));
 * @endcode
 */
class CodecRegistry {
public:
    CodecRegistry() = default;

    /// Registry with every kind this library implements
    static CodecRegistry with_builtin_kinds() {
        CodecRegistry registry;
        (void)registry.register_codec(make_body_codec<AirTrackCodec>());
        return registry;
    }

    /**
     * @brief Register a codec under its kind tag
     * @param codec Codec with non-null encode and decode
     * @return false if the tag is already taken or the codec is incomplete
     */
    bool register_codec(const BodyCodec& codec) noexcept {
        if (codec.encode == nullptr || codec.decode == nullptr) {
            return false;
        }
        auto& slot = codecs_[codec.kind];
        if (slot.has_value()) {
            return false;
        }
        slot = codec;
        return true;
    }

    /// Codec registered for a tag, or nullptr
    const BodyCodec* find(uint8_t kind) const noexcept {
        const auto& slot = codecs_[kind];
        return slot.has_value() ? &*slot : nullptr;
    }

    bool is_registered(uint8_t kind) const noexcept { return codecs_[kind].has_value(); }

    /**
     * @brief Encode a message into a tagged frame
     * @return Tag byte followed by the body, or the body codec's failure,
     *         or UnsupportedKind if no codec is registered for the message
     */
    Result<std::vector<uint8_t>> encode(const Message& msg) const {
        uint8_t tag = message_kind(msg);
        const BodyCodec* codec = find(tag);
        if (codec == nullptr) {
            return CodecFailure::unsupported_kind(tag);
        }

        auto body = codec->encode(msg);
        if (!is_ok(body)) {
            return failure_of(body);
        }
        const auto& body_bytes = std::get<std::vector<uint8_t>>(body);

        std::vector<uint8_t> frame;
        frame.reserve(kind_tag_bytes + body_bytes.size());
        frame.push_back(tag);
        frame.insert(frame.end(), body_bytes.begin(), body_bytes.end());
        return frame;
    }

    /**
     * @brief Decode a tagged frame
     * @param bytes Frame bytes (not modified)
     * @return The message, ShortBuffer for an empty frame or short body,
     *         or UnsupportedKind for an unregistered tag
     */
    Result<Message> decode(std::span<const uint8_t> bytes) const {
        if (bytes.empty()) {
            return CodecFailure::short_buffer(kind_tag_bits, 0);
        }

        uint8_t tag = bytes[0];
        const BodyCodec* codec = find(tag);
        if (codec == nullptr) {
            return CodecFailure::unsupported_kind(tag);
        }
        return codec->decode(bytes.subspan(kind_tag_bytes));
    }

private:
    std::array<std::optional<BodyCodec>, 256> codecs_{};
};

/// Shared registry holding the built-in kinds. Never mutated after first use.
inline const CodecRegistry& default_registry() {
    static const CodecRegistry registry = CodecRegistry::with_builtin_kinds();
    return registry;
}

/// Encode with the default registry
inline Result<std::vector<uint8_t>> encode_message(const Message& msg) {
    return default_registry().encode(msg);
}

/// Decode with the default registry
inline Result<Message> decode_message(std::span<const uint8_t> bytes) {
    return default_registry().decode(bytes);
}

} // namespace jseries
