/**
 * Nimbus - Length-prefixed JSON framing helpers.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <nlohmann/json.hpp>

namespace nimbus::protocol
{

    inline constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);

    // Frames larger than this are rejected by both peers.
    inline constexpr std::uint32_t kMaxFramePayload = 64u * 1024u * 1024u;

    // Largest plaintext segment a transfer may be sealed in.
    inline constexpr std::uint64_t kMaxChunkSize = 32ull * 1024 * 1024;

    // Largest ciphertext range one chunk request may carry. Its base64 form and
    // the request envelope fit one frame.
    inline constexpr std::uint64_t kMaxChunkPayload = 40ull * 1024 * 1024;

    static_assert(kMaxChunkSize + 64 <= kMaxChunkPayload);
    static_assert((kMaxChunkPayload + 2) / 3 * 4 + 1024 * 1024 <= kMaxFramePayload);

    struct DecodedFrame
    {
        nlohmann::json message;
        std::size_t bytes_consumed{};
    };

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    std::uint32_t decode_frame_size(std::span<const std::uint8_t, kFrameHeaderSize> header);

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer);

} // namespace nimbus::protocol
