/**
 * VaultDrop - Length-prefixed JSON framing helpers.
 *
 * Every frame is a 4 byte big-endian payload length followed by a UTF-8 JSON document.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <nlohmann/json.hpp>

namespace vaultdrop::protocol
{

    inline constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);

    // Large enough for a 4 MiB chunk once base64 encoded, plus the envelope.
    inline constexpr std::uint32_t kMaxFramePayload = 8u * 1024u * 1024u;

    struct DecodedFrame
    {
        nlohmann::json message;
        std::size_t bytes_consumed{};
    };

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    /// Throws std::length_error when the announced payload exceeds kMaxFramePayload.
    std::uint32_t frame_payload_size(const std::array<std::uint8_t, kFrameHeaderSize> &header);

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer);

} // namespace vaultdrop::protocol
