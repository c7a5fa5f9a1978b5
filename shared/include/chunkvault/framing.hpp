/**
 * ChunkVault - Length-prefixed JSON framing helpers.
 *
 * A frame is a 4-byte big-endian payload length followed by a JSON document.
 * A zero length is a keep-alive and carries no document.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <nlohmann/json.hpp>

namespace chunkvault::protocol
{

    inline constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);

    // Large enough for a base64-encoded 10 MiB chunk plus envelope.
    inline constexpr std::uint32_t kMaxFramePayload = 16u * 1024u * 1024u;

    using FrameHeaderBytes = std::array<std::uint8_t, kFrameHeaderSize>;

    struct FrameHeader
    {
        std::uint32_t payload_size{};

        bool keep_alive() const noexcept { return payload_size == 0; }
        std::size_t frame_size() const noexcept { return kFrameHeaderSize + payload_size; }
    };

    struct DecodedFrame
    {
        nlohmann::json message;
        std::size_t bytes_consumed{};
    };

    std::uint32_t read_frame_length(std::span<const std::uint8_t, kFrameHeaderSize> header) noexcept;

    // Throws std::length_error when the announced payload exceeds kMaxFramePayload.
    FrameHeader parse_frame_header(std::span<const std::uint8_t, kFrameHeaderSize> header);

    // Throws nlohmann::json::parse_error on malformed documents.
    nlohmann::json parse_frame_payload(std::span<const std::uint8_t> payload);

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    /// Decodes the first complete frame of `buffer`. Returns std::nullopt while more bytes
    /// are needed; keep-alive frames decode to a null message.
    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer);

} // namespace chunkvault::protocol
