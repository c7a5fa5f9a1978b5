#include "chunkvault/framing.hpp"

#include <stdexcept>
#include <string>

namespace chunkvault::protocol
{

    std::uint32_t read_frame_length(std::span<const std::uint8_t, kFrameHeaderSize> header) noexcept
    {
        std::uint32_t length = 0;
        for (const auto byte : header)
        {
            length = (length << 8) | byte;
        }
        return length;
    }

    FrameHeader parse_frame_header(std::span<const std::uint8_t, kFrameHeaderSize> header)
    {
        const FrameHeader parsed{.payload_size = read_frame_length(header)};
        if (parsed.payload_size > kMaxFramePayload)
        {
            throw std::length_error("Frame of " + std::to_string(parsed.payload_size) +
                                    " bytes exceeds the limit of " + std::to_string(kMaxFramePayload));
        }
        return parsed;
    }

    nlohmann::json parse_frame_payload(std::span<const std::uint8_t> payload)
    {
        return nlohmann::json::parse(payload.begin(), payload.end());
    }

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message)
    {
        const auto text = message.dump();
        if (text.size() > kMaxFramePayload)
        {
            throw std::length_error("Message of " + std::to_string(text.size()) + " bytes is too large to frame");
        }
        auto length = static_cast<std::uint32_t>(text.size());

        std::vector<std::uint8_t> frame;
        frame.reserve(kFrameHeaderSize + text.size());
        frame.resize(kFrameHeaderSize);
        for (std::size_t i = kFrameHeaderSize; i-- > 0;)
        {
            frame[i] = static_cast<std::uint8_t>(length & 0xFFu);
            length >>= 8;
        }
        frame.insert(frame.end(), text.begin(), text.end());
        return frame;
    }

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer)
    {
        if (buffer.size() < kFrameHeaderSize)
        {
            return std::nullopt;
        }
        const auto header = parse_frame_header(buffer.first<kFrameHeaderSize>());
        if (buffer.size() < header.frame_size())
        {
            return std::nullopt;
        }
        DecodedFrame decoded{.message = nullptr, .bytes_consumed = header.frame_size()};
        if (!header.keep_alive())
        {
            decoded.message = parse_frame_payload(buffer.subspan(kFrameHeaderSize, header.payload_size));
        }
        return decoded;
    }

} // namespace chunkvault::protocol
