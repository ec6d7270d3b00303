/**
 * shellfs - Length-prefixed CBOR framing helpers.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <nlohmann/json.hpp>

#include "shellfs/protocol.hpp"

namespace shellfs::protocol
{

    inline constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);
    inline constexpr std::size_t kMaxStreamFrameSize = 1u << 20;
    inline constexpr std::size_t kMaxDatagramSize = 65507;
    // Responses above this are replaced by an error on the datagram transport.
    inline constexpr std::size_t kMaxDatagramPayload = 65000;
    // Deepest container nesting a decoded message may have.
    inline constexpr std::size_t kMaxMessageDepth = 8;

    struct DecodedFrame
    {
        nlohmann::json message;
        std::size_t bytes_consumed{};
    };

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    /// Returns std::nullopt while the buffer holds less than one complete frame.
    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer);

    /// A datagram must hold exactly one complete frame.
    nlohmann::json decode_datagram(std::span<const std::uint8_t> datagram);

    std::uint32_t read_frame_length(const std::array<std::uint8_t, kFrameHeaderSize> &header);

    nlohmann::json decode_body(std::span<const std::uint8_t> body);

    std::vector<std::uint8_t> encode_request(const Request &request);
    std::vector<std::uint8_t> encode_response(const Response &response);

} // namespace shellfs::protocol
