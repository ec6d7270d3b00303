#include "shellfs/framing.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

namespace shellfs::protocol
{

    namespace
    {
        std::uint32_t read_u32_be(std::span<const std::uint8_t> buffer)
        {
            return (static_cast<std::uint32_t>(buffer[0]) << 24) |
                   (static_cast<std::uint32_t>(buffer[1]) << 16) |
                   (static_cast<std::uint32_t>(buffer[2]) << 8) |
                   static_cast<std::uint32_t>(buffer[3]);
        }

        void write_u32_be(std::uint32_t value, std::span<std::uint8_t> buffer)
        {
            buffer[0] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
            buffer[1] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
            buffer[2] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
            buffer[3] = static_cast<std::uint8_t>(value & 0xFF);
        }

        // Walks a CBOR body without building it and stops at the first container nested
        // deeper than the limit.
        class DepthLimit : public nlohmann::json_sax<nlohmann::json>
        {
        public:
            explicit DepthLimit(std::size_t max_depth) : max_depth_(max_depth) {}

            bool null() override { return true; }
            bool boolean(bool) override { return true; }
            bool number_integer(number_integer_t) override { return true; }
            bool number_unsigned(number_unsigned_t) override { return true; }
            bool number_float(number_float_t, const string_t &) override { return true; }
            bool string(string_t &) override { return true; }
            bool binary(binary_t &) override { return true; }
            bool key(string_t &) override { return true; }

            bool start_object(std::size_t) override { return enter(); }
            bool end_object() override { return leave(); }
            bool start_array(std::size_t) override { return enter(); }
            bool end_array() override { return leave(); }

            bool parse_error(std::size_t, const std::string &, const nlohmann::json::exception &ex) override
            {
                error_ = ex.what();
                return false;
            }

            bool too_deep() const noexcept { return too_deep_; }
            const std::string &error() const noexcept { return error_; }

        private:
            bool enter()
            {
                if (++depth_ > max_depth_)
                {
                    too_deep_ = true;
                    return false;
                }
                return true;
            }

            bool leave()
            {
                --depth_;
                return true;
            }

            std::size_t max_depth_;
            std::size_t depth_{0};
            bool too_deep_{false};
            std::string error_;
        };
    } // namespace

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message)
    {
        const auto body = nlohmann::json::to_cbor(message);
        if (body.size() > std::numeric_limits<std::uint32_t>::max())
        {
            throw std::length_error("message too large to frame");
        }
        std::vector<std::uint8_t> frame(kFrameHeaderSize + body.size());
        write_u32_be(static_cast<std::uint32_t>(body.size()), std::span<std::uint8_t>(frame).first<kFrameHeaderSize>());
        std::copy(body.begin(), body.end(), frame.begin() + static_cast<std::ptrdiff_t>(kFrameHeaderSize));
        return frame;
    }

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer)
    {
        if (buffer.size() < kFrameHeaderSize)
        {
            return std::nullopt;
        }
        const auto body_size = read_u32_be(buffer.first<kFrameHeaderSize>());
        if (body_size > kMaxStreamFrameSize)
        {
            throw ProtocolError("frame of " + std::to_string(body_size) + " bytes exceeds the limit");
        }
        if (buffer.size() < kFrameHeaderSize + body_size)
        {
            return std::nullopt;
        }
        DecodedFrame result{
            .message = decode_body(buffer.subspan(kFrameHeaderSize, body_size)),
            .bytes_consumed = kFrameHeaderSize + body_size,
        };
        return result;
    }

    nlohmann::json decode_datagram(std::span<const std::uint8_t> datagram)
    {
        if (datagram.size() > kMaxDatagramSize)
        {
            throw ProtocolError("datagram exceeds the maximum size");
        }
        if (datagram.size() < kFrameHeaderSize)
        {
            throw ProtocolError("truncated frame header");
        }
        const auto body_size = read_u32_be(datagram.first<kFrameHeaderSize>());
        if (datagram.size() - kFrameHeaderSize != body_size)
        {
            throw ProtocolError("frame length " + std::to_string(body_size) + " does not match datagram of " +
                                std::to_string(datagram.size()) + " bytes");
        }
        return decode_body(datagram.subspan(kFrameHeaderSize));
    }

    std::uint32_t read_frame_length(const std::array<std::uint8_t, kFrameHeaderSize> &header)
    {
        return read_u32_be(header);
    }

    nlohmann::json decode_body(std::span<const std::uint8_t> body)
    {
        try
        {
            DepthLimit limit(kMaxMessageDepth);
            if (!nlohmann::json::sax_parse(body.begin(), body.end(), &limit, nlohmann::json::input_format_t::cbor))
            {
                if (limit.too_deep())
                {
                    throw ProtocolError("frame nests deeper than " + std::to_string(kMaxMessageDepth) + " levels");
                }
                throw ProtocolError("undecodable frame: " + limit.error());
            }
            return nlohmann::json::from_cbor(body.begin(), body.end());
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw ProtocolError(std::string("undecodable frame: ") + ex.what());
        }
    }

    std::vector<std::uint8_t> encode_request(const Request &request)
    {
        return encode_frame(request_to_json(request));
    }

    std::vector<std::uint8_t> encode_response(const Response &response)
    {
        return encode_frame(response_to_json(response));
    }

} // namespace shellfs::protocol
