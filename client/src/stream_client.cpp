#include "shellfs/client/stream_client.hpp"

#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <algorithm>
#include <array>
#include <fstream>
#include <span>

#include "shellfs/crypto.hpp"
#include "shellfs/framing.hpp"

namespace shellfs::client
{

    namespace protocol = shellfs::protocol;

    StreamClient::StreamClient(const ClientConfig &config, Logger &logger)
        : config_(config), logger_(logger), socket_(io_context_) {}

    void StreamClient::connect()
    {
        asio::ip::tcp::resolver resolver(io_context_);
        const auto results = resolver.resolve(config_.host, std::to_string(config_.port));
        asio::connect(socket_, results);

        const auto greeting = receive();
        if (const auto *error = std::get_if<protocol::Error>(&greeting))
        {
            logger_.log("connect", "rejected: ", error->message);
            throw ClientError(error->code, error->message);
        }
        logger_.log("info", "connected to ", config_.host, ':', config_.port, " over tcp");
    }

    void StreamClient::send(const protocol::Request &request)
    {
        const auto frame = protocol::encode_request(request);
        asio::write(socket_, asio::buffer(frame));
    }

    protocol::Response StreamClient::receive()
    {
        std::array<std::uint8_t, protocol::kFrameHeaderSize> header{};
        asio::read(socket_, asio::buffer(header));
        const auto size = protocol::read_frame_length(header);
        if (size > protocol::kMaxStreamFrameSize)
        {
            throw protocol::ProtocolError("response frame of " + std::to_string(size) + " bytes exceeds the limit");
        }
        std::vector<std::uint8_t> body(size);
        asio::read(socket_, asio::buffer(body));
        return protocol::response_from_json(protocol::decode_body(body));
    }

    protocol::Response StreamClient::request(const protocol::Request &request)
    {
        send(request);
        auto response = receive();
        if (const auto *error = std::get_if<protocol::Error>(&response))
        {
            logger_.log("rpc", "error=", to_string(error->code), " msg=", error->message);
        }
        else
        {
            logger_.log("rpc", "success cmd=", protocol::to_string(protocol::command_of(request)));
        }
        return response;
    }

    TransferResult StreamClient::upload(const std::filesystem::path &local, const std::string &remote_directory)
    {
        const auto source = inspect_local_file(local);
        std::ifstream input(local, std::ios::binary);
        if (!input)
        {
            throw ClientError(ErrorCode::IoError, "cannot open " + local.string());
        }

        expect<protocol::Ok>(request(protocol::UploadStart{
                                 .file_name = source.name,
                                 .size = source.size,
                                 .directory = remote_directory,
                             }),
                             "OK");

        std::uint64_t sent = 0;
        while (sent < source.size)
        {
            const auto to_read =
                static_cast<std::size_t>(std::min<std::uint64_t>(transfer_buffer_.size(), source.size - sent));
            input.read(reinterpret_cast<char *>(transfer_buffer_.data()), static_cast<std::streamsize>(to_read));
            const auto read_count = static_cast<std::size_t>(input.gcount());
            if (read_count == 0)
            {
                // The server is waiting for exactly `size` bytes; nothing sensible can follow.
                socket_.close();
                throw ClientError(ErrorCode::IoError, "local file shrank during upload: " + local.string());
            }
            asio::write(socket_, asio::buffer(transfer_buffer_.data(), read_count));
            sent += read_count;
        }

        expect<protocol::Ok>(receive(), "OK");
        logger_.log("upload", source.name, " bytes=", sent);
        return TransferResult{.name = source.name, .bytes = sent, .local_path = local};
    }

    TransferResult StreamClient::download(const std::string &remote, const std::filesystem::path &local_directory)
    {
        const auto metadata =
            expect<protocol::FileMetadata>(request(protocol::DownloadStart{.source_path = remote}), "FILE_METADATA");

        const auto target = local_directory / std::filesystem::path(metadata.name).filename();
        std::ofstream output(target, std::ios::binary | std::ios::trunc);
        if (!output)
        {
            // Drain the body so the connection stays usable.
            std::uint64_t skipped = 0;
            while (skipped < metadata.size)
            {
                const auto to_read = static_cast<std::size_t>(
                    std::min<std::uint64_t>(transfer_buffer_.size(), metadata.size - skipped));
                asio::read(socket_, asio::buffer(transfer_buffer_.data(), to_read));
                skipped += to_read;
            }
            throw ClientError(ErrorCode::IoError, "cannot create " + target.string());
        }

        shellfs::crypto::StreamingHash hash;
        std::uint64_t received = 0;
        while (received < metadata.size)
        {
            const auto to_read =
                static_cast<std::size_t>(std::min<std::uint64_t>(transfer_buffer_.size(), metadata.size - received));
            asio::read(socket_, asio::buffer(transfer_buffer_.data(), to_read));
            const std::span<const std::uint8_t> piece(transfer_buffer_.data(), to_read);
            output.write(reinterpret_cast<const char *>(piece.data()), static_cast<std::streamsize>(piece.size()));
            hash.update(piece);
            received += to_read;
        }
        output.flush();
        if (!output)
        {
            throw ClientError(ErrorCode::IoError, "failed to write " + target.string());
        }

        if (metadata.content_hash && hash.finish() != *metadata.content_hash)
        {
            throw ClientError(ErrorCode::IoError, "content hash mismatch for " + metadata.name);
        }
        logger_.log("download", metadata.name, " bytes=", received);
        return TransferResult{.name = metadata.name, .bytes = received, .local_path = target};
    }

} // namespace shellfs::client
