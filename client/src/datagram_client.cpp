#include "shellfs/client/datagram_client.hpp"

#include <asio/connect.hpp>

#include <fstream>
#include <span>

#include "shellfs/crypto.hpp"

namespace shellfs::client
{

    namespace protocol = shellfs::protocol;
    namespace transfer = shellfs::transfer;

    namespace
    {

        bool is_error(const protocol::Response &response)
        {
            return std::holds_alternative<protocol::Error>(response);
        }

    } // namespace

    DatagramClient::DatagramClient(const ClientConfig &config, Logger &logger, std::size_t chunk_size)
        : config_(config),
          logger_(logger),
          chunk_size_(chunk_size),
          policy_{.timeout = config.chunk_timeout, .max_attempts = config.max_attempts},
          socket_(io_context_) {}

    void DatagramClient::connect()
    {
        asio::ip::udp::resolver resolver(io_context_);
        const auto results = resolver.resolve(asio::ip::udp::v4(), config_.host, std::to_string(config_.port));
        asio::connect(socket_, results);
        logger_.log("info", "using ", config_.host, ':', config_.port, " over udp");
    }

    void DatagramClient::send(const protocol::Request &request)
    {
        const auto frame = protocol::encode_request(request);
        if (frame.size() > protocol::kMaxDatagramSize)
        {
            throw ClientError(ErrorCode::InvalidPayload, "request too large for one datagram");
        }
        socket_.send(asio::buffer(frame));
    }

    std::optional<protocol::Response> DatagramClient::receive_for(Clock::duration timeout)
    {
        std::optional<std::size_t> received;
        std::error_code receive_ec;
        socket_.async_receive(asio::buffer(receive_buffer_),
                              [&](const std::error_code &ec, std::size_t bytes_received)
                              {
                                  receive_ec = ec;
                                  received = bytes_received;
                              });

        io_context_.restart();
        io_context_.run_for(timeout);
        if (!received)
        {
            socket_.cancel();
            io_context_.restart();
            io_context_.run();
            return std::nullopt;
        }
        if (receive_ec)
        {
            logger_.log("udp", "receive failed: ", receive_ec.message());
            return std::nullopt;
        }

        try
        {
            return protocol::response_from_json(
                protocol::decode_datagram(std::span<const std::uint8_t>(receive_buffer_.data(), *received)));
        }
        catch (const protocol::ProtocolError &ex)
        {
            logger_.log("udp", "dropping malformed datagram: ", ex.what());
            return std::nullopt;
        }
    }

    std::optional<protocol::Response> DatagramClient::await(const Matcher &matches, Clock::duration timeout)
    {
        const auto deadline = Clock::now() + timeout;
        for (auto now = Clock::now(); now < deadline; now = Clock::now())
        {
            auto response = receive_for(deadline - now);
            if (!response)
            {
                return std::nullopt;
            }
            if (is_error(*response) || matches(*response))
            {
                return response;
            }
            logger_.log("udp", "ignoring stale ", protocol::to_string(protocol::kind_of(*response)));
        }
        return std::nullopt;
    }

    protocol::Response DatagramClient::exchange(const protocol::Request &request, const Matcher &matches,
                                                const std::string &what)
    {
        try
        {
            return transfer::exchange_with_retry(
                policy_, [&]
                { send(request); },
                [&](std::chrono::milliseconds timeout)
                { return await(matches, timeout); },
                what);
        }
        catch (const transfer::TransferError &ex)
        {
            logger_.log("udp", ex.what());
            throw ClientError(ex.code(), ex.what());
        }
    }

    protocol::Response DatagramClient::request(const protocol::Request &request)
    {
        send(request);
        auto response = await([](const protocol::Response &candidate)
                              { return !std::holds_alternative<protocol::ChunkAck>(candidate) &&
                                       !std::holds_alternative<protocol::FileChunk>(candidate); },
                              policy_.timeout);
        if (!response)
        {
            throw ClientError(ErrorCode::ChunkTimeout, "no response from server within " +
                                                           std::to_string(config_.chunk_timeout.count()) + "s");
        }
        logger_.log("rpc", protocol::to_string(protocol::command_of(request)), " -> ",
                    protocol::to_string(protocol::kind_of(*response)));
        return std::move(*response);
    }

    TransferResult DatagramClient::upload(const std::filesystem::path &local, const std::string &remote_directory)
    {
        const auto source_info = inspect_local_file(local);
        std::ifstream input(local, std::ios::binary);
        if (!input)
        {
            throw ClientError(ErrorCode::IoError, "cannot open " + local.string());
        }

        const protocol::Request start = protocol::UploadStart{
            .file_name = source_info.name,
            .size = source_info.size,
            .directory = remote_directory,
        };
        expect<protocol::Ok>(exchange(start, [](const protocol::Response &candidate)
                                      { return std::holds_alternative<protocol::Ok>(candidate); },
                                      "upload start"),
                             "OK");

        transfer::ChunkSource source(input, source_info.size, chunk_size_);
        while (!source.finished())
        {
            auto chunk = source.next();
            const auto id = chunk.id;
            const protocol::Request message = protocol::UploadChunk{.id = id, .data = std::move(chunk.data),
                                                                    .is_last = chunk.is_last};
            const auto reply = exchange(
                message, [id](const protocol::Response &candidate)
                {
                    const auto *ack = std::get_if<protocol::ChunkAck>(&candidate);
                    return ack != nullptr && ack->id == id; },
                "upload chunk " + std::to_string(id));
            expect_success(reply);
        }

        logger_.log("upload", source_info.name, " bytes=", source.bytes_read(), " chunks=", source.next_id());
        return TransferResult{.name = source_info.name, .bytes = source.bytes_read(), .local_path = local};
    }

    TransferResult DatagramClient::download(const std::string &remote, const std::filesystem::path &local_directory)
    {
        const protocol::Request start = protocol::DownloadStart{.source_path = remote};
        const auto metadata = expect<protocol::FileMetadata>(
            exchange(start, [](const protocol::Response &candidate)
                     { return std::holds_alternative<protocol::FileMetadata>(candidate); },
                     "download start"),
            "FILE_METADATA");

        const auto target = local_directory / std::filesystem::path(metadata.name).filename();
        std::ofstream output(target, std::ios::binary | std::ios::trunc);
        if (!output)
        {
            throw ClientError(ErrorCode::IoError, "cannot create " + target.string());
        }

        shellfs::crypto::StreamingHash hash;
        std::uint64_t received = 0;
        for (std::uint32_t id = 0;; ++id)
        {
            const auto reply = exchange(
                protocol::DownloadChunk{.id = id}, [id](const protocol::Response &candidate)
                {
                    const auto *chunk = std::get_if<protocol::FileChunk>(&candidate);
                    return chunk != nullptr && chunk->id == id; },
                "download chunk " + std::to_string(id));
            const auto &chunk = expect<protocol::FileChunk>(reply, "FILE_CHUNK");

            output.write(reinterpret_cast<const char *>(chunk.data.data()),
                         static_cast<std::streamsize>(chunk.data.size()));
            if (!output)
            {
                throw ClientError(ErrorCode::IoError, "failed to write " + target.string());
            }
            hash.update(chunk.data);
            received += chunk.data.size();
            if (chunk.is_last)
            {
                break;
            }
        }
        output.flush();

        if (received != metadata.size)
        {
            throw ClientError(ErrorCode::IoError, "received " + std::to_string(received) + " of " +
                                                      std::to_string(metadata.size) + " bytes");
        }
        if (metadata.content_hash && hash.finish() != *metadata.content_hash)
        {
            throw ClientError(ErrorCode::IoError, "content hash mismatch for " + metadata.name);
        }
        logger_.log("download", metadata.name, " bytes=", received);
        return TransferResult{.name = metadata.name, .bytes = received, .local_path = target};
    }

} // namespace shellfs::client
