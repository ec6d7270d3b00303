#pragma once

#include <cstddef>
#include <vector>

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include "shellfs/client/config.hpp"
#include "shellfs/client/connection.hpp"
#include "shellfs/client/logger.hpp"
#include "shellfs/transfer.hpp"

namespace shellfs::client
{

    /// Blocking TCP client. File bodies travel as raw bytes right after the start message.
    class StreamClient : public Connection
    {
    public:
        StreamClient(const ClientConfig &config, Logger &logger);

        /// Connects and consumes the greeting; throws ClientError(ServerBusy) when rejected.
        void connect();

        shellfs::protocol::Response request(const shellfs::protocol::Request &request) override;
        TransferResult upload(const std::filesystem::path &local, const std::string &remote_directory) override;
        TransferResult download(const std::string &remote, const std::filesystem::path &local_directory) override;

    private:
        void send(const shellfs::protocol::Request &request);
        shellfs::protocol::Response receive();

        ClientConfig config_;
        Logger &logger_;
        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        std::vector<std::uint8_t> transfer_buffer_ = std::vector<std::uint8_t>(shellfs::transfer::kDefaultChunkSize);
    };

} // namespace shellfs::client
