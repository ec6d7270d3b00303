#pragma once

#include <array>
#include <chrono>
#include <functional>
#include <optional>

#include <asio/io_context.hpp>
#include <asio/ip/udp.hpp>

#include "shellfs/client/config.hpp"
#include "shellfs/client/connection.hpp"
#include "shellfs/client/logger.hpp"
#include "shellfs/framing.hpp"
#include "shellfs/transfer.hpp"

namespace shellfs::client
{

    /// UDP client. Directory requests get one reply within the timeout; transfer starts and
    /// chunks are retransmitted until the matching reply arrives or the attempts run out.
    class DatagramClient : public Connection
    {
    public:
        DatagramClient(const ClientConfig &config, Logger &logger,
                       std::size_t chunk_size = shellfs::transfer::kDefaultChunkSize);

        void connect();

        shellfs::protocol::Response request(const shellfs::protocol::Request &request) override;
        TransferResult upload(const std::filesystem::path &local, const std::string &remote_directory) override;
        TransferResult download(const std::string &remote, const std::filesystem::path &local_directory) override;

        const shellfs::transfer::RetryPolicy &retry_policy() const noexcept { return policy_; }

    private:
        using Clock = std::chrono::steady_clock;
        using Matcher = std::function<bool(const shellfs::protocol::Response &)>;

        void send(const shellfs::protocol::Request &request);
        std::optional<shellfs::protocol::Response> receive_for(Clock::duration timeout);

        /// Waits up to `timeout` for a reply accepted by `matches`, discarding stale ones.
        std::optional<shellfs::protocol::Response> await(const Matcher &matches, Clock::duration timeout);

        shellfs::protocol::Response exchange(const shellfs::protocol::Request &request, const Matcher &matches,
                                             const std::string &what);

        ClientConfig config_;
        Logger &logger_;
        std::size_t chunk_size_;
        shellfs::transfer::RetryPolicy policy_;
        asio::io_context io_context_;
        asio::ip::udp::socket socket_;
        std::array<std::uint8_t, shellfs::protocol::kMaxDatagramSize> receive_buffer_{};
    };

} // namespace shellfs::client
