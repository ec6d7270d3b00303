#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <vector>

#include <asio/io_context.hpp>
#include <asio/ip/udp.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>

#include "shellfs/framing.hpp"
#include "shellfs/server/config.hpp"
#include "shellfs/server/dispatcher.hpp"
#include "shellfs/server/filesystem.hpp"
#include "shellfs/server/session_manager.hpp"

namespace shellfs::server
{

    /// UDP endpoint serving any number of peers, one session per source address.
    ///
    /// Socket operations and the expiry timer run on one strand. Each datagram is processed
    /// on the shared io_context under its session's lease, so different peers proceed in
    /// parallel while one peer's requests are applied in turn.
    class DatagramServer
    {
    public:
        DatagramServer(asio::io_context &io_context, const asio::ip::udp::endpoint &endpoint, Filesystem &filesystem,
                       const ServerConfig &config);

        void start();

        void stop();

        asio::ip::udp::endpoint local_endpoint() const;

        SessionManager &sessions() noexcept { return sessions_; }

    private:
        void receive_next();
        void process(asio::ip::udp::endpoint peer, std::shared_ptr<std::vector<std::uint8_t>> datagram);
        void send(const asio::ip::udp::endpoint &peer, std::shared_ptr<std::vector<std::uint8_t>> frame);
        void schedule_sweep();

        asio::io_context &io_context_;
        asio::strand<asio::io_context::executor_type> strand_;
        asio::ip::udp::socket socket_;
        asio::steady_timer sweep_timer_;
        std::chrono::seconds sweep_interval_;
        Dispatcher dispatcher_;
        SessionManager sessions_;

        asio::ip::udp::endpoint sender_;
        std::array<std::uint8_t, shellfs::protocol::kMaxDatagramSize> receive_buffer_{};
    };

} // namespace shellfs::server
