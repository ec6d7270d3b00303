#pragma once

#include <cstddef>
#include <memory>

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include "shellfs/server/arbiter.hpp"
#include "shellfs/server/filesystem.hpp"

namespace shellfs::server
{

    /// TCP listener admitting one client at a time through the ConnectionArbiter.
    /// Connections arriving while busy get a ServerBusy frame and are closed.
    class StreamServer
    {
    public:
        StreamServer(asio::io_context &io_context, const asio::ip::tcp::endpoint &endpoint, Filesystem &filesystem,
                     std::size_t chunk_size);

        void start();

        void stop();

        asio::ip::tcp::endpoint local_endpoint() const;

        const ConnectionArbiter &arbiter() const noexcept { return *arbiter_; }

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void reject_busy(asio::ip::tcp::socket socket);

        asio::ip::tcp::acceptor acceptor_;
        Filesystem &filesystem_;
        std::size_t chunk_size_;
        std::shared_ptr<ConnectionArbiter> arbiter_;
    };

} // namespace shellfs::server
