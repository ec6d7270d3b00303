#pragma once

#include <memory>
#include <thread>
#include <vector>

#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include "shellfs/server/config.hpp"
#include "shellfs/server/datagram_server.hpp"
#include "shellfs/server/filesystem.hpp"
#include "shellfs/server/stream_server.hpp"

namespace shellfs::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        /// Runs the event loop on the configured worker threads until shutdown().
        void run();

        /// Stops accepting connections and datagrams, cancels the expiry sweep and ends run().
        /// Safe to call from any thread.
        void shutdown();

        StreamServer *stream() noexcept { return stream_.get(); }
        DatagramServer *datagram() noexcept { return datagram_.get(); }

    private:
        ServerConfig config_;
        asio::io_context io_context_;
        asio::signal_set signals_;
        Filesystem filesystem_;
        std::unique_ptr<StreamServer> stream_;
        std::unique_ptr<DatagramServer> datagram_;

        std::vector<std::thread> workers_;
    };

} // namespace shellfs::server
