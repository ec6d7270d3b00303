#include "shellfs/server/server.hpp"

#include <asio/ip/address.hpp>
#include <asio/post.hpp>

#include <csignal>
#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace shellfs::server
{

    namespace
    {

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          signals_(io_context_),
          filesystem_(config_.root)
    {
        if (config_.chunk_size == 0 || config_.chunk_size > shellfs::transfer::kMaxChunkSize)
        {
            throw std::invalid_argument("chunk size must be between 1 and " +
                                        std::to_string(shellfs::transfer::kMaxChunkSize));
        }

        const auto address = asio::ip::make_address(config_.address);
        if (config_.transport != TransportMode::Datagram)
        {
            stream_ = std::make_unique<StreamServer>(io_context_, asio::ip::tcp::endpoint(address, config_.port),
                                                     filesystem_, config_.chunk_size);
        }
        if (config_.transport != TransportMode::Stream)
        {
            datagram_ = std::make_unique<DatagramServer>(io_context_, asio::ip::udp::endpoint(address, config_.port),
                                                         filesystem_, config_);
        }

        spdlog::info("Serving {} on {}:{}", filesystem_.root().string(), config_.address, config_.port);

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int signal)
                            {
            if (!ec)
            {
                spdlog::info("Signal {} received, shutting down", signal);
                shutdown();
            } });
    }

    void Server::run()
    {
        if (stream_)
        {
            stream_->start();
        }
        if (datagram_)
        {
            datagram_->start();
        }

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count - 1);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Server event loop running with {} threads", worker_count);
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
        workers_.clear();
        spdlog::info("Server stopped");
    }

    void Server::shutdown()
    {
        asio::post(io_context_, [this]
                   {
            if (stream_)
            {
                stream_->stop();
            }
            if (datagram_)
            {
                datagram_->stop();
            }
            std::error_code ec;
            signals_.cancel(ec);
            io_context_.stop(); });
    }

} // namespace shellfs::server
