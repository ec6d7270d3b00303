#include "shellfs/server/stream_server.hpp"

#include <asio/write.hpp>

#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "shellfs/framing.hpp"
#include "shellfs/server/stream_connection.hpp"

namespace shellfs::server
{

    StreamServer::StreamServer(asio::io_context &io_context, const asio::ip::tcp::endpoint &endpoint,
                               Filesystem &filesystem, std::size_t chunk_size)
        : acceptor_(io_context),
          filesystem_(filesystem),
          chunk_size_(chunk_size),
          arbiter_(std::make_shared<ConnectionArbiter>())
    {
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
    }

    void StreamServer::start()
    {
        const auto endpoint = local_endpoint();
        spdlog::info("Stream transport listening on {}:{}", endpoint.address().to_string(), endpoint.port());
        accept_next();
    }

    void StreamServer::stop()
    {
        std::error_code ec;
        acceptor_.close(ec);
    }

    asio::ip::tcp::endpoint StreamServer::local_endpoint() const
    {
        return acceptor_.local_endpoint();
    }

    void StreamServer::accept_next()
    {
        acceptor_.async_accept([this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void StreamServer::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (ec == asio::error::operation_aborted || !acceptor_.is_open())
        {
            return;
        }
        if (ec)
        {
            spdlog::error("Accept error: {}", ec.message());
            accept_next();
            return;
        }

        if (auto lease = arbiter_->try_acquire())
        {
            auto connection =
                std::make_shared<StreamConnection>(std::move(socket), filesystem_, chunk_size_, std::move(*lease));
            connection->start();
        }
        else
        {
            reject_busy(std::move(socket));
        }
        accept_next();
    }

    void StreamServer::reject_busy(asio::ip::tcp::socket socket)
    {
        auto rejected = std::make_shared<asio::ip::tcp::socket>(std::move(socket));
        std::error_code ec;
        const auto peer = rejected->remote_endpoint(ec);
        if (!ec)
        {
            spdlog::info("Rejecting {}:{}: server busy", peer.address().to_string(), peer.port());
        }

        auto frame = std::make_shared<std::vector<std::uint8_t>>(shellfs::protocol::encode_response(
            shellfs::protocol::make_error(ErrorCode::ServerBusy, "server busy: another client is connected")));
        asio::async_write(*rejected, asio::buffer(*frame),
                          [rejected, frame](const std::error_code & /*ec*/, std::size_t /*bytes_transferred*/)
                          {
                              std::error_code close_ec;
                              rejected->shutdown(asio::ip::tcp::socket::shutdown_both, close_ec);
                              rejected->close(close_ec);
                          });
    }

} // namespace shellfs::server
