#include "shellfs/server/datagram_server.hpp"

#include <asio/bind_executor.hpp>
#include <asio/post.hpp>

#include <optional>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace shellfs::server
{

    namespace protocol = shellfs::protocol;

    namespace
    {

        std::string identity_of(const asio::ip::udp::endpoint &peer)
        {
            return peer.address().to_string() + ":" + std::to_string(peer.port());
        }

    } // namespace

    DatagramServer::DatagramServer(asio::io_context &io_context, const asio::ip::udp::endpoint &endpoint,
                                   Filesystem &filesystem, const ServerConfig &config)
        : io_context_(io_context),
          strand_(asio::make_strand(io_context)),
          socket_(strand_),
          sweep_timer_(strand_),
          sweep_interval_(config.sweep_interval),
          dispatcher_(filesystem, TransportKind::Datagram, config.chunk_size),
          sessions_(config.idle_timeout)
    {
        socket_.open(endpoint.protocol());
        socket_.set_option(asio::ip::udp::socket::reuse_address(true));
        socket_.bind(endpoint);
    }

    void DatagramServer::start()
    {
        const auto endpoint = local_endpoint();
        spdlog::info("Datagram transport listening on {}:{} (idle timeout {}s)", endpoint.address().to_string(),
                     endpoint.port(), sessions_.idle_timeout().count());
        asio::post(strand_, [this]
                   {
            receive_next();
            schedule_sweep(); });
    }

    void DatagramServer::stop()
    {
        asio::post(strand_, [this]
                   {
            std::error_code ec;
            sweep_timer_.cancel();
            socket_.close(ec); });
    }

    asio::ip::udp::endpoint DatagramServer::local_endpoint() const
    {
        return socket_.local_endpoint();
    }

    void DatagramServer::receive_next()
    {
        socket_.async_receive_from(
            asio::buffer(receive_buffer_), sender_,
            asio::bind_executor(strand_, [this](const std::error_code &ec, std::size_t bytes_received)
                                {
                if (ec == asio::error::operation_aborted || !socket_.is_open())
                {
                    return;
                }
                if (ec)
                {
                    spdlog::error("Datagram receive error: {}", ec.message());
                }
                else
                {
                    auto datagram = std::make_shared<std::vector<std::uint8_t>>(
                        receive_buffer_.begin(), receive_buffer_.begin() + static_cast<std::ptrdiff_t>(bytes_received));
                    asio::post(io_context_, [this, peer = sender_, datagram]
                               { process(peer, datagram); });
                }
                receive_next(); }));
    }

    void DatagramServer::process(asio::ip::udp::endpoint peer, std::shared_ptr<std::vector<std::uint8_t>> datagram)
    {
        const auto identity = identity_of(peer);

        protocol::Request request;
        try
        {
            request = protocol::request_from_json(protocol::decode_datagram(*datagram));
        }
        catch (const protocol::ProtocolError &ex)
        {
            spdlog::warn("Dropping malformed datagram from {}: {}", identity, ex.what());
            return;
        }

        std::optional<protocol::Response> response;
        {
            const auto now = SessionManager::Clock::now();
            auto lease = sessions_.get_or_create(identity, now);
            if (lease.created())
            {
                spdlog::info("New datagram session for {}", identity);
            }
            lease.touch(now);
            response = dispatcher_.dispatch(request, *lease);
        }
        if (!response)
        {
            return;
        }

        auto frame = std::make_shared<std::vector<std::uint8_t>>(protocol::encode_response(*response));
        if (frame->size() > protocol::kMaxDatagramPayload)
        {
            spdlog::warn("Response {} for {} is {} bytes; replacing with an error",
                         protocol::to_string(protocol::kind_of(*response)), identity, frame->size());
            *frame = protocol::encode_response(
                protocol::make_error(ErrorCode::InternalError, "response too large for datagram transport"));
        }
        send(peer, std::move(frame));
    }

    void DatagramServer::send(const asio::ip::udp::endpoint &peer, std::shared_ptr<std::vector<std::uint8_t>> frame)
    {
        asio::post(strand_, [this, peer, frame = std::move(frame)]
                   {
            if (!socket_.is_open())
            {
                return;
            }
            socket_.async_send_to(asio::buffer(*frame), peer,
                                  asio::bind_executor(strand_, [frame, peer](const std::error_code &ec, std::size_t /*bytes_sent*/)
                                                      {
                                      if (ec && ec != asio::error::operation_aborted)
                                      {
                                          spdlog::error("Datagram send to {}:{} failed: {}", peer.address().to_string(),
                                                        peer.port(), ec.message());
                                      } })); });
    }

    void DatagramServer::schedule_sweep()
    {
        sweep_timer_.expires_after(sweep_interval_);
        sweep_timer_.async_wait(asio::bind_executor(strand_, [this](const std::error_code &ec)
                                                    {
            if (ec || !socket_.is_open())
            {
                return;
            }
            sessions_.expire_idle(SessionManager::Clock::now());
            schedule_sweep(); }));
    }

} // namespace shellfs::server
