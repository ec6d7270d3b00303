#include "shellfs/server/stream_connection.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>

#include <algorithm>
#include <span>
#include <utility>

#include <spdlog/spdlog.h>

namespace shellfs::server
{

    namespace protocol = shellfs::protocol;

    namespace
    {

        std::string endpoint_label(const asio::ip::tcp::socket &socket)
        {
            std::error_code ec;
            const auto endpoint = socket.remote_endpoint(ec);
            if (ec)
            {
                return "unknown";
            }
            return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
        }

    } // namespace

    StreamConnection::StreamConnection(asio::ip::tcp::socket socket, Filesystem &filesystem, std::size_t chunk_size,
                                       ConnectionArbiter::Lease lease)
        : socket_(std::move(socket)),
          remote_endpoint_(endpoint_label(socket_)),
          dispatcher_(filesystem, TransportKind::Stream, chunk_size),
          lease_(std::move(lease)),
          transfer_buffer_(chunk_size) {}

    StreamConnection::~StreamConnection()
    {
        session_.end_transfer();
    }

    void StreamConnection::start()
    {
        spdlog::info("Client connected from {}", remote_endpoint_);
        send_response(protocol::Ok{}, [this]
                      { read_frame_header(); });
    }

    void StreamConnection::stop()
    {
        if (stopped_)
        {
            return;
        }
        stopped_ = true;

        if (session_.transfer_active())
        {
            spdlog::warn("Connection {} dropped during transfer of {}; partial file kept", remote_endpoint_,
                         session_.transfer->path.string());
        }
        session_.end_transfer();

        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        lease_.reset();
        spdlog::info("Client {} disconnected", remote_endpoint_);
    }

    void StreamConnection::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             const auto size = protocol::read_frame_length(header_buffer_);
                             if (size == 0 || size > protocol::kMaxStreamFrameSize)
                             {
                                 spdlog::warn("Invalid frame length {} from {}", size, remote_endpoint_);
                                 stop();
                                 return;
                             }
                             buffer_.resize(size);
                             read_frame_payload(size);
                         });
    }

    void StreamConnection::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data(), size),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             protocol::Request request;
                             try
                             {
                                 request = protocol::request_from_json(protocol::decode_body(buffer_));
                             }
                             catch (const protocol::ProtocolError &ex)
                             {
                                 spdlog::warn("Protocol error from {}: {}", remote_endpoint_, ex.what());
                                 stop();
                                 return;
                             }
                             process_request(request);
                         });
    }

    void StreamConnection::process_request(const protocol::Request &request)
    {
        auto response = dispatcher_.dispatch(request, session_);
        if (!response)
        {
            read_frame_header();
            return;
        }

        const bool upload_started = std::holds_alternative<protocol::UploadStart>(request) &&
                                    std::holds_alternative<protocol::Ok>(*response);
        const bool download_started = std::holds_alternative<protocol::DownloadStart>(request) &&
                                      std::holds_alternative<protocol::FileMetadata>(*response);
        if (upload_started)
        {
            upload_failed_ = false;
            send_response(*response, [this]
                          { receive_upload(); });
            return;
        }
        if (download_started)
        {
            send_response(*response, [this]
                          { send_download(); });
            return;
        }
        send_response(*response, [this]
                      { read_frame_header(); });
    }

    void StreamConnection::send_response(const protocol::Response &response, std::function<void()> next)
    {
        auto frame = std::make_shared<std::vector<std::uint8_t>>(protocol::encode_response(response));
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(*frame),
                          [this, self, frame, next = std::move(next)](const std::error_code &ec,
                                                                      std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  stop();
                                  return;
                              }
                              next();
                          });
    }

    void StreamConnection::receive_upload()
    {
        auto &context = *session_.transfer;
        const auto remaining = context.total_size - context.bytes_transferred;
        if (remaining == 0)
        {
            finish_upload();
            return;
        }

        const auto to_read = static_cast<std::size_t>(std::min<std::uint64_t>(transfer_buffer_.size(), remaining));
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(transfer_buffer_.data(), to_read),
                         [this, self](const std::error_code &ec, std::size_t bytes_transferred)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             auto &context = *session_.transfer;
                             if (!upload_failed_)
                             {
                                 context.file.write(reinterpret_cast<const char *>(transfer_buffer_.data()),
                                                    static_cast<std::streamsize>(bytes_transferred));
                                 if (!context.file)
                                 {
                                     spdlog::error("Write to {} failed; draining the rest of the upload",
                                                   context.path.string());
                                     upload_failed_ = true;
                                 }
                             }
                             context.bytes_transferred += bytes_transferred;
                             receive_upload();
                         });
    }

    void StreamConnection::finish_upload()
    {
        auto &context = *session_.transfer;
        if (!upload_failed_)
        {
            context.file.flush();
            upload_failed_ = !context.file;
        }

        protocol::Response outcome = protocol::Ok{};
        if (upload_failed_)
        {
            outcome = protocol::make_error(ErrorCode::IoError, "failed to write uploaded file");
        }
        else
        {
            spdlog::info("Upload of {} complete ({} bytes)", context.path.string(), context.bytes_transferred);
        }
        session_.end_transfer();
        send_response(outcome, [this]
                      { read_frame_header(); });
    }

    void StreamConnection::send_download()
    {
        auto &context = *session_.transfer;
        const auto remaining = context.total_size - context.bytes_transferred;
        if (remaining == 0)
        {
            spdlog::info("Download of {} complete ({} bytes)", context.path.string(), context.bytes_transferred);
            session_.end_transfer();
            read_frame_header();
            return;
        }

        const auto to_read = static_cast<std::size_t>(std::min<std::uint64_t>(transfer_buffer_.size(), remaining));
        context.file.read(reinterpret_cast<char *>(transfer_buffer_.data()), static_cast<std::streamsize>(to_read));
        const auto read_count = static_cast<std::size_t>(context.file.gcount());
        if (read_count == 0)
        {
            spdlog::error("Read from {} failed at offset {}; closing connection", context.path.string(),
                          context.bytes_transferred);
            stop();
            return;
        }

        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(transfer_buffer_.data(), read_count),
                          [this, self](const std::error_code &ec, std::size_t bytes_transferred)
                          {
                              if (ec)
                              {
                                  stop();
                                  return;
                              }
                              session_.transfer->bytes_transferred += bytes_transferred;
                              spdlog::debug("Sent {} of {} bytes", session_.transfer->bytes_transferred,
                                            session_.transfer->total_size);
                              send_download();
                          });
    }

} // namespace shellfs::server
