#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <asio/ip/tcp.hpp>

#include "shellfs/framing.hpp"
#include "shellfs/protocol.hpp"
#include "shellfs/server/arbiter.hpp"
#include "shellfs/server/dispatcher.hpp"
#include "shellfs/server/filesystem.hpp"
#include "shellfs/server/session.hpp"

namespace shellfs::server
{

    /// The one admitted stream client. Owns its session; the session dies with the connection.
    ///
    /// Every step (frame read, dispatch, response write, raw transfer) is chained from the
    /// previous completion handler, so at most one operation is outstanding at a time.
    class StreamConnection : public std::enable_shared_from_this<StreamConnection>
    {
    public:
        StreamConnection(asio::ip::tcp::socket socket, Filesystem &filesystem, std::size_t chunk_size,
                         ConnectionArbiter::Lease lease);
        ~StreamConnection();

        void start();

        void stop();

        const std::string &remote_endpoint() const noexcept { return remote_endpoint_; }

    private:
        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void process_request(const shellfs::protocol::Request &request);
        void send_response(const shellfs::protocol::Response &response, std::function<void()> next);

        void receive_upload();
        void finish_upload();
        void send_download();

        asio::ip::tcp::socket socket_;
        std::string remote_endpoint_;
        Dispatcher dispatcher_;
        Session session_;
        std::optional<ConnectionArbiter::Lease> lease_;
        bool stopped_{false};
        bool upload_failed_{false};

        std::array<std::uint8_t, shellfs::protocol::kFrameHeaderSize> header_buffer_{};
        std::vector<std::uint8_t> buffer_;
        std::vector<std::uint8_t> transfer_buffer_;
    };

} // namespace shellfs::server
