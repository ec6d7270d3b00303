#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "shellfs/protocol.hpp"
#include "shellfs/server/filesystem.hpp"
#include "shellfs/server/session.hpp"
#include "shellfs/transfer.hpp"

namespace shellfs::server
{

    enum class TransportKind : std::uint8_t
    {
        Stream,
        Datagram
    };

    /// Routes one decoded request against a session.
    ///
    /// Returns the single response to send back, or std::nullopt when the request must be
    /// dropped without a reply (an out-of-order chunk). Failures never escape: they become
    /// Error responses and leave the session as it was, apart from aborted transfers.
    class Dispatcher
    {
    public:
        Dispatcher(Filesystem &filesystem, TransportKind transport,
                   std::size_t chunk_size = shellfs::transfer::kDefaultChunkSize);

        std::optional<shellfs::protocol::Response> dispatch(const shellfs::protocol::Request &request,
                                                            Session &session);

        TransportKind transport() const noexcept { return transport_; }

    private:
        shellfs::protocol::Response handle(const shellfs::protocol::ListDirectory &request, Session &session);
        shellfs::protocol::Response handle(const shellfs::protocol::ChangeDirectory &request, Session &session);
        shellfs::protocol::Response handle(const shellfs::protocol::ChangeDirectoryUp &request, Session &session);
        shellfs::protocol::Response handle(const shellfs::protocol::MakeDirectory &request, Session &session);
        shellfs::protocol::Response handle(const shellfs::protocol::CopyFile &request, Session &session);
        shellfs::protocol::Response handle(const shellfs::protocol::UploadStart &request, Session &session);
        shellfs::protocol::Response handle(const shellfs::protocol::DownloadStart &request, Session &session);
        std::optional<shellfs::protocol::Response> handle(const shellfs::protocol::UploadChunk &request,
                                                          Session &session);
        std::optional<shellfs::protocol::Response> handle(const shellfs::protocol::DownloadChunk &request,
                                                          Session &session);

        Filesystem &filesystem_;
        TransportKind transport_;
        std::size_t chunk_size_;
    };

} // namespace shellfs::server
