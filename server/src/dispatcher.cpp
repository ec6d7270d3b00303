#include "shellfs/server/dispatcher.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include <spdlog/spdlog.h>

#include "shellfs/crypto.hpp"

namespace shellfs::server
{

    namespace protocol = shellfs::protocol;
    namespace transfer = shellfs::transfer;

    namespace
    {

        std::string display_path(const std::filesystem::path &cwd)
        {
            return cwd.empty() ? std::string{"/"} : "/" + cwd.generic_string();
        }

        template <typename T>
        constexpr bool is_chunk_request_v =
            std::is_same_v<T, protocol::UploadChunk> || std::is_same_v<T, protocol::DownloadChunk>;

        // A start whose reply was lost arrives again before any chunk moved.
        bool repeats_pending_start(const TransferContext &context, TransferDirection direction,
                                   const std::filesystem::path &path)
        {
            return context.direction == direction && context.sequencer.expected() == 0 && context.path == path;
        }

    } // namespace

    Dispatcher::Dispatcher(Filesystem &filesystem, TransportKind transport, std::size_t chunk_size)
        : filesystem_(filesystem), transport_(transport), chunk_size_(chunk_size)
    {
        if (chunk_size_ == 0 || chunk_size_ > transfer::kMaxChunkSize)
        {
            throw std::invalid_argument("chunk size out of range");
        }
    }

    std::optional<protocol::Response> Dispatcher::dispatch(const protocol::Request &request, Session &session)
    {
        spdlog::debug("Dispatching {} in {}", protocol::to_string(protocol::command_of(request)),
                      display_path(session.cwd));
        try
        {
            return std::visit(
                [&](const auto &body) -> std::optional<protocol::Response>
                {
                    using T = std::decay_t<decltype(body)>;
                    if constexpr (is_chunk_request_v<T>)
                    {
                        if (transport_ == TransportKind::Stream)
                        {
                            return protocol::make_error(ErrorCode::InvalidCommand,
                                                        "chunk messages are not used on the stream transport");
                        }
                        return handle(body, session);
                    }
                    else
                    {
                        return handle(body, session);
                    }
                },
                request);
        }
        catch (const FilesystemError &ex)
        {
            return protocol::make_error(ex.code(), ex.what());
        }
        catch (const transfer::TransferError &ex)
        {
            return protocol::make_error(ex.code(), ex.what());
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Request {} failed: {}", protocol::to_string(protocol::command_of(request)), ex.what());
            return protocol::make_error(ErrorCode::InternalError, ex.what());
        }
    }

    protocol::Response Dispatcher::handle(const protocol::ListDirectory &, Session &session)
    {
        return protocol::Listing{.entries = filesystem_.list(session.cwd)};
    }

    protocol::Response Dispatcher::handle(const protocol::ChangeDirectory &request, Session &session)
    {
        session.cwd = filesystem_.change_directory(session.cwd, request.path);
        return protocol::Ok{};
    }

    protocol::Response Dispatcher::handle(const protocol::ChangeDirectoryUp &, Session &session)
    {
        session.cwd = filesystem_.parent_directory(session.cwd);
        return protocol::Ok{};
    }

    protocol::Response Dispatcher::handle(const protocol::MakeDirectory &request, Session &session)
    {
        filesystem_.make_directory(session.cwd, request.name);
        return protocol::Ok{};
    }

    protocol::Response Dispatcher::handle(const protocol::CopyFile &request, Session &session)
    {
        const auto bytes = filesystem_.copy(session.cwd, request.source, request.destination);
        spdlog::debug("Copied {} -> {} ({} bytes)", request.source, request.destination, bytes);
        return protocol::Ok{};
    }

    protocol::Response Dispatcher::handle(const protocol::UploadStart &request, Session &session)
    {
        if (session.transfer_active())
        {
            if (transport_ == TransportKind::Datagram)
            {
                const auto target = filesystem_.resolve(session.cwd, request.directory.empty() ? std::string{"."}
                                                                                                : request.directory) /
                                    std::filesystem::path(request.file_name);
                if (repeats_pending_start(*session.transfer, TransferDirection::Upload, target) &&
                    session.transfer->total_size == request.size)
                {
                    spdlog::debug("Repeated upload start for {}", filesystem_.to_relative(target).string());
                    return protocol::Ok{};
                }
            }
            return protocol::make_error(ErrorCode::TransferAlreadyActive, "a transfer is already in progress");
        }

        auto opened = filesystem_.open_for_write(session.cwd, request.directory, request.file_name);

        auto context = std::make_unique<TransferContext>();
        context->direction = TransferDirection::Upload;
        context->path = std::move(opened.path);
        context->file = std::move(opened.stream);
        context->total_size = request.size;
        session.transfer = std::move(context);
        session.completed_upload_id.reset();
        session.completed_download_chunk.reset();

        spdlog::info("Upload of {} ({} bytes) started", filesystem_.to_relative(session.transfer->path).string(),
                     request.size);
        return protocol::Ok{};
    }

    protocol::Response Dispatcher::handle(const protocol::DownloadStart &request, Session &session)
    {
        if (session.transfer_active())
        {
            if (transport_ == TransportKind::Datagram)
            {
                const auto &context = *session.transfer;
                if (repeats_pending_start(context, TransferDirection::Download,
                                          filesystem_.resolve(session.cwd, request.source_path)))
                {
                    spdlog::debug("Repeated download start for {}", request.source_path);
                    return protocol::FileMetadata{
                        .name = context.path.filename().string(),
                        .size = context.total_size,
                        .content_hash = context.content_hash,
                    };
                }
            }
            return protocol::make_error(ErrorCode::TransferAlreadyActive, "a transfer is already in progress");
        }

        auto opened = filesystem_.open_for_read(session.cwd, request.source_path);
        auto hash = shellfs::crypto::hash_file(opened.path);

        auto context = std::make_unique<TransferContext>();
        context->direction = TransferDirection::Download;
        context->path = std::move(opened.path);
        context->file = std::move(opened.stream);
        context->total_size = opened.size;
        context->content_hash = hash;
        if (transport_ == TransportKind::Datagram)
        {
            context->source.emplace(context->file, context->total_size, chunk_size_);
        }
        session.transfer = std::move(context);
        session.completed_upload_id.reset();
        session.completed_download_chunk.reset();

        spdlog::info("Download of {} ({} bytes) started", filesystem_.to_relative(session.transfer->path).string(),
                     opened.size);
        return protocol::FileMetadata{.name = std::move(opened.name), .size = opened.size, .content_hash = std::move(hash)};
    }

    std::optional<protocol::Response> Dispatcher::handle(const protocol::UploadChunk &request, Session &session)
    {
        auto *context = session.transfer.get();
        if (context == nullptr || context->direction != TransferDirection::Upload)
        {
            if (context == nullptr && session.completed_upload_id && *session.completed_upload_id == request.id)
            {
                spdlog::debug("Re-acknowledging final upload chunk {}", request.id);
                return protocol::ChunkAck{.id = request.id};
            }
            return protocol::make_error(ErrorCode::NoActiveTransfer, "no upload in progress");
        }

        switch (context->sequencer.classify(request.id))
        {
        case transfer::ChunkDisposition::Duplicate:
            spdlog::debug("Duplicate upload chunk {} (expecting {})", request.id, context->sequencer.expected());
            return protocol::ChunkAck{.id = request.id};
        case transfer::ChunkDisposition::OutOfOrder:
            spdlog::debug("Dropping out-of-order upload chunk {} (expecting {})", request.id,
                          context->sequencer.expected());
            return std::nullopt;
        case transfer::ChunkDisposition::Accepted:
            break;
        }

        if (request.data.size() > chunk_size_)
        {
            spdlog::warn("Upload chunk {} carries {} bytes, above the {} byte chunk size; aborting", request.id,
                         request.data.size(), chunk_size_);
            session.end_transfer();
            return protocol::make_error(ErrorCode::InvalidPayload, "chunk exceeds the chunk size");
        }
        if (request.data.size() > context->total_size - context->bytes_transferred)
        {
            spdlog::warn("Upload chunk {} overflows {}; aborting", request.id, context->path.string());
            session.end_transfer();
            return protocol::make_error(ErrorCode::InvalidPayload, "chunk exceeds the advertised upload size");
        }

        if (!request.data.empty())
        {
            context->file.write(reinterpret_cast<const char *>(request.data.data()),
                                static_cast<std::streamsize>(request.data.size()));
        }
        if (!context->file)
        {
            spdlog::error("Write to {} failed; aborting upload", context->path.string());
            session.end_transfer();
            return protocol::make_error(ErrorCode::IoError, "failed to write upload chunk");
        }
        context->bytes_transferred += request.data.size();
        context->sequencer.advance();

        if (request.is_last)
        {
            context->file.flush();
            if (!context->file)
            {
                session.end_transfer();
                return protocol::make_error(ErrorCode::IoError, "failed to flush uploaded file");
            }
            if (context->bytes_transferred != context->total_size)
            {
                spdlog::warn("Upload of {} ended at {} of {} bytes", context->path.string(),
                             context->bytes_transferred, context->total_size);
            }
            spdlog::info("Upload of {} complete ({} bytes)", filesystem_.to_relative(context->path).string(),
                         context->bytes_transferred);
            session.completed_upload_id = request.id;
            session.end_transfer();
        }
        return protocol::ChunkAck{.id = request.id};
    }

    std::optional<protocol::Response> Dispatcher::handle(const protocol::DownloadChunk &request, Session &session)
    {
        auto *context = session.transfer.get();
        if (context == nullptr || context->direction != TransferDirection::Download || !context->source)
        {
            if (context == nullptr && session.completed_download_chunk &&
                session.completed_download_chunk->id == request.id)
            {
                spdlog::debug("Replaying final download chunk {}", request.id);
                return *session.completed_download_chunk;
            }
            return protocol::make_error(ErrorCode::NoActiveTransfer, "no download in progress");
        }

        switch (context->sequencer.classify(request.id))
        {
        case transfer::ChunkDisposition::Duplicate:
            if (context->last_sent && context->last_sent->id == request.id)
            {
                spdlog::debug("Resending download chunk {}", request.id);
                return *context->last_sent;
            }
            spdlog::debug("Ignoring stale download request {}", request.id);
            return std::nullopt;
        case transfer::ChunkDisposition::OutOfOrder:
            spdlog::debug("Dropping out-of-order download request {} (expecting {})", request.id,
                          context->sequencer.expected());
            return std::nullopt;
        case transfer::ChunkDisposition::Accepted:
            break;
        }

        transfer::Chunk chunk;
        try
        {
            chunk = context->source->next();
        }
        catch (const transfer::TransferError &)
        {
            spdlog::error("Read from {} failed; aborting download", context->path.string());
            session.end_transfer();
            throw;
        }

        protocol::FileChunk reply{.id = chunk.id, .data = std::move(chunk.data), .is_last = chunk.is_last};
        context->bytes_transferred += reply.data.size();
        context->sequencer.advance();

        if (reply.is_last)
        {
            spdlog::info("Download of {} complete ({} bytes)", filesystem_.to_relative(context->path).string(),
                         context->bytes_transferred);
            session.completed_download_chunk = reply;
            session.end_transfer();
        }
        else
        {
            context->last_sent = reply;
        }
        return reply;
    }

} // namespace shellfs::server
