#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>

#include "shellfs/protocol.hpp"
#include "shellfs/transfer.hpp"

namespace shellfs::server
{

    enum class TransferDirection : std::uint8_t
    {
        Upload,
        Download
    };

    /// In-progress upload or download. Always heap allocated and never moved:
    /// `source` reads from `file`.
    struct TransferContext
    {
        TransferDirection direction{TransferDirection::Upload};
        std::filesystem::path path;
        std::fstream file;
        std::uint64_t total_size{};
        std::uint64_t bytes_transferred{};
        std::optional<std::string> content_hash;
        shellfs::transfer::ChunkSequencer sequencer;
        std::optional<shellfs::transfer::ChunkSource> source;
        std::optional<shellfs::protocol::FileChunk> last_sent;
    };

    struct Session
    {
        using Clock = std::chrono::steady_clock;

        // Relative to the sandbox root; empty at the root itself.
        std::filesystem::path cwd;
        std::unique_ptr<TransferContext> transfer;
        Clock::time_point last_activity{Clock::now()};

        // Final messages of the last finished transfer, replayed when the peer
        // retransmits because our last reply was lost.
        std::optional<std::uint32_t> completed_upload_id;
        std::optional<shellfs::protocol::FileChunk> completed_download_chunk;

        bool transfer_active() const noexcept { return transfer != nullptr; }

        /// Drops the transfer context, closing its file. A partial file stays on disk.
        void end_transfer() noexcept { transfer.reset(); }
    };

} // namespace shellfs::server
