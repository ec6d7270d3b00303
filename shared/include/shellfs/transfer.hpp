/**
 * shellfs - Chunking, sequencing and retransmission primitives shared by both peers.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "shellfs/error_codes.hpp"

namespace shellfs::transfer
{

    inline constexpr std::size_t kDefaultChunkSize = 8 * 1024;
    inline constexpr std::size_t kMaxChunkSize = 32 * 1024;

    class TransferError : public std::runtime_error
    {
    public:
        TransferError(ErrorCode code, std::string message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

    struct Chunk
    {
        std::uint32_t id{};
        std::vector<std::uint8_t> data;
        bool is_last{};
    };

    /// Splits a stream of known size into chunks numbered from 0.
    /// The chunk that reaches the advertised size, or comes up short, is marked last.
    class ChunkSource
    {
    public:
        ChunkSource(std::istream &input, std::uint64_t total_size, std::size_t chunk_size = kDefaultChunkSize);

        Chunk next();

        bool finished() const noexcept { return finished_; }
        std::uint64_t bytes_read() const noexcept { return bytes_read_; }
        std::uint32_t next_id() const noexcept { return next_id_; }

    private:
        std::istream &input_;
        std::uint64_t total_size_;
        std::size_t chunk_size_;
        std::uint64_t bytes_read_{0};
        std::uint32_t next_id_{0};
        bool finished_{false};
    };

    enum class ChunkDisposition : std::uint8_t
    {
        Accepted,
        Duplicate,
        OutOfOrder
    };

    /// Receiver-side ordering: only the expected id is applied, ids below it are
    /// re-acknowledged, ids above it are dropped.
    class ChunkSequencer
    {
    public:
        ChunkDisposition classify(std::uint32_t id) const noexcept;

        void advance() noexcept { ++expected_; }

        std::uint32_t expected() const noexcept { return expected_; }

    private:
        std::uint32_t expected_{0};
    };

    struct RetryPolicy
    {
        std::chrono::milliseconds timeout{std::chrono::seconds{5}};
        std::size_t max_attempts{5};
    };

    /// Sends, then waits up to one timeout for the matching reply, retransmitting the
    /// same message until it arrives or the attempts run out (ChunkTimeout).
    /// `await_reply(timeout)` returns std::nullopt when the timeout elapses.
    template <typename SendFn, typename AwaitFn>
    auto exchange_with_retry(const RetryPolicy &policy, SendFn &&send, AwaitFn &&await_reply,
                             const std::string &what)
    {
        for (std::size_t attempt = 1; attempt <= policy.max_attempts; ++attempt)
        {
            send();
            if (auto reply = await_reply(policy.timeout))
            {
                return std::move(*reply);
            }
        }
        throw TransferError(ErrorCode::ChunkTimeout,
                            what + " not acknowledged after " + std::to_string(policy.max_attempts) + " attempts");
    }

} // namespace shellfs::transfer
