#include "shellfs/transfer.hpp"

#include <algorithm>

namespace shellfs::transfer
{

    TransferError::TransferError(ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    ChunkSource::ChunkSource(std::istream &input, std::uint64_t total_size, std::size_t chunk_size)
        : input_(input), total_size_(total_size), chunk_size_(chunk_size)
    {
        if (chunk_size_ == 0 || chunk_size_ > kMaxChunkSize)
        {
            throw std::invalid_argument("chunk size out of range");
        }
    }

    Chunk ChunkSource::next()
    {
        if (finished_)
        {
            throw std::logic_error("chunk source already exhausted");
        }

        const auto remaining = total_size_ - bytes_read_;
        const auto to_read = static_cast<std::size_t>(std::min<std::uint64_t>(chunk_size_, remaining));

        Chunk chunk;
        chunk.id = next_id_++;
        chunk.data.resize(to_read);
        if (to_read > 0)
        {
            input_.read(reinterpret_cast<char *>(chunk.data.data()), static_cast<std::streamsize>(to_read));
            if (input_.bad())
            {
                throw TransferError(ErrorCode::IoError, "read failed at offset " + std::to_string(bytes_read_));
            }
        }
        const auto read_count = static_cast<std::size_t>(input_.gcount());
        chunk.data.resize(to_read > 0 ? read_count : 0);
        bytes_read_ += chunk.data.size();

        chunk.is_last = chunk.data.size() < chunk_size_ || bytes_read_ == total_size_;
        finished_ = chunk.is_last;
        return chunk;
    }

    ChunkDisposition ChunkSequencer::classify(std::uint32_t id) const noexcept
    {
        if (id == expected_)
        {
            return ChunkDisposition::Accepted;
        }
        if (id < expected_)
        {
            return ChunkDisposition::Duplicate;
        }
        return ChunkDisposition::OutOfOrder;
    }

} // namespace shellfs::transfer
