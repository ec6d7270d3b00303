/**
 * shellfs - Content hashing built on libsodium (BLAKE2b, hex encoded).
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <span>
#include <string>

namespace shellfs::crypto
{

    void ensure_sodium_init();

    std::string hash_bytes(std::span<const std::uint8_t> data);

    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

    /// Incremental hash for data that arrives piecewise, such as chunked downloads.
    class StreamingHash
    {
    public:
        StreamingHash();
        ~StreamingHash();

        StreamingHash(const StreamingHash &) = delete;
        StreamingHash &operator=(const StreamingHash &) = delete;

        void update(std::span<const std::uint8_t> data);

        std::string finish();

    private:
        struct State;
        std::unique_ptr<State> state_;
    };

} // namespace shellfs::crypto
