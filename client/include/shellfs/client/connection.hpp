/**
 * shellfs - Client side of both transports behind one interface.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <variant>

#include "shellfs/error_codes.hpp"
#include "shellfs/protocol.hpp"

namespace shellfs::client
{

    /// A failed request or transfer, carrying the server's error code when there was one.
    class ClientError : public std::runtime_error
    {
    public:
        ClientError(ErrorCode code, const std::string &message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

    struct TransferResult
    {
        std::string name;
        std::uint64_t bytes{};
        std::filesystem::path local_path;
    };

    class Connection
    {
    public:
        virtual ~Connection() = default;

        /// One request, one response. Not for chunk messages.
        virtual shellfs::protocol::Response request(const shellfs::protocol::Request &request) = 0;

        /// Sends `local` into `remote_directory` (relative to the remote cwd).
        virtual TransferResult upload(const std::filesystem::path &local, const std::string &remote_directory) = 0;

        /// Fetches `remote` into `local_directory`, verifying the content hash when the server sends one.
        virtual TransferResult download(const std::string &remote, const std::filesystem::path &local_directory) = 0;
    };

    /// Throws ClientError for an Error response; returns the response otherwise.
    const shellfs::protocol::Response &expect_success(const shellfs::protocol::Response &response);

    /// Throws ClientError(InvalidPayload) naming `expected` when the response is not a T.
    template <typename T>
    const T &expect(const shellfs::protocol::Response &response, const char *expected)
    {
        expect_success(response);
        if (const auto *value = std::get_if<T>(&response))
        {
            return *value;
        }
        throw ClientError(ErrorCode::InvalidPayload,
                          std::string("unexpected ") +
                              std::string(shellfs::protocol::to_string(shellfs::protocol::kind_of(response))) +
                              " response, expected " + expected);
    }

    struct LocalSource
    {
        std::string name;
        std::uint64_t size{};
    };

    /// Throws ClientError unless `local` is a regular file.
    LocalSource inspect_local_file(const std::filesystem::path &local);

} // namespace shellfs::client
