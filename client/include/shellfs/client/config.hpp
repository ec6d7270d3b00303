#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace shellfs::client
{

    enum class ClientTransport : std::uint8_t
    {
        Stream,
        Datagram
    };

    struct ClientConfig
    {
        std::string host;
        std::uint16_t port{};
        ClientTransport transport{ClientTransport::Stream};
        std::chrono::seconds chunk_timeout{std::chrono::seconds{5}};
        std::size_t max_attempts{5};
        std::optional<std::filesystem::path> log_path;
    };

    /// Parses `<host>:<port> [--udp] [--timeout <seconds>] [--retries <n>] [--log <file>]`.
    /// Throws std::runtime_error with a usage message on bad input.
    ClientConfig parse_arguments(int argc, char *argv[]);

} // namespace shellfs::client
