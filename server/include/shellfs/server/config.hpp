#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "shellfs/transfer.hpp"

namespace shellfs::server
{

    enum class TransportMode : std::uint8_t
    {
        Stream,
        Datagram,
        Both
    };

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root;
        TransportMode transport{TransportMode::Both};
        std::size_t worker_threads{0};
        std::chrono::seconds idle_timeout{std::chrono::seconds{300}};
        std::chrono::seconds sweep_interval{std::chrono::seconds{5}};
        std::size_t chunk_size{shellfs::transfer::kDefaultChunkSize};
        std::optional<std::filesystem::path> log_file;
    };

} // namespace shellfs::server
