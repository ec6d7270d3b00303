#include "shellfs/client/config.hpp"

#include <stdexcept>
#include <string>

namespace shellfs::client
{

    namespace
    {

        const char *require_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return argv[index++];
        }

    } // namespace

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 2)
        {
            throw std::runtime_error(
                "Usage: shellfs_client <host>:<port> [--udp] [--timeout <seconds>] [--retries <n>] [--log <file>]");
        }

        ClientConfig config;
        int index = 1;
        const std::string endpoint = argv[index++];

        const auto colon_pos = endpoint.rfind(':');
        if (colon_pos == std::string::npos || colon_pos == 0)
        {
            throw std::runtime_error("Expected endpoint format host:port");
        }
        config.host = endpoint.substr(0, colon_pos);
        const auto port = std::stoul(endpoint.substr(colon_pos + 1));
        if (port == 0 || port > 65535)
        {
            throw std::runtime_error("Port must be between 1 and 65535");
        }
        config.port = static_cast<std::uint16_t>(port);

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--udp")
            {
                config.transport = ClientTransport::Datagram;
            }
            else if (arg == "--timeout")
            {
                const auto seconds = std::stoll(require_value(index, argc, argv, arg));
                if (seconds <= 0)
                {
                    throw std::runtime_error("--timeout must be positive");
                }
                config.chunk_timeout = std::chrono::seconds(seconds);
            }
            else if (arg == "--retries")
            {
                const auto attempts = std::stoul(require_value(index, argc, argv, arg));
                if (attempts == 0)
                {
                    throw std::runtime_error("--retries must be at least 1");
                }
                config.max_attempts = static_cast<std::size_t>(attempts);
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        return config;
    }

} // namespace shellfs::client
