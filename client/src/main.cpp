#include <cstdlib>
#include <iostream>
#include <memory>
#include <utility>

#include <unistd.h>

#include "shellfs/client/config.hpp"
#include "shellfs/client/datagram_client.hpp"
#include "shellfs/client/logger.hpp"
#include "shellfs/client/shell.hpp"
#include "shellfs/client/stream_client.hpp"
#include "shellfs/version.hpp"

int main(int argc, char *argv[])
{
    using namespace shellfs::client;

    ClientConfig config;
    try
    {
        config = parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    Logger logger(config.log_path);
    logger.log("info", "shellfs client ", shellfs::version());

    try
    {
        std::unique_ptr<Connection> connection;
        if (config.transport == ClientTransport::Datagram)
        {
            auto datagram = std::make_unique<DatagramClient>(config, logger);
            datagram->connect();
            connection = std::move(datagram);
        }
        else
        {
            auto stream = std::make_unique<StreamClient>(config, logger);
            stream->connect();
            connection = std::move(stream);
        }

        std::cout << "Connected to " << config.host << ':' << config.port
                  << (config.transport == ClientTransport::Datagram ? " (udp)" : " (tcp)") << std::endl;

        Shell shell(*connection, logger, std::cout, std::cerr);
        shell.run(std::cin, ::isatty(STDIN_FILENO) != 0);
    }
    catch (const ClientError &ex)
    {
        std::cerr << "ERROR " << shellfs::to_string(ex.code()) << ": " << ex.what() << std::endl;
        logger.log("error", "fatal: ", ex.what());
        return EXIT_FAILURE;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        logger.log("error", "fatal: ", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
