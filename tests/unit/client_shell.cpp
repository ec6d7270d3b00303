#include <cassert>
#include <deque>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "shellfs/client/config.hpp"
#include "shellfs/client/connection.hpp"
#include "shellfs/client/logger.hpp"
#include "shellfs/client/shell.hpp"

using namespace shellfs;
using namespace shellfs::client;
namespace protocol = shellfs::protocol;

namespace
{

    class ScriptedConnection : public Connection
    {
    public:
        protocol::Response request(const protocol::Request &request) override
        {
            requests.push_back(request);
            assert(!replies.empty());
            auto reply = replies.front();
            replies.pop_front();
            return reply;
        }

        TransferResult upload(const std::filesystem::path &local, const std::string &remote_directory) override
        {
            uploads.emplace_back(local.string(), remote_directory);
            return TransferResult{.name = local.filename().string(), .bytes = 10, .local_path = local};
        }

        TransferResult download(const std::string &remote, const std::filesystem::path &local_directory) override
        {
            throw ClientError(ErrorCode::NotFound, "file not found: " + remote + " (into " +
                                                       local_directory.string() + ")");
        }

        std::vector<protocol::Request> requests;
        std::deque<protocol::Response> replies;
        std::vector<std::pair<std::string, std::string>> uploads;
    };

    std::vector<std::string> split_args(const std::string &line)
    {
        std::vector<std::string> args;
        std::istringstream iss(line);
        std::string token;
        while (iss >> token)
        {
            args.push_back(token);
        }
        return args;
    }

    ClientConfig parse(const std::string &line)
    {
        auto args = split_args(line);
        std::vector<char *> argv;
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        return parse_arguments(static_cast<int>(argv.size()), argv.data());
    }

    void test_parse_arguments()
    {
        const auto tcp = parse("shellfs_client localhost:7000");
        assert(tcp.host == "localhost");
        assert(tcp.port == 7000);
        assert(tcp.transport == ClientTransport::Stream);
        assert(tcp.chunk_timeout == std::chrono::seconds{5});
        assert(tcp.max_attempts == 5);

        const auto udp = parse("shellfs_client 10.0.0.2:9000 --udp --timeout 2 --retries 7 --log client.log");
        assert(udp.transport == ClientTransport::Datagram);
        assert(udp.chunk_timeout == std::chrono::seconds{2});
        assert(udp.max_attempts == 7);
        assert(udp.log_path == std::filesystem::path("client.log"));

        for (const auto *bad : {"shellfs_client", "shellfs_client nohost", "shellfs_client h:1 --bogus",
                                "shellfs_client h:1 --retries 0", "shellfs_client h:1 --log"})
        {
            bool failed = false;
            try
            {
                parse(bad);
            }
            catch (const std::exception &)
            {
                failed = true;
            }
            assert(failed);
        }
    }

    void test_shell_routes_commands()
    {
        ScriptedConnection connection;
        Logger logger;
        std::ostringstream out;
        std::ostringstream err;
        Shell shell(connection, logger, out, err);

        protocol::Listing listing;
        listing.entries.push_back(protocol::DirEntry{.name = "docs", .is_dir = true});
        listing.entries.push_back(protocol::DirEntry{.name = "f.txt", .is_dir = false, .size = 10});
        connection.replies = {
            protocol::Ok{},
            protocol::Ok{},
            listing,
            protocol::Ok{},
            protocol::make_error(ErrorCode::PathEscape, "cannot go above root"),
            protocol::Ok{},
        };

        std::istringstream script("mkdir docs\n"
                                  "cd docs\n"
                                  "ls\n"
                                  "cd ..\n"
                                  "cd ..\n"
                                  "copy a.txt b.txt\n"
                                  "upload /tmp/report.pdf inbox\n"
                                  "download missing.bin /tmp\n"
                                  "frobnicate\n"
                                  "exit\n"
                                  "ls\n");
        const auto failures = shell.run(script, false);

        assert(failures == 3);
        assert(connection.replies.empty());
        assert(connection.requests.size() == 6);
        assert(std::get<protocol::MakeDirectory>(connection.requests[0]).name == "docs");
        assert(std::get<protocol::ChangeDirectory>(connection.requests[1]).path == "docs");
        assert(std::holds_alternative<protocol::ListDirectory>(connection.requests[2]));
        assert(std::holds_alternative<protocol::ChangeDirectoryUp>(connection.requests[3]));
        assert(std::holds_alternative<protocol::ChangeDirectoryUp>(connection.requests[4]));
        const auto &copy = std::get<protocol::CopyFile>(connection.requests[5]);
        assert(copy.source == "a.txt" && copy.destination == "b.txt");

        assert(connection.uploads.size() == 1);
        assert(connection.uploads[0].first == "/tmp/report.pdf");
        assert(connection.uploads[0].second == "inbox");

        const auto printed = out.str();
        assert(printed.find("docs/") != std::string::npos);
        assert(printed.find("f.txt") != std::string::npos);
        assert(printed.find("Uploaded report.pdf (10 bytes)") != std::string::npos);

        const auto errors = err.str();
        assert(errors.find("path_escape") != std::string::npos);
        assert(errors.find("not_found") != std::string::npos);
        assert(errors.find("invalid_command") != std::string::npos);
    }

    void test_shell_checks_arity_without_sending()
    {
        ScriptedConnection connection;
        Logger logger;
        std::ostringstream out;
        std::ostringstream err;
        Shell shell(connection, logger, out, err);

        assert(shell.execute("mkdir"));
        assert(shell.execute("copy only-one"));
        assert(shell.execute("   "));
        assert(!shell.execute("QUIT"));
        assert(shell.failures() == 2);
        assert(connection.requests.empty());
        assert(err.str().find("usage: mkdir <name>") != std::string::npos);
    }

    void test_expect_helpers()
    {
        const protocol::Response ok = protocol::Ok{};
        assert(&expect_success(ok) == &ok);

        bool busy = false;
        try
        {
            expect_success(protocol::make_error(ErrorCode::ServerBusy, "server busy"));
        }
        catch (const ClientError &ex)
        {
            busy = ex.code() == ErrorCode::ServerBusy && std::string(ex.what()) == "server busy";
        }
        assert(busy);

        bool mismatched = false;
        try
        {
            expect<protocol::Listing>(ok, "LISTING");
        }
        catch (const ClientError &ex)
        {
            mismatched = ex.code() == ErrorCode::InvalidPayload;
        }
        assert(mismatched);
    }

} // namespace

void run_client_tests()
{
    test_parse_arguments();
    test_shell_routes_commands();
    test_shell_checks_arity_without_sending();
    test_expect_helpers();
}
