#include "shellfs/client/shell.hpp"

#include <cctype>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace shellfs::client
{

    namespace protocol = shellfs::protocol;

    namespace
    {

        std::string trim(const std::string &input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }

        std::vector<std::string> split_tokens(const std::string &input)
        {
            std::vector<std::string> tokens;
            std::istringstream iss(input);
            std::string token;
            while (iss >> token)
            {
                tokens.push_back(token);
            }
            return tokens;
        }

        std::string to_upper(std::string value)
        {
            for (auto &ch : value)
            {
                ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
            }
            return value;
        }

        void require_args(const std::vector<std::string> &args, std::size_t min, std::size_t max, const char *usage)
        {
            if (args.size() < min || args.size() > max)
            {
                throw ClientError(ErrorCode::InvalidCommand, std::string("usage: ") + usage);
            }
        }

    } // namespace

    Shell::Shell(Connection &connection, Logger &logger, std::ostream &out, std::ostream &err)
        : connection_(connection), logger_(logger), out_(out), err_(err) {}

    int Shell::run(std::istream &in, bool interactive)
    {
        for (;;)
        {
            if (interactive)
            {
                std::string cwd;
                for (const auto &part : remote_cwd_)
                {
                    cwd += "/" + part;
                }
                out_ << (cwd.empty() ? "/" : cwd) << "> " << std::flush;
            }
            std::string line;
            if (!std::getline(in, line))
            {
                if (interactive)
                {
                    out_ << std::endl;
                }
                break;
            }
            if (!execute(line))
            {
                break;
            }
        }
        return failures_;
    }

    bool Shell::execute(const std::string &raw_line)
    {
        const auto line = trim(raw_line);
        if (line.empty())
        {
            return true;
        }
        logger_.log("cmd", line);

        const auto tokens = split_tokens(line);
        const auto command = to_upper(tokens[0]);
        const std::vector<std::string> args(tokens.begin() + 1, tokens.end());

        if (command == "EXIT" || command == "QUIT")
        {
            out_ << "OK" << std::endl;
            return false;
        }

        try
        {
            dispatch(command, args);
        }
        catch (const ClientError &ex)
        {
            ++failures_;
            err_ << "ERROR " << to_string(ex.code()) << ": " << ex.what() << std::endl;
            logger_.log("error", to_string(ex.code()), " ", ex.what());
        }
        catch (const protocol::ProtocolError &ex)
        {
            ++failures_;
            err_ << "ERROR protocol_error: " << ex.what() << std::endl;
            logger_.log("error", "protocol: ", ex.what());
            throw;
        }
        return true;
    }

    void Shell::dispatch(const std::string &command, const std::vector<std::string> &args)
    {
        if (command == "HELP")
        {
            print_help();
        }
        else if (command == "LS" || command == "LIST" || command == "DIR")
        {
            require_args(args, 0, 0, "ls");
            print_listing(expect<protocol::Listing>(connection_.request(protocol::ListDirectory{}), "LISTING"));
        }
        else if (command == "CD" && args.size() == 1 && args[0] == "..")
        {
            expect<protocol::Ok>(connection_.request(protocol::ChangeDirectoryUp{}), "OK");
            update_prompt_path("..");
            out_ << "OK" << std::endl;
        }
        else if (command == "CD")
        {
            require_args(args, 1, 1, "cd <path>");
            expect<protocol::Ok>(connection_.request(protocol::ChangeDirectory{.path = args[0]}), "OK");
            update_prompt_path(args[0]);
            out_ << "OK" << std::endl;
        }
        else if (command == "MKDIR")
        {
            require_args(args, 1, 1, "mkdir <name>");
            expect<protocol::Ok>(connection_.request(protocol::MakeDirectory{.name = args[0]}), "OK");
            out_ << "OK" << std::endl;
        }
        else if (command == "COPY" || command == "CP")
        {
            require_args(args, 2, 2, "copy <src> <dst>");
            expect<protocol::Ok>(
                connection_.request(protocol::CopyFile{.source = args[0], .destination = args[1]}), "OK");
            out_ << "OK" << std::endl;
        }
        else if (command == "UPLOAD")
        {
            require_args(args, 1, 2, "upload <local_path> [remote_dir]");
            const auto result = connection_.upload(args[0], args.size() > 1 ? args[1] : std::string{"."});
            out_ << "Uploaded " << result.name << " (" << result.bytes << " bytes)" << std::endl;
        }
        else if (command == "DOWNLOAD")
        {
            require_args(args, 1, 2, "download <remote_path> [local_dir]");
            const auto result = connection_.download(args[0], args.size() > 1 ? std::filesystem::path(args[1])
                                                                              : std::filesystem::current_path());
            out_ << "Downloaded " << result.name << " (" << result.bytes << " bytes) -> "
                 << result.local_path.string() << std::endl;
        }
        else
        {
            throw ClientError(ErrorCode::InvalidCommand, "unknown command '" + command + "', try help");
        }
    }

    void Shell::print_help() const
    {
        out_ << "Commands:\n"
             << "  ls                                   list the remote directory\n"
             << "  cd <path> | cd ..                    change the remote directory\n"
             << "  mkdir <name>                         create a remote directory\n"
             << "  copy <src> <dst>                     copy a file on the server\n"
             << "  upload <local_path> [remote_dir]     send a local file\n"
             << "  download <remote_path> [local_dir]   fetch a remote file\n"
             << "  exit                                 leave the shell" << std::endl;
    }

    void Shell::print_listing(const protocol::Listing &listing) const
    {
        for (const auto &entry : listing.entries)
        {
            if (entry.is_dir)
            {
                out_ << "  " << std::setw(12) << "<dir>" << "  " << entry.name << "/\n";
            }
            else
            {
                out_ << "  " << std::setw(12) << entry.size << "  " << entry.name << "\n";
            }
        }
        out_ << listing.entries.size() << " entries" << std::endl;
    }

    void Shell::update_prompt_path(const std::string &target)
    {
        const std::filesystem::path path(target);
        if (path.is_absolute())
        {
            remote_cwd_.clear();
        }
        for (const auto &part : path.relative_path())
        {
            const auto name = part.string();
            if (name.empty() || name == ".")
            {
                continue;
            }
            if (name == "..")
            {
                if (!remote_cwd_.empty())
                {
                    remote_cwd_.pop_back();
                }
                continue;
            }
            remote_cwd_.push_back(name);
        }
    }

} // namespace shellfs::client
