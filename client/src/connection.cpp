#include "shellfs/client/connection.hpp"

#include <system_error>

namespace shellfs::client
{

    ClientError::ClientError(ErrorCode code, const std::string &message)
        : std::runtime_error(message), code_(code) {}

    const shellfs::protocol::Response &expect_success(const shellfs::protocol::Response &response)
    {
        if (const auto *error = std::get_if<shellfs::protocol::Error>(&response))
        {
            throw ClientError(error->code, error->message);
        }
        return response;
    }

    LocalSource inspect_local_file(const std::filesystem::path &local)
    {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(local, ec))
        {
            throw ClientError(ErrorCode::NotFound, "not a regular file: " + local.string());
        }
        const auto size = std::filesystem::file_size(local, ec);
        if (ec)
        {
            throw ClientError(ErrorCode::IoError, "cannot stat " + local.string() + ": " + ec.message());
        }
        return LocalSource{.name = local.filename().string(), .size = size};
    }

} // namespace shellfs::client
