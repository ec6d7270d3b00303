#include "shellfs/error_codes.hpp"

#include <array>

namespace shellfs
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 15> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::ProtocolError, "protocol_error"},
            {ErrorCode::InvalidCommand, "invalid_command"},
            {ErrorCode::InvalidPayload, "invalid_payload"},
            {ErrorCode::PathEscape, "path_escape"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::NotADirectory, "not_a_directory"},
            {ErrorCode::AlreadyExists, "already_exists"},
            {ErrorCode::PermissionDenied, "permission_denied"},
            {ErrorCode::IoError, "io_error"},
            {ErrorCode::NoActiveTransfer, "no_active_transfer"},
            {ErrorCode::TransferAlreadyActive, "transfer_already_active"},
            {ErrorCode::ServerBusy, "server_busy"},
            {ErrorCode::ChunkTimeout, "chunk_timeout"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

} // namespace shellfs
