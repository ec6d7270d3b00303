/**
 * shellfs - Error codes shared by the codec, the server and the clients.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace shellfs
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        ProtocolError = 1,
        InvalidCommand = 2,
        InvalidPayload = 3,
        PathEscape = 4,
        NotFound = 5,
        NotADirectory = 6,
        AlreadyExists = 7,
        PermissionDenied = 8,
        IoError = 9,
        NoActiveTransfer = 10,
        TransferAlreadyActive = 11,
        ServerBusy = 12,
        ChunkTimeout = 13,
        InternalError = 14
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

} // namespace shellfs
