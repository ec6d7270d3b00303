/**
 * shellfs - Request/response vocabulary shared by both transports.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "shellfs/error_codes.hpp"

namespace shellfs::protocol
{

    class ProtocolError : public std::runtime_error
    {
    public:
        explicit ProtocolError(const std::string &message);
    };

    enum class Command : std::uint8_t
    {
        ListDirectory,
        ChangeDirectory,
        ChangeDirectoryUp,
        MakeDirectory,
        CopyFile,
        UploadStart,
        UploadChunk,
        DownloadStart,
        DownloadChunk
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    enum class ResponseKind : std::uint8_t
    {
        Ok,
        Error,
        Listing,
        FileMetadata,
        ChunkAck,
        FileChunk
    };

    std::string_view to_string(ResponseKind kind) noexcept;
    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept;

    // Requests

    struct ListDirectory
    {
    };

    struct ChangeDirectory
    {
        std::string path;
    };

    struct ChangeDirectoryUp
    {
    };

    struct MakeDirectory
    {
        std::string name;
    };

    struct CopyFile
    {
        std::string source;
        std::string destination;
    };

    struct UploadStart
    {
        std::string file_name;
        std::uint64_t size{};
        std::string directory{"."};
    };

    // Datagram transport only; the stream transport sends raw bytes after UploadStart.
    struct UploadChunk
    {
        std::uint32_t id{};
        std::vector<std::uint8_t> data;
        bool is_last{};
    };

    struct DownloadStart
    {
        std::string source_path;
    };

    // Datagram transport only.
    struct DownloadChunk
    {
        std::uint32_t id{};
    };

    using Request = std::variant<ListDirectory, ChangeDirectory, ChangeDirectoryUp, MakeDirectory, CopyFile,
                                 UploadStart, UploadChunk, DownloadStart, DownloadChunk>;

    Command command_of(const Request &request) noexcept;

    // Responses

    struct DirEntry
    {
        std::string name;
        bool is_dir{};
        std::uint64_t size{};
    };

    struct Ok
    {
    };

    struct Error
    {
        ErrorCode code{ErrorCode::InternalError};
        std::string message;
    };

    struct Listing
    {
        std::vector<DirEntry> entries;
    };

    struct FileMetadata
    {
        std::string name;
        std::uint64_t size{};
        std::optional<std::string> content_hash{};
    };

    struct ChunkAck
    {
        std::uint32_t id{};
    };

    struct FileChunk
    {
        std::uint32_t id{};
        std::vector<std::uint8_t> data;
        bool is_last{};
    };

    using Response = std::variant<Ok, Error, Listing, FileMetadata, ChunkAck, FileChunk>;

    ResponseKind kind_of(const Response &response) noexcept;

    void to_json(nlohmann::json &json, const ChangeDirectory &request);
    void from_json(const nlohmann::json &json, ChangeDirectory &request);
    void to_json(nlohmann::json &json, const MakeDirectory &request);
    void from_json(const nlohmann::json &json, MakeDirectory &request);
    void to_json(nlohmann::json &json, const CopyFile &request);
    void from_json(const nlohmann::json &json, CopyFile &request);
    void to_json(nlohmann::json &json, const UploadStart &request);
    void from_json(const nlohmann::json &json, UploadStart &request);
    void to_json(nlohmann::json &json, const UploadChunk &request);
    void from_json(const nlohmann::json &json, UploadChunk &request);
    void to_json(nlohmann::json &json, const DownloadStart &request);
    void from_json(const nlohmann::json &json, DownloadStart &request);
    void to_json(nlohmann::json &json, const DownloadChunk &request);
    void from_json(const nlohmann::json &json, DownloadChunk &request);

    void to_json(nlohmann::json &json, const DirEntry &entry);
    void from_json(const nlohmann::json &json, DirEntry &entry);
    void to_json(nlohmann::json &json, const Error &response);
    void from_json(const nlohmann::json &json, Error &response);
    void to_json(nlohmann::json &json, const Listing &response);
    void from_json(const nlohmann::json &json, Listing &response);
    void to_json(nlohmann::json &json, const FileMetadata &response);
    void from_json(const nlohmann::json &json, FileMetadata &response);
    void to_json(nlohmann::json &json, const ChunkAck &response);
    void from_json(const nlohmann::json &json, ChunkAck &response);
    void to_json(nlohmann::json &json, const FileChunk &response);
    void from_json(const nlohmann::json &json, FileChunk &response);

    /// Builds the `{"cmd", "payload"}` document for a request.
    nlohmann::json request_to_json(const Request &request);

    /// Throws ProtocolError on unknown commands or malformed payloads.
    Request request_from_json(const nlohmann::json &json);

    nlohmann::json response_to_json(const Response &response);
    Response response_from_json(const nlohmann::json &json);

    Response make_error(ErrorCode code, std::string message);

} // namespace shellfs::protocol
