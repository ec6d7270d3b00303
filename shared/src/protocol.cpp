#include "shellfs/protocol.hpp"

#include <array>
#include <cstdint>
#include <limits>
#include <utility>

namespace shellfs::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 9> kCommandMappings{{
            {Command::ListDirectory, "LIST"},
            {Command::ChangeDirectory, "CD"},
            {Command::ChangeDirectoryUp, "CD_UP"},
            {Command::MakeDirectory, "MKDIR"},
            {Command::CopyFile, "COPY"},
            {Command::UploadStart, "UPLOAD_START"},
            {Command::UploadChunk, "UPLOAD_CHUNK"},
            {Command::DownloadStart, "DOWNLOAD_START"},
            {Command::DownloadChunk, "DOWNLOAD_CHUNK"},
        }};

        struct ResponseKindMapping
        {
            ResponseKind kind;
            std::string_view label;
        };

        constexpr std::array<ResponseKindMapping, 6> kResponseMappings{{
            {ResponseKind::Ok, "OK"},
            {ResponseKind::Error, "ERROR"},
            {ResponseKind::Listing, "LISTING"},
            {ResponseKind::FileMetadata, "FILE_METADATA"},
            {ResponseKind::ChunkAck, "CHUNK_ACK"},
            {ResponseKind::FileChunk, "FILE_CHUNK"},
        }};

        // Variant alternatives are declared in the same order as the enumerators.
        static_assert(std::variant_size_v<Request> == kCommandMappings.size());
        static_assert(std::variant_size_v<Response> == kResponseMappings.size());

        template <typename T>
        nlohmann::json payload_of(const T &body)
        {
            return body;
        }

        nlohmann::json payload_of(const ListDirectory &)
        {
            return nlohmann::json::object();
        }

        nlohmann::json payload_of(const ChangeDirectoryUp &)
        {
            return nlohmann::json::object();
        }

        nlohmann::json payload_of(const Ok &)
        {
            return nlohmann::json::object();
        }

        const nlohmann::json &payload_field(const nlohmann::json &json)
        {
            static const nlohmann::json kEmpty = nlohmann::json::object();
            if (auto it = json.find("payload"); it != json.end())
            {
                if (!it->is_object())
                {
                    throw ProtocolError("payload must be a map");
                }
                return *it;
            }
            return kEmpty;
        }

        std::vector<std::uint8_t> binary_field(const nlohmann::json &json, const char *key)
        {
            const auto &value = json.at(key);
            if (!value.is_binary())
            {
                throw ProtocolError(std::string("field '") + key + "' must be a byte string");
            }
            const auto &bytes = value.get_binary();
            return std::vector<std::uint8_t>(bytes.begin(), bytes.end());
        }

        // Negative or oversized values must not wrap into valid ids and sizes.
        template <typename T>
        T unsigned_field(const nlohmann::json &json, const char *key)
        {
            const auto &value = json.at(key);
            bool representable = false;
            std::uint64_t raw = 0;
            if (value.is_number_unsigned())
            {
                raw = value.get<std::uint64_t>();
                representable = true;
            }
            else if (value.is_number_integer() && value.get<std::int64_t>() >= 0)
            {
                raw = static_cast<std::uint64_t>(value.get<std::int64_t>());
                representable = true;
            }
            if (!representable || raw > std::numeric_limits<T>::max())
            {
                throw ProtocolError(std::string("field '") + key + "' is not an unsigned integer in range");
            }
            return static_cast<T>(raw);
        }

    } // namespace

    ProtocolError::ProtocolError(const std::string &message) : std::runtime_error(message) {}

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.label == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(ResponseKind kind) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    Command command_of(const Request &request) noexcept
    {
        return static_cast<Command>(request.index());
    }

    ResponseKind kind_of(const Response &response) noexcept
    {
        return static_cast<ResponseKind>(response.index());
    }

    void to_json(nlohmann::json &json, const ChangeDirectory &request)
    {
        json = {{"path", request.path}};
    }

    void from_json(const nlohmann::json &json, ChangeDirectory &request)
    {
        request.path = json.at("path").get<std::string>();
    }

    void to_json(nlohmann::json &json, const MakeDirectory &request)
    {
        json = {{"name", request.name}};
    }

    void from_json(const nlohmann::json &json, MakeDirectory &request)
    {
        request.name = json.at("name").get<std::string>();
    }

    void to_json(nlohmann::json &json, const CopyFile &request)
    {
        json = {
            {"src", request.source},
            {"dst", request.destination},
        };
    }

    void from_json(const nlohmann::json &json, CopyFile &request)
    {
        request.source = json.at("src").get<std::string>();
        request.destination = json.at("dst").get<std::string>();
    }

    void to_json(nlohmann::json &json, const UploadStart &request)
    {
        json = {
            {"file_name", request.file_name},
            {"size", request.size},
            {"directory", request.directory},
        };
    }

    void from_json(const nlohmann::json &json, UploadStart &request)
    {
        request.file_name = json.at("file_name").get<std::string>();
        request.size = unsigned_field<std::uint64_t>(json, "size");
        request.directory = json.value("directory", std::string{"."});
    }

    void to_json(nlohmann::json &json, const UploadChunk &request)
    {
        json = {
            {"id", request.id},
            {"data", nlohmann::json::binary(request.data)},
            {"is_last", request.is_last},
        };
    }

    void from_json(const nlohmann::json &json, UploadChunk &request)
    {
        request.id = unsigned_field<std::uint32_t>(json, "id");
        request.data = binary_field(json, "data");
        request.is_last = json.at("is_last").get<bool>();
    }

    void to_json(nlohmann::json &json, const DownloadStart &request)
    {
        json = {{"src_path", request.source_path}};
    }

    void from_json(const nlohmann::json &json, DownloadStart &request)
    {
        request.source_path = json.at("src_path").get<std::string>();
    }

    void to_json(nlohmann::json &json, const DownloadChunk &request)
    {
        json = {{"id", request.id}};
    }

    void from_json(const nlohmann::json &json, DownloadChunk &request)
    {
        request.id = unsigned_field<std::uint32_t>(json, "id");
    }

    void to_json(nlohmann::json &json, const DirEntry &entry)
    {
        json = {
            {"name", entry.name},
            {"is_dir", entry.is_dir},
            {"size", entry.size},
        };
    }

    void from_json(const nlohmann::json &json, DirEntry &entry)
    {
        entry.name = json.at("name").get<std::string>();
        entry.is_dir = json.value("is_dir", false);
        entry.size = json.contains("size") ? unsigned_field<std::uint64_t>(json, "size") : 0;
    }

    void to_json(nlohmann::json &json, const Error &response)
    {
        json = {
            {"code", to_int(response.code)},
            {"message", response.message},
        };
    }

    void from_json(const nlohmann::json &json, Error &response)
    {
        response.code = json.contains("code") ? error_code_from_int(unsigned_field<std::uint16_t>(json, "code"))
                                              : ErrorCode::InternalError;
        response.message = json.value("message", std::string{});
    }

    void to_json(nlohmann::json &json, const Listing &response)
    {
        json = {{"entries", response.entries}};
    }

    void from_json(const nlohmann::json &json, Listing &response)
    {
        response.entries = json.at("entries").get<std::vector<DirEntry>>();
    }

    void to_json(nlohmann::json &json, const FileMetadata &response)
    {
        json = {
            {"name", response.name},
            {"size", response.size},
        };
        if (response.content_hash)
        {
            json["hash"] = *response.content_hash;
        }
    }

    void from_json(const nlohmann::json &json, FileMetadata &response)
    {
        response.name = json.at("name").get<std::string>();
        response.size = unsigned_field<std::uint64_t>(json, "size");
        if (auto it = json.find("hash"); it != json.end())
        {
            response.content_hash = it->get<std::string>();
        }
        else
        {
            response.content_hash.reset();
        }
    }

    void to_json(nlohmann::json &json, const ChunkAck &response)
    {
        json = {{"id", response.id}};
    }

    void from_json(const nlohmann::json &json, ChunkAck &response)
    {
        response.id = unsigned_field<std::uint32_t>(json, "id");
    }

    void to_json(nlohmann::json &json, const FileChunk &response)
    {
        json = {
            {"id", response.id},
            {"data", nlohmann::json::binary(response.data)},
            {"is_last", response.is_last},
        };
    }

    void from_json(const nlohmann::json &json, FileChunk &response)
    {
        response.id = unsigned_field<std::uint32_t>(json, "id");
        response.data = binary_field(json, "data");
        response.is_last = json.at("is_last").get<bool>();
    }

    nlohmann::json request_to_json(const Request &request)
    {
        return {
            {"cmd", to_string(command_of(request))},
            {"payload", std::visit([](const auto &body)
                                   { return payload_of(body); },
                                   request)},
        };
    }

    Request request_from_json(const nlohmann::json &json)
    {
        if (!json.is_object())
        {
            throw ProtocolError("request must be a map");
        }
        try
        {
            const auto label = json.at("cmd").get<std::string>();
            const auto command = command_from_string(label);
            if (!command)
            {
                throw ProtocolError("Unknown command: " + label);
            }
            const auto &payload = payload_field(json);
            switch (*command)
            {
            case Command::ListDirectory:
                return ListDirectory{};
            case Command::ChangeDirectory:
                return payload.get<ChangeDirectory>();
            case Command::ChangeDirectoryUp:
                return ChangeDirectoryUp{};
            case Command::MakeDirectory:
                return payload.get<MakeDirectory>();
            case Command::CopyFile:
                return payload.get<CopyFile>();
            case Command::UploadStart:
                return payload.get<UploadStart>();
            case Command::UploadChunk:
                return payload.get<UploadChunk>();
            case Command::DownloadStart:
                return payload.get<DownloadStart>();
            case Command::DownloadChunk:
                return payload.get<DownloadChunk>();
            }
            throw ProtocolError("Unhandled command: " + label);
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw ProtocolError(std::string("Malformed request: ") + ex.what());
        }
    }

    nlohmann::json response_to_json(const Response &response)
    {
        return {
            {"kind", to_string(kind_of(response))},
            {"payload", std::visit([](const auto &body)
                                   { return payload_of(body); },
                                   response)},
        };
    }

    Response response_from_json(const nlohmann::json &json)
    {
        if (!json.is_object())
        {
            throw ProtocolError("response must be a map");
        }
        try
        {
            const auto label = json.at("kind").get<std::string>();
            const auto kind = response_kind_from_string(label);
            if (!kind)
            {
                throw ProtocolError("Unknown response kind: " + label);
            }
            const auto &payload = payload_field(json);
            switch (*kind)
            {
            case ResponseKind::Ok:
                return Ok{};
            case ResponseKind::Error:
                return payload.get<Error>();
            case ResponseKind::Listing:
                return payload.get<Listing>();
            case ResponseKind::FileMetadata:
                return payload.get<FileMetadata>();
            case ResponseKind::ChunkAck:
                return payload.get<ChunkAck>();
            case ResponseKind::FileChunk:
                return payload.get<FileChunk>();
            }
            throw ProtocolError("Unhandled response kind: " + label);
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw ProtocolError(std::string("Malformed response: ") + ex.what());
        }
    }

    Response make_error(ErrorCode code, std::string message)
    {
        return Error{.code = code, .message = std::move(message)};
    }

} // namespace shellfs::protocol
