#include "vaultdrop/protocol.hpp"

#include <array>
#include <stdexcept>

namespace vaultdrop::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 14> kCommandMappings{{
            {Command::Ping, "PING"},
            {Command::ServerInfo, "SERVER_INFO"},
            {Command::UploadInit, "UPLOAD_INIT"},
            {Command::UploadChunk, "UPLOAD_CHUNK"},
            {Command::UploadProgress, "UPLOAD_PROGRESS"},
            {Command::UploadAssemble, "UPLOAD_ASSEMBLE"},
            {Command::UploadCancel, "UPLOAD_CANCEL"},
            {Command::UploadList, "UPLOAD_LIST"},
            {Command::FileList, "FILE_LIST"},
            {Command::FileStat, "FILE_STAT"},
            {Command::FileDownload, "FILE_DOWNLOAD"},
            {Command::FileDelete, "FILE_DELETE"},
            {Command::FileLock, "FILE_LOCK"},
            {Command::FileUnlock, "FILE_UNLOCK"},
        }};

        struct ResponseKindMapping
        {
            ResponseKind kind;
            std::string_view label;
        };

        constexpr std::array<ResponseKindMapping, 2> kResponseMappings{{
            {ResponseKind::Ok, "OK"},
            {ResponseKind::Error, "ERROR"},
        }};

        template <typename T>
        void read_optional(const nlohmann::json &json, const char *key, std::optional<T> &target)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                target = it->template get<T>();
            }
            else
            {
                target.reset();
            }
        }

    } // namespace

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

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope)
    {
        json = {
            {"cmd", to_string(envelope.command)},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, RequestEnvelope &envelope)
    {
        const auto cmd_label = json.at("cmd").get<std::string>();
        auto cmd = command_from_string(cmd_label);
        if (!cmd)
        {
            throw std::runtime_error("Unknown command: " + cmd_label);
        }
        envelope.command = *cmd;
        envelope.payload = json.value("payload", nlohmann::json::object());
        read_optional(json, "id", envelope.request_id);
    }

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope)
    {
        json = {
            {"status", to_string(envelope.kind)},
            {"error", to_int(envelope.error)},
            {"message", envelope.message},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope)
    {
        const auto status_label = json.at("status").get<std::string>();
        auto kind = response_kind_from_string(status_label);
        if (!kind)
        {
            throw std::runtime_error("Unknown response status: " + status_label);
        }
        envelope.kind = *kind;
        const auto error_value = json.value("error", 0u);
        envelope.error = error_code_from_int(static_cast<std::uint16_t>(error_value));
        envelope.message = json.value("message", std::string{});
        envelope.payload = json.value("payload", nlohmann::json::object());
        read_optional(json, "id", envelope.request_id);
    }

    void to_json(nlohmann::json &json, const UploadInitRequest &request)
    {
        json = {
            {"filename", request.filename},
            {"total_size", request.total_size},
        };
    }

    void from_json(const nlohmann::json &json, UploadInitRequest &request)
    {
        request.filename = json.at("filename").get<std::string>();
        request.total_size = json.at("total_size").get<std::int64_t>();
    }

    void to_json(nlohmann::json &json, const UploadInitResponse &response)
    {
        json = {
            {"session_id", response.session_id},
            {"chunk_size", response.chunk_size},
            {"total_chunks", response.total_chunks},
        };
    }

    void from_json(const nlohmann::json &json, UploadInitResponse &response)
    {
        response.session_id = json.at("session_id").get<std::string>();
        response.chunk_size = json.at("chunk_size").get<std::uint64_t>();
        response.total_chunks = json.at("total_chunks").get<std::uint64_t>();
    }

    void to_json(nlohmann::json &json, const UploadChunkRequest &request)
    {
        json = {
            {"session_id", request.session_id},
            {"index", request.index},
            {"data", request.data_base64},
        };
    }

    void from_json(const nlohmann::json &json, UploadChunkRequest &request)
    {
        request.session_id = json.at("session_id").get<std::string>();
        request.index = json.at("index").get<std::int64_t>();
        request.data_base64 = json.at("data").get<std::string>();
    }

    void to_json(nlohmann::json &json, const UploadChunkResponse &response)
    {
        json = {
            {"index", response.index},
            {"checksum", response.checksum},
            {"stored_size", response.stored_size},
            {"compressed", response.compressed},
            {"percent", response.percent},
        };
    }

    void from_json(const nlohmann::json &json, UploadChunkResponse &response)
    {
        response.index = json.at("index").get<std::uint64_t>();
        response.checksum = json.at("checksum").get<std::string>();
        response.stored_size = json.value("stored_size", 0ULL);
        response.compressed = json.value("compressed", false);
        response.percent = json.value("percent", 0.0);
    }

    void to_json(nlohmann::json &json, const SessionRequest &request)
    {
        json = {{"session_id", request.session_id}};
    }

    void from_json(const nlohmann::json &json, SessionRequest &request)
    {
        request.session_id = json.at("session_id").get<std::string>();
    }

    void to_json(nlohmann::json &json, const ProgressMessage &message)
    {
        json = {
            {"session_id", message.session_id},
            {"filename", message.filename},
            {"status", message.status},
            {"total_size", message.total_size},
            {"uploaded_bytes", message.uploaded_bytes},
            {"total_chunks", message.total_chunks},
            {"uploaded_chunks", message.uploaded_chunks},
            {"percent", message.percent},
            {"speed_bps", message.speed_bytes_per_sec},
            {"elapsed_seconds", message.elapsed_seconds},
            {"eta_seconds", message.eta_seconds ? nlohmann::json(*message.eta_seconds) : nlohmann::json(nullptr)},
        };
    }

    void from_json(const nlohmann::json &json, ProgressMessage &message)
    {
        message.session_id = json.at("session_id").get<std::string>();
        message.filename = json.value("filename", std::string{});
        message.status = json.value("status", std::string{});
        message.total_size = json.value("total_size", 0ULL);
        message.uploaded_bytes = json.value("uploaded_bytes", 0ULL);
        message.total_chunks = json.value("total_chunks", 0ULL);
        message.uploaded_chunks = json.value("uploaded_chunks", 0ULL);
        message.percent = json.value("percent", 0.0);
        message.speed_bytes_per_sec = json.value("speed_bps", 0.0);
        message.elapsed_seconds = json.value("elapsed_seconds", 0.0);
        read_optional(json, "eta_seconds", message.eta_seconds);
    }

    void to_json(nlohmann::json &json, const AssembleResponse &response)
    {
        json = {
            {"filename", response.filename},
            {"final_size", response.final_size},
            {"total_chunks", response.total_chunks},
            {"checksum", response.checksum},
        };
    }

    void from_json(const nlohmann::json &json, AssembleResponse &response)
    {
        response.filename = json.at("filename").get<std::string>();
        response.final_size = json.at("final_size").get<std::uint64_t>();
        response.total_chunks = json.value("total_chunks", 0ULL);
        response.checksum = json.value("checksum", std::string{});
    }

    void to_json(nlohmann::json &json, const SessionSummaryMessage &message)
    {
        json = {
            {"session_id", message.session_id},
            {"filename", message.filename},
            {"total_size", message.total_size},
            {"percent", message.percent},
            {"status", message.status},
            {"started_at", message.started_at},
        };
    }

    void from_json(const nlohmann::json &json, SessionSummaryMessage &message)
    {
        message.session_id = json.at("session_id").get<std::string>();
        message.filename = json.value("filename", std::string{});
        message.total_size = json.value("total_size", 0ULL);
        message.percent = json.value("percent", 0.0);
        message.status = json.value("status", std::string{});
        message.started_at = json.value("started_at", 0LL);
    }

    void to_json(nlohmann::json &json, const FileMetadata &metadata)
    {
        json = {
            {"name", metadata.name},
            {"size", metadata.size},
            {"locked", metadata.locked},
            {"uploaded_at", metadata.uploaded_at},
        };
        if (metadata.checksum)
        {
            json["checksum"] = *metadata.checksum;
        }
    }

    void from_json(const nlohmann::json &json, FileMetadata &metadata)
    {
        metadata.name = json.at("name").get<std::string>();
        metadata.size = json.value("size", 0ULL);
        metadata.locked = json.value("locked", false);
        metadata.uploaded_at = json.value("uploaded_at", 0LL);
        read_optional(json, "checksum", metadata.checksum);
    }

    void to_json(nlohmann::json &json, const FileRequest &request)
    {
        json = {{"name", request.name}};
        if (request.password)
        {
            json["password"] = *request.password;
        }
    }

    void from_json(const nlohmann::json &json, FileRequest &request)
    {
        request.name = json.at("name").get<std::string>();
        read_optional(json, "password", request.password);
    }

    void to_json(nlohmann::json &json, const FileDownloadRequest &request)
    {
        json = {
            {"name", request.name},
            {"offset", request.offset},
            {"max_bytes", request.max_bytes},
        };
    }

    void from_json(const nlohmann::json &json, FileDownloadRequest &request)
    {
        request.name = json.at("name").get<std::string>();
        request.offset = json.value("offset", 0ULL);
        request.max_bytes = json.value("max_bytes", 0ULL);
    }

    void to_json(nlohmann::json &json, const FileDownloadResponse &response)
    {
        json = {
            {"name", response.name},
            {"offset", response.offset},
            {"bytes", response.bytes},
            {"done", response.done},
            {"data", response.data_base64},
        };
    }

    void from_json(const nlohmann::json &json, FileDownloadResponse &response)
    {
        response.name = json.at("name").get<std::string>();
        response.offset = json.value("offset", 0ULL);
        response.bytes = json.value("bytes", 0ULL);
        response.done = json.value("done", false);
        response.data_base64 = json.value("data", std::string{});
    }

} // namespace vaultdrop::protocol
