/**
 * VaultDrop - Shared protocol schema and serialization helpers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "vaultdrop/error_codes.hpp"

namespace vaultdrop::protocol
{

    enum class Command : std::uint8_t
    {
        Ping,
        ServerInfo,
        UploadInit,
        UploadChunk,
        UploadProgress,
        UploadAssemble,
        UploadCancel,
        UploadList,
        FileList,
        FileStat,
        FileDownload,
        FileDelete,
        FileLock,
        FileUnlock
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        Error = 1
    };

    std::string_view to_string(ResponseKind kind) noexcept;
    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept;

    struct RequestEnvelope
    {
        Command command{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope);
    void from_json(const nlohmann::json &json, RequestEnvelope &envelope);

    struct ResponseEnvelope
    {
        ResponseKind kind{ResponseKind::Ok};
        ErrorCode error{ErrorCode::Ok};
        std::string message{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope);
    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope);

    struct UploadInitRequest
    {
        std::string filename;
        std::int64_t total_size{};
    };

    void to_json(nlohmann::json &json, const UploadInitRequest &request);
    void from_json(const nlohmann::json &json, UploadInitRequest &request);

    struct UploadInitResponse
    {
        std::string session_id;
        std::uint64_t chunk_size{};
        std::uint64_t total_chunks{};
    };

    void to_json(nlohmann::json &json, const UploadInitResponse &response);
    void from_json(const nlohmann::json &json, UploadInitResponse &response);

    struct UploadChunkRequest
    {
        std::string session_id;
        std::int64_t index{};
        std::string data_base64;
    };

    void to_json(nlohmann::json &json, const UploadChunkRequest &request);
    void from_json(const nlohmann::json &json, UploadChunkRequest &request);

    struct UploadChunkResponse
    {
        std::uint64_t index{};
        std::string checksum;
        std::uint64_t stored_size{};
        bool compressed{};
        double percent{};
    };

    void to_json(nlohmann::json &json, const UploadChunkResponse &response);
    void from_json(const nlohmann::json &json, UploadChunkResponse &response);

    struct SessionRequest
    {
        std::string session_id;
    };

    void to_json(nlohmann::json &json, const SessionRequest &request);
    void from_json(const nlohmann::json &json, SessionRequest &request);

    struct ProgressMessage
    {
        std::string session_id;
        std::string filename;
        std::string status;
        std::uint64_t total_size{};
        std::uint64_t uploaded_bytes{};
        std::uint64_t total_chunks{};
        std::uint64_t uploaded_chunks{};
        double percent{};
        double speed_bytes_per_sec{};
        double elapsed_seconds{};
        std::optional<double> eta_seconds{};
    };

    void to_json(nlohmann::json &json, const ProgressMessage &message);
    void from_json(const nlohmann::json &json, ProgressMessage &message);

    struct AssembleResponse
    {
        std::string filename;
        std::uint64_t final_size{};
        std::uint64_t total_chunks{};
        std::string checksum;
    };

    void to_json(nlohmann::json &json, const AssembleResponse &response);
    void from_json(const nlohmann::json &json, AssembleResponse &response);

    struct SessionSummaryMessage
    {
        std::string session_id;
        std::string filename;
        std::uint64_t total_size{};
        double percent{};
        std::string status;
        std::int64_t started_at{};
    };

    void to_json(nlohmann::json &json, const SessionSummaryMessage &message);
    void from_json(const nlohmann::json &json, SessionSummaryMessage &message);

    struct FileMetadata
    {
        std::string name;
        std::uint64_t size{};
        bool locked{};
        std::int64_t uploaded_at{};
        std::optional<std::string> checksum{};
    };

    void to_json(nlohmann::json &json, const FileMetadata &metadata);
    void from_json(const nlohmann::json &json, FileMetadata &metadata);

    struct FileRequest
    {
        std::string name;
        std::optional<std::string> password{};
    };

    void to_json(nlohmann::json &json, const FileRequest &request);
    void from_json(const nlohmann::json &json, FileRequest &request);

    struct FileDownloadRequest
    {
        std::string name;
        std::uint64_t offset{};
        std::uint64_t max_bytes{};
    };

    void to_json(nlohmann::json &json, const FileDownloadRequest &request);
    void from_json(const nlohmann::json &json, FileDownloadRequest &request);

    struct FileDownloadResponse
    {
        std::string name;
        std::uint64_t offset{};
        std::uint64_t bytes{};
        bool done{};
        std::string data_base64;
    };

    void to_json(nlohmann::json &json, const FileDownloadResponse &response);
    void from_json(const nlohmann::json &json, FileDownloadResponse &response);

} // namespace vaultdrop::protocol
