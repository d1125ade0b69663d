#include "vaultdrop/server/session.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "session_common.hpp"
#include "vaultdrop/encoding/base64.hpp"

namespace vaultdrop::server
{

    namespace
    {
        constexpr std::uint64_t kDefaultDownloadBytes = 1u << 20;
        constexpr std::uint64_t kMaxDownloadBytes = 4u << 20;

        std::string require_password(const protocol::FileRequest &request)
        {
            if (!request.password || request.password->empty())
            {
                throw OperationError(ErrorCode::InvalidPayload, "Password required");
            }
            return *request.password;
        }

    } // namespace

    nlohmann::json Session::handle_file_list(const protocol::RequestEnvelope & /*envelope*/)
    {
        auto files = nlohmann::json::array();
        for (const auto &record : services_.files.list())
        {
            files.push_back(session_common::to_message(record));
        }
        return {{"files", std::move(files)}};
    }

    nlohmann::json Session::handle_file_stat(const protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<protocol::FileRequest>();
        return session_common::to_message(services_.files.get(request.name));
    }

    nlohmann::json Session::handle_file_download(const protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<protocol::FileDownloadRequest>();
        const auto max_bytes = request.max_bytes == 0 ? kDefaultDownloadBytes
                                                      : std::min(request.max_bytes, kMaxDownloadBytes);
        const auto range = services_.files.read_range(request.name, request.offset, max_bytes);
        return protocol::FileDownloadResponse{
            .name = request.name,
            .offset = range.offset,
            .bytes = range.data.size(),
            .done = range.done,
            .data_base64 = encoding::encode_base64(range.data),
        };
    }

    nlohmann::json Session::handle_file_delete(const protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<protocol::FileRequest>();
        try
        {
            services_.files.remove(request.name, request.password);
        }
        catch (const OperationError &error)
        {
            if (error.code() == ErrorCode::AuthenticationFailed)
            {
                spdlog::warn("Rejected delete of locked file {} from {}", request.name, remote_endpoint());
            }
            throw;
        }
        return {{"name", request.name}, {"deleted", true}};
    }

    nlohmann::json Session::handle_file_lock(const protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<protocol::FileRequest>();
        services_.files.lock(request.name, require_password(request));
        return session_common::to_message(services_.files.get(request.name));
    }

    nlohmann::json Session::handle_file_unlock(const protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<protocol::FileRequest>();
        try
        {
            services_.files.unlock(request.name, require_password(request));
        }
        catch (const OperationError &error)
        {
            if (error.code() == ErrorCode::AuthenticationFailed)
            {
                spdlog::warn("Failed unlock attempt for {} from {}", request.name, remote_endpoint());
            }
            throw;
        }
        return session_common::to_message(services_.files.get(request.name));
    }

} // namespace vaultdrop::server
