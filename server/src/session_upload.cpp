#include "vaultdrop/server/session.hpp"

#include "session_common.hpp"
#include "vaultdrop/encoding/base64.hpp"
#include "vaultdrop/version.hpp"

namespace vaultdrop::server
{

    nlohmann::json Session::handle_ping(const protocol::RequestEnvelope & /*envelope*/)
    {
        return {{"pong", true}, {"version", std::string(vaultdrop::version())}};
    }

    nlohmann::json Session::handle_server_info(const protocol::RequestEnvelope & /*envelope*/)
    {
        const auto &upload = services_.uploads.config();
        nlohmann::json payload;
        payload["version"] = std::string(vaultdrop::version());
        payload["upload"] = upload;
        payload["expiry_interval"] = services_.config.expiry_interval.count();
        payload["active_sessions"] = services_.uploads.active_sessions().size();
        payload["buffered_bytes"] = services_.uploads.chunk_store().buffered_bytes();
        payload["warnings"] = validate_config(upload);
        return payload;
    }

    nlohmann::json Session::handle_upload_init(const protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<protocol::UploadInitRequest>();
        // Reject unsafe names before any chunk is accepted.
        services_.files.path_for(request.filename);
        const auto descriptor = services_.uploads.create_session(request.filename, request.total_size);
        return protocol::UploadInitResponse{
            .session_id = descriptor.session_id,
            .chunk_size = descriptor.chunk_size,
            .total_chunks = descriptor.total_chunks,
        };
    }

    nlohmann::json Session::handle_upload_chunk(const protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<protocol::UploadChunkRequest>();
        const auto data = encoding::decode_base64(request.data_base64);
        if (!data)
        {
            throw OperationError(ErrorCode::InvalidPayload, "Invalid chunk data");
        }
        const auto receipt = services_.uploads.put_chunk(request.session_id, request.index, *data);
        const auto progress = services_.uploads.progress(request.session_id);
        return protocol::UploadChunkResponse{
            .index = receipt.index,
            .checksum = receipt.checksum,
            .stored_size = receipt.stored_size,
            .compressed = receipt.compressed,
            .percent = progress.percent,
        };
    }

    nlohmann::json Session::handle_upload_progress(const protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<protocol::SessionRequest>();
        return session_common::to_message(services_.uploads.progress(request.session_id));
    }

    nlohmann::json Session::handle_upload_assemble(const protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<protocol::SessionRequest>();
        const auto progress = services_.uploads.progress(request.session_id);
        // Held until the record is registered so a second upload of the same name cannot overwrite it.
        services_.files.reserve(progress.filename);

        const auto target = services_.files.path_for(progress.filename);
        AssemblyResult result;
        try
        {
            result = services_.uploads.assemble(request.session_id, target);
            services_.files.register_file(result.filename, result.checksum);
        }
        catch (const OperationError &error)
        {
            services_.files.release_reservation(progress.filename);
            // A failed assembly cannot be retried, only abandoned.
            if (error.code() == ErrorCode::IOFailure)
            {
                services_.uploads.cleanup_session(request.session_id);
            }
            throw;
        }

        services_.uploads.cleanup_session(request.session_id);
        return protocol::AssembleResponse{
            .filename = result.filename,
            .final_size = result.final_size,
            .total_chunks = result.total_chunks,
            .checksum = result.checksum,
        };
    }

    nlohmann::json Session::handle_upload_cancel(const protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<protocol::SessionRequest>();
        services_.uploads.cleanup_session(request.session_id);
        return {{"session_id", request.session_id}, {"cancelled", true}};
    }

    nlohmann::json Session::handle_upload_list(const protocol::RequestEnvelope & /*envelope*/)
    {
        auto sessions = nlohmann::json::array();
        for (const auto &summary : services_.uploads.active_sessions())
        {
            sessions.push_back(session_common::to_message(summary));
        }
        return {{"sessions", std::move(sessions)}};
    }

} // namespace vaultdrop::server
