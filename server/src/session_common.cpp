#include "session_common.hpp"

#include "upload_common.hpp"

namespace vaultdrop::server::session_common
{

    protocol::ResponseEnvelope make_ok_response(nlohmann::json payload, const std::optional<std::string> &request_id)
    {
        protocol::ResponseEnvelope envelope;
        envelope.kind = protocol::ResponseKind::Ok;
        envelope.payload = std::move(payload);
        envelope.error = ErrorCode::Ok;
        envelope.request_id = request_id;
        return envelope;
    }

    protocol::ProgressMessage to_message(const ProgressReport &report)
    {
        return {
            .session_id = report.session_id,
            .filename = report.filename,
            .status = std::string(to_string(report.status)),
            .total_size = report.total_size,
            .uploaded_bytes = report.uploaded_bytes,
            .total_chunks = report.total_chunks,
            .uploaded_chunks = report.uploaded_chunks,
            .percent = report.percent,
            .speed_bytes_per_sec = report.speed_bytes_per_sec,
            .elapsed_seconds = report.elapsed_seconds,
            .eta_seconds = report.eta_seconds,
        };
    }

    protocol::SessionSummaryMessage to_message(const SessionSummary &summary)
    {
        return {
            .session_id = summary.session_id,
            .filename = summary.filename,
            .total_size = summary.total_size,
            .percent = summary.percent,
            .status = std::string(to_string(summary.status)),
            .started_at = upload_common::to_unix_seconds(summary.started_at),
        };
    }

    protocol::FileMetadata to_message(const FileRecord &record)
    {
        protocol::FileMetadata metadata{
            .name = record.name,
            .size = record.size,
            .locked = record.locked,
            .uploaded_at = upload_common::to_unix_seconds(record.uploaded_at),
        };
        if (!record.checksum.empty())
        {
            metadata.checksum = record.checksum;
        }
        return metadata;
    }

} // namespace vaultdrop::server::session_common
