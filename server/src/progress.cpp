#include "vaultdrop/server/progress.hpp"

#include "upload_common.hpp"

namespace vaultdrop::server
{

    ProgressReport estimate_progress(const UploadSession &session, const ChunkStats &stats,
                                     std::chrono::system_clock::time_point now)
    {
        ProgressReport report{
            .session_id = session.session_id,
            .filename = session.filename,
            .status = session.status,
            .total_size = session.total_size,
            .uploaded_bytes = stats.stored_bytes,
            .total_chunks = session.total_chunks,
            .uploaded_chunks = stats.uploaded_chunks,
        };

        if (session.total_chunks > 0)
        {
            report.percent = static_cast<double>(stats.uploaded_chunks) / static_cast<double>(session.total_chunks) *
                             100.0;
        }

        report.elapsed_seconds = upload_common::seconds_between(session.created_at, now);
        if (report.elapsed_seconds > 0.0)
        {
            report.speed_bytes_per_sec = static_cast<double>(stats.stored_bytes) / report.elapsed_seconds;
        }

        if (report.speed_bytes_per_sec > 0.0)
        {
            const auto remaining = session.total_size > stats.stored_bytes ? session.total_size - stats.stored_bytes
                                                                           : std::uint64_t{0};
            report.eta_seconds = static_cast<double>(remaining) / report.speed_bytes_per_sec;
        }
        return report;
    }

} // namespace vaultdrop::server
