#include "vaultdrop/server/upload_manager.hpp"

#include <algorithm>
#include <mutex>

#include <spdlog/spdlog.h>

#include "vaultdrop/error_codes.hpp"

namespace vaultdrop::server
{

    template <typename Callback>
    void UploadManager::notify(const char *event, Callback &&callback) const
    {
        try
        {
            callback(*observer_);
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Progress mirror failed on {} event: {}", event, ex.what());
        }
    }

    UploadManager::UploadManager(UploadConfig config, std::shared_ptr<ProgressObserver> observer)
        : config_(std::move(config)),
          registry_(config_),
          chunks_(config_.max_buffered_bytes),
          assembler_(registry_, chunks_),
          observer_(observer ? std::move(observer) : std::make_shared<NullProgressObserver>())
    {
    }

    SessionDescriptor UploadManager::create_session(const std::string &filename, std::int64_t total_size)
    {
        if (!is_extension_allowed(config_, filename))
        {
            spdlog::warn("Rejected upload of {}: file type not allowed", filename);
            throw OperationError(ErrorCode::InvalidArgument, "File type not allowed");
        }
        const auto session = registry_.create(filename, total_size, std::chrono::system_clock::now());
        chunks_.open(session.session_id, session.total_chunks, session.chunk_size);
        notify("session created", [&](ProgressObserver &observer)
               { observer.on_session_created(session); });
        return {
            .session_id = session.session_id,
            .chunk_size = session.chunk_size,
            .total_chunks = session.total_chunks,
        };
    }

    ChunkReceipt UploadManager::put_chunk(const std::string &session_id, std::int64_t index,
                                          std::span<const std::byte> payload)
    {
        const auto session = registry_.get(session_id);
        if (session.status != UploadStatus::Uploading)
        {
            throw OperationError(ErrorCode::InvalidState,
                                 "Upload session is " + std::string(to_string(session.status)));
        }

        const auto now = std::chrono::system_clock::now();
        const auto settings = compression_settings_for(config_, session.filename);
        auto receipt = chunks_.put(session_id, index, payload, settings, now);
        registry_.touch(session_id, now);

        spdlog::debug("Stored chunk {}/{} for session {} ({} bytes{})", receipt.index + 1, session.total_chunks,
                      session_id, receipt.stored_size, receipt.compressed ? ", compressed" : "");

        std::shared_lock lifecycle(lifecycle_mutex_);
        if (registry_.find(session_id))
        {
            notify("progress", [&](ProgressObserver &observer)
                   { observer.on_progress(estimate_progress(session, chunks_.stats(session_id), now)); });
        }
        return receipt;
    }

    ProgressReport UploadManager::progress(const std::string &session_id) const
    {
        const auto session = registry_.get(session_id);
        return estimate_progress(session, chunks_.stats(session_id), std::chrono::system_clock::now());
    }

    AssemblyResult UploadManager::assemble(const std::string &session_id, const std::filesystem::path &output_path)
    {
        auto result = assembler_.assemble(session_id, output_path);
        std::shared_lock lifecycle(lifecycle_mutex_);
        if (auto session = registry_.find(session_id))
        {
            notify("completed", [&](ProgressObserver &observer)
                   { observer.on_completed(*session, result.final_size); });
        }
        return result;
    }

    void UploadManager::cleanup_session(const std::string &session_id)
    {
        std::unique_lock lifecycle(lifecycle_mutex_);
        chunks_.drop(session_id);
        if (registry_.remove(session_id))
        {
            spdlog::info("Removed upload session {}", session_id);
            notify("removed", [&](ProgressObserver &observer)
                   { observer.on_removed(session_id); });
        }
    }

    std::size_t UploadManager::expire_older_than(std::chrono::seconds max_age)
    {
        return expire_older_than(max_age, std::chrono::system_clock::now());
    }

    std::size_t UploadManager::expire_older_than(std::chrono::seconds max_age,
                                                 std::chrono::system_clock::time_point now)
    {
        const auto expired = registry_.expired(max_age, now);
        std::size_t removed = 0;
        for (const auto &session_id : expired)
        {
            std::unique_lock lifecycle(lifecycle_mutex_);
            chunks_.drop(session_id);
            if (registry_.remove(session_id))
            {
                ++removed;
                notify("removed", [&](ProgressObserver &observer)
                       { observer.on_removed(session_id); });
            }
        }
        if (removed > 0)
        {
            spdlog::info("Expired {} upload session(s) idle for more than {}s", removed, max_age.count());
        }
        return removed;
    }

    std::vector<SessionSummary> UploadManager::active_sessions() const
    {
        const auto now = std::chrono::system_clock::now();
        std::vector<SessionSummary> summaries;
        for (const auto &session : registry_.list())
        {
            SessionSummary summary{
                .session_id = session.session_id,
                .filename = session.filename,
                .total_size = session.total_size,
                .status = session.status,
                .started_at = session.created_at,
            };
            try
            {
                summary.percent = estimate_progress(session, chunks_.stats(session.session_id), now).percent;
            }
            catch (const OperationError &)
            {
                // Removed between the registry snapshot and the stats read.
                continue;
            }
            summaries.push_back(std::move(summary));
        }
        std::sort(summaries.begin(), summaries.end(),
                  [](const SessionSummary &lhs, const SessionSummary &rhs)
                  { return lhs.started_at < rhs.started_at; });
        return summaries;
    }

} // namespace vaultdrop::server
