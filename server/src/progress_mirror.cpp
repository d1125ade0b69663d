#include "vaultdrop/server/progress_mirror.hpp"

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "upload_common.hpp"

namespace vaultdrop::server
{

    namespace
    {

        nlohmann::json session_snapshot(const UploadSession &session)
        {
            return {
                {"session_id", session.session_id},
                {"filename", session.filename},
                {"status", to_string(session.status)},
                {"total_size", session.total_size},
                {"chunk_size", session.chunk_size},
                {"total_chunks", session.total_chunks},
                {"created_at", upload_common::to_unix_seconds(session.created_at)},
                {"last_activity", upload_common::to_unix_seconds(session.last_activity)},
            };
        }

    } // namespace

    JsonFileProgressMirror::JsonFileProgressMirror(std::filesystem::path directory) : directory_(std::move(directory))
    {
        std::filesystem::create_directories(directory_);
    }

    void JsonFileProgressMirror::on_session_created(const UploadSession &session)
    {
        auto json = session_snapshot(session);
        json["uploaded_chunks"] = 0;
        json["percent"] = 0.0;
        write_snapshot(session.session_id, json);
    }

    void JsonFileProgressMirror::on_progress(const ProgressReport &report)
    {
        nlohmann::json json{
            {"session_id", report.session_id},
            {"filename", report.filename},
            {"status", to_string(report.status)},
            {"total_size", report.total_size},
            {"uploaded_bytes", report.uploaded_bytes},
            {"total_chunks", report.total_chunks},
            {"uploaded_chunks", report.uploaded_chunks},
            {"percent", report.percent},
            {"speed_bps", report.speed_bytes_per_sec},
            {"elapsed_seconds", report.elapsed_seconds},
        };
        json["eta_seconds"] = report.eta_seconds ? nlohmann::json(*report.eta_seconds) : nlohmann::json(nullptr);
        write_snapshot(report.session_id, json);
    }

    void JsonFileProgressMirror::on_completed(const UploadSession &session, std::uint64_t final_size)
    {
        auto json = session_snapshot(session);
        json["status"] = to_string(UploadStatus::Completed);
        json["uploaded_chunks"] = session.total_chunks;
        json["percent"] = 100.0;
        json["final_size"] = final_size;
        write_snapshot(session.session_id, json);
    }

    void JsonFileProgressMirror::on_removed(const std::string &session_id)
    {
        std::lock_guard lock(mutex_);
        std::error_code ec;
        std::filesystem::remove(snapshot_path(session_id), ec);
        if (ec)
        {
            throw std::runtime_error("Failed to remove progress snapshot: " + ec.message());
        }
    }

    std::filesystem::path JsonFileProgressMirror::snapshot_path(const std::string &session_id) const
    {
        return directory_ / (session_id + ".json");
    }

    void JsonFileProgressMirror::write_snapshot(const std::string &session_id, const nlohmann::json &json)
    {
        std::lock_guard lock(mutex_);
        const auto path = snapshot_path(session_id);
        auto temp_path = path;
        temp_path += ".tmp";
        {
            std::ofstream out(temp_path, std::ios::trunc);
            if (!out.is_open())
            {
                throw std::runtime_error("Failed to open progress snapshot " + temp_path.string());
            }
            out << json.dump(2);
        }
        std::filesystem::rename(temp_path, path);
    }

} // namespace vaultdrop::server
