#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "vaultdrop/server/progress.hpp"
#include "vaultdrop/server/session_registry.hpp"

namespace vaultdrop::server
{

    /// Receives upload lifecycle events for best-effort mirroring outside the process.
    /// Implementations may throw; callers log the failure and carry on.
    class ProgressObserver
    {
    public:
        virtual ~ProgressObserver() = default;

        virtual void on_session_created(const UploadSession & /*session*/) {}
        virtual void on_progress(const ProgressReport & /*report*/) {}
        virtual void on_completed(const UploadSession & /*session*/, std::uint64_t /*final_size*/) {}
        virtual void on_removed(const std::string & /*session_id*/) {}
    };

    class NullProgressObserver final : public ProgressObserver
    {
    };

    /// Writes one JSON snapshot per session into a directory shared with other processes.
    class JsonFileProgressMirror final : public ProgressObserver
    {
    public:
        explicit JsonFileProgressMirror(std::filesystem::path directory);

        void on_session_created(const UploadSession &session) override;
        void on_progress(const ProgressReport &report) override;
        void on_completed(const UploadSession &session, std::uint64_t final_size) override;
        void on_removed(const std::string &session_id) override;

        std::filesystem::path snapshot_path(const std::string &session_id) const;

    private:
        void write_snapshot(const std::string &session_id, const nlohmann::json &json);

        std::filesystem::path directory_;
        std::mutex mutex_;
    };

} // namespace vaultdrop::server
