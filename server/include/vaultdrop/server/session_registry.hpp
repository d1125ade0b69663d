#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "vaultdrop/server/config.hpp"

namespace vaultdrop::server
{

    enum class UploadStatus : std::uint8_t
    {
        Uploading,
        Assembling,
        Completed,
        Failed
    };

    std::string_view to_string(UploadStatus status) noexcept;

    struct UploadSession
    {
        std::string session_id;
        std::string filename;
        std::uint64_t total_size{};
        std::uint64_t chunk_size{};
        std::uint64_t total_chunks{};
        std::chrono::system_clock::time_point created_at{};
        std::chrono::system_clock::time_point last_activity{};
        UploadStatus status{UploadStatus::Uploading};
    };

    class SessionRegistry
    {
    public:
        explicit SessionRegistry(UploadConfig config);

        UploadSession create(const std::string &filename, std::int64_t total_size,
                             std::chrono::system_clock::time_point now);

        std::optional<UploadSession> find(const std::string &session_id) const;

        /// Like find() but throws OperationError(NotFound).
        UploadSession get(const std::string &session_id) const;

        void touch(const std::string &session_id, std::chrono::system_clock::time_point now);

        bool transition(const std::string &session_id, UploadStatus from, UploadStatus to);

        void mark_failed(const std::string &session_id);

        bool remove(const std::string &session_id);

        std::vector<std::string> expired(std::chrono::seconds max_age, std::chrono::system_clock::time_point now) const;

        std::vector<UploadSession> list() const;

        std::size_t size() const;

    private:
        struct Slot
        {
            mutable std::shared_mutex mutex;
            UploadSession session;
        };

        std::shared_ptr<Slot> find_slot(const std::string &session_id) const;
        std::string generate_session_id(const std::string &filename, std::chrono::system_clock::time_point now) const;

        UploadConfig config_;
        mutable std::shared_mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<Slot>> sessions_;
    };

} // namespace vaultdrop::server
