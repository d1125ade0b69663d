#include "vaultdrop/server/session_registry.hpp"

#include <array>
#include <mutex>

#include <spdlog/spdlog.h>

#include "upload_common.hpp"
#include "vaultdrop/crypto.hpp"
#include "vaultdrop/error_codes.hpp"

namespace vaultdrop::server
{

    namespace
    {
        constexpr std::size_t kSessionIdLength = 32;
        constexpr std::size_t kSessionEntropyBytes = 32;

        struct StatusMapping
        {
            UploadStatus status;
            std::string_view label;
        };

        constexpr std::array<StatusMapping, 4> kStatusMappings{{
            {UploadStatus::Uploading, "uploading"},
            {UploadStatus::Assembling, "assembling"},
            {UploadStatus::Completed, "completed"},
            {UploadStatus::Failed, "failed"},
        }};

        bool is_terminal(UploadStatus status)
        {
            return status == UploadStatus::Completed || status == UploadStatus::Failed;
        }
    } // namespace

    std::string_view to_string(UploadStatus status) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.status == status)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    SessionRegistry::SessionRegistry(UploadConfig config) : config_(std::move(config)) {}

    UploadSession SessionRegistry::create(const std::string &filename, std::int64_t total_size,
                                          std::chrono::system_clock::time_point now)
    {
        if (filename.empty())
        {
            throw OperationError(ErrorCode::InvalidArgument, "Filename is required");
        }
        if (total_size <= 0)
        {
            throw OperationError(ErrorCode::InvalidArgument, "Total size must be positive");
        }
        const auto size = static_cast<std::uint64_t>(total_size);
        if (size > config_.max_file_size)
        {
            throw OperationError(ErrorCode::InvalidArgument,
                                 "File exceeds maximum size of " + upload_common::format_size(config_.max_file_size));
        }

        auto slot = std::make_shared<Slot>();
        auto &session = slot->session;
        session.filename = filename;
        session.total_size = size;
        session.chunk_size = chunk_size_for(config_, size);
        session.total_chunks = (size + session.chunk_size - 1) / session.chunk_size;
        session.created_at = now;
        session.last_activity = now;
        session.status = UploadStatus::Uploading;

        {
            std::unique_lock lock(mutex_);
            do
            {
                session.session_id = generate_session_id(filename, now);
            } while (sessions_.contains(session.session_id));
            sessions_.emplace(session.session_id, slot);
        }

        spdlog::info("Created upload session {} for {} ({}, {} chunks of {})", session.session_id, filename,
                     upload_common::format_size(size), session.total_chunks,
                     upload_common::format_size(session.chunk_size));
        return session;
    }

    std::optional<UploadSession> SessionRegistry::find(const std::string &session_id) const
    {
        auto slot = find_slot(session_id);
        if (!slot)
        {
            return std::nullopt;
        }
        std::shared_lock lock(slot->mutex);
        return slot->session;
    }

    UploadSession SessionRegistry::get(const std::string &session_id) const
    {
        auto session = find(session_id);
        if (!session)
        {
            throw OperationError(ErrorCode::NotFound, "Upload session not found");
        }
        return *session;
    }

    void SessionRegistry::touch(const std::string &session_id, std::chrono::system_clock::time_point now)
    {
        auto slot = find_slot(session_id);
        if (!slot)
        {
            return;
        }
        std::unique_lock lock(slot->mutex);
        if (now > slot->session.last_activity)
        {
            slot->session.last_activity = now;
        }
    }

    bool SessionRegistry::transition(const std::string &session_id, UploadStatus from, UploadStatus to)
    {
        auto slot = find_slot(session_id);
        if (!slot)
        {
            return false;
        }
        std::unique_lock lock(slot->mutex);
        if (slot->session.status != from)
        {
            return false;
        }
        slot->session.status = to;
        return true;
    }

    void SessionRegistry::mark_failed(const std::string &session_id)
    {
        auto slot = find_slot(session_id);
        if (!slot)
        {
            return;
        }
        std::unique_lock lock(slot->mutex);
        if (!is_terminal(slot->session.status))
        {
            slot->session.status = UploadStatus::Failed;
        }
    }

    bool SessionRegistry::remove(const std::string &session_id)
    {
        std::unique_lock lock(mutex_);
        return sessions_.erase(session_id) > 0;
    }

    std::vector<std::string> SessionRegistry::expired(std::chrono::seconds max_age,
                                                      std::chrono::system_clock::time_point now) const
    {
        std::vector<std::shared_ptr<Slot>> slots;
        {
            std::shared_lock lock(mutex_);
            slots.reserve(sessions_.size());
            for (const auto &[id, slot] : sessions_)
            {
                slots.push_back(slot);
            }
        }

        std::vector<std::string> ids;
        for (const auto &slot : slots)
        {
            std::shared_lock lock(slot->mutex);
            if (now - slot->session.last_activity > max_age)
            {
                ids.push_back(slot->session.session_id);
            }
        }
        return ids;
    }

    std::vector<UploadSession> SessionRegistry::list() const
    {
        std::vector<std::shared_ptr<Slot>> slots;
        {
            std::shared_lock lock(mutex_);
            slots.reserve(sessions_.size());
            for (const auto &[id, slot] : sessions_)
            {
                slots.push_back(slot);
            }
        }

        std::vector<UploadSession> sessions;
        sessions.reserve(slots.size());
        for (const auto &slot : slots)
        {
            std::shared_lock lock(slot->mutex);
            sessions.push_back(slot->session);
        }
        return sessions;
    }

    std::size_t SessionRegistry::size() const
    {
        std::shared_lock lock(mutex_);
        return sessions_.size();
    }

    std::shared_ptr<SessionRegistry::Slot> SessionRegistry::find_slot(const std::string &session_id) const
    {
        std::shared_lock lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end())
        {
            return nullptr;
        }
        return it->second;
    }

    std::string SessionRegistry::generate_session_id(const std::string &filename,
                                                     std::chrono::system_clock::time_point now) const
    {
        auto material = crypto::random_bytes(kSessionEntropyBytes);
        const auto stamp = std::to_string(now.time_since_epoch().count());
        for (const char c : filename + stamp)
        {
            material.push_back(static_cast<std::byte>(c));
        }
        return crypto::hash_bytes(material).substr(0, kSessionIdLength);
    }

} // namespace vaultdrop::server
