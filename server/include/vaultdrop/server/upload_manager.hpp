#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <span>
#include <string>
#include <vector>

#include "vaultdrop/server/assembler.hpp"
#include "vaultdrop/server/chunk_store.hpp"
#include "vaultdrop/server/config.hpp"
#include "vaultdrop/server/progress.hpp"
#include "vaultdrop/server/progress_mirror.hpp"
#include "vaultdrop/server/session_registry.hpp"

namespace vaultdrop::server
{

    struct SessionDescriptor
    {
        std::string session_id;
        std::uint64_t chunk_size{};
        std::uint64_t total_chunks{};
    };

    struct SessionSummary
    {
        std::string session_id;
        std::string filename;
        std::uint64_t total_size{};
        double percent{};
        UploadStatus status{UploadStatus::Uploading};
        std::chrono::system_clock::time_point started_at{};
    };

    /// Entry point for chunked uploads. One instance per process, shared by every connection.
    class UploadManager
    {
    public:
        explicit UploadManager(UploadConfig config, std::shared_ptr<ProgressObserver> observer = nullptr);

        SessionDescriptor create_session(const std::string &filename, std::int64_t total_size);

        ChunkReceipt put_chunk(const std::string &session_id, std::int64_t index, std::span<const std::byte> payload);

        ProgressReport progress(const std::string &session_id) const;

        AssemblyResult assemble(const std::string &session_id, const std::filesystem::path &output_path);

        /// Idempotent; unknown ids are ignored.
        void cleanup_session(const std::string &session_id);

        std::size_t expire_older_than(std::chrono::seconds max_age);
        std::size_t expire_older_than(std::chrono::seconds max_age, std::chrono::system_clock::time_point now);

        std::vector<SessionSummary> active_sessions() const;

        const UploadConfig &config() const noexcept { return config_; }
        const ChunkStore &chunk_store() const noexcept { return chunks_; }

    private:
        template <typename Callback>
        void notify(const char *event, Callback &&callback) const;

        UploadConfig config_;
        SessionRegistry registry_;
        ChunkStore chunks_;
        Assembler assembler_;
        std::shared_ptr<ProgressObserver> observer_;
        // Shared while reporting on a live session, exclusive while removing one, so no event
        // reaches the observer after on_removed for the same id.
        mutable std::shared_mutex lifecycle_mutex_;
    };

} // namespace vaultdrop::server
