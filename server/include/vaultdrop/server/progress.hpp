#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "vaultdrop/server/chunk_store.hpp"
#include "vaultdrop/server/session_registry.hpp"

namespace vaultdrop::server
{

    struct ProgressReport
    {
        std::string session_id;
        std::string filename;
        UploadStatus status{UploadStatus::Uploading};
        std::uint64_t total_size{};
        // Post-compression bytes actually held for the session.
        std::uint64_t uploaded_bytes{};
        std::uint64_t total_chunks{};
        std::uint64_t uploaded_chunks{};
        double percent{};
        double speed_bytes_per_sec{};
        double elapsed_seconds{};
        // Empty while the transfer rate is still zero.
        std::optional<double> eta_seconds{};
    };

    ProgressReport estimate_progress(const UploadSession &session, const ChunkStats &stats,
                                     std::chrono::system_clock::time_point now);

} // namespace vaultdrop::server
