#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "vaultdrop/server/config.hpp"

namespace vaultdrop::server
{

    struct UploadChunk
    {
        std::uint64_t index{};
        std::vector<std::byte> data;
        // Checksum of the payload as received, before compression.
        std::string checksum;
        std::uint64_t stored_size{};
        std::uint64_t original_size{};
        bool compressed{};
        std::chrono::system_clock::time_point received_at{};
    };

    struct ChunkReceipt
    {
        std::uint64_t index{};
        std::string checksum;
        std::uint64_t stored_size{};
        bool compressed{};
        std::uint64_t uploaded_chunks{};
    };

    struct ChunkStats
    {
        std::uint64_t total_chunks{};
        std::uint64_t uploaded_chunks{};
        std::uint64_t stored_bytes{};
        std::uint64_t original_bytes{};
        std::optional<std::chrono::system_clock::time_point> last_arrival{};
    };

    class ChunkStore
    {
    public:
        explicit ChunkStore(std::uint64_t max_buffered_bytes);

        void open(const std::string &session_id, std::uint64_t total_chunks, std::uint64_t chunk_size);

        ChunkReceipt put(const std::string &session_id, std::int64_t index, std::span<const std::byte> payload,
                         const CompressionSettings &compression, std::chrono::system_clock::time_point now);

        ChunkStats stats(const std::string &session_id) const;

        std::optional<UploadChunk> chunk(const std::string &session_id, std::uint64_t index) const;

        /// Moves every chunk out in index order and stops accepting new ones. Throws Incomplete
        /// without side effects when a chunk is still missing. The chunks keep their share of the
        /// buffer budget until the caller hands it back through release().
        std::vector<UploadChunk> take_all(const std::string &session_id);

        void drop(const std::string &session_id);

        void release(std::uint64_t bytes) noexcept;

        std::uint64_t buffered_bytes() const noexcept { return buffered_bytes_.load(); }

    private:
        struct ChunkSet
        {
            mutable std::shared_mutex mutex;
            std::uint64_t total_chunks{};
            std::uint64_t chunk_size{};
            bool sealed{};
            std::map<std::uint64_t, UploadChunk> chunks;
            // Counters survive take_all() so progress stays monotonic after assembly.
            std::uint64_t uploaded_chunks{};
            std::uint64_t stored_bytes{};
            std::uint64_t original_bytes{};
            std::uint64_t buffered_bytes{};
            std::optional<std::chrono::system_clock::time_point> last_arrival;
        };

        std::shared_ptr<ChunkSet> find_set(const std::string &session_id) const;
        bool try_reserve(std::uint64_t bytes) noexcept;

        std::uint64_t max_buffered_bytes_;
        std::atomic<std::uint64_t> buffered_bytes_{0};
        mutable std::shared_mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<ChunkSet>> sets_;
    };

} // namespace vaultdrop::server
