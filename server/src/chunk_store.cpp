#include "vaultdrop/server/chunk_store.hpp"

#include <mutex>

#include <spdlog/spdlog.h>

#include "upload_common.hpp"
#include "vaultdrop/compression.hpp"
#include "vaultdrop/crypto.hpp"
#include "vaultdrop/error_codes.hpp"

namespace vaultdrop::server
{

    namespace
    {

        void ensure_accepting(bool sealed, std::uint64_t index, bool already_stored)
        {
            if (sealed)
            {
                throw OperationError(ErrorCode::InvalidState, "Upload session is no longer accepting chunks");
            }
            if (already_stored)
            {
                throw OperationError(ErrorCode::DuplicateChunk,
                                     "Chunk " + std::to_string(index) + " already uploaded");
            }
        }

    } // namespace

    ChunkStore::ChunkStore(std::uint64_t max_buffered_bytes) : max_buffered_bytes_(max_buffered_bytes) {}

    void ChunkStore::open(const std::string &session_id, std::uint64_t total_chunks, std::uint64_t chunk_size)
    {
        auto set = std::make_shared<ChunkSet>();
        set->total_chunks = total_chunks;
        set->chunk_size = chunk_size;
        std::unique_lock lock(mutex_);
        if (!sets_.emplace(session_id, std::move(set)).second)
        {
            throw OperationError(ErrorCode::AlreadyExists, "Chunk storage already open for session");
        }
    }

    ChunkReceipt ChunkStore::put(const std::string &session_id, std::int64_t index, std::span<const std::byte> payload,
                                 const CompressionSettings &compression, std::chrono::system_clock::time_point now)
    {
        auto set = find_set(session_id);
        if (!set)
        {
            throw OperationError(ErrorCode::NotFound, "Upload session not found");
        }
        if (index < 0 || static_cast<std::uint64_t>(index) >= set->total_chunks)
        {
            throw OperationError(ErrorCode::InvalidIndex, "Invalid chunk index " + std::to_string(index));
        }
        const auto chunk_index = static_cast<std::uint64_t>(index);
        if (payload.size() > set->chunk_size)
        {
            throw OperationError(ErrorCode::InvalidArgument, "Chunk exceeds session chunk size");
        }

        {
            std::shared_lock lock(set->mutex);
            ensure_accepting(set->sealed, chunk_index, set->chunks.contains(chunk_index));
        }

        UploadChunk chunk{};
        chunk.index = chunk_index;
        chunk.checksum = crypto::hash_bytes(payload);
        chunk.original_size = payload.size();
        chunk.received_at = now;

        std::vector<std::byte> deflated;
        if (compression.enabled && payload.size() > compression.min_size &&
            compression::deflate_compress(payload, compression.level, deflated) && deflated.size() < payload.size())
        {
            chunk.data = std::move(deflated);
            chunk.compressed = true;
        }
        else
        {
            chunk.data.assign(payload.begin(), payload.end());
        }
        chunk.stored_size = chunk.data.size();

        if (!try_reserve(chunk.stored_size))
        {
            spdlog::warn("Rejecting chunk {} for session {}: buffer limit of {} reached", chunk_index, session_id,
                         upload_common::format_size(max_buffered_bytes_));
            throw OperationError(ErrorCode::CapacityExceeded, "Server is buffering too many chunks, retry later");
        }

        ChunkReceipt receipt{
            .index = chunk_index,
            .checksum = chunk.checksum,
            .stored_size = chunk.stored_size,
            .compressed = chunk.compressed,
        };
        {
            std::unique_lock lock(set->mutex);
            try
            {
                ensure_accepting(set->sealed, chunk_index, set->chunks.contains(chunk_index));
            }
            catch (const OperationError &)
            {
                release(chunk.stored_size);
                throw;
            }
            set->stored_bytes += chunk.stored_size;
            set->original_bytes += chunk.original_size;
            set->buffered_bytes += chunk.stored_size;
            set->uploaded_chunks += 1;
            if (!set->last_arrival || now > *set->last_arrival)
            {
                set->last_arrival = now;
            }
            set->chunks.emplace(chunk_index, std::move(chunk));
            receipt.uploaded_chunks = set->uploaded_chunks;
        }
        return receipt;
    }

    ChunkStats ChunkStore::stats(const std::string &session_id) const
    {
        auto set = find_set(session_id);
        if (!set)
        {
            throw OperationError(ErrorCode::NotFound, "Upload session not found");
        }
        std::shared_lock lock(set->mutex);
        return {
            .total_chunks = set->total_chunks,
            .uploaded_chunks = set->uploaded_chunks,
            .stored_bytes = set->stored_bytes,
            .original_bytes = set->original_bytes,
            .last_arrival = set->last_arrival,
        };
    }

    std::optional<UploadChunk> ChunkStore::chunk(const std::string &session_id, std::uint64_t index) const
    {
        auto set = find_set(session_id);
        if (!set)
        {
            return std::nullopt;
        }
        std::shared_lock lock(set->mutex);
        auto it = set->chunks.find(index);
        if (it == set->chunks.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<UploadChunk> ChunkStore::take_all(const std::string &session_id)
    {
        auto set = find_set(session_id);
        if (!set)
        {
            throw OperationError(ErrorCode::NotFound, "Upload session not found");
        }

        std::vector<UploadChunk> chunks;
        {
            std::unique_lock lock(set->mutex);
            if (set->sealed)
            {
                throw OperationError(ErrorCode::InvalidState, "Upload session is no longer accepting chunks");
            }
            if (set->uploaded_chunks != set->total_chunks)
            {
                throw OperationError(ErrorCode::Incomplete,
                                     "Not all chunks uploaded (" + std::to_string(set->uploaded_chunks) + "/" +
                                         std::to_string(set->total_chunks) + ")");
            }
            set->sealed = true;
            chunks.reserve(set->chunks.size());
            for (auto &[index, chunk] : set->chunks)
            {
                chunks.push_back(std::move(chunk));
            }
            set->chunks.clear();
            // The reservation moves with the chunks; drop() must not release it a second time.
            set->buffered_bytes = 0;
        }
        return chunks;
    }

    void ChunkStore::drop(const std::string &session_id)
    {
        std::shared_ptr<ChunkSet> set;
        {
            std::unique_lock lock(mutex_);
            auto it = sets_.find(session_id);
            if (it == sets_.end())
            {
                return;
            }
            set = std::move(it->second);
            sets_.erase(it);
        }

        std::uint64_t released = 0;
        {
            std::unique_lock lock(set->mutex);
            set->sealed = true;
            set->chunks.clear();
            released = set->buffered_bytes;
            set->buffered_bytes = 0;
        }
        release(released);
    }

    std::shared_ptr<ChunkStore::ChunkSet> ChunkStore::find_set(const std::string &session_id) const
    {
        std::shared_lock lock(mutex_);
        auto it = sets_.find(session_id);
        if (it == sets_.end())
        {
            return nullptr;
        }
        return it->second;
    }

    bool ChunkStore::try_reserve(std::uint64_t bytes) noexcept
    {
        auto current = buffered_bytes_.load();
        do
        {
            if (current + bytes > max_buffered_bytes_)
            {
                return false;
            }
        } while (!buffered_bytes_.compare_exchange_weak(current, current + bytes));
        return true;
    }

    void ChunkStore::release(std::uint64_t bytes) noexcept
    {
        buffered_bytes_.fetch_sub(bytes);
    }

} // namespace vaultdrop::server
