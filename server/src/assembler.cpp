#include "vaultdrop/server/assembler.hpp"

#include <fstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "upload_common.hpp"
#include "vaultdrop/compression.hpp"
#include "vaultdrop/crypto.hpp"
#include "vaultdrop/error_codes.hpp"

namespace vaultdrop::server
{

    namespace
    {

        std::filesystem::path partial_path_for(const std::filesystem::path &output_path)
        {
            auto partial = output_path;
            partial += ".part";
            return partial;
        }

        // Holds the buffer reservation of chunks taken out of the store until they reach disk.
        class PendingBytes
        {
        public:
            PendingBytes(ChunkStore &store, const std::vector<UploadChunk> &chunks) : store_(store)
            {
                for (const auto &chunk : chunks)
                {
                    remaining_ += chunk.stored_size;
                }
            }

            PendingBytes(const PendingBytes &) = delete;
            PendingBytes &operator=(const PendingBytes &) = delete;

            ~PendingBytes()
            {
                store_.release(remaining_);
            }

            void release(std::uint64_t bytes) noexcept
            {
                store_.release(bytes);
                remaining_ -= bytes;
            }

        private:
            ChunkStore &store_;
            std::uint64_t remaining_{0};
        };

        std::uint64_t write_chunks(const UploadSession &session, std::vector<UploadChunk> &chunks,
                                   const std::filesystem::path &target, PendingBytes &pending)
        {
            if (target.has_parent_path())
            {
                std::filesystem::create_directories(target.parent_path());
            }
            std::ofstream out(target, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw std::runtime_error("Unable to open " + target.string() + " for writing");
            }

            std::uint64_t written = 0;
            std::uint64_t expected_index = 0;
            std::vector<std::byte> inflated;
            for (auto &chunk : chunks)
            {
                if (chunk.index != expected_index)
                {
                    throw std::runtime_error("Missing chunk " + std::to_string(expected_index));
                }
                std::span<const std::byte> bytes = chunk.data;
                if (chunk.compressed)
                {
                    if (!compression::deflate_decompress(chunk.data, chunk.original_size, inflated))
                    {
                        throw std::runtime_error("Chunk " + std::to_string(chunk.index) + " failed to decompress");
                    }
                    bytes = inflated;
                }
                out.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
                if (!out)
                {
                    throw std::runtime_error("Write failed at chunk " + std::to_string(chunk.index));
                }
                written += bytes.size();
                ++expected_index;

                // Release each chunk as soon as it is on disk.
                std::vector<std::byte>().swap(chunk.data);
                pending.release(chunk.stored_size);
            }
            if (expected_index != session.total_chunks)
            {
                throw std::runtime_error("Expected " + std::to_string(session.total_chunks) + " chunks, got " +
                                         std::to_string(expected_index));
            }
            out.flush();
            if (!out)
            {
                throw std::runtime_error("Flush failed for " + target.string());
            }
            return written;
        }

    } // namespace

    Assembler::Assembler(SessionRegistry &registry, ChunkStore &chunks) : registry_(registry), chunks_(chunks) {}

    AssemblyResult Assembler::assemble(const std::string &session_id, const std::filesystem::path &output_path)
    {
        const auto session = registry_.get(session_id);
        if (session.status != UploadStatus::Uploading)
        {
            throw OperationError(ErrorCode::InvalidState,
                                 "Upload session is " + std::string(to_string(session.status)));
        }

        auto chunks = chunks_.take_all(session_id);
        PendingBytes pending(chunks_, chunks);
        if (!registry_.transition(session_id, UploadStatus::Uploading, UploadStatus::Assembling))
        {
            throw OperationError(ErrorCode::NotFound, "Upload session not found");
        }

        spdlog::info("Assembling {} from {} chunks into {}", session.filename, chunks.size(), output_path.string());

        const auto partial = partial_path_for(output_path);
        AssemblyResult result{
            .session_id = session_id,
            .filename = session.filename,
            .output_path = output_path,
            .total_chunks = session.total_chunks,
        };
        try
        {
            result.final_size = write_chunks(session, chunks, partial, pending);
            std::filesystem::rename(partial, output_path);
            result.checksum = crypto::hash_file(output_path);
        }
        catch (const std::exception &ex)
        {
            registry_.mark_failed(session_id);
            std::error_code ec;
            std::filesystem::remove(partial, ec);
            spdlog::error("Assembly of {} for session {} failed: {}", session.filename, session_id, ex.what());
            throw OperationError(ErrorCode::IOFailure, std::string("Assembly failed: ") + ex.what());
        }

        result.size_matches = result.final_size == session.total_size;
        if (!result.size_matches)
        {
            spdlog::warn("Assembled size of {} is {} bytes, declared {} bytes", session.filename, result.final_size,
                         session.total_size);
        }

        registry_.transition(session_id, UploadStatus::Assembling, UploadStatus::Completed);
        spdlog::info("Assembled {} ({})", session.filename, upload_common::format_size(result.final_size));
        return result;
    }

} // namespace vaultdrop::server
