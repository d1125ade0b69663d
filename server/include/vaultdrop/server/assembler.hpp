#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "vaultdrop/server/chunk_store.hpp"
#include "vaultdrop/server/session_registry.hpp"

namespace vaultdrop::server
{

    struct AssemblyResult
    {
        std::string session_id;
        std::string filename;
        std::filesystem::path output_path;
        std::uint64_t final_size{};
        std::uint64_t total_chunks{};
        std::string checksum;
        bool size_matches{true};
    };

    class Assembler
    {
    public:
        Assembler(SessionRegistry &registry, ChunkStore &chunks);

        /// Concatenates every chunk of a complete session into `output_path` in index order.
        /// Incomplete sessions are rejected before anything touches the filesystem; a failure
        /// after that point marks the session failed and surfaces as IOFailure.
        AssemblyResult assemble(const std::string &session_id, const std::filesystem::path &output_path);

    private:
        SessionRegistry &registry_;
        ChunkStore &chunks_;
    };

} // namespace vaultdrop::server
