/**
 * VaultDrop - zlib helpers for chunk payloads.
 */
#pragma once

#include <cstddef>
#include <span>
#include <vector>

namespace vaultdrop::compression
{

    /// Returns false on any zlib error; `out` is left empty in that case.
    bool deflate_compress(std::span<const std::byte> data, int level, std::vector<std::byte> &out);

    /// Fails unless the stream inflates to exactly `expected_size` bytes.
    bool deflate_decompress(std::span<const std::byte> data, std::size_t expected_size, std::vector<std::byte> &out);

} // namespace vaultdrop::compression
