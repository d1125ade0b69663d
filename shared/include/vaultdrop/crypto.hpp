/**
 * VaultDrop - Hashing, randomness and password token helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vaultdrop::crypto
{

    void ensure_sodium_init();

    /// Irreversible, salted verification token for a file password (argon2id string form).
    std::string hash_password(std::string_view password);

    bool verify_password(std::string_view password, std::string_view password_hash);

    /// Hex BLAKE2b digest used as a chunk and file checksum.
    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

    /// Fills a buffer from the operating system CSPRNG.
    std::vector<std::byte> random_bytes(std::size_t count);

    std::string to_hex(std::span<const std::byte> data);

} // namespace vaultdrop::crypto
