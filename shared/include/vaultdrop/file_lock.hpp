/**
 * VaultDrop - Password based file locking.
 *
 * A locked file is stored as an envelope:
 *
 *     salt(16) || iv(16) || tag(32) || ciphertext
 *
 * The key is derived from the password and salt with PBKDF2-HMAC-SHA256, the plaintext is PKCS#7
 * padded and encrypted with AES-256-CBC, and the tag is HMAC-SHA256 over iv || ciphertext under the
 * same key. Unlocking always verifies the tag before any decryption takes place.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

namespace vaultdrop::lock
{

    inline constexpr std::size_t kSaltSize = 16;
    inline constexpr std::size_t kIvSize = 16;
    inline constexpr std::size_t kTagSize = 32;
    inline constexpr std::size_t kKeySize = 32;
    inline constexpr std::size_t kBlockSize = 16;
    inline constexpr std::size_t kHeaderSize = kSaltSize + kIvSize + kTagSize;
    inline constexpr std::size_t kMinEnvelopeSize = kHeaderSize + kBlockSize;
    inline constexpr std::uint32_t kMinIterations = 100'000;

    class LockingCipher
    {
    public:
        explicit LockingCipher(std::uint32_t iterations = kMinIterations);

        std::vector<std::byte> lock(std::span<const std::byte> plaintext, std::string_view password) const;

        /// Throws OperationError with InvalidEnvelope or AuthenticationFailed.
        std::vector<std::byte> unlock(std::span<const std::byte> envelope, std::string_view password) const;

        /// In-place variants. The file is replaced through a rename so readers never see a partial write.
        void lock_file(const std::filesystem::path &path, std::string_view password) const;
        void unlock_file(const std::filesystem::path &path, std::string_view password) const;

        std::uint32_t iterations() const noexcept { return iterations_; }

    private:
        std::uint32_t iterations_;
    };

    /// Cheap structural check; says nothing about the password or integrity.
    bool is_well_formed_envelope(std::span<const std::byte> data) noexcept;

} // namespace vaultdrop::lock
