#include "vaultdrop/file_lock.hpp"

#include <algorithm>
#include <array>
#include <climits>
#include <fstream>
#include <stdexcept>
#include <string>

#include <openssl/evp.h>
#include <sodium.h>

#include "vaultdrop/crypto.hpp"
#include "vaultdrop/error_codes.hpp"

namespace vaultdrop::lock
{

    namespace
    {
        constexpr auto kAuthenticationFailure = "Incorrect password or corrupted data";
        constexpr std::size_t kCipherSlice = 1u << 20;

        using Tag = std::array<unsigned char, kTagSize>;

        struct DerivedKey
        {
            std::array<unsigned char, kKeySize> bytes{};

            DerivedKey() = default;
            DerivedKey(const DerivedKey &) = delete;
            DerivedKey &operator=(const DerivedKey &) = delete;

            ~DerivedKey()
            {
                sodium_memzero(bytes.data(), bytes.size());
            }
        };

        struct CipherContext
        {
            EVP_CIPHER_CTX *ctx = nullptr;

            CipherContext()
            {
                ctx = EVP_CIPHER_CTX_new();
                if (!ctx)
                {
                    throw std::runtime_error("Failed to create cipher context");
                }
            }

            CipherContext(const CipherContext &) = delete;
            CipherContext &operator=(const CipherContext &) = delete;

            ~CipherContext()
            {
                EVP_CIPHER_CTX_free(ctx);
            }
        };

        const unsigned char *as_uchar(const std::byte *data)
        {
            return reinterpret_cast<const unsigned char *>(data);
        }

        unsigned char *as_uchar(std::byte *data)
        {
            return reinterpret_cast<unsigned char *>(data);
        }

        [[noreturn]] void fail_authentication()
        {
            throw OperationError(ErrorCode::AuthenticationFailed, kAuthenticationFailure);
        }

        void derive_key(std::string_view password, std::span<const std::byte> salt, std::uint32_t iterations,
                        DerivedKey &key)
        {
            if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()), as_uchar(salt.data()),
                                  static_cast<int>(salt.size()), static_cast<int>(iterations), EVP_sha256(),
                                  static_cast<int>(key.bytes.size()), key.bytes.data()) != 1)
            {
                throw std::runtime_error("PBKDF2 key derivation failed");
            }
        }

        Tag compute_tag(const DerivedKey &key, std::span<const std::byte> iv, std::span<const std::byte> ciphertext)
        {
            crypto_auth_hmacsha256_state state;
            crypto_auth_hmacsha256_init(&state, key.bytes.data(), key.bytes.size());
            crypto_auth_hmacsha256_update(&state, as_uchar(iv.data()), iv.size());
            crypto_auth_hmacsha256_update(&state, as_uchar(ciphertext.data()), ciphertext.size());
            Tag tag{};
            crypto_auth_hmacsha256_final(&state, tag.data());
            sodium_memzero(&state, sizeof(state));
            return tag;
        }

        // Input must already be block aligned; padding is handled by the caller.
        std::vector<std::byte> run_cipher(bool encrypting, const DerivedKey &key, std::span<const std::byte> iv,
                                          std::span<const std::byte> input)
        {
            CipherContext context;
            const auto init = encrypting ? EVP_EncryptInit_ex : EVP_DecryptInit_ex;
            if (init(context.ctx, EVP_aes_256_cbc(), nullptr, key.bytes.data(), as_uchar(iv.data())) != 1)
            {
                throw std::runtime_error("Failed to initialize AES-256-CBC");
            }
            EVP_CIPHER_CTX_set_padding(context.ctx, 0);

            std::vector<std::byte> output(input.size() + kBlockSize);
            std::size_t written = 0;
            for (std::size_t offset = 0; offset < input.size(); offset += kCipherSlice)
            {
                const auto slice = std::min(kCipherSlice, input.size() - offset);
                int out_len = 0;
                const auto update = encrypting ? EVP_EncryptUpdate : EVP_DecryptUpdate;
                if (update(context.ctx, as_uchar(output.data() + written), &out_len, as_uchar(input.data() + offset),
                           static_cast<int>(slice)) != 1)
                {
                    throw std::runtime_error("AES-256-CBC update failed");
                }
                written += static_cast<std::size_t>(out_len);
            }

            int final_len = 0;
            const auto finalize = encrypting ? EVP_EncryptFinal_ex : EVP_DecryptFinal_ex;
            if (finalize(context.ctx, as_uchar(output.data() + written), &final_len) != 1)
            {
                throw std::runtime_error("AES-256-CBC finalization failed");
            }
            written += static_cast<std::size_t>(final_len);
            output.resize(written);
            return output;
        }

        std::vector<std::byte> pad(std::span<const std::byte> plaintext)
        {
            const auto pad_length = kBlockSize - (plaintext.size() % kBlockSize);
            std::vector<std::byte> padded;
            padded.reserve(plaintext.size() + pad_length);
            padded.insert(padded.end(), plaintext.begin(), plaintext.end());
            padded.insert(padded.end(), pad_length, static_cast<std::byte>(pad_length));
            return padded;
        }

        void strip_padding(std::vector<std::byte> &padded)
        {
            if (padded.empty() || padded.size() % kBlockSize != 0)
            {
                fail_authentication();
            }
            const auto pad_length = std::to_integer<std::size_t>(padded.back());
            if (pad_length == 0 || pad_length > kBlockSize)
            {
                fail_authentication();
            }
            unsigned mismatch = 0;
            for (std::size_t i = padded.size() - pad_length; i < padded.size(); ++i)
            {
                mismatch |= std::to_integer<unsigned>(padded[i]) ^ static_cast<unsigned>(pad_length);
            }
            if (mismatch != 0)
            {
                fail_authentication();
            }
            padded.resize(padded.size() - pad_length);
        }

        std::vector<std::byte> read_file(const std::filesystem::path &path)
        {
            std::ifstream in(path, std::ios::binary);
            if (!in.is_open())
            {
                throw OperationError(ErrorCode::IOFailure, "Failed to open " + path.string());
            }
            in.seekg(0, std::ios::end);
            const auto size = static_cast<std::size_t>(in.tellg());
            in.seekg(0, std::ios::beg);
            std::vector<std::byte> data(size);
            if (size > 0 && !in.read(reinterpret_cast<char *>(data.data()), static_cast<std::streamsize>(size)))
            {
                throw OperationError(ErrorCode::IOFailure, "Failed to read " + path.string());
            }
            return data;
        }

        void replace_file(const std::filesystem::path &path, std::span<const std::byte> data)
        {
            auto temp_path = path;
            temp_path += ".tmp";
            {
                std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
                out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
                out.flush();
                if (!out)
                {
                    out.close();
                    std::error_code ec;
                    std::filesystem::remove(temp_path, ec);
                    throw OperationError(ErrorCode::IOFailure, "Failed to write " + temp_path.string());
                }
            }
            std::error_code ec;
            std::filesystem::rename(temp_path, path, ec);
            if (ec)
            {
                std::filesystem::remove(temp_path, ec);
                throw OperationError(ErrorCode::IOFailure, "Failed to replace " + path.string());
            }
        }

    } // namespace

    LockingCipher::LockingCipher(std::uint32_t iterations) : iterations_(iterations)
    {
        if (iterations_ < kMinIterations || iterations_ > static_cast<std::uint32_t>(INT_MAX))
        {
            throw OperationError(ErrorCode::InvalidArgument, "Key derivation iteration count out of range");
        }
        crypto::ensure_sodium_init();
    }

    std::vector<std::byte> LockingCipher::lock(std::span<const std::byte> plaintext, std::string_view password) const
    {
        const auto salt = crypto::random_bytes(kSaltSize);
        const auto iv = crypto::random_bytes(kIvSize);

        DerivedKey key;
        derive_key(password, salt, iterations_, key);

        auto padded = pad(plaintext);
        const auto ciphertext = run_cipher(true, key, iv, padded);
        sodium_memzero(padded.data(), padded.size());
        const auto tag = compute_tag(key, iv, ciphertext);

        std::vector<std::byte> envelope;
        envelope.reserve(kHeaderSize + ciphertext.size());
        envelope.insert(envelope.end(), salt.begin(), salt.end());
        envelope.insert(envelope.end(), iv.begin(), iv.end());
        for (const auto value : tag)
        {
            envelope.push_back(static_cast<std::byte>(value));
        }
        envelope.insert(envelope.end(), ciphertext.begin(), ciphertext.end());
        return envelope;
    }

    std::vector<std::byte> LockingCipher::unlock(std::span<const std::byte> envelope, std::string_view password) const
    {
        if (envelope.size() < kHeaderSize)
        {
            throw OperationError(ErrorCode::InvalidEnvelope, "Invalid locked file");
        }
        const auto salt = envelope.subspan(0, kSaltSize);
        const auto iv = envelope.subspan(kSaltSize, kIvSize);
        const auto stored_tag = envelope.subspan(kSaltSize + kIvSize, kTagSize);
        const auto ciphertext = envelope.subspan(kHeaderSize);
        if (ciphertext.empty() || ciphertext.size() % kBlockSize != 0)
        {
            throw OperationError(ErrorCode::InvalidEnvelope, "Invalid locked file");
        }

        DerivedKey key;
        derive_key(password, salt, iterations_, key);

        const auto expected_tag = compute_tag(key, iv, ciphertext);
        if (sodium_memcmp(expected_tag.data(), stored_tag.data(), kTagSize) != 0)
        {
            fail_authentication();
        }

        auto plaintext = run_cipher(false, key, iv, ciphertext);
        strip_padding(plaintext);
        return plaintext;
    }

    void LockingCipher::lock_file(const std::filesystem::path &path, std::string_view password) const
    {
        auto plaintext = read_file(path);
        const auto envelope = lock(plaintext, password);
        sodium_memzero(plaintext.data(), plaintext.size());
        replace_file(path, envelope);
    }

    void LockingCipher::unlock_file(const std::filesystem::path &path, std::string_view password) const
    {
        const auto envelope = read_file(path);
        auto plaintext = unlock(envelope, password);
        replace_file(path, plaintext);
        sodium_memzero(plaintext.data(), plaintext.size());
    }

    bool is_well_formed_envelope(std::span<const std::byte> data) noexcept
    {
        return data.size() >= kMinEnvelopeSize && (data.size() - kHeaderSize) % kBlockSize == 0;
    }

} // namespace vaultdrop::lock
