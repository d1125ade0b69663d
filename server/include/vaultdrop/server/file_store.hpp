#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

#include "vaultdrop/file_lock.hpp"

namespace vaultdrop::server
{

    struct FileRecord
    {
        std::string name;
        // Plaintext size, unchanged while the file is locked.
        std::uint64_t size{};
        bool locked{};
        std::optional<std::string> password_token;
        // Key derivation cost the file was locked with; zero while unlocked.
        std::uint32_t kdf_iterations{};
        std::filesystem::path location;
        std::chrono::system_clock::time_point uploaded_at{};
        std::string checksum;
    };

    struct FileRange
    {
        std::vector<std::byte> data;
        std::uint64_t offset{};
        bool done{};
    };

    /// Completed uploads and their metadata sidecars.
    ///
    /// Layout under the storage root:
    ///     files/<name>                  file contents (plaintext or locked envelope)
    ///     .vaultdrop/files/<name>.json  record metadata
    class FileStore
    {
    public:
        static constexpr std::size_t kMinPasswordLength = 4;

        FileStore(std::filesystem::path root, std::uint32_t kdf_iterations);

        /// Destination path for a new upload. Throws InvalidArgument for unsafe names.
        std::filesystem::path path_for(const std::string &name) const;

        bool contains(const std::string &name) const;

        /// Claims a name for an upload that is about to be assembled. Throws AlreadyExists when the
        /// name is stored or already claimed. register_file() or release_reservation() ends the claim.
        void reserve(const std::string &name);
        void release_reservation(const std::string &name);

        FileRecord register_file(const std::string &name, const std::string &checksum);

        std::optional<FileRecord> find(const std::string &name) const;
        FileRecord get(const std::string &name) const;
        std::vector<FileRecord> list() const;

        void lock(const std::string &name, const std::string &password);
        void unlock(const std::string &name, const std::string &password);

        /// Locked files can only be removed with their password.
        void remove(const std::string &name, const std::optional<std::string> &password);

        FileRange read_range(const std::string &name, std::uint64_t offset, std::uint64_t max_bytes) const;

    private:
        std::shared_ptr<std::mutex> file_mutex(const std::string &name) const;
        lock::LockingCipher cipher_for(const FileRecord &record) const;
        std::filesystem::path metadata_path(const std::string &name) const;
        void persist(const FileRecord &record) const;
        void load_existing();
        void store_record(const FileRecord &record);

        std::filesystem::path files_dir_;
        std::filesystem::path metadata_dir_;
        lock::LockingCipher cipher_;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, FileRecord> records_;
        std::unordered_set<std::string> reserved_;
        mutable std::unordered_map<std::string, std::shared_ptr<std::mutex>> file_mutexes_;
    };

    void to_json(nlohmann::json &json, const FileRecord &record);
    void from_json(const nlohmann::json &json, FileRecord &record);

} // namespace vaultdrop::server
