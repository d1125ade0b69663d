#include "vaultdrop/server/file_store.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "upload_common.hpp"
#include "vaultdrop/crypto.hpp"
#include "vaultdrop/error_codes.hpp"

namespace vaultdrop::server
{

    namespace
    {
        constexpr auto kFilesDir = "files";
        constexpr auto kMetadataDir = ".vaultdrop/files";
        constexpr std::size_t kMaxNameLength = 255;

        void validate_name(const std::string &name)
        {
            if (name.empty() || name.size() > kMaxNameLength)
            {
                throw OperationError(ErrorCode::InvalidArgument, "Invalid file name");
            }
            if (name.front() == '.')
            {
                throw OperationError(ErrorCode::InvalidArgument, "File name must not start with '.'");
            }
            if (name.find_first_of(std::string("/\\\0", 3)) != std::string::npos)
            {
                throw OperationError(ErrorCode::InvalidArgument, "File name must not contain path separators");
            }
        }

        std::uint64_t file_size_or_throw(const std::filesystem::path &path)
        {
            std::error_code ec;
            const auto size = std::filesystem::file_size(path, ec);
            if (ec)
            {
                throw OperationError(ErrorCode::IOFailure, "Unable to stat " + path.filename().string());
            }
            return size;
        }

        // Undoes a file transform whose metadata could not be written.
        template <typename Undo>
        void roll_back(const std::string &name, Undo &&undo)
        {
            try
            {
                undo();
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Failed to restore {} after a metadata error: {}", name, ex.what());
            }
        }

    } // namespace

    void to_json(nlohmann::json &json, const FileRecord &record)
    {
        json = {
            {"name", record.name},
            {"size", record.size},
            {"locked", record.locked},
            {"uploaded_at", upload_common::to_unix_seconds(record.uploaded_at)},
            {"checksum", record.checksum},
            {"kdf_iterations", record.kdf_iterations},
        };
        json["password_token"] = record.password_token ? nlohmann::json(*record.password_token)
                                                       : nlohmann::json(nullptr);
    }

    void from_json(const nlohmann::json &json, FileRecord &record)
    {
        record.name = json.at("name").get<std::string>();
        record.size = json.value("size", 0ULL);
        record.locked = json.value("locked", false);
        record.uploaded_at = std::chrono::system_clock::time_point{
            std::chrono::seconds{json.value("uploaded_at", 0LL)}};
        record.checksum = json.value("checksum", std::string{});
        record.kdf_iterations = json.value("kdf_iterations", std::uint32_t{0});
        if (auto it = json.find("password_token"); it != json.end() && it->is_string())
        {
            record.password_token = it->get<std::string>();
        }
        else
        {
            record.password_token.reset();
        }
    }

    FileStore::FileStore(std::filesystem::path root, std::uint32_t kdf_iterations)
        : files_dir_(root / kFilesDir), metadata_dir_(root / kMetadataDir), cipher_(kdf_iterations)
    {
        std::filesystem::create_directories(files_dir_);
        std::filesystem::create_directories(metadata_dir_);
        load_existing();
    }

    std::filesystem::path FileStore::path_for(const std::string &name) const
    {
        validate_name(name);
        return files_dir_ / name;
    }

    bool FileStore::contains(const std::string &name) const
    {
        std::lock_guard lock(mutex_);
        return records_.contains(name);
    }

    void FileStore::reserve(const std::string &name)
    {
        validate_name(name);
        std::lock_guard lock(mutex_);
        if (records_.contains(name) || !reserved_.insert(name).second)
        {
            throw OperationError(ErrorCode::AlreadyExists, "A file named " + name + " already exists");
        }
    }

    void FileStore::release_reservation(const std::string &name)
    {
        std::lock_guard lock(mutex_);
        reserved_.erase(name);
    }

    FileRecord FileStore::register_file(const std::string &name, const std::string &checksum)
    {
        const auto path = path_for(name);
        if (contains(name))
        {
            throw OperationError(ErrorCode::AlreadyExists, "A file named " + name + " already exists");
        }
        FileRecord record{
            .name = name,
            .size = file_size_or_throw(path),
            .locked = false,
            .location = path,
            .uploaded_at = std::chrono::system_clock::now(),
            .checksum = checksum,
        };
        persist(record);
        store_record(record);
        release_reservation(name);
        spdlog::info("Registered file {} ({})", name, upload_common::format_size(record.size));
        return record;
    }

    std::optional<FileRecord> FileStore::find(const std::string &name) const
    {
        std::lock_guard lock(mutex_);
        auto it = records_.find(name);
        if (it == records_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    FileRecord FileStore::get(const std::string &name) const
    {
        auto record = find(name);
        if (!record)
        {
            throw OperationError(ErrorCode::NotFound, "File not found");
        }
        return *record;
    }

    std::vector<FileRecord> FileStore::list() const
    {
        std::vector<FileRecord> records;
        {
            std::lock_guard lock(mutex_);
            records.reserve(records_.size());
            for (const auto &[name, record] : records_)
            {
                records.push_back(record);
            }
        }
        std::sort(records.begin(), records.end(),
                  [](const FileRecord &lhs, const FileRecord &rhs)
                  { return lhs.name < rhs.name; });
        return records;
    }

    void FileStore::lock(const std::string &name, const std::string &password)
    {
        if (password.size() < kMinPasswordLength)
        {
            throw OperationError(ErrorCode::InvalidArgument, "Password must be at least 4 characters");
        }
        auto guard = file_mutex(name);
        std::lock_guard file_lock(*guard);

        auto record = get(name);
        if (record.locked)
        {
            throw OperationError(ErrorCode::InvalidState, "File is already locked");
        }

        auto token = crypto::hash_password(password);
        cipher_.lock_file(record.location, password);
        record.locked = true;
        record.password_token = std::move(token);
        record.kdf_iterations = cipher_.iterations();
        try
        {
            persist(record);
        }
        catch (const OperationError &)
        {
            roll_back(name, [&]
                      { cipher_.unlock_file(record.location, password); });
            throw;
        }
        store_record(record);
        spdlog::info("File locked: {}", name);
    }

    void FileStore::unlock(const std::string &name, const std::string &password)
    {
        auto guard = file_mutex(name);
        std::lock_guard file_lock(*guard);

        auto record = get(name);
        if (!record.locked)
        {
            throw OperationError(ErrorCode::InvalidState, "File is not locked");
        }
        if (record.password_token && !crypto::verify_password(password, *record.password_token))
        {
            throw OperationError(ErrorCode::AuthenticationFailed, "Incorrect password or corrupted data");
        }

        const auto cipher = cipher_for(record);
        cipher.unlock_file(record.location, password);
        record.locked = false;
        record.password_token.reset();
        record.kdf_iterations = 0;
        try
        {
            persist(record);
        }
        catch (const OperationError &)
        {
            roll_back(name, [&]
                      { cipher.lock_file(record.location, password); });
            throw;
        }
        store_record(record);
        spdlog::info("File unlocked: {}", name);
    }

    void FileStore::remove(const std::string &name, const std::optional<std::string> &password)
    {
        auto guard = file_mutex(name);
        std::lock_guard file_lock(*guard);

        const auto record = get(name);
        if (record.locked)
        {
            if (!password)
            {
                throw OperationError(ErrorCode::AuthenticationFailed, "Password required to delete locked file");
            }
            if (!record.password_token || !crypto::verify_password(*password, *record.password_token))
            {
                throw OperationError(ErrorCode::AuthenticationFailed, "Incorrect password");
            }
        }

        std::error_code ec;
        std::filesystem::remove(record.location, ec);
        if (ec)
        {
            throw OperationError(ErrorCode::IOFailure, "Failed to delete " + name + ": " + ec.message());
        }
        std::filesystem::remove(metadata_path(name), ec);
        if (ec)
        {
            spdlog::warn("Failed to remove metadata for {}: {}", name, ec.message());
        }
        {
            std::lock_guard lock(mutex_);
            records_.erase(name);
            file_mutexes_.erase(name);
        }
        spdlog::info("File deleted: {}", name);
    }

    FileRange FileStore::read_range(const std::string &name, std::uint64_t offset, std::uint64_t max_bytes) const
    {
        auto guard = file_mutex(name);
        std::lock_guard file_lock(*guard);

        const auto record = get(name);
        if (record.locked)
        {
            throw OperationError(ErrorCode::InvalidState, "File is locked. Unlock it first.");
        }

        const auto size = file_size_or_throw(record.location);
        if (offset > size)
        {
            throw OperationError(ErrorCode::InvalidArgument, "Offset beyond end of file");
        }

        std::ifstream in(record.location, std::ios::binary);
        if (!in.is_open())
        {
            throw OperationError(ErrorCode::IOFailure, "Unable to open " + name);
        }
        const auto length = std::min<std::uint64_t>(max_bytes, size - offset);
        FileRange range{.offset = offset};
        range.data.resize(static_cast<std::size_t>(length));
        in.seekg(static_cast<std::streamoff>(offset));
        in.read(reinterpret_cast<char *>(range.data.data()), static_cast<std::streamsize>(length));
        if (static_cast<std::uint64_t>(in.gcount()) != length)
        {
            throw OperationError(ErrorCode::IOFailure, "Short read on " + name);
        }
        range.done = offset + length >= size;
        return range;
    }

    std::shared_ptr<std::mutex> FileStore::file_mutex(const std::string &name) const
    {
        std::lock_guard lock(mutex_);
        if (!records_.contains(name))
        {
            throw OperationError(ErrorCode::NotFound, "File not found");
        }
        auto &entry = file_mutexes_[name];
        if (!entry)
        {
            entry = std::make_shared<std::mutex>();
        }
        return entry;
    }

    lock::LockingCipher FileStore::cipher_for(const FileRecord &record) const
    {
        // Records written before the cost was stored were locked with the configured value.
        if (record.kdf_iterations == 0 || record.kdf_iterations == cipher_.iterations())
        {
            return cipher_;
        }
        return lock::LockingCipher(record.kdf_iterations);
    }

    std::filesystem::path FileStore::metadata_path(const std::string &name) const
    {
        return metadata_dir_ / (name + ".json");
    }

    void FileStore::persist(const FileRecord &record) const
    {
        const auto path = metadata_path(record.name);
        auto temp_path = path;
        temp_path += ".tmp";
        {
            std::ofstream out(temp_path, std::ios::trunc);
            if (!out.is_open())
            {
                throw OperationError(ErrorCode::IOFailure, "Unable to write metadata for " + record.name);
            }
            out << nlohmann::json(record).dump(2);
        }
        std::error_code ec;
        std::filesystem::rename(temp_path, path, ec);
        if (ec)
        {
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            throw OperationError(ErrorCode::IOFailure, "Unable to write metadata for " + record.name);
        }
    }

    void FileStore::load_existing()
    {
        for (const auto &entry : std::filesystem::directory_iterator(metadata_dir_))
        {
            if (!entry.is_regular_file() || entry.path().extension() != ".json")
            {
                continue;
            }
            std::ifstream in(entry.path());
            if (!in.is_open())
            {
                continue;
            }
            try
            {
                nlohmann::json json;
                in >> json;
                auto record = json.get<FileRecord>();
                record.location = files_dir_ / record.name;
                if (!std::filesystem::exists(record.location))
                {
                    spdlog::warn("Skipping metadata for missing file {}", record.name);
                    continue;
                }
                records_[record.name] = std::move(record);
            }
            catch (const nlohmann::json::exception &ex)
            {
                spdlog::warn("Ignoring unreadable metadata {}: {}", entry.path().string(), ex.what());
            }
        }
        if (!records_.empty())
        {
            spdlog::info("Loaded {} stored file record(s)", records_.size());
        }
    }

    void FileStore::store_record(const FileRecord &record)
    {
        std::lock_guard lock(mutex_);
        records_[record.name] = record;
    }

} // namespace vaultdrop::server
