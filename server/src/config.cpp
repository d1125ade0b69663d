#include "vaultdrop/server/config.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace vaultdrop::server
{

    namespace
    {
        constexpr std::uint64_t kKiB = 1024;
        constexpr std::uint64_t kMiB = 1024 * kKiB;
        constexpr std::uint64_t kGiB = 1024 * kMiB;

        constexpr std::array<std::string_view, 8> kHighlyCompressible{
            ".txt", ".log", ".csv", ".json", ".xml", ".html", ".css", ".js"};

        constexpr std::array<std::string_view, 14> kAlreadyCompressed{
            ".jpg", ".jpeg", ".png", ".gif", ".heic", ".heif", ".mp4",
            ".avi", ".mov", ".mp3", ".wav", ".zip", ".rar", ".7z"};

        std::string lowercase_extension(std::string_view filename)
        {
            auto extension = std::filesystem::path(std::string(filename)).extension().string();
            std::transform(extension.begin(), extension.end(), extension.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return extension;
        }

        template <std::size_t N>
        bool contains(const std::array<std::string_view, N> &values, std::string_view needle)
        {
            return std::find(values.begin(), values.end(), needle) != values.end();
        }

    } // namespace

    std::uint64_t chunk_size_for(const UploadConfig &config, std::uint64_t file_size) noexcept
    {
        if (!config.dynamic_chunk_size)
        {
            return config.chunk_size;
        }
        if (file_size < 10 * kMiB)
        {
            return 512 * kKiB;
        }
        if (file_size < 100 * kMiB)
        {
            return kMiB;
        }
        if (file_size < kGiB)
        {
            return 2 * kMiB;
        }
        return 4 * kMiB;
    }

    CompressionSettings compression_settings_for(const UploadConfig &config, std::string_view filename)
    {
        const auto extension = lowercase_extension(filename);
        if (contains(kHighlyCompressible, extension))
        {
            return {
                .enabled = config.enable_compression,
                .level = std::min(config.compression_level + 2, 9),
                .min_size = config.min_compression_size / 2,
            };
        }
        if (contains(kAlreadyCompressed, extension))
        {
            return {
                .enabled = false,
                .level = config.compression_level,
                .min_size = config.min_compression_size * 4,
            };
        }
        return {
            .enabled = config.enable_compression,
            .level = config.compression_level,
            .min_size = config.min_compression_size,
        };
    }

    bool is_extension_allowed(const UploadConfig &config, std::string_view filename)
    {
        if (config.allowed_extensions.empty())
        {
            return true;
        }
        const auto extension = lowercase_extension(filename);
        if (extension.size() < 2)
        {
            return false;
        }
        return std::find(config.allowed_extensions.begin(), config.allowed_extensions.end(), extension.substr(1)) !=
               config.allowed_extensions.end();
    }

    std::vector<std::string> parse_extension_list(std::string_view list)
    {
        std::vector<std::string> extensions;
        std::size_t start = 0;
        while (start <= list.size())
        {
            const auto end = std::min(list.find(',', start), list.size());
            auto item = list.substr(start, end - start);
            while (!item.empty() && std::isspace(static_cast<unsigned char>(item.front())))
            {
                item.remove_prefix(1);
            }
            while (!item.empty() && std::isspace(static_cast<unsigned char>(item.back())))
            {
                item.remove_suffix(1);
            }
            if (!item.empty() && item.front() == '.')
            {
                item.remove_prefix(1);
            }
            if (!item.empty())
            {
                std::string extension(item);
                std::transform(extension.begin(), extension.end(), extension.begin(),
                               [](unsigned char c)
                               { return static_cast<char>(std::tolower(c)); });
                extensions.push_back(std::move(extension));
            }
            start = end + 1;
        }
        return extensions;
    }

    std::vector<std::string> validate_config(const UploadConfig &config)
    {
        std::vector<std::string> warnings;
        if (config.chunk_size < 64 * kKiB)
        {
            warnings.emplace_back("Chunk size is very small, may impact performance");
        }
        else if (config.chunk_size > 16 * kMiB)
        {
            warnings.emplace_back("Chunk size is very large, may cause memory issues");
        }
        if (config.max_buffered_bytes < 256 * kMiB)
        {
            warnings.emplace_back("Low buffer limit may cause chunk rejections under load");
        }
        if (config.max_buffered_bytes < chunk_size_for(config, config.max_file_size))
        {
            warnings.emplace_back("Buffer limit is smaller than a single chunk");
        }
        if (config.session_timeout < std::chrono::minutes{1})
        {
            warnings.emplace_back("Short session timeout may expire uploads on slow connections");
        }
        if (config.compression_level < 1 || config.compression_level > 9)
        {
            warnings.emplace_back("Compression level should be between 1 and 9");
        }
        return warnings;
    }

    void apply_config_file(const std::filesystem::path &path, ServerConfig &config)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Failed to open config file: " + path.string());
        }
        nlohmann::json json;
        in >> json;
        if (!json.is_object())
        {
            throw std::runtime_error("Config file must contain a JSON object");
        }

        config.address = json.value("address", config.address);
        config.port = json.value("port", config.port);
        if (auto it = json.find("root"); it != json.end())
        {
            config.root = it->get<std::string>();
        }
        config.worker_threads = json.value("threads", config.worker_threads);
        if (auto it = json.find("expiry_interval"); it != json.end())
        {
            config.expiry_interval = std::chrono::seconds(it->get<std::int64_t>());
        }
        if (auto it = json.find("log"); it != json.end())
        {
            config.log_file = std::filesystem::path(it->get<std::string>());
        }
        if (auto it = json.find("mirror_dir"); it != json.end())
        {
            config.mirror_dir = std::filesystem::path(it->get<std::string>());
        }
        if (auto it = json.find("upload"); it != json.end())
        {
            nlohmann::json merged = config.upload;
            merged.update(*it);
            config.upload = merged.get<UploadConfig>();
        }
    }

    void to_json(nlohmann::json &json, const UploadConfig &config)
    {
        json = {
            {"chunk_size", config.chunk_size},
            {"dynamic_chunk_size", config.dynamic_chunk_size},
            {"max_file_size", config.max_file_size},
            {"enable_compression", config.enable_compression},
            {"compression_level", config.compression_level},
            {"min_compression_size", config.min_compression_size},
            {"max_buffered_bytes", config.max_buffered_bytes},
            {"session_timeout", config.session_timeout.count()},
            {"kdf_iterations", config.kdf_iterations},
            {"allowed_extensions", config.allowed_extensions},
        };
    }

    void from_json(const nlohmann::json &json, UploadConfig &config)
    {
        const UploadConfig defaults{};
        config.chunk_size = json.value("chunk_size", defaults.chunk_size);
        config.dynamic_chunk_size = json.value("dynamic_chunk_size", defaults.dynamic_chunk_size);
        config.max_file_size = json.value("max_file_size", defaults.max_file_size);
        config.enable_compression = json.value("enable_compression", defaults.enable_compression);
        config.compression_level = json.value("compression_level", defaults.compression_level);
        config.min_compression_size = json.value("min_compression_size", defaults.min_compression_size);
        config.max_buffered_bytes = json.value("max_buffered_bytes", defaults.max_buffered_bytes);
        config.session_timeout =
            std::chrono::seconds(json.value("session_timeout", static_cast<std::int64_t>(defaults.session_timeout.count())));
        config.kdf_iterations = json.value("kdf_iterations", defaults.kdf_iterations);
        config.allowed_extensions.clear();
        if (auto it = json.find("allowed_extensions"); it != json.end())
        {
            for (const auto &item : *it)
            {
                auto parsed = parse_extension_list(item.get<std::string>());
                config.allowed_extensions.insert(config.allowed_extensions.end(), parsed.begin(), parsed.end());
            }
        }
        if (config.chunk_size == 0)
        {
            throw std::invalid_argument("chunk_size must be positive");
        }
    }

} // namespace vaultdrop::server
