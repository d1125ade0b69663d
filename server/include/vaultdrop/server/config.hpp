#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace vaultdrop::server
{

    struct UploadConfig
    {
        std::uint64_t chunk_size{1u << 20};
        bool dynamic_chunk_size{false};
        std::uint64_t max_file_size{5ULL * 1024 * 1024 * 1024};
        bool enable_compression{true};
        int compression_level{6};
        std::uint64_t min_compression_size{1024};
        // Ceiling on chunk bytes held in memory across every live session.
        std::uint64_t max_buffered_bytes{512ULL * 1024 * 1024};
        std::chrono::seconds session_timeout{std::chrono::hours{24}};
        std::uint32_t kdf_iterations{100'000};
        // Lowercase extensions without the dot. Empty accepts every file type.
        std::vector<std::string> allowed_extensions;
    };

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root;
        std::size_t worker_threads{0};
        std::chrono::seconds expiry_interval{std::chrono::seconds{3600}};
        std::optional<std::filesystem::path> log_file;
        std::optional<std::filesystem::path> mirror_dir;
        UploadConfig upload;
    };

    struct CompressionSettings
    {
        bool enabled{};
        int level{};
        std::uint64_t min_size{};
    };

    /// Fixed chunk size, or a size tier when dynamic sizing is enabled.
    std::uint64_t chunk_size_for(const UploadConfig &config, std::uint64_t file_size) noexcept;

    CompressionSettings compression_settings_for(const UploadConfig &config, std::string_view filename);

    bool is_extension_allowed(const UploadConfig &config, std::string_view filename);

    /// Parses a comma separated list such as "txt, .PDF,zip" into allowlist form.
    std::vector<std::string> parse_extension_list(std::string_view list);

    std::vector<std::string> validate_config(const UploadConfig &config);

    /// Overlays the keys present in a JSON config file onto `config`.
    void apply_config_file(const std::filesystem::path &path, ServerConfig &config);

    void to_json(nlohmann::json &json, const UploadConfig &config);
    void from_json(const nlohmann::json &json, UploadConfig &config);

} // namespace vaultdrop::server
