#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "vaultdrop/server/server.hpp"
#include "vaultdrop/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "VaultDrop server " << vaultdrop::version() << "\n"
                  << "Usage: " << program_name
                  << " --port <PORT> --root <ROOT> [--config <FILE>] [--address <ADDRESS>] [--threads <N>]\n"
                     "       [--chunk-size <BYTES>] [--dynamic-chunks] [--max-file-size <BYTES>] [--no-compression]\n"
                     "       [--session-timeout <seconds>] [--expiry-interval <seconds>] [--mirror-dir <DIR>]\n"
                     "       [--allowed-extensions <ext,ext,...>] [--log <FILE>] [--verbose]\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

    // The config file is applied first so that every other flag overrides it.
    std::optional<std::filesystem::path> find_config_flag(int argc, char *argv[])
    {
        for (int i = 1; i + 1 < argc; ++i)
        {
            if (std::string(argv[i]) == "--config")
            {
                return std::filesystem::path(argv[i + 1]);
            }
        }
        return std::nullopt;
    }

} // namespace

int main(int argc, char *argv[])
{
    using vaultdrop::server::Server;
    using vaultdrop::server::ServerConfig;

    ServerConfig config;
    bool verbose = false;

    try
    {
        if (auto config_path = find_config_flag(argc, argv))
        {
            vaultdrop::server::apply_config_file(*config_path, config);
        }

        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                print_usage(argv[0]);
                return EXIT_SUCCESS;
            }
            if (arg == "--dynamic-chunks")
            {
                config.upload.dynamic_chunk_size = true;
                continue;
            }
            if (arg == "--no-compression")
            {
                config.upload.enable_compression = false;
                continue;
            }
            if (arg == "--verbose")
            {
                verbose = true;
                continue;
            }

            auto value = read_option(i, argc, argv);
            if (!value)
            {
                std::cerr << "Missing value for " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
            if (arg == "--config")
            {
                continue;
            }
            if (arg == "--port")
            {
                config.port = static_cast<std::uint16_t>(std::stoi(*value));
            }
            else if (arg == "--root")
            {
                config.root = std::filesystem::path(*value);
            }
            else if (arg == "--address")
            {
                config.address = *value;
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(std::stoul(*value));
            }
            else if (arg == "--chunk-size")
            {
                config.upload.chunk_size = std::stoull(*value);
            }
            else if (arg == "--max-file-size")
            {
                config.upload.max_file_size = std::stoull(*value);
            }
            else if (arg == "--session-timeout")
            {
                config.upload.session_timeout = std::chrono::seconds(std::stoll(*value));
            }
            else if (arg == "--expiry-interval")
            {
                config.expiry_interval = std::chrono::seconds(std::stoll(*value));
            }
            else if (arg == "--mirror-dir")
            {
                config.mirror_dir = std::filesystem::path(*value);
            }
            else if (arg == "--allowed-extensions")
            {
                config.upload.allowed_extensions = vaultdrop::server::parse_extension_list(*value);
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(*value);
            }
            else
            {
                std::cerr << "Unknown argument: " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
        }
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Invalid configuration: " << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (config.port == 0 || config.root.empty() || config.upload.chunk_size == 0 ||
        config.expiry_interval.count() <= 0)
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting VaultDrop server {} on {}:{}", vaultdrop::version(), config.address, config.port);

        Server server(std::move(config));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
