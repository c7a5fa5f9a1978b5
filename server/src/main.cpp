#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "chunkvault/server/config.hpp"
#include "chunkvault/server/server.hpp"
#include "chunkvault/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "ChunkVault server " << chunkvault::version() << "\n"
                  << "Usage: " << program_name
                  << " --port <PORT> --root <ROOT> [--config <FILE>] [--address <ADDRESS>] [--threads <N>]\n"
                     "       [--chunk-size <BYTES>] [--retention-hours <H>] [--max-file-size <BYTES>]\n"
                     "       [--allowed-ext <.a,.b>] [--no-digest-check] [--sweep-interval <seconds>]\n"
                     "       [--log <FILE>] [--verbose]\n";
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

    std::vector<std::string> split_list(const std::string &value)
    {
        std::vector<std::string> items;
        std::stringstream stream(value);
        std::string item;
        while (std::getline(stream, item, ','))
        {
            if (!item.empty())
            {
                items.push_back(chunkvault::server::normalize_extension(item));
            }
        }
        return items;
    }

    // Finds --config before the other flags so command-line values override the file.
    std::optional<std::filesystem::path> find_config_path(int argc, char *argv[])
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
    using chunkvault::server::Server;
    using chunkvault::server::ServerConfig;

    ServerConfig config;
    bool verbose = false;

    try
    {
        if (auto path = find_config_path(argc, argv))
        {
            chunkvault::server::load_config_file(*path, config);
        }

        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                print_usage(argv[0]);
                return EXIT_SUCCESS;
            }
            if (arg == "--no-digest-check")
            {
                config.upload.enable_digest_check = false;
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
                // Loaded above.
            }
            else if (arg == "--port")
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
            else if (arg == "--retention-hours")
            {
                config.upload.retention = std::chrono::hours(std::stoll(*value));
            }
            else if (arg == "--max-file-size")
            {
                config.upload.max_file_size = std::stoull(*value);
            }
            else if (arg == "--allowed-ext")
            {
                config.upload.allowed_extensions = split_list(*value);
            }
            else if (arg == "--sweep-interval")
            {
                config.sweep_interval = std::chrono::seconds(std::stoll(*value));
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

    if (config.port == 0 || config.root.empty())
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        chunkvault::server::validate(config.upload);

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
        spdlog::info("Starting ChunkVault server {} on {}:{}", chunkvault::version(), config.address, config.port);
        spdlog::info("Chunk size {} bytes, retention {}h, digest check {}", config.upload.chunk_size,
                     config.upload.retention.count(), config.upload.enable_digest_check ? "on" : "off");

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
