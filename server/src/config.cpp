#include "chunkvault/server/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace chunkvault::server
{

    namespace
    {
        constexpr std::uint64_t kMinChunkBound = 1024;
        constexpr std::uint64_t kMaxChunkBound = 10ULL * 1024 * 1024;
    } // namespace

    void validate(const UploadConfig &config)
    {
        if (config.min_chunk_size < kMinChunkBound || config.max_chunk_size > kMaxChunkBound)
        {
            throw std::invalid_argument("Chunk size bounds must lie within 1 KiB and 10 MiB");
        }
        if (config.min_chunk_size > config.max_chunk_size)
        {
            throw std::invalid_argument("Minimum chunk size exceeds maximum chunk size");
        }
        if (config.chunk_size < config.min_chunk_size || config.chunk_size > config.max_chunk_size)
        {
            throw std::invalid_argument("Default chunk size " + std::to_string(config.chunk_size) +
                                        " is outside the configured bounds");
        }
        if (config.retention.count() < 0)
        {
            throw std::invalid_argument("Retention must not be negative");
        }
        for (const auto &extension : config.allowed_extensions)
        {
            if (extension.size() < 2 || extension.front() != '.')
            {
                throw std::invalid_argument("Invalid allowed extension: " + extension);
            }
        }
    }

    std::string normalize_extension(std::string extension)
    {
        std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char ch)
                       { return static_cast<char>(std::tolower(ch)); });
        if (!extension.empty() && extension.front() != '.')
        {
            extension.insert(extension.begin(), '.');
        }
        return extension;
    }

    void load_config_file(const std::filesystem::path &path, ServerConfig &config)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Cannot open configuration file: " + path.string());
        }
        nlohmann::json json;
        in >> json;
        if (!json.is_object())
        {
            throw std::runtime_error("Configuration file must contain a JSON object");
        }

        config.address = json.value("address", config.address);
        config.port = json.value("port", config.port);
        if (auto it = json.find("root"); it != json.end())
        {
            config.root = it->get<std::string>();
        }
        config.worker_threads = json.value("threads", config.worker_threads);
        if (auto it = json.find("sweepIntervalSeconds"); it != json.end())
        {
            config.sweep_interval = std::chrono::seconds{it->get<std::int64_t>()};
        }
        if (auto it = json.find("logFile"); it != json.end())
        {
            config.log_file = std::filesystem::path(it->get<std::string>());
        }

        auto &upload = config.upload;
        upload.chunk_size = json.value("chunkSizeBytes", upload.chunk_size);
        if (auto it = json.find("retentionHours"); it != json.end())
        {
            upload.retention = std::chrono::hours{it->get<std::int64_t>()};
        }
        upload.enable_digest_check = json.value("enableDigestCheck", upload.enable_digest_check);
        upload.max_file_size = json.value("maxFileSizeBytes", upload.max_file_size);
        if (auto it = json.find("allowedExtensions"); it != json.end())
        {
            upload.allowed_extensions.clear();
            for (const auto &item : *it)
            {
                upload.allowed_extensions.push_back(normalize_extension(item.get<std::string>()));
            }
        }
    }

} // namespace chunkvault::server
