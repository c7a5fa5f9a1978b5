#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace chunkvault::server
{

    struct UploadConfig
    {
        std::uint64_t chunk_size{2ULL * 1024 * 1024};
        std::uint64_t min_chunk_size{1024};
        std::uint64_t max_chunk_size{10ULL * 1024 * 1024};
        std::chrono::hours retention{24};
        bool enable_digest_check{true};
        // 0 disables the limit.
        std::uint64_t max_file_size{0};
        // Lowercase, with leading dot. Empty accepts every extension.
        std::vector<std::string> allowed_extensions;
    };

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root;
        std::size_t worker_threads{0};
        std::chrono::seconds sweep_interval{std::chrono::hours{1}};
        std::optional<std::filesystem::path> log_file;
        UploadConfig upload;
    };

    // Throws std::invalid_argument describing the first inconsistent setting.
    void validate(const UploadConfig &config);

    std::string normalize_extension(std::string extension);

    /// Reads a JSON configuration document into `config`. Keys absent from the
    /// document keep their current values, so command-line flags can be applied
    /// afterwards to override the file.
    void load_config_file(const std::filesystem::path &path, ServerConfig &config);

} // namespace chunkvault::server
