#pragma once

#include <exception>
#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace chunkvault::server::storage_common
{

    inline constexpr auto kMetadataDir = ".chunkvault";

    // Session and file identifiers become path components; only [A-Za-z0-9_-] is accepted.
    bool is_safe_identifier(std::string_view value) noexcept;

    void require_safe_identifier(std::string_view value, std::string_view what);

    // Writes to a sibling temporary file and renames it over `path`.
    void write_json_atomically(const std::filesystem::path &path, const nlohmann::json &json);

    nlohmann::json read_json(const std::filesystem::path &path);

    [[noreturn]] void throw_storage_failure(const std::string &context, const std::exception &cause);

} // namespace chunkvault::server::storage_common
