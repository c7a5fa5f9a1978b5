#include "storage_common.hpp"

#include <cctype>
#include <fstream>

#include "chunkvault/crypto.hpp"
#include "chunkvault/server/upload_error.hpp"

namespace chunkvault::server::storage_common
{

    namespace
    {
        constexpr std::size_t kMaxIdentifierLength = 128;
    } // namespace

    bool is_safe_identifier(std::string_view value) noexcept
    {
        if (value.empty() || value.size() > kMaxIdentifierLength)
        {
            return false;
        }
        for (const char ch : value)
        {
            const auto c = static_cast<unsigned char>(ch);
            if (!std::isalnum(c) && ch != '-' && ch != '_')
            {
                return false;
            }
        }
        return true;
    }

    void require_safe_identifier(std::string_view value, std::string_view what)
    {
        if (!is_safe_identifier(value))
        {
            throw UploadError(chunkvault::ErrorCode::InvalidArgument,
                              "Malformed " + std::string(what) + ": '" + std::string(value) + "'");
        }
    }

    void write_json_atomically(const std::filesystem::path &path, const nlohmann::json &json)
    {
        auto temp_path = path;
        temp_path += ".tmp-" + crypto::random_hex(4);
        {
            std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw UploadError(chunkvault::ErrorCode::StorageFailure,
                                  "Cannot open " + temp_path.string() + " for writing");
            }
            out << json.dump(2);
            out.flush();
            if (!out)
            {
                std::error_code ec;
                std::filesystem::remove(temp_path, ec);
                throw UploadError(chunkvault::ErrorCode::StorageFailure, "Failed to write " + temp_path.string());
            }
        }
        std::error_code ec;
        std::filesystem::rename(temp_path, path, ec);
        if (ec)
        {
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            throw UploadError(chunkvault::ErrorCode::StorageFailure,
                              "Failed to replace " + path.string() + ": " + ec.message());
        }
    }

    nlohmann::json read_json(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
        {
            throw UploadError(chunkvault::ErrorCode::StorageFailure, "Cannot open " + path.string());
        }
        nlohmann::json json;
        in >> json;
        return json;
    }

    void throw_storage_failure(const std::string &context, const std::exception &cause)
    {
        throw UploadError(chunkvault::ErrorCode::StorageFailure, context + ": " + cause.what());
    }

} // namespace chunkvault::server::storage_common
