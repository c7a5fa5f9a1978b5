#include "chunkvault/server/content_index.hpp"

#include <spdlog/spdlog.h>

#include "chunkvault/crypto.hpp"
#include "chunkvault/server/upload_error.hpp"
#include "storage_common.hpp"

namespace chunkvault::server
{

    namespace
    {
        constexpr auto kIndexFile = "files.json";
    } // namespace

    JsonContentIndex::JsonContentIndex(std::filesystem::path storage_root)
        : index_path_(std::move(storage_root) / storage_common::kMetadataDir / kIndexFile)
    {
        std::filesystem::create_directories(index_path_.parent_path());
        load_existing();
    }

    std::optional<FinalizedFile> JsonContentIndex::find_by_digest(const std::string &digest) const
    {
        std::lock_guard lock(mutex_);
        auto it = by_digest_.find(crypto::normalize_digest(digest));
        if (it == by_digest_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<FinalizedFile> JsonContentIndex::find_by_id(const std::string &file_id) const
    {
        std::lock_guard lock(mutex_);
        auto id = digest_by_id_.find(file_id);
        if (id == digest_by_id_.end())
        {
            return std::nullopt;
        }
        return by_digest_.at(id->second);
    }

    ContentIndex::InsertResult JsonContentIndex::insert_if_absent(const FinalizedFile &file)
    {
        std::lock_guard lock(mutex_);
        auto entry = file;
        entry.digest = crypto::normalize_digest(file.digest);
        if (auto it = by_digest_.find(entry.digest); it != by_digest_.end())
        {
            return InsertResult{.file = it->second, .inserted = false};
        }
        if (digest_by_id_.contains(entry.file_id))
        {
            throw UploadError(chunkvault::ErrorCode::StateConflict, "File id " + entry.file_id + " already in use");
        }

        by_digest_.emplace(entry.digest, entry);
        digest_by_id_.emplace(entry.file_id, entry.digest);
        try
        {
            persist();
        }
        catch (...)
        {
            by_digest_.erase(entry.digest);
            digest_by_id_.erase(entry.file_id);
            throw;
        }
        return InsertResult{.file = entry, .inserted = true};
    }

    std::size_t JsonContentIndex::size() const
    {
        std::lock_guard lock(mutex_);
        return by_digest_.size();
    }

    void JsonContentIndex::load_existing()
    {
        if (!std::filesystem::exists(index_path_))
        {
            return;
        }
        const auto json = storage_common::read_json(index_path_);
        if (!json.is_object())
        {
            throw UploadError(chunkvault::ErrorCode::StorageFailure, "Malformed content index " + index_path_.string());
        }
        for (const auto &[key, value] : json.items())
        {
            try
            {
                auto file = value.get<FinalizedFile>();
                file.digest = crypto::normalize_digest(file.digest);
                digest_by_id_.emplace(file.file_id, file.digest);
                by_digest_.emplace(file.digest, std::move(file));
            }
            catch (const nlohmann::json::exception &ex)
            {
                spdlog::warn("Skipping malformed content index entry {}: {}", key, ex.what());
            }
        }
        spdlog::debug("Loaded {} finalized files from {}", by_digest_.size(), index_path_.string());
    }

    void JsonContentIndex::persist() const
    {
        nlohmann::json json = nlohmann::json::object();
        for (const auto &[digest, file] : by_digest_)
        {
            json[digest] = file;
        }
        storage_common::write_json_atomically(index_path_, json);
    }

} // namespace chunkvault::server
