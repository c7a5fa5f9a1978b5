#pragma once

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "chunkvault/server/upload_session.hpp"

namespace chunkvault::server
{

    /// Maps content digests to finalized files. Digests are compared case-insensitively.
    class ContentIndex
    {
    public:
        struct InsertResult
        {
            FinalizedFile file;
            bool inserted{};
        };

        virtual ~ContentIndex() = default;

        virtual std::optional<FinalizedFile> find_by_digest(const std::string &digest) const = 0;
        virtual std::optional<FinalizedFile> find_by_id(const std::string &file_id) const = 0;

        /// Atomically inserts `file` unless its digest is already present. When another
        /// entry wins, that entry is returned with `inserted == false`.
        virtual InsertResult insert_if_absent(const FinalizedFile &file) = 0;

        virtual std::size_t size() const = 0;
    };

    // All entries live in a single document, <root>/.chunkvault/files.json, keyed by digest.
    class JsonContentIndex final : public ContentIndex
    {
    public:
        explicit JsonContentIndex(std::filesystem::path storage_root);

        std::optional<FinalizedFile> find_by_digest(const std::string &digest) const override;
        std::optional<FinalizedFile> find_by_id(const std::string &file_id) const override;
        InsertResult insert_if_absent(const FinalizedFile &file) override;
        std::size_t size() const override;

    private:
        void load_existing();
        void persist() const;

        std::filesystem::path index_path_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, FinalizedFile> by_digest_;
        std::unordered_map<std::string, std::string> digest_by_id_;
    };

} // namespace chunkvault::server
