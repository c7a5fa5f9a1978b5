#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <span>
#include <string>

#include "chunkvault/server/upload_session.hpp"

namespace chunkvault::server
{

    /// Sequential writer for one finalized file. Nothing is visible under the final
    /// locator until commit() succeeds; a writer destroyed without commit discards its bytes.
    class BlobWriter
    {
    public:
        virtual ~BlobWriter() = default;

        virtual void write(std::span<const std::byte> data) = 0;
        virtual std::uint64_t bytes_written() const noexcept = 0;
        virtual std::string commit() = 0;
    };

    class BlobStore
    {
    public:
        virtual ~BlobStore() = default;

        virtual std::unique_ptr<BlobWriter> create(const std::string &file_name) = 0;
        virtual bool exists(const std::string &locator) const = 0;
        virtual std::unique_ptr<std::istream> open(const std::string &locator) const = 0;
        virtual void remove(const std::string &locator) = 0;
    };

    // Finalized files live under <root>/files/ as {stem}_{yyyyMMddHHmmss}_{8 hex}{ext};
    // in-progress writes are staged under <root>/.chunkvault/staging/.
    class FilesystemBlobStore final : public BlobStore
    {
    public:
        explicit FilesystemBlobStore(std::filesystem::path storage_root);

        std::unique_ptr<BlobWriter> create(const std::string &file_name) override;
        bool exists(const std::string &locator) const override;
        std::unique_ptr<std::istream> open(const std::string &locator) const override;
        void remove(const std::string &locator) override;

        std::filesystem::path resolve(const std::string &locator) const;

        static std::string unique_file_name(const std::string &file_name, TimePoint now);

    private:
        std::filesystem::path root_;
        std::filesystem::path files_dir_;
        std::filesystem::path staging_dir_;
    };

} // namespace chunkvault::server
