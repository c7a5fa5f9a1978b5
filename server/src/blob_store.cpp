#include "chunkvault/server/blob_store.hpp"

#include <ctime>
#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include "chunkvault/crypto.hpp"
#include "chunkvault/server/upload_error.hpp"
#include "storage_common.hpp"

namespace chunkvault::server
{

    namespace
    {
        constexpr auto kFilesDir = "files";
        constexpr auto kStagingDir = "staging";

        std::string timestamp_utc(TimePoint now)
        {
            const auto time = std::chrono::system_clock::to_time_t(now);
            std::tm parts{};
            gmtime_r(&time, &parts);
            char buffer[16]{};
            std::strftime(buffer, sizeof(buffer), "%Y%m%d%H%M%S", &parts);
            return buffer;
        }

        class FilesystemBlobWriter final : public BlobWriter
        {
        public:
            FilesystemBlobWriter(std::filesystem::path staging_path, std::filesystem::path final_path,
                                 std::string locator)
                : staging_path_(std::move(staging_path)), final_path_(std::move(final_path)),
                  locator_(std::move(locator))
            {
                out_.open(staging_path_, std::ios::binary | std::ios::trunc);
                if (!out_.is_open())
                {
                    throw UploadError(chunkvault::ErrorCode::StorageFailure,
                                      "Cannot create staging file " + staging_path_.string());
                }
            }

            ~FilesystemBlobWriter() override
            {
                if (!committed_)
                {
                    out_.close();
                    std::error_code ec;
                    std::filesystem::remove(staging_path_, ec);
                }
            }

            void write(std::span<const std::byte> data) override
            {
                out_.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
                if (!out_)
                {
                    throw UploadError(chunkvault::ErrorCode::StorageFailure,
                                      "Write to " + staging_path_.string() + " failed");
                }
                written_ += data.size();
            }

            std::uint64_t bytes_written() const noexcept override { return written_; }

            std::string commit() override
            {
                if (committed_)
                {
                    return locator_;
                }
                out_.flush();
                out_.close();
                if (out_.fail())
                {
                    throw UploadError(chunkvault::ErrorCode::StorageFailure,
                                      "Flushing " + staging_path_.string() + " failed");
                }
                std::error_code ec;
                std::filesystem::rename(staging_path_, final_path_, ec);
                if (ec)
                {
                    throw UploadError(chunkvault::ErrorCode::StorageFailure,
                                      "Cannot move " + staging_path_.string() + " into place: " + ec.message());
                }
                committed_ = true;
                spdlog::debug("Committed {} ({} bytes)", locator_, written_);
                return locator_;
            }

        private:
            std::filesystem::path staging_path_;
            std::filesystem::path final_path_;
            std::string locator_;
            std::ofstream out_;
            std::uint64_t written_{0};
            bool committed_{false};
        };
    } // namespace

    FilesystemBlobStore::FilesystemBlobStore(std::filesystem::path storage_root)
        : root_(std::move(storage_root)), files_dir_(root_ / kFilesDir),
          staging_dir_(root_ / storage_common::kMetadataDir / kStagingDir)
    {
        std::filesystem::create_directories(files_dir_);
        std::filesystem::create_directories(staging_dir_);
    }

    std::unique_ptr<BlobWriter> FilesystemBlobStore::create(const std::string &file_name)
    {
        const auto name = unique_file_name(file_name, std::chrono::system_clock::now());
        auto staging_path = staging_dir_ / (name + ".part");
        auto final_path = files_dir_ / name;
        return std::make_unique<FilesystemBlobWriter>(std::move(staging_path), std::move(final_path),
                                                      std::string(kFilesDir) + "/" + name);
    }

    bool FilesystemBlobStore::exists(const std::string &locator) const
    {
        std::error_code ec;
        return std::filesystem::is_regular_file(resolve(locator), ec);
    }

    std::unique_ptr<std::istream> FilesystemBlobStore::open(const std::string &locator) const
    {
        auto stream = std::make_unique<std::ifstream>(resolve(locator), std::ios::binary);
        if (!stream->is_open())
        {
            throw UploadError(chunkvault::ErrorCode::NotFound, "No stored file at " + locator);
        }
        return stream;
    }

    void FilesystemBlobStore::remove(const std::string &locator)
    {
        std::error_code ec;
        std::filesystem::remove(resolve(locator), ec);
        if (ec)
        {
            throw UploadError(chunkvault::ErrorCode::StorageFailure,
                              "Failed to delete " + locator + ": " + ec.message());
        }
    }

    std::filesystem::path FilesystemBlobStore::resolve(const std::string &locator) const
    {
        const std::filesystem::path relative(locator);
        const auto name = relative.filename().string();
        if (relative.parent_path() != kFilesDir || name.empty() || name == "." || name == "..")
        {
            throw UploadError(chunkvault::ErrorCode::InvalidArgument, "Malformed file locator: " + locator);
        }
        return files_dir_ / name;
    }

    std::string FilesystemBlobStore::unique_file_name(const std::string &file_name, TimePoint now)
    {
        const std::filesystem::path original(file_name);
        auto stem = original.stem().string();
        if (stem.empty())
        {
            stem = "file";
        }
        return stem + "_" + timestamp_utc(now) + "_" + crypto::random_hex(4) + original.extension().string();
    }

} // namespace chunkvault::server
