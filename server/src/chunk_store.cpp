#include "chunkvault/server/chunk_store.hpp"

#include <array>
#include <cstdio>
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
        constexpr auto kChunksDir = "chunks";
        constexpr std::size_t kReadBufferSize = 64 * 1024;

        std::string chunk_file_name(std::uint32_t index)
        {
            std::array<char, 32> name{};
            std::snprintf(name.data(), name.size(), "chunk_%06u", static_cast<unsigned>(index));
            return name.data();
        }
    } // namespace

    FilesystemChunkStore::FilesystemChunkStore(std::filesystem::path storage_root)
        : chunks_dir_(std::move(storage_root) / storage_common::kMetadataDir / kChunksDir)
    {
        std::filesystem::create_directories(chunks_dir_);
    }

    std::string FilesystemChunkStore::write(const std::string &session_id, std::uint32_t index,
                                            std::span<const std::byte> data)
    {
        const auto target = chunk_path(session_id, index);
        const auto locator = locator_for(session_id, index);
        try
        {
            if (std::filesystem::exists(target))
            {
                return locator;
            }
            std::filesystem::create_directories(target.parent_path());

            auto temp_path = target.parent_path() / ("." + target.filename().string() + ".tmp-" + crypto::random_hex(4));
            {
                std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
                if (!out.is_open())
                {
                    throw UploadError(chunkvault::ErrorCode::StorageFailure,
                                      "Cannot create chunk file " + temp_path.string());
                }
                out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
                out.flush();
                if (!out)
                {
                    out.close();
                    std::error_code ignored;
                    std::filesystem::remove(temp_path, ignored);
                    throw UploadError(chunkvault::ErrorCode::StorageFailure,
                                      "Short write on chunk file " + temp_path.string());
                }
            }

            // Linking fails if another writer published the same index first; the
            // existing chunk wins and ours is dropped.
            std::error_code ec;
            std::filesystem::create_hard_link(temp_path, target, ec);
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            if (ec && ec != std::errc::file_exists)
            {
                throw UploadError(chunkvault::ErrorCode::StorageFailure,
                                  "Cannot publish chunk " + target.string() + ": " + ec.message());
            }
            return locator;
        }
        catch (const UploadError &)
        {
            throw;
        }
        catch (const std::filesystem::filesystem_error &ex)
        {
            storage_common::throw_storage_failure("Chunk write failed", ex);
        }
    }

    bool FilesystemChunkStore::exists(const std::string &session_id, std::uint32_t index) const
    {
        std::error_code ec;
        return std::filesystem::is_regular_file(chunk_path(session_id, index), ec);
    }

    std::vector<std::byte> FilesystemChunkStore::read(const std::string &session_id, std::uint32_t index) const
    {
        std::vector<std::byte> data;
        read_into(session_id, index, [&data](std::span<const std::byte> piece)
                  { data.insert(data.end(), piece.begin(), piece.end()); });
        return data;
    }

    std::uint64_t FilesystemChunkStore::read_into(const std::string &session_id, std::uint32_t index,
                                                  const ChunkSink &sink) const
    {
        const auto path = chunk_path(session_id, index);
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
        {
            throw UploadError(chunkvault::ErrorCode::NotFound,
                              "Chunk " + std::to_string(index) + " of session " + session_id + " is not stored");
        }
        std::vector<std::byte> buffer(kReadBufferSize);
        std::uint64_t total = 0;
        while (in)
        {
            in.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            const auto count = static_cast<std::size_t>(in.gcount());
            if (count == 0)
            {
                break;
            }
            sink(std::span<const std::byte>(buffer.data(), count));
            total += count;
        }
        if (in.bad())
        {
            throw UploadError(chunkvault::ErrorCode::StorageFailure, "I/O error while reading " + path.string());
        }
        return total;
    }

    void FilesystemChunkStore::remove_session(const std::string &session_id)
    {
        std::error_code ec;
        const auto removed = std::filesystem::remove_all(session_dir(session_id), ec);
        if (ec)
        {
            throw UploadError(chunkvault::ErrorCode::StorageFailure,
                              "Failed to delete chunks of session " + session_id + ": " + ec.message());
        }
        if (removed > 0)
        {
            spdlog::debug("Deleted {} chunk entries of session {}", removed, session_id);
        }
    }

    std::vector<std::string> FilesystemChunkStore::sessions() const
    {
        std::vector<std::string> result;
        std::error_code ec;
        for (const auto &entry : std::filesystem::directory_iterator(chunks_dir_, ec))
        {
            if (entry.is_directory())
            {
                result.push_back(entry.path().filename().string());
            }
        }
        if (ec)
        {
            throw UploadError(chunkvault::ErrorCode::StorageFailure,
                              "Cannot list chunk directory " + chunks_dir_.string() + ": " + ec.message());
        }
        return result;
    }

    std::filesystem::path FilesystemChunkStore::chunk_path(const std::string &session_id, std::uint32_t index) const
    {
        return session_dir(session_id) / chunk_file_name(index);
    }

    std::filesystem::path FilesystemChunkStore::session_dir(const std::string &session_id) const
    {
        storage_common::require_safe_identifier(session_id, "session id");
        return chunks_dir_ / session_id;
    }

    std::string FilesystemChunkStore::locator_for(const std::string &session_id, std::uint32_t index) const
    {
        return std::string(kChunksDir) + "/" + session_id + "/" + chunk_file_name(index);
    }

} // namespace chunkvault::server
