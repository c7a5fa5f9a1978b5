#include "chunkvault/server/upload_manager.hpp"

#include <algorithm>
#include <stdexcept>

#include <asio/post.hpp>
#include <spdlog/spdlog.h>

#include "chunkvault/crypto.hpp"
#include "chunkvault/server/upload_error.hpp"

namespace chunkvault::server
{

    namespace
    {
        constexpr std::size_t kIdentifierBytes = 16;

        // Registers a merge for the lifetime of the object; a second registration of
        // the same session fails while the first one is alive.
        class MergeGuard
        {
        public:
            MergeGuard(std::mutex &mutex, std::set<std::string> &in_flight, std::string session_id)
                : mutex_(mutex), in_flight_(in_flight), session_id_(std::move(session_id))
            {
                std::lock_guard lock(mutex_);
                if (!in_flight_.insert(session_id_).second)
                {
                    throw UploadError(chunkvault::ErrorCode::StateConflict,
                                      "A merge of session " + session_id_ + " is already running");
                }
            }

            ~MergeGuard()
            {
                std::lock_guard lock(mutex_);
                in_flight_.erase(session_id_);
            }

            MergeGuard(const MergeGuard &) = delete;
            MergeGuard &operator=(const MergeGuard &) = delete;

        private:
            std::mutex &mutex_;
            std::set<std::string> &in_flight_;
            std::string session_id_;
        };

        std::vector<std::uint32_t> indices_of(const std::vector<ChunkRecord> &records)
        {
            std::vector<std::uint32_t> result;
            result.reserve(records.size());
            for (const auto &record : records)
            {
                result.push_back(record.index);
            }
            return result;
        }

        std::vector<std::uint32_t> missing_indices(const std::vector<std::uint32_t> &uploaded, std::uint32_t total)
        {
            std::vector<std::uint32_t> missing;
            auto it = uploaded.begin();
            for (std::uint32_t index = 0; index < total; ++index)
            {
                if (it != uploaded.end() && *it == index)
                {
                    ++it;
                    continue;
                }
                missing.push_back(index);
            }
            return missing;
        }

        bool is_complete_index_set(const std::vector<ChunkRecord> &records, std::uint32_t total)
        {
            if (records.size() != total)
            {
                return false;
            }
            for (std::uint32_t i = 0; i < total; ++i)
            {
                if (records[i].index != i)
                {
                    return false;
                }
            }
            return true;
        }
    } // namespace

    UploadManager::UploadManager(UploadConfig config, UploadServices services, Clock clock)
        : config_(std::move(config)), services_(services), clock_(std::move(clock))
    {
        validate(config_);
        for (auto &extension : config_.allowed_extensions)
        {
            extension = normalize_extension(extension);
        }
    }

    UploadManager::~UploadManager()
    {
        wait_for_background_tasks();
        background_.join();
    }

    InitResult UploadManager::init(const InitRequest &request)
    {
        validate_file_name(request.file_name);
        if (request.total_size == 0)
        {
            throw UploadError(chunkvault::ErrorCode::InvalidArgument, "Total size must be positive");
        }
        if (config_.max_file_size != 0 && request.total_size > config_.max_file_size)
        {
            throw UploadError(chunkvault::ErrorCode::InvalidArgument,
                              "File size " + std::to_string(request.total_size) + " exceeds the limit of " +
                                  std::to_string(config_.max_file_size) + " bytes");
        }
        const auto chunk_size = resolve_chunk_size(request.chunk_size);
        if (request.declared_digest && !crypto::is_well_formed_digest(*request.declared_digest))
        {
            throw UploadError(chunkvault::ErrorCode::InvalidArgument, "Declared digest is not a 64 character hex string");
        }
        const auto plan = this->plan(request.total_size, chunk_size);

        const auto created = now();
        UploadSession session{};
        session.session_id = crypto::random_hex(kIdentifierBytes);
        session.file_name = request.file_name;
        session.total_size = request.total_size;
        if (request.declared_digest)
        {
            session.declared_digest = crypto::normalize_digest(*request.declared_digest);
        }
        session.chunk_size = plan.chunk_size;
        session.total_chunks = plan.total_chunks;
        session.status = SessionStatus::Initialized;
        session.owner_id = request.owner_id;
        session.created_at = created;
        session.updated_at = created;
        session.expires_at = created + config_.retention;

        services_.registry.create(session);
        spdlog::info("Upload session {} created for '{}' ({} bytes, {} chunks of {})", session.session_id,
                     session.file_name, session.total_size, session.total_chunks, session.chunk_size);

        return InitResult{
            .session_id = session.session_id,
            .total_chunks = session.total_chunks,
            .chunk_size = session.chunk_size,
            .expires_at = session.expires_at,
        };
    }

    ChunkResult UploadManager::upload_chunk(const std::string &session_id, std::uint32_t index,
                                            std::span<const std::byte> data,
                                            const std::optional<std::string> &chunk_digest)
    {
        const auto session = require_session(session_id);
        if (is_terminal(session.status))
        {
            throw UploadError(chunkvault::ErrorCode::StateConflict,
                              "Session " + session_id + " is " + std::string(to_string(session.status)));
        }
        const auto current = now();
        if (session.is_expired(current))
        {
            mark_expired(session);
            throw UploadError(chunkvault::ErrorCode::Expired, "Session " + session_id + " has expired");
        }
        if (index >= session.total_chunks)
        {
            throw UploadError(chunkvault::ErrorCode::InvalidArgument,
                              "Chunk index " + std::to_string(index) + " out of range [0, " +
                                  std::to_string(session.total_chunks) + ")");
        }
        const auto expected_size = expected_chunk_size(session.total_size, session.chunk_size, index);
        if (data.size() != expected_size)
        {
            throw UploadError(chunkvault::ErrorCode::InvalidArgument,
                              "Chunk " + std::to_string(index) + " has " + std::to_string(data.size()) +
                                  " bytes, expected " + std::to_string(expected_size));
        }

        if (services_.registry.find_chunk(session_id, index))
        {
            // A retry after a failed status update still has to move the session forward.
            const auto refreshed = services_.registry.refresh_progress(session_id, current);
            return ChunkResult{
                .uploaded_chunk_count = refreshed.uploaded_chunk_count,
                .total_chunks = refreshed.total_chunks,
                .progress_percent = progress_percent(refreshed.uploaded_chunk_count, refreshed.total_chunks),
                .already_present = true,
                .status = refreshed.status,
            };
        }

        const auto digest = crypto::hash_bytes(data);
        if (chunk_digest && config_.enable_digest_check && !crypto::digests_equal(digest, *chunk_digest))
        {
            spdlog::warn("Digest mismatch for chunk {} of session {}", index, session_id);
            throw UploadError(chunkvault::ErrorCode::IntegrityError,
                              "Chunk " + std::to_string(index) + " does not match its digest");
        }

        ChunkRecord record{};
        record.session_id = session_id;
        record.index = index;
        record.size = data.size();
        record.digest = digest;
        record.locator = services_.chunks.write(session_id, index, data);
        record.uploaded_at = current;

        const bool inserted = services_.registry.insert_chunk(record);
        const auto updated = services_.registry.refresh_progress(session_id, current);
        spdlog::debug("Chunk {}/{} of session {} stored ({} bytes)", index + 1, updated.total_chunks, session_id,
                      data.size());
        if (updated.status == SessionStatus::Completed && session.status != SessionStatus::Completed)
        {
            spdlog::info("Session {} received all {} chunks", session_id, updated.total_chunks);
        }

        return ChunkResult{
            .uploaded_chunk_count = updated.uploaded_chunk_count,
            .total_chunks = updated.total_chunks,
            .progress_percent = progress_percent(updated.uploaded_chunk_count, updated.total_chunks),
            .already_present = !inserted,
            .status = updated.status,
        };
    }

    SessionStatusReport UploadManager::status(const std::string &session_id) const
    {
        auto session = require_session(session_id);
        if (!is_terminal(session.status) && session.is_expired(now()))
        {
            session.status = SessionStatus::Expired;
        }

        SessionStatusReport report{};
        report.uploaded = indices_of(services_.registry.chunks(session_id));
        session.uploaded_chunk_count = static_cast<std::uint32_t>(report.uploaded.size());
        if (session.status == SessionStatus::Merged)
        {
            // Chunks are released after a merge; the file itself is complete.
            report.progress_percent = 100.0;
        }
        else
        {
            report.missing = missing_indices(report.uploaded, session.total_chunks);
            report.progress_percent = progress_percent(session.uploaded_chunk_count, session.total_chunks);
        }
        report.session = std::move(session);
        return report;
    }

    std::vector<std::uint32_t> UploadManager::uploaded_chunks(const std::string &session_id) const
    {
        require_session(session_id);
        return indices_of(services_.registry.chunks(session_id));
    }

    MergeResult UploadManager::merge(const std::string &session_id, const std::optional<std::string> &expected_digest)
    {
        MergeGuard guard(merge_mutex_, merges_in_flight_, session_id);

        const auto session = require_session(session_id);
        const auto current = now();
        if (!is_terminal(session.status) && session.is_expired(current))
        {
            persist_expired(session);
            throw UploadError(chunkvault::ErrorCode::Expired, "Session " + session_id + " has expired");
        }
        if (session.status != SessionStatus::Completed)
        {
            throw UploadError(chunkvault::ErrorCode::StateConflict,
                              "Session " + session_id + " is " + std::string(to_string(session.status)) +
                                  ", merge requires Completed");
        }
        if (expected_digest && !crypto::is_well_formed_digest(*expected_digest))
        {
            throw UploadError(chunkvault::ErrorCode::InvalidArgument, "Expected digest is not a 64 character hex string");
        }

        const auto records = services_.registry.chunks(session_id);
        if (!is_complete_index_set(records, session.total_chunks))
        {
            throw UploadError(chunkvault::ErrorCode::IntegrityError,
                              "Session " + session_id + " has " + std::to_string(records.size()) + " of " +
                                  std::to_string(session.total_chunks) + " chunk records");
        }

        auto result = assemble(session, records, expected_digest);
        services_.registry.update_status(session_id, SessionStatus::Merged, result.file.file_id, now());
        release_chunks_async(session_id);

        if (result.deduplicated)
        {
            spdlog::info("Session {} deduplicated onto file {} ({})", session_id, result.file.file_id,
                         result.file.digest);
        }
        else
        {
            spdlog::info("Session {} merged into {} ({} bytes, {})", session_id, result.file.locator,
                         result.file.size, result.file.digest);
        }
        return result;
    }

    bool UploadManager::cancel(const std::string &session_id)
    {
        auto session = services_.registry.find(session_id);
        if (!session || session->status == SessionStatus::Merged)
        {
            return false;
        }

        bool cancelled = false;
        {
            std::lock_guard lock(merge_mutex_);
            if (merges_in_flight_.contains(session_id))
            {
                throw UploadError(chunkvault::ErrorCode::StateConflict,
                                  "Session " + session_id + " is being merged");
            }
            if (!is_terminal(session->status))
            {
                services_.registry.update_status(session_id, SessionStatus::Cancelled, std::nullopt, now());
                cancelled = true;
            }
        }

        services_.chunks.remove_session(session_id);
        services_.registry.remove(session_id);
        if (cancelled)
        {
            spdlog::info("Upload session {} cancelled", session_id);
        }
        return cancelled;
    }

    bool UploadManager::validate_chunk(const std::string &session_id, std::uint32_t index,
                                       const std::string &expected_digest) const
    {
        const auto session = require_session(session_id);
        if (index >= session.total_chunks)
        {
            throw UploadError(chunkvault::ErrorCode::InvalidArgument,
                              "Chunk index " + std::to_string(index) + " out of range");
        }
        if (!services_.registry.find_chunk(session_id, index) || !services_.chunks.exists(session_id, index))
        {
            return false;
        }
        crypto::Hasher hasher;
        services_.chunks.read_into(session_id, index, [&hasher](std::span<const std::byte> piece)
                                   { hasher.update(piece); });
        return crypto::digests_equal(hasher.finish(), expected_digest);
    }

    std::size_t UploadManager::cleanup_expired()
    {
        const auto current = now();
        std::size_t removed = 0;
        for (const auto &session : services_.registry.expired(current))
        {
            {
                std::lock_guard lock(merge_mutex_);
                if (merges_in_flight_.contains(session.session_id))
                {
                    continue;
                }
            }
            try
            {
                services_.chunks.remove_session(session.session_id);
                services_.registry.remove(session.session_id);
                ++removed;
                spdlog::info("Removed {} upload session {} ('{}')", to_string(session.status), session.session_id,
                             session.file_name);
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Failed to clean up session {}: {}", session.session_id, ex.what());
            }
        }

        try
        {
            std::size_t orphans = 0;
            for (const auto &session_id : services_.chunks.sessions())
            {
                if (services_.registry.find(session_id))
                {
                    continue;
                }
                services_.chunks.remove_session(session_id);
                ++orphans;
            }
            if (orphans > 0)
            {
                spdlog::info("Removed chunks of {} orphaned sessions", orphans);
            }
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Orphan chunk collection failed: {}", ex.what());
        }

        if (removed > 0)
        {
            spdlog::info("Cleanup removed {} upload sessions", removed);
        }
        return removed;
    }

    ChunkPlan UploadManager::plan(std::uint64_t total_size, std::uint64_t chunk_size) const
    {
        try
        {
            return plan_chunks(total_size, chunk_size == 0 ? config_.chunk_size : chunk_size);
        }
        catch (const std::invalid_argument &ex)
        {
            throw UploadError(chunkvault::ErrorCode::InvalidArgument, ex.what());
        }
    }

    FinalizedFile UploadManager::finalized_file(const std::string &file_id) const
    {
        auto file = services_.index.find_by_id(file_id);
        if (!file)
        {
            throw UploadError(chunkvault::ErrorCode::NotFound, "Unknown file " + file_id);
        }
        return *file;
    }

    void UploadManager::wait_for_background_tasks()
    {
        std::unique_lock lock(background_mutex_);
        background_cv_.wait(lock, [this]
                            { return pending_background_ == 0; });
    }

    TimePoint UploadManager::now() const
    {
        return clock_ ? clock_() : std::chrono::system_clock::now();
    }

    UploadSession UploadManager::require_session(const std::string &session_id) const
    {
        auto session = services_.registry.find(session_id);
        if (!session)
        {
            throw UploadError(chunkvault::ErrorCode::NotFound, "Unknown upload session " + session_id);
        }
        return *session;
    }

    std::uint64_t UploadManager::resolve_chunk_size(std::uint64_t requested) const
    {
        if (requested == 0)
        {
            return config_.chunk_size;
        }
        if (requested < config_.min_chunk_size || requested > config_.max_chunk_size)
        {
            throw UploadError(chunkvault::ErrorCode::InvalidArgument,
                              "Chunk size " + std::to_string(requested) + " outside [" +
                                  std::to_string(config_.min_chunk_size) + ", " +
                                  std::to_string(config_.max_chunk_size) + "]");
        }
        return requested;
    }

    void UploadManager::validate_file_name(const std::string &file_name) const
    {
        if (file_name.empty())
        {
            throw UploadError(chunkvault::ErrorCode::InvalidArgument, "File name must not be empty");
        }
        if (file_name == "." || file_name == ".." || file_name.find_first_of("/\\") != std::string::npos)
        {
            throw UploadError(chunkvault::ErrorCode::InvalidArgument, "File name must not be a path: " + file_name);
        }
        if (config_.allowed_extensions.empty())
        {
            return;
        }
        const auto extension = normalize_extension(std::filesystem::path(file_name).extension().string());
        if (std::find(config_.allowed_extensions.begin(), config_.allowed_extensions.end(), extension) ==
            config_.allowed_extensions.end())
        {
            throw UploadError(chunkvault::ErrorCode::InvalidArgument,
                              "File type '" + extension + "' is not allowed");
        }
    }

    void UploadManager::mark_expired(const UploadSession &session)
    {
        std::lock_guard lock(merge_mutex_);
        if (merges_in_flight_.contains(session.session_id))
        {
            // The running merge decides the final state.
            spdlog::debug("Session {} not marked expired: merge in progress", session.session_id);
            return;
        }
        persist_expired(session);
    }

    void UploadManager::persist_expired(const UploadSession &session)
    {
        try
        {
            services_.registry.update_status(session.session_id, SessionStatus::Expired, std::nullopt, now());
            spdlog::info("Upload session {} expired", session.session_id);
        }
        catch (const UploadError &ex)
        {
            // Another caller reached a terminal state first.
            if (ex.code() != chunkvault::ErrorCode::StateConflict && ex.code() != chunkvault::ErrorCode::NotFound)
            {
                throw;
            }
            spdlog::debug("Session {} not marked expired: {}", session.session_id, ex.what());
        }
    }

    MergeResult UploadManager::assemble(const UploadSession &session, const std::vector<ChunkRecord> &records,
                                        const std::optional<std::string> &expected_digest)
    {
        auto writer = services_.blobs.create(session.file_name);
        crypto::Hasher hasher;
        for (const auto &record : records)
        {
            const auto expected_size = expected_chunk_size(session.total_size, session.chunk_size, record.index);
            std::uint64_t read = 0;
            try
            {
                read = services_.chunks.read_into(session.session_id, record.index,
                                                  [&](std::span<const std::byte> piece)
                                                  {
                                                      writer->write(piece);
                                                      hasher.update(piece);
                                                  });
            }
            catch (const UploadError &ex)
            {
                if (ex.code() != chunkvault::ErrorCode::NotFound)
                {
                    throw;
                }
                throw UploadError(chunkvault::ErrorCode::IntegrityError,
                                  "Chunk " + std::to_string(record.index) + " of session " + session.session_id +
                                      " is recorded but missing from storage");
            }
            if (read != expected_size || read != record.size)
            {
                throw UploadError(chunkvault::ErrorCode::IntegrityError,
                                  "Chunk " + std::to_string(record.index) + " of session " + session.session_id +
                                      " holds " + std::to_string(read) + " bytes, expected " +
                                      std::to_string(expected_size));
            }
        }
        if (writer->bytes_written() != session.total_size)
        {
            throw UploadError(chunkvault::ErrorCode::IntegrityError,
                              "Assembled " + std::to_string(writer->bytes_written()) + " bytes, expected " +
                                  std::to_string(session.total_size));
        }

        const auto digest = hasher.finish();
        const auto &wanted = expected_digest ? expected_digest : session.declared_digest;
        if (wanted && config_.enable_digest_check && !crypto::digests_equal(digest, *wanted))
        {
            throw UploadError(chunkvault::ErrorCode::IntegrityError,
                              "Assembled file digest " + digest + " does not match " + *wanted);
        }

        if (auto existing = services_.index.find_by_digest(digest))
        {
            return MergeResult{.file = *existing, .deduplicated = true};
        }

        FinalizedFile file{};
        file.file_id = crypto::random_hex(kIdentifierBytes);
        file.digest = digest;
        file.size = writer->bytes_written();
        file.locator = writer->commit();
        file.created_at = now();

        auto inserted = services_.index.insert_if_absent(file);
        if (!inserted.inserted)
        {
            // A concurrent merge of identical content won; keep a single stored copy.
            services_.blobs.remove(file.locator);
            return MergeResult{.file = inserted.file, .deduplicated = true};
        }
        return MergeResult{.file = inserted.file, .deduplicated = false};
    }

    void UploadManager::release_chunks(const std::string &session_id)
    {
        services_.chunks.remove_session(session_id);
        services_.registry.remove_chunks(session_id);
    }

    void UploadManager::release_chunks_async(const std::string &session_id)
    {
        {
            std::lock_guard lock(background_mutex_);
            ++pending_background_;
        }
        asio::post(background_, [this, session_id]()
                   {
                       try
                       {
                           release_chunks(session_id);
                           spdlog::debug("Released chunks of merged session {}", session_id);
                       }
                       catch (const std::exception &ex)
                       {
                           spdlog::warn("Failed to release chunks of session {}: {}", session_id, ex.what());
                       }
                       std::lock_guard lock(background_mutex_);
                       --pending_background_;
                       background_cv_.notify_all(); });
    }

} // namespace chunkvault::server
