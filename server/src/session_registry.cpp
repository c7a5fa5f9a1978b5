#include "chunkvault/server/session_registry.hpp"

#include <system_error>

#include <spdlog/spdlog.h>

#include "chunkvault/server/upload_error.hpp"
#include "storage_common.hpp"

namespace chunkvault::server
{

    namespace
    {
        constexpr auto kSessionsDir = "sessions";
        constexpr auto kSessionFile = "session.json";
        constexpr auto kChunkRecordsDir = "chunks";

        bool is_record_file(const std::filesystem::directory_entry &entry)
        {
            return entry.is_regular_file() && entry.path().extension() == ".json";
        }

        // Status implied by the chunk records of a session still on the forward path.
        SessionStatus progressed_status(SessionStatus current, std::size_t count, std::uint32_t total)
        {
            if (is_terminal(current) || current == SessionStatus::Completed)
            {
                return current;
            }
            if (count == total)
            {
                return SessionStatus::Completed;
            }
            return count > 0 ? SessionStatus::Uploading : current;
        }
    } // namespace

    JsonSessionRegistry::JsonSessionRegistry(std::filesystem::path storage_root)
        : sessions_dir_(std::move(storage_root) / storage_common::kMetadataDir / kSessionsDir)
    {
        std::filesystem::create_directories(sessions_dir_);
        load_existing();
    }

    void JsonSessionRegistry::create(const UploadSession &session)
    {
        storage_common::require_safe_identifier(session.session_id, "session id");
        std::lock_guard lock(mutex_);
        if (entries_.contains(session.session_id))
        {
            throw UploadError(chunkvault::ErrorCode::StateConflict,
                              "Session " + session.session_id + " already exists");
        }
        std::error_code ec;
        std::filesystem::create_directories(chunk_records_dir(session.session_id), ec);
        if (ec)
        {
            throw UploadError(chunkvault::ErrorCode::StorageFailure,
                              "Cannot create session directory: " + ec.message());
        }
        Entry entry{.session = session, .chunks = {}};
        entry.session.uploaded_chunk_count = 0;
        persist_session(entry.session);
        entries_.emplace(session.session_id, std::move(entry));
    }

    std::optional<UploadSession> JsonSessionRegistry::find(const std::string &session_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(session_id);
        if (it == entries_.end())
        {
            return std::nullopt;
        }
        return snapshot(it->second);
    }

    std::vector<UploadSession> JsonSessionRegistry::list() const
    {
        std::lock_guard lock(mutex_);
        std::vector<UploadSession> result;
        result.reserve(entries_.size());
        for (const auto &[id, entry] : entries_)
        {
            result.push_back(snapshot(entry));
        }
        return result;
    }

    bool JsonSessionRegistry::insert_chunk(const ChunkRecord &record)
    {
        std::lock_guard lock(mutex_);
        auto &entry = require(record.session_id);
        if (record.index >= entry.session.total_chunks)
        {
            throw UploadError(chunkvault::ErrorCode::InvalidArgument,
                              "Chunk index " + std::to_string(record.index) + " out of range");
        }
        if (entry.chunks.contains(record.index))
        {
            return false;
        }
        const auto dir = chunk_records_dir(record.session_id);
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            throw UploadError(chunkvault::ErrorCode::StorageFailure,
                              "Cannot create chunk record directory: " + ec.message());
        }
        storage_common::write_json_atomically(dir / (std::to_string(record.index) + ".json"), record);
        entry.chunks.emplace(record.index, record);
        return true;
    }

    std::optional<ChunkRecord> JsonSessionRegistry::find_chunk(const std::string &session_id,
                                                               std::uint32_t index) const
    {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(session_id);
        if (it == entries_.end())
        {
            return std::nullopt;
        }
        auto chunk = it->second.chunks.find(index);
        if (chunk == it->second.chunks.end())
        {
            return std::nullopt;
        }
        return chunk->second;
    }

    std::vector<ChunkRecord> JsonSessionRegistry::chunks(const std::string &session_id) const
    {
        std::lock_guard lock(mutex_);
        std::vector<ChunkRecord> result;
        auto it = entries_.find(session_id);
        if (it == entries_.end())
        {
            return result;
        }
        result.reserve(it->second.chunks.size());
        for (const auto &[index, record] : it->second.chunks)
        {
            result.push_back(record);
        }
        return result;
    }

    UploadSession JsonSessionRegistry::refresh_progress(const std::string &session_id, TimePoint now)
    {
        std::lock_guard lock(mutex_);
        auto &entry = require(session_id);
        auto &session = entry.session;
        if (is_terminal(session.status) || session.status == SessionStatus::Completed)
        {
            return snapshot(entry);
        }

        const auto next = progressed_status(session.status, entry.chunks.size(), session.total_chunks);
        auto updated = session;
        updated.updated_at = now;
        if (next != session.status)
        {
            spdlog::debug("Session {} {} -> {}", session_id, to_string(session.status), to_string(next));
            updated.status = next;
            if (next == SessionStatus::Completed)
            {
                updated.completed_at = now;
            }
        }
        persist_session(updated);
        session = std::move(updated);
        return snapshot(entry);
    }

    UploadSession JsonSessionRegistry::update_status(const std::string &session_id, SessionStatus status,
                                                     const std::optional<std::string> &finalized_file_id,
                                                     TimePoint now)
    {
        std::lock_guard lock(mutex_);
        auto &entry = require(session_id);
        auto &session = entry.session;
        if (!can_transition(session.status, status))
        {
            throw UploadError(chunkvault::ErrorCode::StateConflict,
                              "Session " + session_id + " cannot move from " + std::string(to_string(session.status)) +
                                  " to " + std::string(to_string(status)));
        }
        auto updated = session;
        updated.status = status;
        updated.updated_at = now;
        if (status == SessionStatus::Completed && !updated.completed_at)
        {
            updated.completed_at = now;
        }
        if (finalized_file_id)
        {
            updated.finalized_file_id = finalized_file_id;
        }
        persist_session(updated);
        session = std::move(updated);
        return snapshot(entry);
    }

    std::vector<UploadSession> JsonSessionRegistry::expired(TimePoint now) const
    {
        std::lock_guard lock(mutex_);
        std::vector<UploadSession> result;
        for (const auto &[id, entry] : entries_)
        {
            const auto status = entry.session.status;
            if (status == SessionStatus::Merged)
            {
                continue;
            }
            if (entry.session.is_expired(now) || status == SessionStatus::Cancelled ||
                status == SessionStatus::Expired)
            {
                result.push_back(snapshot(entry));
            }
        }
        return result;
    }

    void JsonSessionRegistry::remove_chunks(const std::string &session_id)
    {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(session_id);
        if (it == entries_.end())
        {
            return;
        }
        std::error_code ec;
        std::filesystem::remove_all(chunk_records_dir(session_id), ec);
        if (ec)
        {
            throw UploadError(chunkvault::ErrorCode::StorageFailure,
                              "Failed to delete chunk records of " + session_id + ": " + ec.message());
        }
        it->second.chunks.clear();
    }

    void JsonSessionRegistry::remove(const std::string &session_id)
    {
        std::lock_guard lock(mutex_);
        std::error_code ec;
        std::filesystem::remove_all(session_dir(session_id), ec);
        if (ec)
        {
            throw UploadError(chunkvault::ErrorCode::StorageFailure,
                              "Failed to delete session " + session_id + ": " + ec.message());
        }
        entries_.erase(session_id);
    }

    std::filesystem::path JsonSessionRegistry::session_dir(const std::string &session_id) const
    {
        storage_common::require_safe_identifier(session_id, "session id");
        return sessions_dir_ / session_id;
    }

    std::filesystem::path JsonSessionRegistry::chunk_records_dir(const std::string &session_id) const
    {
        return session_dir(session_id) / kChunkRecordsDir;
    }

    void JsonSessionRegistry::load_existing()
    {
        for (const auto &dir : std::filesystem::directory_iterator(sessions_dir_))
        {
            if (!dir.is_directory())
            {
                continue;
            }
            const auto session_file = dir.path() / kSessionFile;
            if (!std::filesystem::exists(session_file))
            {
                continue;
            }
            try
            {
                Entry entry{};
                entry.session = storage_common::read_json(session_file).get<UploadSession>();
                if (entry.session.session_id != dir.path().filename().string())
                {
                    spdlog::warn("Skipping session record {}: id does not match its directory",
                                 session_file.string());
                    continue;
                }
                const auto records_dir = dir.path() / kChunkRecordsDir;
                if (std::filesystem::is_directory(records_dir))
                {
                    for (const auto &file : std::filesystem::directory_iterator(records_dir))
                    {
                        if (!is_record_file(file))
                        {
                            continue;
                        }
                        auto record = storage_common::read_json(file.path()).get<ChunkRecord>();
                        if (record.index < entry.session.total_chunks)
                        {
                            entry.chunks.emplace(record.index, std::move(record));
                        }
                    }
                }
                reconcile_status(entry);
                entries_.emplace(entry.session.session_id, std::move(entry));
            }
            catch (const std::exception &ex)
            {
                spdlog::warn("Skipping unreadable session record {}: {}", session_file.string(), ex.what());
            }
        }
        spdlog::debug("Loaded {} upload sessions from {}", entries_.size(), sessions_dir_.string());
    }

    // A crash between persisting a chunk record and persisting the session leaves the
    // stored status behind its records; the records win.
    void JsonSessionRegistry::reconcile_status(Entry &entry) const
    {
        auto &session = entry.session;
        const auto next = progressed_status(session.status, entry.chunks.size(), session.total_chunks);
        if (next == session.status)
        {
            return;
        }
        spdlog::info("Session {} restored as {} from {} chunk records (was {})", session.session_id,
                     to_string(next), entry.chunks.size(), to_string(session.status));
        session.status = next;
        if (next == SessionStatus::Completed && !session.completed_at)
        {
            session.completed_at = session.updated_at;
        }
        try
        {
            persist_session(session);
        }
        catch (const std::exception &ex)
        {
            // Kept in memory; the next refresh persists it again.
            spdlog::warn("Cannot persist restored status of session {}: {}", session.session_id, ex.what());
        }
    }

    void JsonSessionRegistry::persist_session(const UploadSession &session) const
    {
        storage_common::write_json_atomically(session_dir(session.session_id) / kSessionFile, session);
    }

    JsonSessionRegistry::Entry &JsonSessionRegistry::require(const std::string &session_id)
    {
        auto it = entries_.find(session_id);
        if (it == entries_.end())
        {
            throw UploadError(chunkvault::ErrorCode::NotFound, "Unknown upload session " + session_id);
        }
        return it->second;
    }

    UploadSession JsonSessionRegistry::snapshot(const Entry &entry)
    {
        auto session = entry.session;
        session.uploaded_chunk_count = static_cast<std::uint32_t>(entry.chunks.size());
        return session;
    }

} // namespace chunkvault::server
