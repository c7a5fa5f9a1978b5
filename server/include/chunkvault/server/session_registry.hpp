#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "chunkvault/server/upload_session.hpp"

namespace chunkvault::server
{

    /// Durable store of upload sessions and their chunk records.
    ///
    /// Every read returns sessions with `uploaded_chunk_count` recomputed from the
    /// chunk records held at the time of the call.
    class SessionRegistry
    {
    public:
        virtual ~SessionRegistry() = default;

        virtual void create(const UploadSession &session) = 0;
        virtual std::optional<UploadSession> find(const std::string &session_id) const = 0;
        virtual std::vector<UploadSession> list() const = 0;

        /// Returns false when a record for the same index already exists. Throws
        /// UploadError(NotFound) if the session has been removed.
        virtual bool insert_chunk(const ChunkRecord &record) = 0;
        virtual std::optional<ChunkRecord> find_chunk(const std::string &session_id, std::uint32_t index) const = 0;
        /// Chunk records ordered by index.
        virtual std::vector<ChunkRecord> chunks(const std::string &session_id) const = 0;

        /// Moves Initialized/Uploading sessions along the forward path according to
        /// their chunk count and returns the updated session.
        virtual UploadSession refresh_progress(const std::string &session_id, TimePoint now) = 0;

        /// Throws UploadError(StateConflict) when the transition is not allowed.
        virtual UploadSession update_status(const std::string &session_id, SessionStatus status,
                                            const std::optional<std::string> &finalized_file_id, TimePoint now) = 0;

        /// Sessions the sweeper should delete: not Merged, and either past their
        /// deadline or already Cancelled/Expired.
        virtual std::vector<UploadSession> expired(TimePoint now) const = 0;

        virtual void remove_chunks(const std::string &session_id) = 0;
        virtual void remove(const std::string &session_id) = 0;
    };

    // Layout: <root>/.chunkvault/sessions/<id>/session.json and chunks/<index>.json
    class JsonSessionRegistry final : public SessionRegistry
    {
    public:
        explicit JsonSessionRegistry(std::filesystem::path storage_root);

        void create(const UploadSession &session) override;
        std::optional<UploadSession> find(const std::string &session_id) const override;
        std::vector<UploadSession> list() const override;

        bool insert_chunk(const ChunkRecord &record) override;
        std::optional<ChunkRecord> find_chunk(const std::string &session_id, std::uint32_t index) const override;
        std::vector<ChunkRecord> chunks(const std::string &session_id) const override;

        UploadSession refresh_progress(const std::string &session_id, TimePoint now) override;
        UploadSession update_status(const std::string &session_id, SessionStatus status,
                                    const std::optional<std::string> &finalized_file_id, TimePoint now) override;

        std::vector<UploadSession> expired(TimePoint now) const override;

        void remove_chunks(const std::string &session_id) override;
        void remove(const std::string &session_id) override;

    private:
        struct Entry
        {
            UploadSession session;
            std::map<std::uint32_t, ChunkRecord> chunks;
        };

        std::filesystem::path session_dir(const std::string &session_id) const;
        std::filesystem::path chunk_records_dir(const std::string &session_id) const;

        void load_existing();
        void reconcile_status(Entry &entry) const;
        void persist_session(const UploadSession &session) const;
        Entry &require(const std::string &session_id);
        static UploadSession snapshot(const Entry &entry);

        std::filesystem::path sessions_dir_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, Entry> entries_;
    };

} // namespace chunkvault::server
