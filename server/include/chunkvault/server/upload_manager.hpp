#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <vector>

#include <asio/thread_pool.hpp>

#include "chunkvault/server/blob_store.hpp"
#include "chunkvault/server/chunk_store.hpp"
#include "chunkvault/server/config.hpp"
#include "chunkvault/server/content_index.hpp"
#include "chunkvault/server/session_registry.hpp"
#include "chunkvault/server/upload_session.hpp"

namespace chunkvault::server
{

    struct UploadServices
    {
        SessionRegistry &registry;
        ChunkStore &chunks;
        ContentIndex &index;
        BlobStore &blobs;
    };

    struct InitRequest
    {
        std::string file_name;
        std::uint64_t total_size{};
        // 0 selects the configured default.
        std::uint64_t chunk_size{};
        std::optional<std::string> declared_digest;
        std::optional<std::string> owner_id;
    };

    struct InitResult
    {
        std::string session_id;
        std::uint32_t total_chunks{};
        std::uint64_t chunk_size{};
        TimePoint expires_at{};
    };

    struct ChunkResult
    {
        std::uint32_t uploaded_chunk_count{};
        std::uint32_t total_chunks{};
        double progress_percent{};
        bool already_present{};
        SessionStatus status{SessionStatus::Initialized};
    };

    struct SessionStatusReport
    {
        UploadSession session;
        std::vector<std::uint32_t> uploaded;
        std::vector<std::uint32_t> missing;
        double progress_percent{};
    };

    struct MergeResult
    {
        FinalizedFile file;
        bool deduplicated{};
    };

    /// Drives upload sessions through Initialized -> Uploading -> Completed -> Merged.
    ///
    /// All operations are safe to call concurrently. Failures are reported as
    /// UploadError carrying the matching ErrorCode; validation failures never leave
    /// partial state behind.
    class UploadManager
    {
    public:
        using Clock = std::function<TimePoint()>;

        UploadManager(UploadConfig config, UploadServices services, Clock clock = {});
        ~UploadManager();

        UploadManager(const UploadManager &) = delete;
        UploadManager &operator=(const UploadManager &) = delete;

        InitResult init(const InitRequest &request);

        ChunkResult upload_chunk(const std::string &session_id, std::uint32_t index,
                                 std::span<const std::byte> data,
                                 const std::optional<std::string> &chunk_digest = std::nullopt);

        SessionStatusReport status(const std::string &session_id) const;

        std::vector<std::uint32_t> uploaded_chunks(const std::string &session_id) const;

        MergeResult merge(const std::string &session_id,
                          const std::optional<std::string> &expected_digest = std::nullopt);

        // Returns true when this call moved the session to Cancelled.
        bool cancel(const std::string &session_id);

        bool validate_chunk(const std::string &session_id, std::uint32_t index, const std::string &expected_digest) const;

        // Deletes expired, cancelled and orphaned sessions; returns how many were removed.
        std::size_t cleanup_expired();

        ChunkPlan plan(std::uint64_t total_size, std::uint64_t chunk_size) const;

        FinalizedFile finalized_file(const std::string &file_id) const;

        // Blocks until chunk releases queued by merge() have finished.
        void wait_for_background_tasks();

        const UploadConfig &config() const noexcept { return config_; }

    private:
        TimePoint now() const;
        UploadSession require_session(const std::string &session_id) const;
        std::uint64_t resolve_chunk_size(std::uint64_t requested) const;
        void validate_file_name(const std::string &file_name) const;
        // Skipped while a merge of the session is running.
        void mark_expired(const UploadSession &session);
        void persist_expired(const UploadSession &session);
        MergeResult assemble(const UploadSession &session, const std::vector<ChunkRecord> &records,
                             const std::optional<std::string> &expected_digest);
        void release_chunks(const std::string &session_id);
        void release_chunks_async(const std::string &session_id);

        UploadConfig config_;
        UploadServices services_;
        Clock clock_;

        mutable std::mutex merge_mutex_;
        std::set<std::string> merges_in_flight_;

        std::mutex background_mutex_;
        std::condition_variable background_cv_;
        std::size_t pending_background_{0};
        asio::thread_pool background_{1};
    };

} // namespace chunkvault::server
