#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace chunkvault::server
{

    using TimePoint = std::chrono::system_clock::time_point;

    enum class SessionStatus : std::uint8_t
    {
        Initialized,
        Uploading,
        Completed,
        Merged,
        Cancelled,
        Expired
    };

    std::string_view to_string(SessionStatus status) noexcept;
    std::optional<SessionStatus> session_status_from_string(std::string_view value) noexcept;

    constexpr bool is_terminal(SessionStatus status) noexcept
    {
        return status == SessionStatus::Merged || status == SessionStatus::Cancelled ||
               status == SessionStatus::Expired;
    }

    // Transitions only move forward: Initialized -> Uploading -> Completed -> Merged, and any
    // non-terminal state may end in Cancelled or Expired.
    bool can_transition(SessionStatus from, SessionStatus to) noexcept;

    struct UploadSession
    {
        std::string session_id;
        std::string file_name;
        std::uint64_t total_size{};
        std::optional<std::string> declared_digest;
        std::uint64_t chunk_size{};
        std::uint32_t total_chunks{};
        // Derived from the chunk records on every read; never persisted.
        std::uint32_t uploaded_chunk_count{};
        SessionStatus status{SessionStatus::Initialized};
        std::optional<std::string> owner_id;
        TimePoint created_at{};
        TimePoint updated_at{};
        TimePoint expires_at{};
        std::optional<TimePoint> completed_at;
        std::optional<std::string> finalized_file_id;

        bool is_expired(TimePoint now) const noexcept { return now >= expires_at; }
    };

    struct ChunkRecord
    {
        std::string session_id;
        std::uint32_t index{};
        std::uint64_t size{};
        std::optional<std::string> digest;
        std::string locator;
        TimePoint uploaded_at{};
    };

    struct FinalizedFile
    {
        std::string file_id;
        std::string digest;
        std::uint64_t size{};
        std::string locator;
        TimePoint created_at{};
    };

    struct ChunkPlan
    {
        std::uint64_t total_size{};
        std::uint64_t chunk_size{};
        std::uint32_t total_chunks{};
        std::uint64_t last_chunk_size{};
    };

    /// Splits `total_size` bytes into ceil(total_size / chunk_size) chunks. Every chunk
    /// has `chunk_size` bytes except the last, which holds the remainder. Throws
    /// std::invalid_argument when either size is zero or the chunk count overflows.
    ChunkPlan plan_chunks(std::uint64_t total_size, std::uint64_t chunk_size);

    std::uint64_t expected_chunk_size(std::uint64_t total_size, std::uint64_t chunk_size, std::uint32_t index);

    double progress_percent(std::uint32_t uploaded, std::uint32_t total) noexcept;

    std::int64_t to_unix_seconds(TimePoint time) noexcept;
    TimePoint from_unix_seconds(std::int64_t seconds) noexcept;

    void to_json(nlohmann::json &json, const UploadSession &session);
    void from_json(const nlohmann::json &json, UploadSession &session);

    void to_json(nlohmann::json &json, const ChunkRecord &record);
    void from_json(const nlohmann::json &json, ChunkRecord &record);

    void to_json(nlohmann::json &json, const FinalizedFile &file);
    void from_json(const nlohmann::json &json, FinalizedFile &file);

} // namespace chunkvault::server
