#include "chunkvault/server/upload_session.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <stdexcept>

#include "chunkvault/server/upload_error.hpp"

namespace chunkvault::server
{

    UploadError::UploadError(chunkvault::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    namespace
    {
        struct StatusMapping
        {
            SessionStatus status;
            std::string_view label;
        };

        constexpr std::array<StatusMapping, 6> kStatusMappings{{
            {SessionStatus::Initialized, "Initialized"},
            {SessionStatus::Uploading, "Uploading"},
            {SessionStatus::Completed, "Completed"},
            {SessionStatus::Merged, "Merged"},
            {SessionStatus::Cancelled, "Cancelled"},
            {SessionStatus::Expired, "Expired"},
        }};

        // Position along the forward path; terminal states that leave it rank last.
        int rank(SessionStatus status) noexcept
        {
            switch (status)
            {
            case SessionStatus::Initialized:
                return 0;
            case SessionStatus::Uploading:
                return 1;
            case SessionStatus::Completed:
                return 2;
            case SessionStatus::Merged:
                return 3;
            default:
                return 4;
            }
        }

        template <typename T>
        std::optional<T> optional_field(const nlohmann::json &json, const char *key)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                return it->get<T>();
            }
            return std::nullopt;
        }
    } // namespace

    std::string_view to_string(SessionStatus status) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.status == status)
            {
                return mapping.label;
            }
        }
        return "Unknown";
    }

    std::optional<SessionStatus> session_status_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.label == value)
            {
                return mapping.status;
            }
        }
        return std::nullopt;
    }

    bool can_transition(SessionStatus from, SessionStatus to) noexcept
    {
        if (is_terminal(from))
        {
            return false;
        }
        if (to == SessionStatus::Cancelled || to == SessionStatus::Expired)
        {
            return true;
        }
        if (to == SessionStatus::Merged)
        {
            return from == SessionStatus::Completed;
        }
        return rank(to) > rank(from);
    }

    ChunkPlan plan_chunks(std::uint64_t total_size, std::uint64_t chunk_size)
    {
        if (total_size == 0)
        {
            throw std::invalid_argument("Total size must be positive");
        }
        if (chunk_size == 0)
        {
            throw std::invalid_argument("Chunk size must be positive");
        }
        const auto chunk_count = (total_size + chunk_size - 1) / chunk_size;
        if (chunk_count > std::numeric_limits<std::uint32_t>::max())
        {
            throw std::invalid_argument("File would need more than 2^32-1 chunks");
        }
        const auto total_chunks = static_cast<std::uint32_t>(chunk_count);
        return ChunkPlan{
            .total_size = total_size,
            .chunk_size = chunk_size,
            .total_chunks = total_chunks,
            .last_chunk_size = total_size - static_cast<std::uint64_t>(total_chunks - 1) * chunk_size,
        };
    }

    std::uint64_t expected_chunk_size(std::uint64_t total_size, std::uint64_t chunk_size, std::uint32_t index)
    {
        const auto offset = static_cast<std::uint64_t>(index) * chunk_size;
        if (offset >= total_size)
        {
            return 0;
        }
        return std::min(chunk_size, total_size - offset);
    }

    double progress_percent(std::uint32_t uploaded, std::uint32_t total) noexcept
    {
        if (total == 0)
        {
            return 0.0;
        }
        return static_cast<double>(uploaded) * 100.0 / static_cast<double>(total);
    }

    std::int64_t to_unix_seconds(TimePoint time) noexcept
    {
        return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
    }

    TimePoint from_unix_seconds(std::int64_t seconds) noexcept
    {
        return TimePoint{std::chrono::seconds{seconds}};
    }

    void to_json(nlohmann::json &json, const UploadSession &session)
    {
        json = {
            {"session_id", session.session_id},
            {"file_name", session.file_name},
            {"total_size", session.total_size},
            {"chunk_size", session.chunk_size},
            {"total_chunks", session.total_chunks},
            {"status", to_string(session.status)},
            {"created_at", to_unix_seconds(session.created_at)},
            {"updated_at", to_unix_seconds(session.updated_at)},
            {"expires_at", to_unix_seconds(session.expires_at)},
        };
        if (session.declared_digest)
        {
            json["declared_digest"] = *session.declared_digest;
        }
        if (session.owner_id)
        {
            json["owner_id"] = *session.owner_id;
        }
        if (session.completed_at)
        {
            json["completed_at"] = to_unix_seconds(*session.completed_at);
        }
        if (session.finalized_file_id)
        {
            json["finalized_file_id"] = *session.finalized_file_id;
        }
    }

    void from_json(const nlohmann::json &json, UploadSession &session)
    {
        session.session_id = json.at("session_id").get<std::string>();
        session.file_name = json.at("file_name").get<std::string>();
        session.total_size = json.at("total_size").get<std::uint64_t>();
        session.chunk_size = json.at("chunk_size").get<std::uint64_t>();
        session.total_chunks = json.at("total_chunks").get<std::uint32_t>();
        const auto status_label = json.at("status").get<std::string>();
        const auto status = session_status_from_string(status_label);
        if (!status)
        {
            throw std::runtime_error("Unknown session status: " + status_label);
        }
        session.status = *status;
        session.created_at = from_unix_seconds(json.value("created_at", 0LL));
        session.updated_at = from_unix_seconds(json.value("updated_at", 0LL));
        session.expires_at = from_unix_seconds(json.value("expires_at", 0LL));
        session.declared_digest = optional_field<std::string>(json, "declared_digest");
        session.owner_id = optional_field<std::string>(json, "owner_id");
        if (auto completed = optional_field<std::int64_t>(json, "completed_at"))
        {
            session.completed_at = from_unix_seconds(*completed);
        }
        else
        {
            session.completed_at.reset();
        }
        session.finalized_file_id = optional_field<std::string>(json, "finalized_file_id");
        session.uploaded_chunk_count = 0;
    }

    void to_json(nlohmann::json &json, const ChunkRecord &record)
    {
        json = {
            {"session_id", record.session_id},
            {"index", record.index},
            {"size", record.size},
            {"locator", record.locator},
            {"uploaded_at", to_unix_seconds(record.uploaded_at)},
        };
        if (record.digest)
        {
            json["digest"] = *record.digest;
        }
    }

    void from_json(const nlohmann::json &json, ChunkRecord &record)
    {
        record.session_id = json.at("session_id").get<std::string>();
        record.index = json.at("index").get<std::uint32_t>();
        record.size = json.at("size").get<std::uint64_t>();
        record.locator = json.value("locator", std::string{});
        record.uploaded_at = from_unix_seconds(json.value("uploaded_at", 0LL));
        record.digest = optional_field<std::string>(json, "digest");
    }

    void to_json(nlohmann::json &json, const FinalizedFile &file)
    {
        json = {
            {"file_id", file.file_id},
            {"digest", file.digest},
            {"size", file.size},
            {"locator", file.locator},
            {"created_at", to_unix_seconds(file.created_at)},
        };
    }

    void from_json(const nlohmann::json &json, FinalizedFile &file)
    {
        file.file_id = json.at("file_id").get<std::string>();
        file.digest = json.at("digest").get<std::string>();
        file.size = json.at("size").get<std::uint64_t>();
        file.locator = json.at("locator").get<std::string>();
        file.created_at = from_unix_seconds(json.value("created_at", 0LL));
    }

} // namespace chunkvault::server
