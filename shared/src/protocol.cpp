#include "chunkvault/protocol.hpp"

#include <array>
#include <stdexcept>

namespace chunkvault::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 11> kCommandMappings{{
            {Command::Ping, "PING"},
            {Command::UploadInit, "UPLOAD_INIT"},
            {Command::UploadChunk, "UPLOAD_CHUNK"},
            {Command::UploadStatus, "UPLOAD_STATUS"},
            {Command::UploadChunks, "UPLOAD_CHUNKS"},
            {Command::UploadMerge, "UPLOAD_MERGE"},
            {Command::UploadCancel, "UPLOAD_CANCEL"},
            {Command::ValidateChunk, "VALIDATE_CHUNK"},
            {Command::Cleanup, "CLEANUP"},
            {Command::PlanChunks, "PLAN_CHUNKS"},
            {Command::FileInfo, "FILE_INFO"},
        }};

        struct ResponseKindMapping
        {
            ResponseKind kind;
            std::string_view label;
        };

        constexpr std::array<ResponseKindMapping, 2> kResponseMappings{{
            {ResponseKind::Ok, "OK"},
            {ResponseKind::Error, "ERROR"},
        }};

        template <typename T>
        void write_optional(nlohmann::json &json, const char *key, const std::optional<T> &value)
        {
            if (value)
            {
                json[key] = *value;
            }
        }

        template <typename T>
        std::optional<T> read_optional(const nlohmann::json &json, const char *key)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                return it->get<T>();
            }
            return std::nullopt;
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.label == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(ResponseKind kind) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope)
    {
        json = {
            {"cmd", to_string(envelope.command)},
            {"payload", envelope.payload},
        };
        write_optional(json, "id", envelope.request_id);
    }

    void from_json(const nlohmann::json &json, RequestEnvelope &envelope)
    {
        const auto cmd_label = json.at("cmd").get<std::string>();
        auto cmd = command_from_string(cmd_label);
        if (!cmd)
        {
            throw std::runtime_error("Unknown command: " + cmd_label);
        }
        envelope.command = *cmd;
        envelope.payload = json.value("payload", nlohmann::json::object());
        envelope.request_id = read_optional<std::string>(json, "id");
    }

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope)
    {
        json = {
            {"status", to_string(envelope.kind)},
            {"error", to_int(envelope.error)},
            {"message", envelope.message},
            {"payload", envelope.payload},
        };
        write_optional(json, "id", envelope.request_id);
    }

    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope)
    {
        const auto status_label = json.at("status").get<std::string>();
        auto kind = response_kind_from_string(status_label);
        if (!kind)
        {
            throw std::runtime_error("Unknown response status: " + status_label);
        }
        envelope.kind = *kind;
        const auto error_value = json.value("error", 0u);
        envelope.error = error_code_from_int(static_cast<std::uint16_t>(error_value));
        envelope.message = json.value("message", std::string{});
        envelope.payload = json.value("payload", nlohmann::json::object());
        envelope.request_id = read_optional<std::string>(json, "id");
    }

    void to_json(nlohmann::json &json, const UploadInitRequest &request)
    {
        json = {
            {"file_name", request.file_name},
            {"total_size", request.total_size},
            {"chunk_size", request.chunk_size},
        };
        write_optional(json, "digest", request.declared_digest);
        write_optional(json, "owner", request.owner_id);
    }

    void from_json(const nlohmann::json &json, UploadInitRequest &request)
    {
        request.file_name = json.at("file_name").get<std::string>();
        request.total_size = json.at("total_size").get<std::uint64_t>();
        request.chunk_size = json.value("chunk_size", 0ULL);
        request.declared_digest = read_optional<std::string>(json, "digest");
        request.owner_id = read_optional<std::string>(json, "owner");
    }

    void to_json(nlohmann::json &json, const UploadInitResponse &response)
    {
        json = {
            {"session_id", response.session_id},
            {"total_chunks", response.total_chunks},
            {"chunk_size", response.chunk_size},
            {"expires_at", response.expires_at},
        };
    }

    void from_json(const nlohmann::json &json, UploadInitResponse &response)
    {
        response.session_id = json.at("session_id").get<std::string>();
        response.total_chunks = json.value("total_chunks", 0u);
        response.chunk_size = json.value("chunk_size", 0ULL);
        response.expires_at = json.value("expires_at", 0LL);
    }

    void to_json(nlohmann::json &json, const UploadChunkRequest &request)
    {
        json = {
            {"session_id", request.session_id},
            {"index", request.index},
            {"data", request.data_base64},
        };
        write_optional(json, "digest", request.chunk_digest);
    }

    void from_json(const nlohmann::json &json, UploadChunkRequest &request)
    {
        request.session_id = json.at("session_id").get<std::string>();
        request.index = json.at("index").get<std::uint32_t>();
        request.data_base64 = json.at("data").get<std::string>();
        request.chunk_digest = read_optional<std::string>(json, "digest");
    }

    void to_json(nlohmann::json &json, const UploadChunkResponse &response)
    {
        json = {
            {"session_id", response.session_id},
            {"index", response.index},
            {"uploaded_chunks", response.uploaded_chunks},
            {"total_chunks", response.total_chunks},
            {"progress", response.progress},
            {"already_present", response.already_present},
        };
    }

    void from_json(const nlohmann::json &json, UploadChunkResponse &response)
    {
        response.session_id = json.at("session_id").get<std::string>();
        response.index = json.value("index", 0u);
        response.uploaded_chunks = json.value("uploaded_chunks", 0u);
        response.total_chunks = json.value("total_chunks", 0u);
        response.progress = json.value("progress", 0.0);
        response.already_present = json.value("already_present", false);
    }

    void to_json(nlohmann::json &json, const SessionRequest &request)
    {
        json = {{"session_id", request.session_id}};
    }

    void from_json(const nlohmann::json &json, SessionRequest &request)
    {
        request.session_id = json.at("session_id").get<std::string>();
    }

    void to_json(nlohmann::json &json, const UploadStatusResponse &response)
    {
        json = {
            {"session_id", response.session_id},
            {"file_name", response.file_name},
            {"status", response.status},
            {"total_size", response.total_size},
            {"chunk_size", response.chunk_size},
            {"total_chunks", response.total_chunks},
            {"uploaded_chunks", response.uploaded_chunks},
            {"progress", response.progress},
            {"uploaded", response.uploaded_indices},
            {"missing", response.missing_indices},
            {"created_at", response.created_at},
            {"expires_at", response.expires_at},
        };
        write_optional(json, "digest", response.declared_digest);
        write_optional(json, "owner", response.owner_id);
        write_optional(json, "file_id", response.finalized_file_id);
    }

    void from_json(const nlohmann::json &json, UploadStatusResponse &response)
    {
        response.session_id = json.at("session_id").get<std::string>();
        response.file_name = json.value("file_name", std::string{});
        response.status = json.value("status", std::string{});
        response.total_size = json.value("total_size", 0ULL);
        response.chunk_size = json.value("chunk_size", 0ULL);
        response.total_chunks = json.value("total_chunks", 0u);
        response.uploaded_chunks = json.value("uploaded_chunks", 0u);
        response.progress = json.value("progress", 0.0);
        response.uploaded_indices = json.value("uploaded", std::vector<std::uint32_t>{});
        response.missing_indices = json.value("missing", std::vector<std::uint32_t>{});
        response.created_at = json.value("created_at", 0LL);
        response.expires_at = json.value("expires_at", 0LL);
        response.declared_digest = read_optional<std::string>(json, "digest");
        response.owner_id = read_optional<std::string>(json, "owner");
        response.finalized_file_id = read_optional<std::string>(json, "file_id");
    }

    void to_json(nlohmann::json &json, const UploadMergeRequest &request)
    {
        json = {{"session_id", request.session_id}};
        write_optional(json, "expected_digest", request.expected_digest);
    }

    void from_json(const nlohmann::json &json, UploadMergeRequest &request)
    {
        request.session_id = json.at("session_id").get<std::string>();
        request.expected_digest = read_optional<std::string>(json, "expected_digest");
    }

    void to_json(nlohmann::json &json, const FinalizedFileDescriptor &descriptor)
    {
        json = {
            {"file_id", descriptor.file_id},
            {"digest", descriptor.digest},
            {"size", descriptor.size},
            {"locator", descriptor.locator},
            {"created_at", descriptor.created_at},
        };
    }

    void from_json(const nlohmann::json &json, FinalizedFileDescriptor &descriptor)
    {
        descriptor.file_id = json.at("file_id").get<std::string>();
        descriptor.digest = json.at("digest").get<std::string>();
        descriptor.size = json.value("size", 0ULL);
        descriptor.locator = json.value("locator", std::string{});
        descriptor.created_at = json.value("created_at", 0LL);
    }

    void to_json(nlohmann::json &json, const UploadMergeResponse &response)
    {
        json = {
            {"session_id", response.session_id},
            {"file", response.file},
            {"deduplicated", response.deduplicated},
        };
    }

    void from_json(const nlohmann::json &json, UploadMergeResponse &response)
    {
        response.session_id = json.at("session_id").get<std::string>();
        response.file = json.at("file").get<FinalizedFileDescriptor>();
        response.deduplicated = json.value("deduplicated", false);
    }

    void to_json(nlohmann::json &json, const ValidateChunkRequest &request)
    {
        json = {
            {"session_id", request.session_id},
            {"index", request.index},
            {"expected_digest", request.expected_digest},
        };
    }

    void from_json(const nlohmann::json &json, ValidateChunkRequest &request)
    {
        request.session_id = json.at("session_id").get<std::string>();
        request.index = json.at("index").get<std::uint32_t>();
        request.expected_digest = json.at("expected_digest").get<std::string>();
    }

    void to_json(nlohmann::json &json, const PlanChunksRequest &request)
    {
        json = {
            {"total_size", request.total_size},
            {"chunk_size", request.chunk_size},
        };
    }

    void from_json(const nlohmann::json &json, PlanChunksRequest &request)
    {
        request.total_size = json.at("total_size").get<std::uint64_t>();
        request.chunk_size = json.value("chunk_size", 0ULL);
    }

    void to_json(nlohmann::json &json, const PlanChunksResponse &response)
    {
        json = {
            {"total_size", response.total_size},
            {"chunk_size", response.chunk_size},
            {"total_chunks", response.total_chunks},
            {"last_chunk_size", response.last_chunk_size},
        };
    }

    void from_json(const nlohmann::json &json, PlanChunksResponse &response)
    {
        response.total_size = json.value("total_size", 0ULL);
        response.chunk_size = json.value("chunk_size", 0ULL);
        response.total_chunks = json.value("total_chunks", 0u);
        response.last_chunk_size = json.value("last_chunk_size", 0ULL);
    }

    void to_json(nlohmann::json &json, const FileInfoRequest &request)
    {
        json = {{"file_id", request.file_id}};
    }

    void from_json(const nlohmann::json &json, FileInfoRequest &request)
    {
        request.file_id = json.at("file_id").get<std::string>();
    }

} // namespace chunkvault::protocol
