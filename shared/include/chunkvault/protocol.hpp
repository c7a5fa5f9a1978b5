/**
 * ChunkVault - Wire schema for the chunked upload service.
 *
 * Every request is a RequestEnvelope ({"cmd", "payload", "id"}) and every reply a
 * ResponseEnvelope ({"status", "error", "message", "payload", "id"}). Payload structs
 * below carry the fields of the individual commands. Timestamps are unix seconds.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkvault/error_codes.hpp"

namespace chunkvault::protocol
{

    enum class Command : std::uint8_t
    {
        Ping,
        UploadInit,
        UploadChunk,
        UploadStatus,
        UploadChunks,
        UploadMerge,
        UploadCancel,
        ValidateChunk,
        Cleanup,
        PlanChunks,
        FileInfo
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        Error = 1
    };

    std::string_view to_string(ResponseKind kind) noexcept;
    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept;

    struct RequestEnvelope
    {
        Command command{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope);
    void from_json(const nlohmann::json &json, RequestEnvelope &envelope);

    struct ResponseEnvelope
    {
        ResponseKind kind{ResponseKind::Ok};
        ErrorCode error{ErrorCode::Ok};
        std::string message{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope);
    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope);

    struct UploadInitRequest
    {
        std::string file_name;
        std::uint64_t total_size{};
        std::uint64_t chunk_size{};
        std::optional<std::string> declared_digest{};
        std::optional<std::string> owner_id{};
    };

    void to_json(nlohmann::json &json, const UploadInitRequest &request);
    void from_json(const nlohmann::json &json, UploadInitRequest &request);

    struct UploadInitResponse
    {
        std::string session_id;
        std::uint32_t total_chunks{};
        std::uint64_t chunk_size{};
        std::int64_t expires_at{};
    };

    void to_json(nlohmann::json &json, const UploadInitResponse &response);
    void from_json(const nlohmann::json &json, UploadInitResponse &response);

    struct UploadChunkRequest
    {
        std::string session_id;
        std::uint32_t index{};
        std::string data_base64;
        std::optional<std::string> chunk_digest{};
    };

    void to_json(nlohmann::json &json, const UploadChunkRequest &request);
    void from_json(const nlohmann::json &json, UploadChunkRequest &request);

    struct UploadChunkResponse
    {
        std::string session_id;
        std::uint32_t index{};
        std::uint32_t uploaded_chunks{};
        std::uint32_t total_chunks{};
        double progress{};
        bool already_present{};
    };

    void to_json(nlohmann::json &json, const UploadChunkResponse &response);
    void from_json(const nlohmann::json &json, UploadChunkResponse &response);

    // Used by UPLOAD_STATUS, UPLOAD_CHUNKS and UPLOAD_CANCEL.
    struct SessionRequest
    {
        std::string session_id;
    };

    void to_json(nlohmann::json &json, const SessionRequest &request);
    void from_json(const nlohmann::json &json, SessionRequest &request);

    struct UploadStatusResponse
    {
        std::string session_id;
        std::string file_name;
        std::string status;
        std::uint64_t total_size{};
        std::uint64_t chunk_size{};
        std::uint32_t total_chunks{};
        std::uint32_t uploaded_chunks{};
        double progress{};
        std::vector<std::uint32_t> uploaded_indices;
        std::vector<std::uint32_t> missing_indices;
        std::int64_t created_at{};
        std::int64_t expires_at{};
        std::optional<std::string> declared_digest{};
        std::optional<std::string> owner_id{};
        std::optional<std::string> finalized_file_id{};
    };

    void to_json(nlohmann::json &json, const UploadStatusResponse &response);
    void from_json(const nlohmann::json &json, UploadStatusResponse &response);

    struct UploadMergeRequest
    {
        std::string session_id;
        std::optional<std::string> expected_digest{};
    };

    void to_json(nlohmann::json &json, const UploadMergeRequest &request);
    void from_json(const nlohmann::json &json, UploadMergeRequest &request);

    struct FinalizedFileDescriptor
    {
        std::string file_id;
        std::string digest;
        std::uint64_t size{};
        std::string locator;
        std::int64_t created_at{};
    };

    void to_json(nlohmann::json &json, const FinalizedFileDescriptor &descriptor);
    void from_json(const nlohmann::json &json, FinalizedFileDescriptor &descriptor);

    struct UploadMergeResponse
    {
        std::string session_id;
        FinalizedFileDescriptor file;
        bool deduplicated{};
    };

    void to_json(nlohmann::json &json, const UploadMergeResponse &response);
    void from_json(const nlohmann::json &json, UploadMergeResponse &response);

    struct ValidateChunkRequest
    {
        std::string session_id;
        std::uint32_t index{};
        std::string expected_digest;
    };

    void to_json(nlohmann::json &json, const ValidateChunkRequest &request);
    void from_json(const nlohmann::json &json, ValidateChunkRequest &request);

    struct PlanChunksRequest
    {
        std::uint64_t total_size{};
        std::uint64_t chunk_size{};
    };

    void to_json(nlohmann::json &json, const PlanChunksRequest &request);
    void from_json(const nlohmann::json &json, PlanChunksRequest &request);

    struct PlanChunksResponse
    {
        std::uint64_t total_size{};
        std::uint64_t chunk_size{};
        std::uint32_t total_chunks{};
        std::uint64_t last_chunk_size{};
    };

    void to_json(nlohmann::json &json, const PlanChunksResponse &response);
    void from_json(const nlohmann::json &json, PlanChunksResponse &response);

    struct FileInfoRequest
    {
        std::string file_id;
    };

    void to_json(nlohmann::json &json, const FileInfoRequest &request);
    void from_json(const nlohmann::json &json, FileInfoRequest &request);

} // namespace chunkvault::protocol
