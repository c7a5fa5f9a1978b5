#include "chunkvault/server/connection.hpp"

#include <nlohmann/json.hpp>

#include "chunkvault/encoding/base64.hpp"
#include "chunkvault/server/upload_error.hpp"
#include "chunkvault/version.hpp"
#include "connection_common.hpp"

namespace chunkvault::server
{

    nlohmann::json Connection::handle_ping(const nlohmann::json & /*payload*/)
    {
        return {{"pong", true}, {"version", std::string(chunkvault::version())}};
    }

    nlohmann::json Connection::handle_upload_init(const nlohmann::json &payload)
    {
        const auto request = payload.get<chunkvault::protocol::UploadInitRequest>();
        const auto result = services_.uploads.init(InitRequest{
            .file_name = request.file_name,
            .total_size = request.total_size,
            .chunk_size = request.chunk_size,
            .declared_digest = request.declared_digest,
            .owner_id = request.owner_id,
        });
        return chunkvault::protocol::UploadInitResponse{
            .session_id = result.session_id,
            .total_chunks = result.total_chunks,
            .chunk_size = result.chunk_size,
            .expires_at = to_unix_seconds(result.expires_at),
        };
    }

    nlohmann::json Connection::handle_upload_chunk(const nlohmann::json &payload)
    {
        const auto request = payload.get<chunkvault::protocol::UploadChunkRequest>();
        const auto data = chunkvault::encoding::decode_base64(request.data_base64);
        if (!data)
        {
            throw UploadError(chunkvault::ErrorCode::InvalidArgument, "Chunk data is not valid base64");
        }
        const auto result = services_.uploads.upload_chunk(request.session_id, request.index, *data,
                                                           request.chunk_digest);
        return chunkvault::protocol::UploadChunkResponse{
            .session_id = request.session_id,
            .index = request.index,
            .uploaded_chunks = result.uploaded_chunk_count,
            .total_chunks = result.total_chunks,
            .progress = result.progress_percent,
            .already_present = result.already_present,
        };
    }

    nlohmann::json Connection::handle_upload_status(const nlohmann::json &payload)
    {
        const auto request = payload.get<chunkvault::protocol::SessionRequest>();
        return connection_common::to_status_response(services_.uploads.status(request.session_id));
    }

    nlohmann::json Connection::handle_upload_chunks(const nlohmann::json &payload)
    {
        const auto request = payload.get<chunkvault::protocol::SessionRequest>();
        nlohmann::json response;
        response["session_id"] = request.session_id;
        response["uploaded"] = services_.uploads.uploaded_chunks(request.session_id);
        return response;
    }

    nlohmann::json Connection::handle_upload_merge(const nlohmann::json &payload)
    {
        const auto request = payload.get<chunkvault::protocol::UploadMergeRequest>();
        const auto result = services_.uploads.merge(request.session_id, request.expected_digest);
        return chunkvault::protocol::UploadMergeResponse{
            .session_id = request.session_id,
            .file = connection_common::to_descriptor(result.file),
            .deduplicated = result.deduplicated,
        };
    }

    nlohmann::json Connection::handle_upload_cancel(const nlohmann::json &payload)
    {
        const auto request = payload.get<chunkvault::protocol::SessionRequest>();
        nlohmann::json response;
        response["session_id"] = request.session_id;
        response["cancelled"] = services_.uploads.cancel(request.session_id);
        return response;
    }

    nlohmann::json Connection::handle_validate_chunk(const nlohmann::json &payload)
    {
        const auto request = payload.get<chunkvault::protocol::ValidateChunkRequest>();
        nlohmann::json response;
        response["session_id"] = request.session_id;
        response["index"] = request.index;
        response["valid"] = services_.uploads.validate_chunk(request.session_id, request.index, request.expected_digest);
        return response;
    }

    nlohmann::json Connection::handle_cleanup(const nlohmann::json & /*payload*/)
    {
        return {{"removed", services_.uploads.cleanup_expired()}};
    }

    nlohmann::json Connection::handle_plan_chunks(const nlohmann::json &payload)
    {
        const auto request = payload.get<chunkvault::protocol::PlanChunksRequest>();
        const auto plan = services_.uploads.plan(request.total_size, request.chunk_size);
        return chunkvault::protocol::PlanChunksResponse{
            .total_size = plan.total_size,
            .chunk_size = plan.chunk_size,
            .total_chunks = plan.total_chunks,
            .last_chunk_size = plan.last_chunk_size,
        };
    }

    nlohmann::json Connection::handle_file_info(const nlohmann::json &payload)
    {
        const auto request = payload.get<chunkvault::protocol::FileInfoRequest>();
        return connection_common::to_descriptor(services_.uploads.finalized_file(request.file_id));
    }

} // namespace chunkvault::server
