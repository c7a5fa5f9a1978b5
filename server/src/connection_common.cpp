#include "connection_common.hpp"

namespace chunkvault::server::connection_common
{

    chunkvault::protocol::ResponseEnvelope make_ok_response(nlohmann::json payload,
                                                            const std::optional<std::string> &request_id)
    {
        chunkvault::protocol::ResponseEnvelope envelope;
        envelope.kind = chunkvault::protocol::ResponseKind::Ok;
        envelope.payload = std::move(payload);
        envelope.message = "";
        envelope.error = chunkvault::ErrorCode::Ok;
        envelope.request_id = request_id;
        return envelope;
    }

    chunkvault::protocol::FinalizedFileDescriptor to_descriptor(const FinalizedFile &file)
    {
        return chunkvault::protocol::FinalizedFileDescriptor{
            .file_id = file.file_id,
            .digest = file.digest,
            .size = file.size,
            .locator = file.locator,
            .created_at = to_unix_seconds(file.created_at),
        };
    }

    chunkvault::protocol::UploadStatusResponse to_status_response(const SessionStatusReport &report)
    {
        const auto &session = report.session;
        chunkvault::protocol::UploadStatusResponse response{};
        response.session_id = session.session_id;
        response.file_name = session.file_name;
        response.status = std::string(to_string(session.status));
        response.total_size = session.total_size;
        response.chunk_size = session.chunk_size;
        response.total_chunks = session.total_chunks;
        response.uploaded_chunks = session.uploaded_chunk_count;
        response.progress = report.progress_percent;
        response.uploaded_indices = report.uploaded;
        response.missing_indices = report.missing;
        response.created_at = to_unix_seconds(session.created_at);
        response.expires_at = to_unix_seconds(session.expires_at);
        response.declared_digest = session.declared_digest;
        response.owner_id = session.owner_id;
        response.finalized_file_id = session.finalized_file_id;
        return response;
    }

} // namespace chunkvault::server::connection_common
