#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "chunkvault/protocol.hpp"
#include "chunkvault/server/upload_manager.hpp"

namespace chunkvault::server::connection_common
{

    chunkvault::protocol::ResponseEnvelope make_ok_response(nlohmann::json payload,
                                                            const std::optional<std::string> &request_id);

    chunkvault::protocol::FinalizedFileDescriptor to_descriptor(const FinalizedFile &file);

    chunkvault::protocol::UploadStatusResponse to_status_response(const SessionStatusReport &report);

} // namespace chunkvault::server::connection_common
