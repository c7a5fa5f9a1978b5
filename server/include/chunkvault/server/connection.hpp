#pragma once

#include <asio/ip/tcp.hpp>
#include <array>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "chunkvault/error_codes.hpp"
#include "chunkvault/framing.hpp"
#include "chunkvault/protocol.hpp"
#include "chunkvault/server/connection_registry.hpp"
#include "chunkvault/server/upload_manager.hpp"

namespace chunkvault::server
{

    struct ConnectionServices
    {
        UploadManager &uploads;
        ConnectionRegistry &connections;
    };

    /// One client connection. Reads length-prefixed JSON requests, runs them against
    /// the UploadManager and queues the responses in request order.
    ///
    /// All handlers run on the socket's executor, which the server makes a strand.
    class Connection : public std::enable_shared_from_this<Connection>
    {
    public:
        Connection(asio::ip::tcp::socket socket, ConnectionServices services, std::uint64_t id);
        ~Connection();

        void start();

        void stop();

        // Thread-safe: schedules stop() on the connection's executor.
        void close();

        std::uint64_t id() const noexcept { return id_; }

    private:
        using Handler = std::function<nlohmann::json()>;

        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void process_message(const nlohmann::json &json);
        void respond(const chunkvault::protocol::RequestEnvelope &envelope, const Handler &handler);
        void send_response(const chunkvault::protocol::ResponseEnvelope &envelope);
        void send_error(chunkvault::ErrorCode code, std::string message,
                        std::optional<std::string> request_id = std::nullopt);
        void write_next();
        void on_disconnect();

        // Command handlers; each returns the response payload or throws.
        nlohmann::json handle_ping(const nlohmann::json &payload);
        nlohmann::json handle_upload_init(const nlohmann::json &payload);
        nlohmann::json handle_upload_chunk(const nlohmann::json &payload);
        nlohmann::json handle_upload_status(const nlohmann::json &payload);
        nlohmann::json handle_upload_chunks(const nlohmann::json &payload);
        nlohmann::json handle_upload_merge(const nlohmann::json &payload);
        nlohmann::json handle_upload_cancel(const nlohmann::json &payload);
        nlohmann::json handle_validate_chunk(const nlohmann::json &payload);
        nlohmann::json handle_cleanup(const nlohmann::json &payload);
        nlohmann::json handle_plan_chunks(const nlohmann::json &payload);
        nlohmann::json handle_file_info(const nlohmann::json &payload);

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        ConnectionServices services_;
        std::uint64_t id_;

        chunkvault::protocol::FrameHeaderBytes header_buffer_{};
        std::vector<std::uint8_t> buffer_;
        std::deque<std::vector<std::uint8_t>> outbound_;
        bool stopped_{false};
    };

} // namespace chunkvault::server
