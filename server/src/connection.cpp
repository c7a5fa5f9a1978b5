#include "chunkvault/server/connection.hpp"

#include <asio/post.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>
#include <nlohmann/json.hpp>

#include <span>
#include <stdexcept>
#include <string>

#include "chunkvault/framing.hpp"
#include "chunkvault/server/upload_error.hpp"
#include "connection_common.hpp"

#include <spdlog/spdlog.h>

namespace chunkvault::server
{

    Connection::Connection(asio::ip::tcp::socket socket, ConnectionServices services, std::uint64_t id)
        : socket_(std::move(socket)), services_(services), id_(id) {}

    Connection::~Connection()
    {
        std::error_code ec;
        socket_.close(ec);
    }

    void Connection::start()
    {
        spdlog::info("Client #{} connected from {}", id_, remote_endpoint());
        read_frame_header();
    }

    void Connection::stop()
    {
        if (stopped_)
        {
            return;
        }
        stopped_ = true;
        std::error_code ec;
        spdlog::info("Closing connection #{} ({})", id_, remote_endpoint());
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        on_disconnect();
    }

    void Connection::close()
    {
        auto self = shared_from_this();
        asio::post(socket_.get_executor(), [self]
                   { self->stop(); });
    }

    void Connection::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             chunkvault::protocol::FrameHeader header;
                             try
                             {
                                 header = chunkvault::protocol::parse_frame_header(header_buffer_);
                             }
                             catch (const std::length_error &ex)
                             {
                                 spdlog::warn("Client #{} closed: {}", id_, ex.what());
                                 stop();
                                 return;
                             }
                             if (header.keep_alive())
                             {
                                 read_frame_header();
                                 return;
                             }
                             buffer_.resize(header.payload_size);
                             read_frame_payload(header.payload_size);
                         });
    }

    void Connection::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data(), size),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             try
                             {
                                 process_message(chunkvault::protocol::parse_frame_payload(buffer_));
                             }
                             catch (const nlohmann::json::exception &ex)
                             {
                                 send_error(chunkvault::ErrorCode::InvalidCommand, ex.what());
                             }
                             read_frame_header();
                         });
    }

    void Connection::process_message(const nlohmann::json &json)
    {
        chunkvault::protocol::RequestEnvelope envelope;
        try
        {
            envelope = json.get<chunkvault::protocol::RequestEnvelope>();
        }
        catch (const std::exception &ex)
        {
            send_error(chunkvault::ErrorCode::InvalidCommand, ex.what());
            return;
        }

        spdlog::debug("#{} -> command {}", id_, chunkvault::protocol::to_string(envelope.command));
        const auto &payload = envelope.payload;

        using chunkvault::protocol::Command;
        switch (envelope.command)
        {
        case Command::Ping:
            respond(envelope, [&]
                    { return handle_ping(payload); });
            break;
        case Command::UploadInit:
            respond(envelope, [&]
                    { return handle_upload_init(payload); });
            break;
        case Command::UploadChunk:
            respond(envelope, [&]
                    { return handle_upload_chunk(payload); });
            break;
        case Command::UploadStatus:
            respond(envelope, [&]
                    { return handle_upload_status(payload); });
            break;
        case Command::UploadChunks:
            respond(envelope, [&]
                    { return handle_upload_chunks(payload); });
            break;
        case Command::UploadMerge:
            respond(envelope, [&]
                    { return handle_upload_merge(payload); });
            break;
        case Command::UploadCancel:
            respond(envelope, [&]
                    { return handle_upload_cancel(payload); });
            break;
        case Command::ValidateChunk:
            respond(envelope, [&]
                    { return handle_validate_chunk(payload); });
            break;
        case Command::Cleanup:
            respond(envelope, [&]
                    { return handle_cleanup(payload); });
            break;
        case Command::PlanChunks:
            respond(envelope, [&]
                    { return handle_plan_chunks(payload); });
            break;
        case Command::FileInfo:
            respond(envelope, [&]
                    { return handle_file_info(payload); });
            break;
        default:
            send_error(chunkvault::ErrorCode::Unsupported, "Command not supported", envelope.request_id);
            break;
        }
    }

    void Connection::respond(const chunkvault::protocol::RequestEnvelope &envelope, const Handler &handler)
    {
        try
        {
            send_response(connection_common::make_ok_response(handler(), envelope.request_id));
        }
        catch (const UploadError &ex)
        {
            send_error(ex.code(), ex.what(), envelope.request_id);
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(chunkvault::ErrorCode::InvalidArgument, ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Command {} from #{} failed: {}", chunkvault::protocol::to_string(envelope.command), id_,
                          ex.what());
            send_error(chunkvault::ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

    void Connection::send_response(const chunkvault::protocol::ResponseEnvelope &envelope)
    {
        if (stopped_)
        {
            return;
        }
        try
        {
            const auto json = nlohmann::json(envelope);
            outbound_.push_back(chunkvault::protocol::encode_frame(json));
        }
        catch (const std::length_error &ex)
        {
            send_error(chunkvault::ErrorCode::InternalError, ex.what(), envelope.request_id);
            return;
        }
        if (outbound_.size() == 1)
        {
            write_next();
        }
    }

    void Connection::send_error(chunkvault::ErrorCode code, std::string message, std::optional<std::string> request_id)
    {
        chunkvault::protocol::ResponseEnvelope envelope;
        envelope.kind = chunkvault::protocol::ResponseKind::Error;
        envelope.error = code;
        envelope.message = std::move(message);
        envelope.request_id = std::move(request_id);
        send_response(envelope);
    }

    void Connection::write_next()
    {
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(outbound_.front()),
                          [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  stop();
                                  return;
                              }
                              outbound_.pop_front();
                              if (!outbound_.empty())
                              {
                                  write_next();
                              }
                          });
    }

    void Connection::on_disconnect()
    {
        services_.connections.remove(id_);
    }

    std::string Connection::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace chunkvault::server
