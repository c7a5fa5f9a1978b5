#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <cstdint>
#include <thread>
#include <vector>

#include "chunkvault/server/blob_store.hpp"
#include "chunkvault/server/chunk_store.hpp"
#include "chunkvault/server/config.hpp"
#include "chunkvault/server/connection_registry.hpp"
#include "chunkvault/server/content_index.hpp"
#include "chunkvault/server/expiry_sweeper.hpp"
#include "chunkvault/server/session_registry.hpp"
#include "chunkvault/server/upload_manager.hpp"

namespace chunkvault::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        void run();

        // Port the acceptor is bound to; differs from the configured one when that was 0.
        std::uint16_t port() const;

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void handle_signal();

        ServerConfig config_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;

        JsonSessionRegistry sessions_;
        FilesystemChunkStore chunks_;
        JsonContentIndex index_;
        FilesystemBlobStore blobs_;
        UploadManager uploads_;
        ExpirySweeper sweeper_;
        ConnectionRegistry connections_;

        std::vector<std::thread> workers_;
    };

} // namespace chunkvault::server
