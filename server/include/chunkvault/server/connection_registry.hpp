#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>

namespace chunkvault::server
{

    class Connection;

    /// Tracks live client connections so the server can close them on shutdown.
    /// Holds weak references only; a connection's lifetime is owned by its pending I/O.
    class ConnectionRegistry
    {
    public:
        std::uint64_t next_id() noexcept;

        void add(const std::shared_ptr<Connection> &connection);
        void remove(std::uint64_t id);

        std::size_t size() const;

        // Asks every live connection to stop on its own executor.
        void close_all();

    private:
        mutable std::mutex mutex_;
        std::map<std::uint64_t, std::weak_ptr<Connection>> connections_;
        std::atomic<std::uint64_t> next_id_{1};
    };

} // namespace chunkvault::server
