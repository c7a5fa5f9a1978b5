#include "chunkvault/server/connection_registry.hpp"

#include <vector>

#include <spdlog/spdlog.h>

#include "chunkvault/server/connection.hpp"

namespace chunkvault::server
{

    std::uint64_t ConnectionRegistry::next_id() noexcept
    {
        return next_id_.fetch_add(1);
    }

    void ConnectionRegistry::add(const std::shared_ptr<Connection> &connection)
    {
        std::lock_guard lock(mutex_);
        std::erase_if(connections_, [](const auto &item)
                      { return item.second.expired(); });
        connections_[connection->id()] = connection;
    }

    void ConnectionRegistry::remove(std::uint64_t id)
    {
        std::lock_guard lock(mutex_);
        connections_.erase(id);
    }

    std::size_t ConnectionRegistry::size() const
    {
        std::lock_guard lock(mutex_);
        std::size_t live = 0;
        for (const auto &[id, weak] : connections_)
        {
            if (!weak.expired())
            {
                ++live;
            }
        }
        return live;
    }

    void ConnectionRegistry::close_all()
    {
        std::vector<std::shared_ptr<Connection>> live;
        {
            std::lock_guard lock(mutex_);
            for (const auto &[id, weak] : connections_)
            {
                if (auto connection = weak.lock())
                {
                    live.push_back(std::move(connection));
                }
            }
        }
        if (!live.empty())
        {
            spdlog::info("Closing {} client connections", live.size());
        }
        for (const auto &connection : live)
        {
            connection->close();
        }
    }

} // namespace chunkvault::server
