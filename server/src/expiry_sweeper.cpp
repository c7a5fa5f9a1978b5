#include "chunkvault/server/expiry_sweeper.hpp"

#include <stdexcept>

#include <asio/post.hpp>
#include <spdlog/spdlog.h>

namespace chunkvault::server
{

    ExpirySweeper::ExpirySweeper(asio::io_context &io_context, UploadManager &manager, std::chrono::seconds interval)
        : manager_(manager), interval_(interval), timer_(io_context)
    {
        if (interval_.count() <= 0)
        {
            throw std::invalid_argument("Sweep interval must be positive");
        }
    }

    ExpirySweeper::~ExpirySweeper()
    {
        stop();
    }

    void ExpirySweeper::start()
    {
        if (running_.exchange(true))
        {
            return;
        }
        spdlog::info("Expiry sweeper started, interval {}s", interval_.count());
        asio::post(timer_.get_executor(), [this]
                   {
                       if (!running_)
                       {
                           return;
                       }
                       sweep_once();
                       schedule_next(); });
    }

    void ExpirySweeper::stop()
    {
        if (!running_.exchange(false))
        {
            return;
        }
        std::lock_guard lock(timer_mutex_);
        timer_.cancel();
        spdlog::info("Expiry sweeper stopped after {} passes", passes_.load());
    }

    std::size_t ExpirySweeper::sweep_once()
    {
        ++passes_;
        try
        {
            const auto removed = manager_.cleanup_expired();
            spdlog::debug("Expiry sweep #{} removed {} sessions", passes_.load(), removed);
            return removed;
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Expiry sweep failed: {}", ex.what());
            return 0;
        }
    }

    void ExpirySweeper::schedule_next()
    {
        std::lock_guard lock(timer_mutex_);
        if (!running_)
        {
            return;
        }
        timer_.expires_after(interval_);
        timer_.async_wait([this](const std::error_code &ec)
                          {
                              if (ec || !running_)
                              {
                                  return;
                              }
                              sweep_once();
                              schedule_next(); });
    }

} // namespace chunkvault::server
