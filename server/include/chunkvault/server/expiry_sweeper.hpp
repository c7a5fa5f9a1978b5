#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

#include "chunkvault/server/upload_manager.hpp"

namespace chunkvault::server
{

    /// Runs UploadManager::cleanup_expired() once on start() and then every `interval`
    /// until stop() is called.
    class ExpirySweeper
    {
    public:
        ExpirySweeper(asio::io_context &io_context, UploadManager &manager, std::chrono::seconds interval);
        ~ExpirySweeper();

        ExpirySweeper(const ExpirySweeper &) = delete;
        ExpirySweeper &operator=(const ExpirySweeper &) = delete;

        void start();
        void stop();

        // Runs one pass on the calling thread; failures are logged, never thrown.
        std::size_t sweep_once();

        std::size_t passes() const noexcept { return passes_.load(); }
        bool running() const noexcept { return running_.load(); }

    private:
        void schedule_next();

        UploadManager &manager_;
        std::chrono::seconds interval_;
        std::mutex timer_mutex_;
        asio::steady_timer timer_;
        std::atomic<bool> running_{false};
        std::atomic<std::size_t> passes_{0};
    };

} // namespace chunkvault::server
