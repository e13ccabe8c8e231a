#pragma once

#include <atomic>
#include <memory>
#include <stop_token>
#include <thread>
#include <vector>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace mediadex::sync {

// Fixed-size io_context worker pool for per-file analysis.
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threads = 1);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    boost::asio::any_io_executor executor() const { return io_.get_executor(); }

    // Idempotent; joins all threads. Handlers not yet started are dropped.
    void stop();

    std::size_t threads() const noexcept { return active_.load(std::memory_order_relaxed); }
    bool stopped() const noexcept { return stopped_.load(); }

private:
    void run_thread(std::stop_token st);

    mutable boost::asio::io_context io_;
    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;
    std::unique_ptr<WorkGuard> guard_;
    std::vector<std::jthread> threads_;
    std::atomic<std::size_t> active_{0};
    std::atomic<bool> stopped_{false};
};

} // namespace mediadex::sync
