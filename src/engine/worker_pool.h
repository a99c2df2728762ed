#pragma once
#ifndef CHAOSFORGE_WORKER_POOL_H
#define CHAOSFORGE_WORKER_POOL_H

#include <cstddef>
#include <thread>
#include <utility>
#include <vector>
#include <boost/asio.hpp>

namespace chaosforge {

// Fixed set of threads draining one io_context. Tasks posted here must not
// let exceptions escape.
class WorkerPool {
public:
    explicit WorkerPool(size_t thread_count);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename Task>
    void post(Task&& task) {
        boost::asio::post(io_context_, std::forward<Task>(task));
    }

    // Finishes queued tasks, then joins every thread
    void stop();

    size_t size() const { return thread_count_; }

private:
    size_t thread_count_;
    boost::asio::io_context io_context_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
    std::vector<std::thread> threads_;
};

}  // namespace chaosforge

#endif  // CHAOSFORGE_WORKER_POOL_H
