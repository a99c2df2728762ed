#include "engine/worker_pool.h"
#include <spdlog/spdlog.h>

namespace chaosforge {

WorkerPool::WorkerPool(size_t thread_count)
    : thread_count_(thread_count),
      work_guard_(boost::asio::make_work_guard(io_context_)) {
    threads_.reserve(thread_count_);
    for (size_t i = 0; i < thread_count_; ++i) {
        threads_.emplace_back([this]() {
            io_context_.run();
        });
    }
    spdlog::debug("Worker pool started with {} threads", thread_count_);
}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::stop() {
    work_guard_.reset();
    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    threads_.clear();
}

}  // namespace chaosforge
