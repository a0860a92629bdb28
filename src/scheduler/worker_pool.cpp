// src/scheduler/worker_pool.cpp
#include "agentteam/scheduler/worker_pool.h"
#include <stdexcept>
#include <string>

namespace agentteam {

WorkerPool::WorkerPool(int size) {
    if (size <= 0) {
        throw std::invalid_argument("WorkerPool size must be positive, got " + std::to_string(size));
    }
    workers_.reserve(static_cast<size_t>(size));
    for (int i = 0; i < size; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& w : workers_) {
        if (w.joinable()) {
            w.join();
        }
    }
}

void WorkerPool::submit(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("WorkerPool is shutting down");
        }
        jobs_.push(std::move(job));
    }
    cv_.notify_one();
}

void WorkerPool::worker_loop() {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !jobs_.empty(); });
            if (jobs_.empty()) {
                return; // stopping and drained
            }
            job = std::move(jobs_.front());
            jobs_.pop();
        }
        job();
    }
}

} // namespace agentteam
