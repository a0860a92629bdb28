// agentteam/scheduler/worker_pool.h
#ifndef AGENTTEAM_SCHEDULER_WORKER_POOL_H
#define AGENTTEAM_SCHEDULER_WORKER_POOL_H

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace agentteam {

// 固定大小线程池; jobs run in submission order as threads free up.
// The destructor finishes every queued job before joining.
class WorkerPool {
public:
    // Throws std::invalid_argument when size <= 0
    explicit WorkerPool(int size);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Jobs must not throw; wrap them if they can
    void submit(std::function<void()> job);

    int size() const { return static_cast<int>(workers_.size()); }

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> jobs_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};

} // namespace agentteam

#endif // AGENTTEAM_SCHEDULER_WORKER_POOL_H
