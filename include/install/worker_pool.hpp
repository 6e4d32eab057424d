#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace ngdp {

// Fixed-size pool of named worker threads draining a FIFO of tasks. Tasks must
// not throw.
class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(int workers, std::string name = "worker");
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void Submit(Task task);

    // Blocks until the queue is empty and no task is running.
    void Wait();

    std::size_t Size() const { return workers_.size(); }

private:
    void WorkerMain(int id);

    std::string name_;
    std::vector<std::thread> workers_;

    std::mutex mu_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::deque<Task> queue_;
    std::size_t running_ = 0;
    bool stopping_ = false;
};

} // namespace ngdp
