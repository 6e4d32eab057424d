#include "install/worker_pool.hpp"

#include <algorithm>
#include <pthread.h>

namespace ngdp {

WorkerPool::WorkerPool(int workers, std::string name) : name_(std::move(name)) {
    const int n = std::max(1, workers);
    workers_.reserve(static_cast<std::size_t>(n));
    for (int i = 0; i < n; ++i) {
        workers_.emplace_back(&WorkerPool::WorkerMain, this, i);
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard lock(mu_);
        stopping_ = true;
    }
    work_cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
}

void WorkerPool::Submit(Task task) {
    {
        std::lock_guard lock(mu_);
        queue_.push_back(std::move(task));
    }
    work_cv_.notify_one();
}

void WorkerPool::Wait() {
    std::unique_lock lock(mu_);
    idle_cv_.wait(lock, [this] { return queue_.empty() && running_ == 0; });
}

void WorkerPool::WorkerMain(int id) {
    {
        // Linux caps thread names at 15 characters.
        const std::string thread_name = (name_ + "-" + std::to_string(id)).substr(0, 15);
        pthread_setname_np(pthread_self(), thread_name.c_str());
    }

    for (;;) {
        Task task;
        {
            std::unique_lock lock(mu_);
            work_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) return; // stopping and drained
            task = std::move(queue_.front());
            queue_.pop_front();
            ++running_;
        }

        task();

        {
            std::lock_guard lock(mu_);
            --running_;
            if (queue_.empty() && running_ == 0) idle_cv_.notify_all();
        }
    }
}

} // namespace ngdp
