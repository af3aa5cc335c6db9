#include "utils/worker_pool.hpp"

#include "utils/debug_log.hpp"

#include <exception>
#include <string>

namespace worker_pool {

WorkerPool::WorkerPool(size_t thread_count, size_t max_queued_jobs)
    : max_queued_jobs(max_queued_jobs == 0 ? 1 : max_queued_jobs) {
    if (thread_count == 0) {
        thread_count = 1;
    }
    workers.reserve(thread_count);
    for (size_t index = 0; index < thread_count; index++) {
        workers.emplace_back([this] { worker_loop(); });
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::try_submit(Job job) {
    std::lock_guard<std::mutex> lock(queue_mutex);
    if (stopping || jobs.size() >= max_queued_jobs) {
        return false;
    }
    jobs.push_back(std::move(job));
    work_condition.notify_one();
    return true;
}

void WorkerPool::wait_idle() {
    std::unique_lock<std::mutex> lock(queue_mutex);
    idle_condition.wait(lock, [this] { return jobs.empty() && running_jobs == 0; });
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        stopping = true;
        work_condition.notify_all();
    }
    for (auto &worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers.clear();
}

void WorkerPool::worker_loop() {
    std::unique_lock<std::mutex> lock(queue_mutex);
    while (true) {
        work_condition.wait(lock, [this] { return stopping || !jobs.empty(); });
        if (jobs.empty()) {
            // stopping and drained
            return;
        }
        Job job = std::move(jobs.front());
        jobs.pop_front();
        running_jobs++;
        lock.unlock();
        try {
            job();
        } catch (const std::exception &exception) {
            debug_log::error("worker job threw: " + std::string(exception.what()));
        }
        lock.lock();
        running_jobs--;
        if (jobs.empty() && running_jobs == 0) {
            idle_condition.notify_all();
        }
    }
}

} // namespace worker_pool
