#ifndef FRAMESYNC_WORKER_POOL_HPP
#define FRAMESYNC_WORKER_POOL_HPP

// Fixed-size thread pool with a bounded job queue.
// try_submit() refuses work when the queue is full so the caller can run the job
// itself instead of blocking the frame ingest path.

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace worker_pool {

using Job = std::function<void()>;

class WorkerPool {
public:
    WorkerPool(size_t thread_count, size_t max_queued_jobs);
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    // Returns false if the queue is full or the pool is shut down.
    bool try_submit(Job job);

    // Blocks until every queued and running job has finished.
    void wait_idle();

    // Finishes queued jobs, then joins all threads.
    void shutdown();

    size_t thread_count() const { return workers.size(); }

private:
    void worker_loop();

    std::mutex queue_mutex;
    std::condition_variable work_condition;
    std::condition_variable idle_condition;
    std::deque<Job> jobs;
    size_t max_queued_jobs;
    size_t running_jobs = 0;
    bool stopping = false;
    std::vector<std::thread> workers;
};

} // namespace worker_pool

#endif // FRAMESYNC_WORKER_POOL_HPP
