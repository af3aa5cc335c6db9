#include "utils/timer_queue.hpp"

#include "utils/debug_log.hpp"

#include <exception>

namespace timer_queue {

TimerQueue::TimerQueue() {
    dispatch_thread = std::thread([this] { run(); });
}

TimerQueue::~TimerQueue() {
    shutdown();
}

TimerId TimerQueue::add_task(Task task) {
    std::lock_guard<std::mutex> lock(queue_mutex);
    if (stopping) {
        return INVALID_TIMER;
    }
    TimerId timer_id = next_timer_id++;
    schedule.push({task.due_time, timer_id});
    tasks.emplace(timer_id, std::move(task));
    wake_condition.notify_one();
    return timer_id;
}

TimerId TimerQueue::schedule_at(Clock::time_point due_time, TimerCallback callback) {
    Task task;
    task.callback = std::move(callback);
    task.due_time = due_time;
    return add_task(std::move(task));
}

TimerId TimerQueue::schedule_after(std::chrono::milliseconds delay, TimerCallback callback) {
    return schedule_at(Clock::now() + delay, std::move(callback));
}

TimerId TimerQueue::schedule_every(std::chrono::milliseconds interval, TimerCallback callback) {
    if (interval.count() <= 0) {
        interval = std::chrono::milliseconds(1);
    }
    Task task;
    task.callback = std::move(callback);
    task.interval = interval;
    task.due_time = Clock::now() + interval;
    return add_task(std::move(task));
}

bool TimerQueue::cancel(TimerId timer_id) {
    if (timer_id == INVALID_TIMER) {
        return false;
    }
    std::unique_lock<std::mutex> lock(queue_mutex);
    bool was_scheduled = tasks.erase(timer_id) > 0;
    // Stale heap entries are skipped by run().
    if (std::this_thread::get_id() != dispatch_thread.get_id()) {
        idle_condition.wait(lock, [this, timer_id] { return running_timer_id != timer_id; });
    }
    return was_scheduled;
}

void TimerQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        if (stopping && !dispatch_thread.joinable()) {
            return;
        }
        stopping = true;
        tasks.clear();
        wake_condition.notify_all();
    }
    if (dispatch_thread.joinable() && std::this_thread::get_id() != dispatch_thread.get_id()) {
        dispatch_thread.join();
    }
}

size_t TimerQueue::pending_count() const {
    std::lock_guard<std::mutex> lock(queue_mutex);
    return tasks.size();
}

void TimerQueue::run() {
    std::unique_lock<std::mutex> lock(queue_mutex);
    while (!stopping) {
        if (schedule.empty()) {
            wake_condition.wait(lock);
            continue;
        }

        ScheduleEntry next_entry = schedule.top();
        auto task_iterator = tasks.find(next_entry.timer_id);
        if (task_iterator == tasks.end() || task_iterator->second.due_time != next_entry.due_time) {
            // Cancelled, or superseded by a re-armed periodic entry.
            schedule.pop();
            continue;
        }

        if (Clock::now() < next_entry.due_time) {
            wake_condition.wait_until(lock, next_entry.due_time);
            continue;
        }

        schedule.pop();
        TimerCallback callback = task_iterator->second.callback;
        if (task_iterator->second.interval.count() > 0) {
            task_iterator->second.due_time = Clock::now() + task_iterator->second.interval;
            schedule.push({task_iterator->second.due_time, next_entry.timer_id});
        } else {
            tasks.erase(task_iterator);
        }

        running_timer_id = next_entry.timer_id;
        lock.unlock();
        try {
            callback();
        } catch (const std::exception &exception) {
            debug_log::error("timer callback threw: " + std::string(exception.what()));
        }
        lock.lock();
        running_timer_id = INVALID_TIMER;
        idle_condition.notify_all();
    }
}

} // namespace timer_queue
