#ifndef FRAMESYNC_TIMER_QUEUE_HPP
#define FRAMESYNC_TIMER_QUEUE_HPP

// Deadline-ordered timer service with one dispatch thread.
// Used for correlation deadlines (FrameBuffer) and the keep-alive tick (FrameSampler).
// Callbacks run on the timer thread, never while the queue lock is held.

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace timer_queue {

using Clock = std::chrono::steady_clock;
using TimerId = uint64_t;
using TimerCallback = std::function<void()>;

// 0 is never handed out.
constexpr TimerId INVALID_TIMER = 0;

class TimerQueue {
public:
    TimerQueue();
    ~TimerQueue();

    TimerQueue(const TimerQueue &) = delete;
    TimerQueue &operator=(const TimerQueue &) = delete;

    // One-shot timer. Returns INVALID_TIMER after shutdown().
    TimerId schedule_at(Clock::time_point due_time, TimerCallback callback);
    TimerId schedule_after(std::chrono::milliseconds delay, TimerCallback callback);

    // Periodic timer; first run after one interval.
    TimerId schedule_every(std::chrono::milliseconds interval, TimerCallback callback);

    // Cancels a timer. If its callback is running on the timer thread, waits for it
    // to return (unless called from the timer thread itself).
    // Returns true if the timer was still scheduled.
    bool cancel(TimerId timer_id);

    // Stops the dispatch thread; pending timers are dropped without running.
    void shutdown();

    size_t pending_count() const;

private:
    struct Task {
        TimerCallback callback;
        std::chrono::milliseconds interval{0}; // zero = one-shot
        Clock::time_point due_time;
    };

    struct ScheduleEntry {
        Clock::time_point due_time;
        TimerId timer_id;
    };

    struct LaterFirst {
        bool operator()(const ScheduleEntry &left, const ScheduleEntry &right) const {
            if (left.due_time != right.due_time) {
                return left.due_time > right.due_time;
            }
            return left.timer_id > right.timer_id;
        }
    };

    TimerId add_task(Task task);
    void run();

    mutable std::mutex queue_mutex;
    std::condition_variable wake_condition;
    std::condition_variable idle_condition;
    std::map<TimerId, Task> tasks;
    std::priority_queue<ScheduleEntry, std::vector<ScheduleEntry>, LaterFirst> schedule;
    TimerId next_timer_id = 1;
    TimerId running_timer_id = INVALID_TIMER;
    bool stopping = false;
    std::thread dispatch_thread;
};

} // namespace timer_queue

#endif // FRAMESYNC_TIMER_QUEUE_HPP
