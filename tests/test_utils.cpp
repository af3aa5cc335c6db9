// Tests for the utility layer: base64, timer queue and worker pool.

#include "utils/base64.hpp"
#include "utils/timer_queue.hpp"
#include "utils/worker_pool.hpp"
#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>

using test_support::check;

namespace test_utils {

static bool test_base64() {
    std::vector<uint8_t> bytes = {'f', 'o', 'o', 'b', 'a', 'r'};
    bool success = check(base64::encode(bytes) == "Zm9vYmFy", "encode(\"foobar\")");
    success &= check(base64::encode({'f', 'o'}) == "Zm8=", "encode pads to a multiple of four");

    std::vector<uint8_t> decoded;
    success &= check(base64::decode("Zm9v\nYmE=", decoded) && decoded.size() == 5 && decoded[4] == 'a',
                     "decode skips whitespace and honours padding");
    success &= check(base64::decode("Zm8", decoded) && decoded.size() == 2, "decode accepts unpadded input");
    success &= check(!base64::decode("Zm9v*", decoded), "decode rejects characters outside the alphabet");
    success &= check(!base64::decode("Zm9*", decoded), "decode rejects a bad character inside a full quantum");
    success &= check(!base64::decode("Zm=v", decoded), "decode rejects data after padding");
    success &= check(base64::decode("", decoded) && decoded.empty(), "decode of empty input is empty");
    success &= check(base64::encode({}).empty(), "encode of no bytes is empty");

    std::vector<uint8_t> binary;
    for (int value = 0; value < 256; value++) {
        binary.push_back(static_cast<uint8_t>(value));
    }
    success &= check(base64::decode(base64::encode(binary), decoded) && decoded == binary,
                     "every byte value survives encode and decode");
    return success;
}

static bool test_timer_queue_one_shot_and_cancel() {
    timer_queue::TimerQueue timers;
    std::atomic<int> fired{0};
    std::atomic<int> cancelled_fired{0};

    timers.schedule_after(std::chrono::milliseconds(20), [&fired]() { fired++; });
    timer_queue::TimerId doomed =
        timers.schedule_after(std::chrono::milliseconds(200), [&cancelled_fired]() { cancelled_fired++; });
    bool success = check(doomed != timer_queue::INVALID_TIMER, "Scheduling returns a valid id");
    success &= check(timers.cancel(doomed), "Pending timer can be cancelled");
    success &= check(!timers.cancel(doomed), "Cancelling twice reports nothing left to cancel");

    test_support::wait_until([&fired]() { return fired.load() == 1; }, 1000);
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    success &= check(fired.load() == 1, "One-shot timer fires exactly once");
    success &= check(cancelled_fired.load() == 0, "Cancelled timer never fires");
    success &= check(timers.pending_count() == 0, "Nothing is left pending");
    return success;
}

static bool test_timer_queue_periodic_and_shutdown() {
    timer_queue::TimerQueue timers;
    std::atomic<int> ticks{0};
    timer_queue::TimerId periodic = timers.schedule_every(std::chrono::milliseconds(20), [&ticks]() { ticks++; });
    bool success = check(test_support::wait_until([&ticks]() { return ticks.load() >= 3; }, 1000),
                         "Periodic timer keeps firing");
    timers.cancel(periodic);
    int ticks_after_cancel = ticks.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    success &= check(ticks.load() == ticks_after_cancel, "Cancelled periodic timer stops");

    timers.shutdown();
    success &= check(timers.schedule_after(std::chrono::milliseconds(1), []() {}) == timer_queue::INVALID_TIMER,
                     "Scheduling after shutdown is refused");
    return success;
}

static bool test_worker_pool() {
    worker_pool::WorkerPool pool(2, 1);
    std::atomic<bool> release{false};
    std::atomic<int> completed{0};
    auto blocking_job = [&release, &completed]() {
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        completed++;
    };

    bool success = check(pool.thread_count() == 2, "Pool starts the requested threads");
    pool.try_submit(blocking_job);
    pool.try_submit(blocking_job);
    // Both workers busy; the queue holds one more job.
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    bool queued = pool.try_submit(blocking_job);
    bool refused = !pool.try_submit(blocking_job);
    success &= check(queued && refused, "Full queue refuses further jobs");

    release.store(true);
    pool.wait_idle();
    success &= check(completed.load() == 3, "wait_idle returns after every accepted job ran");

    pool.shutdown();
    success &= check(!pool.try_submit([]() {}), "Shut-down pool refuses jobs");
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_base64();
    all_passed &= test_timer_queue_one_shot_and_cancel();
    all_passed &= test_timer_queue_periodic_and_shutdown();
    all_passed &= test_worker_pool();
    return all_passed;
}

} // namespace test_utils
