#ifndef FRAMESYNC_FRAME_BUFFER_HPP
#define FRAMESYNC_FRAME_BUFFER_HPP

// Bounded store of forwarded frames plus the action correlator.
//
// register_action() runs an action and then blocks until a frame that arrived
// after the action is "settled" (delta at or below stability_threshold, or the
// stability wait has elapsed), or until max_wait_ms passes, in which case the
// newest buffered frame is returned instead. The executor runs on a detached
// thread so a hung action cannot hold the caller past max_wait_ms. clear()
// cancels every waiter, including callers whose executor is still running.
//
// All state is guarded by one mutex; promises are settled while holding it and
// deadline timers are cancelled after releasing it.

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "browser/browser_action.hpp"
#include "frames/frame_types.hpp"
#include "utils/timer_queue.hpp"

namespace frame_buffer {

struct FrameBufferConfig {
    size_t max_buffer_size = 10;
    int stability_wait_ms = 200;
    int max_wait_ms = 2000;
    double stability_threshold_percent = 0.5;
};

// Returns one message per violated rule; empty when the config is usable.
std::vector<std::string> validate(const FrameBufferConfig &config);

enum class ActionOutcome {
    ResolvedByFrame,   // a settled post-action frame arrived
    ResolvedByTimeout, // max_wait_ms passed, after_frame is the newest buffered frame
    Immediate,         // non-visual action, after_frame == before_frame
    ActionFailed,      // executor failed or threw; no correlation was created
    NoFrameAvailable,  // nothing buffered yet, executor was not run
    Cancelled          // clear() ran while waiting
};

std::string outcome_name(ActionOutcome outcome);

struct FrameActionResult {
    ActionOutcome outcome = ActionOutcome::NoFrameAvailable;
    browser_action::BrowserAction action;
    browser_action::ActionResult action_result;
    frames::FramePtr before_frame;
    frames::FramePtr after_frame;
    bool caused_change = false;
    int64_t latency_ms = 0;
    // Position among the correlations this buffer has settled, from 1; 0 when
    // the action never got a correlation.
    uint64_t resolution_sequence = 0;
    std::string error_detail;

    // True for every outcome that carries a usable after_frame.
    bool has_after_frame() const { return after_frame != nullptr; }
};

enum class WaitStatus {
    Ok,
    Timeout,
    Cancelled
};

// success is true whenever frame is set. For wait_for_stable_frame a Timeout
// status with success means the best available frame was returned.
struct FrameWaitResult {
    bool success = false;
    frames::FramePtr frame;
    WaitStatus status = WaitStatus::Timeout;
    std::string error_detail;
};

struct BufferStats {
    size_t buffered_count = 0;
    size_t pending_correlation_count = 0;
    int64_t oldest_age_ms = 0;
    int64_t newest_age_ms = 0;
    int64_t oldest_frame_id = 0;
    int64_t newest_frame_id = 0;
};

using ActionExecutor = std::function<browser_action::ActionResult(const browser_action::BrowserAction &action)>;

class FrameBuffer {
public:
    // Throws std::invalid_argument if validate(config) reports anything.
    explicit FrameBuffer(const FrameBufferConfig &config);
    ~FrameBuffer();

    FrameBuffer(const FrameBuffer &) = delete;
    FrameBuffer &operator=(const FrameBuffer &) = delete;

    // Frames must arrive with strictly increasing ids; others are dropped.
    void add_frame(const frames::FramePtr &frame);

    // Blocks at most max_wait_ms from the call, executor time included. The
    // executor and the action are copied; whatever the executor captures must
    // stay valid until it returns, which may be after this call.
    FrameActionResult register_action(const browser_action::BrowserAction &action, const ActionExecutor &executor);

    frames::FramePtr latest() const;
    frames::FramePtr by_id(int64_t frame_id) const;
    std::vector<frames::FramePtr> since(int64_t frame_id) const;

    // True if the frame is no longer buffered or older than max_age_ms.
    bool is_frame_stale(int64_t frame_id, int64_t max_age_ms) const;

    FrameWaitResult wait_for_next_frame(int timeout_ms);
    FrameWaitResult wait_for_stable_frame(int duration_ms, int timeout_ms);

    // Drops all frames and settles every correlation and waiter with Cancelled.
    void clear();

    BufferStats stats() const;
    const FrameBufferConfig &config() const { return buffer_config; }

    // State shared between register_action and the thread running its executor.
    struct ExecutorRun {
        std::mutex run_mutex;
        std::condition_variable run_condition;
        bool finished = false;
        bool cancelled = false;
        browser_action::ActionResult action_result;
    };

private:
    using SteadyClock = std::chrono::steady_clock;

    struct CorrelationResolution {
        ActionOutcome outcome = ActionOutcome::Cancelled;
        frames::FramePtr after_frame;
        bool caused_change = false;
        SteadyClock::time_point resolved_at;
        uint64_t sequence = 0;
    };

    struct PendingCorrelation {
        int64_t reference_frame_id = 0;
        SteadyClock::time_point issued_at;
        SteadyClock::time_point deadline;
        std::promise<CorrelationResolution> promise;
        timer_queue::TimerId deadline_timer = timer_queue::INVALID_TIMER;
    };

    bool is_eligible(const PendingCorrelation &correlation, const frames::Frame &frame,
                     SteadyClock::time_point now) const;
    // Caller holds buffer_mutex. Returns the deadline timer to cancel once unlocked.
    timer_queue::TimerId resolve_locked(uint64_t correlation_id, ActionOutcome outcome,
                                        const frames::FramePtr &after_frame, bool caused_change);
    void resolve_by_timeout_locked(uint64_t correlation_id);
    void on_correlation_deadline(uint64_t correlation_id);
    frames::FramePtr latest_locked() const;
    static FrameActionResult cancelled_result(FrameActionResult result, SteadyClock::time_point issued_at);

    const FrameBufferConfig buffer_config;

    mutable std::mutex buffer_mutex;
    std::condition_variable frame_condition;
    std::deque<frames::FramePtr> buffered_frames;
    int64_t last_added_frame_id = 0;
    SteadyClock::time_point last_significant_change_at;
    uint64_t clear_generation = 0;

    std::map<uint64_t, PendingCorrelation> pending_correlations;
    uint64_t next_correlation_id = 1;
    uint64_t resolved_correlation_count = 0;

    // Executors still running, keyed per register_action call; clear() flags them cancelled.
    std::map<uint64_t, std::shared_ptr<ExecutorRun>> running_executors;
    uint64_t next_run_id = 1;

    timer_queue::TimerQueue timers;
};

} // namespace frame_buffer

#endif // FRAMESYNC_FRAME_BUFFER_HPP
