#include "frames/frame_buffer.hpp"

#include <algorithm>
#include <exception>
#include <memory>
#include <stdexcept>
#include <thread>

#include "utils/debug_log.hpp"

namespace frame_buffer {

// Extra time register_action waits on its own after the deadline timer should have fired.
static constexpr std::chrono::milliseconds DEADLINE_GRACE{250};

std::vector<std::string> validate(const FrameBufferConfig &config) {
    std::vector<std::string> problems;
    if (config.max_buffer_size < 1) {
        problems.push_back("max_buffer_size must be at least 1");
    }
    if (config.stability_wait_ms <= 0) {
        problems.push_back("stability_wait_ms must be greater than 0");
    }
    if (config.max_wait_ms <= config.stability_wait_ms) {
        problems.push_back("max_wait_ms must be greater than stability_wait_ms");
    }
    if (!(config.stability_threshold_percent >= 0.0 && config.stability_threshold_percent <= 100.0)) {
        problems.push_back("stability_threshold must be within 0..100");
    }
    return problems;
}

std::string outcome_name(ActionOutcome outcome) {
    switch (outcome) {
    case ActionOutcome::ResolvedByFrame:
        return "resolved_by_frame";
    case ActionOutcome::ResolvedByTimeout:
        return "resolved_by_timeout";
    case ActionOutcome::Immediate:
        return "immediate";
    case ActionOutcome::ActionFailed:
        return "action_failed";
    case ActionOutcome::NoFrameAvailable:
        return "no_frame_available";
    case ActionOutcome::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

static std::string join_problems(const std::vector<std::string> &problems) {
    std::string joined;
    for (const std::string &problem : problems) {
        if (!joined.empty()) {
            joined += "; ";
        }
        joined += problem;
    }
    return joined;
}

static int64_t elapsed_ms(std::chrono::steady_clock::time_point from, std::chrono::steady_clock::time_point to) {
    return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count());
}

FrameBuffer::FrameBuffer(const FrameBufferConfig &config)
    : buffer_config(config), last_significant_change_at(SteadyClock::now()) {
    std::vector<std::string> problems = validate(config);
    if (!problems.empty()) {
        throw std::invalid_argument("invalid frame buffer config: " + join_problems(problems));
    }
}

FrameBuffer::~FrameBuffer() {
    clear();
    timers.shutdown();
}

frames::FramePtr FrameBuffer::latest_locked() const {
    return buffered_frames.empty() ? nullptr : buffered_frames.back();
}

bool FrameBuffer::is_eligible(const PendingCorrelation &correlation, const frames::Frame &frame,
                              SteadyClock::time_point now) const {
    if (frame.id <= correlation.reference_frame_id) {
        return false;
    }
    return frame.delta_percent <= buffer_config.stability_threshold_percent ||
           now - correlation.issued_at >= std::chrono::milliseconds(buffer_config.stability_wait_ms);
}

void FrameBuffer::add_frame(const frames::FramePtr &frame) {
    if (!frame) {
        return;
    }
    std::vector<timer_queue::TimerId> timers_to_cancel;
    {
        std::lock_guard<std::mutex> lock(buffer_mutex);
        if (frame->id <= last_added_frame_id) {
            debug_log::warn("frame buffer: dropping out-of-order frame " + std::to_string(frame->id) +
                            " (last " + std::to_string(last_added_frame_id) + ")");
            return;
        }
        last_added_frame_id = frame->id;

        buffered_frames.push_back(frame);
        while (buffered_frames.size() > buffer_config.max_buffer_size) {
            buffered_frames.pop_front();
        }

        SteadyClock::time_point now = SteadyClock::now();
        // Forced captures (keep-alive and on-demand) carry a 100 % delta and say nothing about motion.
        if (!frame->forced && !frame->keep_alive && frame->delta_percent > buffer_config.stability_threshold_percent) {
            last_significant_change_at = now;
        }

        // Oldest action first.
        std::vector<std::pair<int64_t, uint64_t>> eligible;
        for (const auto &entry : pending_correlations) {
            if (is_eligible(entry.second, *frame, now)) {
                eligible.emplace_back(entry.second.reference_frame_id, entry.first);
            }
        }
        std::sort(eligible.begin(), eligible.end());
        for (const auto &candidate : eligible) {
            timer_queue::TimerId timer =
                resolve_locked(candidate.second, ActionOutcome::ResolvedByFrame, frame, frame->changed);
            timers_to_cancel.push_back(timer);
        }
    }
    frame_condition.notify_all();
    for (timer_queue::TimerId timer : timers_to_cancel) {
        timers.cancel(timer);
    }
}

timer_queue::TimerId FrameBuffer::resolve_locked(uint64_t correlation_id, ActionOutcome outcome,
                                                 const frames::FramePtr &after_frame, bool caused_change) {
    auto found = pending_correlations.find(correlation_id);
    if (found == pending_correlations.end()) {
        return timer_queue::INVALID_TIMER;
    }
    CorrelationResolution resolution;
    resolution.outcome = outcome;
    resolution.after_frame = after_frame;
    resolution.caused_change = caused_change;
    resolution.resolved_at = SteadyClock::now();
    resolution.sequence = ++resolved_correlation_count;

    timer_queue::TimerId timer = found->second.deadline_timer;
    found->second.promise.set_value(resolution);
    pending_correlations.erase(found);
    return timer;
}

void FrameBuffer::resolve_by_timeout_locked(uint64_t correlation_id) {
    auto found = pending_correlations.find(correlation_id);
    if (found == pending_correlations.end()) {
        return;
    }
    frames::FramePtr newest = latest_locked();
    bool caused_change = newest && newest->id != found->second.reference_frame_id;
    resolve_locked(correlation_id, ActionOutcome::ResolvedByTimeout, newest, caused_change);
}

void FrameBuffer::on_correlation_deadline(uint64_t correlation_id) {
    std::lock_guard<std::mutex> lock(buffer_mutex);
    resolve_by_timeout_locked(correlation_id);
}

// Runs on its own detached thread and touches nothing but the shared run state,
// so it may outlive both the caller and the buffer.
static void run_executor(std::shared_ptr<FrameBuffer::ExecutorRun> run, ActionExecutor executor,
                         browser_action::BrowserAction action) {
    browser_action::ActionResult action_result;
    try {
        action_result = executor(action);
    } catch (const std::exception &exception) {
        action_result.success = false;
        action_result.error_detail = exception.what();
    }
    {
        std::lock_guard<std::mutex> lock(run->run_mutex);
        run->action_result = action_result;
        run->finished = true;
    }
    run->run_condition.notify_all();
}

FrameActionResult FrameBuffer::cancelled_result(FrameActionResult result, SteadyClock::time_point issued_at) {
    result.outcome = ActionOutcome::Cancelled;
    result.after_frame = nullptr;
    result.caused_change = false;
    result.error_detail = "cancelled: frame buffer was cleared";
    result.latency_ms = elapsed_ms(issued_at, SteadyClock::now());
    debug_log::log("frame buffer: " + browser_action::action_type_name(result.action.type) + " cancelled after " +
                   std::to_string(result.latency_ms) + " ms");
    return result;
}

FrameActionResult FrameBuffer::register_action(const browser_action::BrowserAction &action,
                                               const ActionExecutor &executor) {
    FrameActionResult result;
    result.action = action;

    SteadyClock::time_point issued_at = SteadyClock::now();
    SteadyClock::time_point deadline = issued_at + std::chrono::milliseconds(buffer_config.max_wait_ms);
    std::shared_ptr<ExecutorRun> run = std::make_shared<ExecutorRun>();
    uint64_t generation = 0;
    uint64_t run_id = 0;
    {
        std::lock_guard<std::mutex> lock(buffer_mutex);
        result.before_frame = latest_locked();
        generation = clear_generation;
        if (result.before_frame) {
            run_id = next_run_id++;
            running_executors[run_id] = run;
        }
    }
    if (!result.before_frame) {
        result.outcome = ActionOutcome::NoFrameAvailable;
        result.error_detail = "no frame available for action";
        return result;
    }

    std::thread(run_executor, run, executor, action).detach();

    bool executor_finished = false;
    bool cancelled = false;
    {
        std::unique_lock<std::mutex> run_lock(run->run_mutex);
        run->run_condition.wait_until(run_lock, deadline, [&run]() { return run->finished || run->cancelled; });
        executor_finished = run->finished;
        cancelled = run->cancelled;
        if (executor_finished) {
            result.action_result = run->action_result;
        }
    }

    if (cancelled) {
        std::lock_guard<std::mutex> lock(buffer_mutex);
        running_executors.erase(run_id);
        return cancelled_result(result, issued_at);
    }

    if (!executor_finished) {
        // The executor keeps running on its own; its result is dropped.
        std::lock_guard<std::mutex> lock(buffer_mutex);
        running_executors.erase(run_id);
        if (clear_generation != generation) {
            return cancelled_result(result, issued_at);
        }
        debug_log::warn("frame buffer: " + browser_action::action_type_name(action.type) +
                        " still executing after " + std::to_string(buffer_config.max_wait_ms) +
                        " ms, resolving with the newest frame");
        result.outcome = ActionOutcome::ResolvedByTimeout;
        result.after_frame = latest_locked();
        result.caused_change = result.after_frame && result.after_frame->id != result.before_frame->id;
        result.action_result.success = true; // issued, completion unconfirmed
        result.latency_ms = elapsed_ms(issued_at, SteadyClock::now());
        return result;
    }

    if (!result.action_result.success) {
        {
            std::lock_guard<std::mutex> lock(buffer_mutex);
            running_executors.erase(run_id);
        }
        result.outcome = ActionOutcome::ActionFailed;
        result.error_detail = result.action_result.error_detail.empty() ? "action failed"
                                                                        : result.action_result.error_detail;
        result.latency_ms = elapsed_ms(issued_at, SteadyClock::now());
        return result;
    }

    if (browser_action::is_non_visual(action)) {
        {
            std::lock_guard<std::mutex> lock(buffer_mutex);
            running_executors.erase(run_id);
        }
        result.outcome = ActionOutcome::Immediate;
        result.after_frame = result.before_frame;
        result.caused_change = false;
        result.latency_ms = elapsed_ms(issued_at, SteadyClock::now());
        return result;
    }

    std::future<CorrelationResolution> resolution_future;
    uint64_t correlation_id = 0;
    timer_queue::TimerId timer_to_cancel = timer_queue::INVALID_TIMER;
    {
        std::lock_guard<std::mutex> lock(buffer_mutex);
        running_executors.erase(run_id);
        if (clear_generation != generation) {
            return cancelled_result(result, issued_at);
        }
        correlation_id = next_correlation_id++;
        PendingCorrelation &correlation = pending_correlations[correlation_id];
        correlation.reference_frame_id = result.before_frame->id;
        correlation.issued_at = issued_at;
        correlation.deadline = deadline;
        resolution_future = correlation.promise.get_future();

        // Frames that arrived while the executor ran count as post-action frames.
        SteadyClock::time_point now = SteadyClock::now();
        bool resolved = false;
        for (const frames::FramePtr &frame : buffered_frames) {
            if (is_eligible(correlation, *frame, now)) {
                resolve_locked(correlation_id, ActionOutcome::ResolvedByFrame, frame, frame->changed);
                resolved = true;
                break;
            }
        }
        if (!resolved && now >= deadline) {
            resolve_by_timeout_locked(correlation_id);
            resolved = true;
        }
        if (!resolved) {
            correlation.deadline_timer =
                timers.schedule_at(deadline, [this, correlation_id]() { on_correlation_deadline(correlation_id); });
        }
    }

    if (resolution_future.wait_until(deadline + DEADLINE_GRACE) != std::future_status::ready) {
        debug_log::warn("frame buffer: deadline timer late, resolving correlation " +
                        std::to_string(correlation_id) + " directly");
        std::lock_guard<std::mutex> lock(buffer_mutex);
        auto found = pending_correlations.find(correlation_id);
        if (found != pending_correlations.end()) {
            timer_to_cancel = found->second.deadline_timer;
        }
        resolve_by_timeout_locked(correlation_id);
    }
    timers.cancel(timer_to_cancel);

    CorrelationResolution resolution = resolution_future.get();
    result.outcome = resolution.outcome;
    result.after_frame = resolution.after_frame;
    result.caused_change = resolution.caused_change;
    result.latency_ms = elapsed_ms(issued_at, resolution.resolved_at);
    result.resolution_sequence = resolution.sequence;
    if (resolution.outcome == ActionOutcome::Cancelled) {
        result.error_detail = "cancelled: frame buffer was cleared";
    }
    debug_log::log("frame buffer: " + browser_action::action_type_name(action.type) + " -> " +
                   outcome_name(result.outcome) + " after " + std::to_string(result.latency_ms) + " ms");
    return result;
}

frames::FramePtr FrameBuffer::latest() const {
    std::lock_guard<std::mutex> lock(buffer_mutex);
    return latest_locked();
}

frames::FramePtr FrameBuffer::by_id(int64_t frame_id) const {
    std::lock_guard<std::mutex> lock(buffer_mutex);
    for (const frames::FramePtr &frame : buffered_frames) {
        if (frame->id == frame_id) {
            return frame;
        }
    }
    return nullptr;
}

std::vector<frames::FramePtr> FrameBuffer::since(int64_t frame_id) const {
    std::lock_guard<std::mutex> lock(buffer_mutex);
    std::vector<frames::FramePtr> newer;
    for (const frames::FramePtr &frame : buffered_frames) {
        if (frame->id > frame_id) {
            newer.push_back(frame);
        }
    }
    return newer;
}

bool FrameBuffer::is_frame_stale(int64_t frame_id, int64_t max_age_ms) const {
    frames::FramePtr frame = by_id(frame_id);
    if (!frame) {
        return true;
    }
    return frames::now_epoch_ms() - frame->captured_at_ms > max_age_ms;
}

FrameWaitResult FrameBuffer::wait_for_next_frame(int timeout_ms) {
    FrameWaitResult result;
    std::unique_lock<std::mutex> lock(buffer_mutex);
    const int64_t observed_frame_id = last_added_frame_id;
    const uint64_t generation = clear_generation;
    SteadyClock::time_point deadline = SteadyClock::now() + std::chrono::milliseconds(std::max(0, timeout_ms));

    frame_condition.wait_until(lock, deadline, [&]() {
        return clear_generation != generation || last_added_frame_id > observed_frame_id;
    });

    if (clear_generation != generation) {
        result.status = WaitStatus::Cancelled;
        result.error_detail = "cancelled: frame buffer was cleared";
        return result;
    }
    if (last_added_frame_id <= observed_frame_id) {
        result.status = WaitStatus::Timeout;
        result.error_detail = "timeout waiting for next frame";
        return result;
    }
    // First frame past the observed id that is still buffered.
    for (const frames::FramePtr &frame : buffered_frames) {
        if (frame->id > observed_frame_id) {
            result.frame = frame;
            break;
        }
    }
    result.success = result.frame != nullptr;
    result.status = WaitStatus::Ok;
    return result;
}

FrameWaitResult FrameBuffer::wait_for_stable_frame(int duration_ms, int timeout_ms) {
    FrameWaitResult result;
    std::unique_lock<std::mutex> lock(buffer_mutex);
    const uint64_t generation = clear_generation;
    const SteadyClock::time_point started_at = SteadyClock::now();
    const SteadyClock::time_point deadline = started_at + std::chrono::milliseconds(std::max(0, timeout_ms));
    const std::chrono::milliseconds stable_for(std::max(0, duration_ms));

    while (true) {
        if (clear_generation != generation) {
            result.status = WaitStatus::Cancelled;
            result.error_detail = "cancelled: frame buffer was cleared";
            return result;
        }

        SteadyClock::time_point now = SteadyClock::now();
        SteadyClock::time_point last_change = std::max(started_at, last_significant_change_at);
        SteadyClock::time_point stable_at = last_change + stable_for;
        frames::FramePtr newest = latest_locked();

        if (newest && now >= stable_at) {
            result.success = true;
            result.frame = newest;
            result.status = WaitStatus::Ok;
            return result;
        }
        if (now >= deadline) {
            result.status = WaitStatus::Timeout;
            if (newest) {
                result.success = true;
                result.frame = newest;
            } else {
                result.error_detail = "timeout waiting for stable frame";
            }
            return result;
        }

        SteadyClock::time_point wake_at = newest ? std::min(stable_at, deadline) : deadline;
        frame_condition.wait_until(lock, wake_at);
    }
}

void FrameBuffer::clear() {
    std::vector<timer_queue::TimerId> timers_to_cancel;
    std::vector<std::shared_ptr<ExecutorRun>> runs_to_cancel;
    {
        std::lock_guard<std::mutex> lock(buffer_mutex);
        buffered_frames.clear();
        clear_generation++;
        for (const auto &entry : running_executors) {
            runs_to_cancel.push_back(entry.second);
        }
        std::vector<uint64_t> correlation_ids;
        for (const auto &entry : pending_correlations) {
            correlation_ids.push_back(entry.first);
        }
        for (uint64_t correlation_id : correlation_ids) {
            timers_to_cancel.push_back(resolve_locked(correlation_id, ActionOutcome::Cancelled, nullptr, false));
        }
        if (!correlation_ids.empty() || !runs_to_cancel.empty()) {
            debug_log::log("frame buffer: cancelled " + std::to_string(correlation_ids.size() + runs_to_cancel.size()) +
                           " pending action(s)");
        }
    }
    for (const std::shared_ptr<ExecutorRun> &run : runs_to_cancel) {
        {
            std::lock_guard<std::mutex> run_lock(run->run_mutex);
            run->cancelled = true;
        }
        run->run_condition.notify_all();
    }
    frame_condition.notify_all();
    for (timer_queue::TimerId timer : timers_to_cancel) {
        timers.cancel(timer);
    }
}

BufferStats FrameBuffer::stats() const {
    BufferStats result;
    std::lock_guard<std::mutex> lock(buffer_mutex);
    result.buffered_count = buffered_frames.size();
    result.pending_correlation_count = pending_correlations.size();
    if (!buffered_frames.empty()) {
        int64_t now = frames::now_epoch_ms();
        result.oldest_age_ms = now - buffered_frames.front()->captured_at_ms;
        result.newest_age_ms = now - buffered_frames.back()->captured_at_ms;
        result.oldest_frame_id = buffered_frames.front()->id;
        result.newest_frame_id = buffered_frames.back()->id;
    }
    return result;
}

} // namespace frame_buffer
