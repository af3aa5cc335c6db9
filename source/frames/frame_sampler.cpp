#include "frames/frame_sampler.hpp"

#include <algorithm>
#include <exception>
#include <vector>

#include "utils/debug_log.hpp"

namespace frame_sampler {

using SteadyClock = std::chrono::steady_clock;

static int64_t capture_time_or_now(const frames::RawFrame &raw_frame) {
    return raw_frame.capture_timestamp_ms > 0 ? raw_frame.capture_timestamp_ms : frames::now_epoch_ms();
}

static std::shared_ptr<frames::Frame> make_frame(int64_t frame_id, const frames::RawFrame &raw_frame) {
    std::shared_ptr<frames::Frame> frame = std::make_shared<frames::Frame>();
    frame->id = frame_id;
    frame->captured_at_ms = capture_time_or_now(raw_frame);
    frame->pixels = raw_frame.encoded_image;
    frame->mime_type = raw_frame.mime_type;
    frame->view_metadata = raw_frame.view_metadata;
    return frame;
}

FrameSampler::FrameSampler(frame_source::FrameSource &source, const SamplerConfig &config)
    : source(source),
      detector(config.delta_threshold_percent),
      keep_alive_interval_ms(config.keep_alive_ms),
      comparison_pool(std::max<size_t>(1, config.worker_count), std::max<size_t>(1, config.max_queued_comparisons)) {}

FrameSampler::~FrameSampler() {
    stop();
    timers.shutdown();
    comparison_pool.shutdown();
}

SubscriberToken FrameSampler::subscribe(FrameSubscriber subscriber) {
    std::lock_guard<std::mutex> lock(subscribers_mutex);
    SubscriberToken token = next_subscriber_token++;
    subscribers[token] = std::move(subscriber);
    return token;
}

bool FrameSampler::unsubscribe(SubscriberToken token) {
    std::lock_guard<std::mutex> lock(subscribers_mutex);
    return subscribers.erase(token) > 0;
}

void FrameSampler::start() {
    std::lock_guard<std::mutex> lock(control_mutex);
    if (running.load()) {
        return;
    }
    running.store(true);
    source.set_frame_handler([this](frames::RawFrame raw_frame) { ingest(std::move(raw_frame)); });
    arm_keep_alive_timer();
    debug_log::log("sampler: started, keep-alive " + std::to_string(keep_alive_interval_ms.load()) + " ms");
}

void FrameSampler::stop() {
    timer_queue::TimerId timer_to_cancel = timer_queue::INVALID_TIMER;
    {
        std::lock_guard<std::mutex> lock(control_mutex);
        if (!running.load()) {
            return;
        }
        running.store(false);
        timer_to_cancel = keep_alive_timer;
        keep_alive_timer = timer_queue::INVALID_TIMER;
    }
    source.set_frame_handler(nullptr);
    timers.cancel(timer_to_cancel);
    debug_log::log("sampler: stopped");
}

void FrameSampler::arm_keep_alive_timer() {
    int tick_ms = std::max(1, keep_alive_interval_ms.load() / 2);
    keep_alive_timer = timers.schedule_every(std::chrono::milliseconds(tick_ms), [this]() { on_keep_alive_tick(); });
}

bool FrameSampler::set_delta_threshold(double delta_threshold_percent) {
    if (!(delta_threshold_percent >= 0.0 && delta_threshold_percent <= 100.0)) {
        return false;
    }
    detector.set_delta_threshold(delta_threshold_percent);
    return true;
}

bool FrameSampler::set_keep_alive_ms(int keep_alive_ms) {
    if (keep_alive_ms <= 0) {
        return false;
    }
    keep_alive_interval_ms.store(keep_alive_ms);
    std::lock_guard<std::mutex> lock(control_mutex);
    if (running.load()) {
        timers.cancel(keep_alive_timer);
        arm_keep_alive_timer();
    }
    return true;
}

void FrameSampler::ingest(frames::RawFrame raw_frame) {
    if (!raw_frame.encoded_image || raw_frame.encoded_image->empty()) {
        debug_log::log("sampler: ignoring empty frame");
        return;
    }

    int64_t frame_id = 0;
    frames::EncodedImagePtr previous_image;
    {
        std::lock_guard<std::mutex> lock(ingest_mutex);
        frame_id = next_frame_id++;
        previous_image = last_captured_image;
        last_captured_image = raw_frame.encoded_image;
        current_frame_id.store(frame_id);
    }
    captured_count++;

    worker_pool::Job comparison = [this, frame_id, previous_image, raw_frame]() {
        delta_detector::DeltaResult delta;
        try {
            delta = detector.compare(previous_image, raw_frame.encoded_image);
        } catch (const std::exception &exception) {
            debug_log::warn(std::string("sampler: comparison failed: ") + exception.what());
            delta = delta_detector::DeltaResult();
        }
        CompletedCapture capture;
        capture.frame = make_frame(frame_id, raw_frame);
        capture.frame->changed = delta.changed;
        capture.frame->delta_percent = delta.delta_percent;
        complete(frame_id, std::move(capture));
    };

    if (!comparison_pool.try_submit(comparison)) {
        // Pool saturated: compare on the ingest thread.
        comparison();
    }
}

CaptureNowResult FrameSampler::capture_now() {
    CaptureNowResult result;
    frame_source::OnDemandCaptureResult capture = source.capture_on_demand();
    if (!capture.success) {
        result.error_detail = capture.error_detail;
        return result;
    }
    result.frame = ingest_forced(std::move(capture.raw_frame), false);
    result.success = result.frame != nullptr;
    if (!result.success) {
        result.error_detail = "capture returned an empty image";
    }
    return result;
}

frames::FramePtr FrameSampler::ingest_forced(frames::RawFrame raw_frame, bool keep_alive) {
    if (!raw_frame.encoded_image || raw_frame.encoded_image->empty()) {
        return nullptr;
    }
    int64_t frame_id = 0;
    {
        // Forced captures take an id but leave the comparison baseline alone.
        std::lock_guard<std::mutex> lock(ingest_mutex);
        frame_id = next_frame_id++;
        current_frame_id.store(frame_id);
    }
    captured_count++;

    CompletedCapture capture;
    capture.frame = make_frame(frame_id, raw_frame);
    capture.frame->changed = true;
    capture.frame->delta_percent = 100.0;
    capture.frame->keep_alive = keep_alive;
    capture.frame->forced = true;
    capture.forced = true;
    frames::FramePtr frame = capture.frame;
    complete(frame_id, std::move(capture));
    return frame;
}

void FrameSampler::complete(int64_t frame_id, CompletedCapture capture) {
    std::lock_guard<std::mutex> lock(release_mutex);
    completed_captures[frame_id] = std::move(capture);
    release_ready_frames();
}

// Caller holds release_mutex.
void FrameSampler::release_ready_frames() {
    while (true) {
        auto next = completed_captures.find(next_release_id);
        if (next == completed_captures.end()) {
            return;
        }
        CompletedCapture capture = std::move(next->second);
        completed_captures.erase(next);
        next_release_id++;

        SteadyClock::time_point now = SteadyClock::now();
        bool interval_elapsed = !has_forwarded ||
            now - last_forwarded_at >= std::chrono::milliseconds(keep_alive_interval_ms.load());

        bool forward = capture.forced || capture.frame->changed;
        if (!forward && interval_elapsed) {
            capture.frame->keep_alive = true;
            forward = true;
        }

        if (!forward) {
            dropped_count++;
            continue;
        }

        record_forward(now);
        forwarded_count++;
        emit(capture.frame);
    }
}

void FrameSampler::record_forward(SteadyClock::time_point now) {
    std::lock_guard<std::mutex> lock(stats_mutex);
    if (has_forwarded) {
        double interval_ms = std::chrono::duration<double, std::milli>(now - last_forwarded_at).count();
        forward_intervals_ms.push_back(interval_ms);
        while (forward_intervals_ms.size() > FORWARD_INTERVAL_WINDOW) {
            forward_intervals_ms.pop_front();
        }
    }
    has_forwarded = true;
    last_forwarded_at = now;
}

void FrameSampler::emit(const frames::FramePtr &frame) {
    std::vector<FrameSubscriber> targets;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex);
        targets.reserve(subscribers.size());
        for (const auto &entry : subscribers) {
            targets.push_back(entry.second);
        }
    }
    for (const FrameSubscriber &subscriber : targets) {
        try {
            subscriber(frame);
        } catch (const std::exception &exception) {
            debug_log::warn(std::string("sampler: subscriber threw: ") + exception.what());
        }
    }
}

void FrameSampler::on_keep_alive_tick() {
    if (!running.load()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(release_mutex);
        if (!has_forwarded) {
            return;
        }
        if (SteadyClock::now() - last_forwarded_at < std::chrono::milliseconds(keep_alive_interval_ms.load())) {
            return;
        }
    }

    frame_source::OnDemandCaptureResult capture = source.capture_on_demand();
    if (!capture.success) {
        debug_log::log("sampler: keep-alive capture failed: " + capture.error_detail);
        return;
    }
    if (!running.load()) {
        return;
    }
    ingest_forced(std::move(capture.raw_frame), true);
}

SamplerStats FrameSampler::stats() const {
    SamplerStats result;
    result.captured_count = captured_count.load();
    result.forwarded_count = forwarded_count.load();
    result.dropped_count = dropped_count.load();
    result.current_frame_id = current_frame_id.load();
    std::lock_guard<std::mutex> lock(stats_mutex);
    if (!forward_intervals_ms.empty()) {
        double total = 0;
        for (double interval : forward_intervals_ms) {
            total += interval;
        }
        result.avg_forward_interval_ms = total / static_cast<double>(forward_intervals_ms.size());
    }
    return result;
}

void FrameSampler::wait_idle() {
    comparison_pool.wait_idle();
}

} // namespace frame_sampler
