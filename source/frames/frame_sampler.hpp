#ifndef FRAMESYNC_FRAME_SAMPLER_HPP
#define FRAMESYNC_FRAME_SAMPLER_HPP

// Frame sampler: assigns ids to raw captures, runs the delta comparison on a
// worker pool and forwards frames to subscribers strictly in id order.
// A frame is forwarded when it changed, or when keep_alive_ms passed since the
// last forward; a timer additionally forces a fresh capture when the source
// has gone quiet for that long.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "frames/delta_detector.hpp"
#include "frames/frame_source.hpp"
#include "frames/frame_types.hpp"
#include "utils/timer_queue.hpp"
#include "utils/worker_pool.hpp"

namespace frame_sampler {

struct SamplerConfig {
    double delta_threshold_percent = delta_detector::DEFAULT_DELTA_THRESHOLD_PERCENT;
    int keep_alive_ms = 5000;
    size_t worker_count = 2;
    size_t max_queued_comparisons = 8;
};

struct SamplerStats {
    int64_t captured_count = 0;
    int64_t forwarded_count = 0;
    int64_t dropped_count = 0;
    double avg_forward_interval_ms = 0; // over the last FORWARD_INTERVAL_WINDOW forwards
    int64_t current_frame_id = 0;       // last id handed out, 0 before the first capture
};

struct CaptureNowResult {
    bool success = false;
    frames::FramePtr frame;
    std::string error_detail;
};

using SubscriberToken = uint64_t;
using FrameSubscriber = std::function<void(const frames::FramePtr &frame)>;

constexpr size_t FORWARD_INTERVAL_WINDOW = 32;

class FrameSampler {
public:
    // source must outlive the sampler.
    FrameSampler(frame_source::FrameSource &source, const SamplerConfig &config);
    ~FrameSampler();

    FrameSampler(const FrameSampler &) = delete;
    FrameSampler &operator=(const FrameSampler &) = delete;

    SubscriberToken subscribe(FrameSubscriber subscriber);
    bool unsubscribe(SubscriberToken token);

    // Attaches to the source and arms the keep-alive timer. Does not start the
    // source's capture; that is the owner's call.
    void start();
    void stop();
    bool is_running() const { return running.load(); }

    // Entry point for every captured frame. Thread-safe.
    void ingest(frames::RawFrame raw_frame);

    // On-demand snapshot forwarded as a forced change. Blocks on the source.
    CaptureNowResult capture_now();

    // Both return false and change nothing when the value is out of range.
    bool set_delta_threshold(double delta_threshold_percent);
    // Restarts the keep-alive timer with the new period when running.
    bool set_keep_alive_ms(int keep_alive_ms);
    int keep_alive_ms() const { return keep_alive_interval_ms.load(); }

    SamplerStats stats() const;

    // Waits until every dispatched comparison has been released.
    void wait_idle();

private:
    struct CompletedCapture {
        std::shared_ptr<frames::Frame> frame;
        bool forced = false;
    };

    frames::FramePtr ingest_forced(frames::RawFrame raw_frame, bool keep_alive);
    void complete(int64_t frame_id, CompletedCapture capture);
    void release_ready_frames();
    void emit(const frames::FramePtr &frame);
    void on_keep_alive_tick();
    void arm_keep_alive_timer();
    void record_forward(std::chrono::steady_clock::time_point now);

    frame_source::FrameSource &source;
    delta_detector::DeltaDetector detector;

    std::atomic<bool> running{false};
    std::atomic<int> keep_alive_interval_ms;

    // Id assignment and the comparison baseline.
    std::mutex ingest_mutex;
    int64_t next_frame_id = 1;
    frames::EncodedImagePtr last_captured_image;

    // In-order release.
    std::mutex release_mutex;
    std::map<int64_t, CompletedCapture> completed_captures;
    int64_t next_release_id = 1;
    bool has_forwarded = false;
    std::chrono::steady_clock::time_point last_forwarded_at;

    std::mutex subscribers_mutex;
    std::map<SubscriberToken, FrameSubscriber> subscribers;
    SubscriberToken next_subscriber_token = 1;

    mutable std::mutex stats_mutex;
    std::deque<double> forward_intervals_ms;
    std::atomic<int64_t> captured_count{0};
    std::atomic<int64_t> forwarded_count{0};
    std::atomic<int64_t> dropped_count{0};
    std::atomic<int64_t> current_frame_id{0};

    // Guards start/stop/keep-alive rearming. The keep-alive callback never takes it.
    std::mutex control_mutex;
    timer_queue::TimerId keep_alive_timer = timer_queue::INVALID_TIMER;

    timer_queue::TimerQueue timers;
    worker_pool::WorkerPool comparison_pool;
};

} // namespace frame_sampler

#endif // FRAMESYNC_FRAME_SAMPLER_HPP
