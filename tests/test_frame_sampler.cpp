// Tests for the frame sampler: delta-based forwarding, keep-alive and forced captures.
// Frames are pushed through a FakeFrameSource; timings are kept short.

#include "frames/frame_sampler.hpp"
#include "test_support.hpp"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

using test_support::check;

namespace test_frame_sampler {

static frames::EncodedImagePtr white_image() {
    return test_support::encode_png(test_support::solid_raster(64, 64, 255, 255, 255));
}

// 16 x 13 = 208 of 4096 pixels, about 5 %.
static frames::EncodedImagePtr five_percent_changed_image() {
    image_decode::RasterImage image = test_support::solid_raster(64, 64, 255, 255, 255);
    test_support::fill_rect(image, 20, 20, 16, 13, 0, 0, 0);
    return test_support::encode_png(image);
}

static frames::EncodedImagePtr black_image() {
    return test_support::encode_png(test_support::solid_raster(64, 64, 0, 0, 0));
}

// Large and incompressible, so decoding it for a comparison takes a while.
static frames::EncodedImagePtr noise_image(int size, uint32_t seed) {
    image_decode::RasterImage image = test_support::solid_raster(size, size, 0, 0, 0);
    uint32_t state = seed;
    for (size_t index = 0; index < image.rgba.size(); index += 4) {
        state = state * 1664525u + 1013904223u;
        image.rgba[index] = static_cast<uint8_t>(state >> 24);
        image.rgba[index + 1] = static_cast<uint8_t>(state >> 16);
        image.rgba[index + 2] = static_cast<uint8_t>(state >> 8);
    }
    return test_support::encode_png(image);
}

// Collects forwarded frames from the subscriber thread.
class FrameCollector {
public:
    void add(const frames::FramePtr &frame) {
        std::lock_guard<std::mutex> lock(frames_mutex);
        collected.push_back(frame);
    }
    std::vector<frames::FramePtr> snapshot() const {
        std::lock_guard<std::mutex> lock(frames_mutex);
        return collected;
    }
    size_t size() const {
        std::lock_guard<std::mutex> lock(frames_mutex);
        return collected.size();
    }

private:
    mutable std::mutex frames_mutex;
    std::vector<frames::FramePtr> collected;
};

static frame_sampler::SamplerConfig test_config(int keep_alive_ms) {
    frame_sampler::SamplerConfig config;
    config.delta_threshold_percent = 2.0;
    config.keep_alive_ms = keep_alive_ms;
    config.worker_count = 2;
    config.max_queued_comparisons = 8;
    return config;
}

static bool test_changed_frame_is_forwarded() {
    test_support::FakeFrameSource source;
    FrameCollector collector;
    frame_sampler::FrameSampler sampler(source, test_config(5000));
    sampler.subscribe([&collector](const frames::FramePtr &frame) { collector.add(frame); });
    sampler.start();

    source.push(white_image());
    test_support::wait_until([&]() { return collector.size() >= 1; }, 2000);
    source.push(five_percent_changed_image());
    test_support::wait_until([&]() { return collector.size() >= 2; }, 2000);

    std::vector<frames::FramePtr> forwarded = collector.snapshot();
    bool success = check(forwarded.size() == 2, "First frame and the 5% change are both forwarded");
    if (forwarded.size() == 2) {
        success &= check(forwarded[0]->id == 1 && forwarded[0]->changed, "First frame is id 1 and counts as changed");
        success &= check(forwarded[1]->id == 2 && forwarded[1]->changed && !forwarded[1]->keep_alive,
                         "Second frame is id 2, changed, not a keep-alive");
        success &= check(forwarded[1]->delta_percent > 4.0 && forwarded[1]->delta_percent < 6.0,
                         "Second frame carries a delta of about 5%");
        success &= check(forwarded[1]->mime_type == "image/png", "MIME type is passed through");
    }
    return success;
}

static bool test_identical_frames_are_dropped() {
    test_support::FakeFrameSource source;
    FrameCollector collector;
    frame_sampler::FrameSampler sampler(source, test_config(5000));
    sampler.subscribe([&collector](const frames::FramePtr &frame) { collector.add(frame); });
    sampler.start();

    frames::EncodedImagePtr image = white_image();
    for (int index = 0; index < 4; index++) {
        source.push(image);
    }
    test_support::wait_until([&]() { return sampler.stats().dropped_count >= 3; }, 2000);
    sampler.wait_idle();

    frame_sampler::SamplerStats stats = sampler.stats();
    bool success = check(collector.size() == 1, "Only the first of four identical frames is forwarded");
    success &= check(stats.captured_count == 4 && stats.dropped_count == 3 && stats.forwarded_count == 1,
                     "Stats count 4 captured, 3 dropped, 1 forwarded");
    success &= check(stats.current_frame_id == 4, "Every capture consumed an id");
    return success;
}

static bool test_keep_alive_forwards_unchanged_frames() {
    test_support::FakeFrameSource source;
    source.set_on_demand_image(white_image());
    FrameCollector collector;
    frame_sampler::FrameSampler sampler(source, test_config(200));
    sampler.subscribe([&collector](const frames::FramePtr &frame) { collector.add(frame); });
    sampler.start();

    frames::EncodedImagePtr image = white_image();
    auto stop_at = std::chrono::steady_clock::now() + std::chrono::milliseconds(700);
    while (std::chrono::steady_clock::now() < stop_at) {
        source.push(image);
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    sampler.stop();
    sampler.wait_idle();

    std::vector<frames::FramePtr> forwarded = collector.snapshot();
    int keep_alive_count = 0;
    bool ids_increasing = true;
    for (size_t index = 0; index < forwarded.size(); index++) {
        if (forwarded[index]->keep_alive) {
            keep_alive_count++;
        }
        if (index > 0 && forwarded[index]->id <= forwarded[index - 1]->id) {
            ids_increasing = false;
        }
    }
    bool success = check(keep_alive_count >= 2, "At least two keep-alive frames over 700 ms with a 200 ms period (got " +
                                                std::to_string(keep_alive_count) + ")");
    success &= check(forwarded.size() < 20, "Unchanged frames between keep-alives are dropped");
    success &= check(ids_increasing, "Forwarded ids are strictly increasing");
    return success;
}

static bool test_quiet_source_gets_forced_keep_alive() {
    test_support::FakeFrameSource source;
    source.set_on_demand_image(black_image());
    FrameCollector collector;
    frame_sampler::FrameSampler sampler(source, test_config(100));
    sampler.subscribe([&collector](const frames::FramePtr &frame) { collector.add(frame); });
    sampler.start();

    source.push(white_image());
    test_support::wait_until([&]() { return collector.size() >= 2; }, 1500);
    sampler.stop();

    std::vector<frames::FramePtr> forwarded = collector.snapshot();
    bool success = check(forwarded.size() >= 2, "A silent source still produces frames");
    success &= check(source.on_demand_count() >= 1, "The keep-alive timer captured on demand");
    if (forwarded.size() >= 2) {
        success &= check(forwarded[1]->keep_alive && forwarded[1]->changed && forwarded[1]->delta_percent == 100.0,
                         "Forced keep-alive frame is marked keep-alive with a 100% delta");
        success &= check(forwarded[1]->id == forwarded[0]->id + 1, "Forced capture takes the next id");
    }
    return success;
}

static bool test_capture_now_leaves_baseline_alone() {
    test_support::FakeFrameSource source;
    FrameCollector collector;
    frame_sampler::FrameSampler sampler(source, test_config(5000));
    sampler.subscribe([&collector](const frames::FramePtr &frame) { collector.add(frame); });
    sampler.start();

    frames::EncodedImagePtr image = white_image();
    source.push(image);
    test_support::wait_until([&]() { return collector.size() >= 1; }, 2000);

    source.set_on_demand_image(black_image());
    frame_sampler::CaptureNowResult forced = sampler.capture_now();
    bool success = check(forced.success && forced.frame, "capture_now returns a frame");
    if (forced.frame) {
        success &= check(forced.frame->id == 2 && forced.frame->changed && forced.frame->delta_percent == 100.0 &&
                         !forced.frame->keep_alive, "Forced capture is id 2, a full change and not a keep-alive");
    }

    // Compared against the pushed white frame, not the forced black one.
    source.push(image);
    test_support::wait_until([&]() { return sampler.stats().dropped_count >= 1; }, 2000);
    success &= check(sampler.stats().dropped_count == 1 && collector.size() == 2,
                     "Next identical push is dropped against the streamed baseline");
    return success;
}

static bool test_forced_frame_waits_for_pending_comparison() {
    test_support::FakeFrameSource source;
    source.set_on_demand_image(black_image());
    FrameCollector collector;
    frame_sampler::FrameSampler sampler(source, test_config(5000));
    sampler.subscribe([&collector](const frames::FramePtr &frame) { collector.add(frame); });
    sampler.start();

    source.push(noise_image(1600, 1));
    test_support::wait_until([&]() { return collector.size() >= 1; }, 5000);

    // Frame 2 needs two large decodes; the forced frame 3 is complete at once.
    source.push(noise_image(1600, 2));
    frame_sampler::CaptureNowResult forced = sampler.capture_now();
    size_t forwarded_when_forced = collector.size();
    test_support::wait_until([&]() { return collector.size() >= 3; }, 5000);

    std::vector<frames::FramePtr> forwarded = collector.snapshot();
    bool success = check(forced.success && forced.frame && forced.frame->id == 3, "Forced capture takes id 3");
    success &= check(forwarded_when_forced != 2,
                     "The forced frame is never forwarded ahead of the comparison before it");
    success &= check(forwarded.size() == 3, "Both frames are forwarded");
    if (forwarded.size() == 3) {
        success &= check(forwarded[0]->id == 1 && forwarded[1]->id == 2 && forwarded[2]->id == 3,
                         "Subscriber sees ids 1, 2, 3 in order");
        success &= check(forwarded[2]->forced && !forwarded[1]->forced, "Only the on-demand frame is marked forced");
    }
    return success;
}

static bool test_capture_now_failure() {
    test_support::FakeFrameSource source;
    frame_sampler::FrameSampler sampler(source, test_config(5000));
    sampler.start();
    frame_sampler::CaptureNowResult forced = sampler.capture_now();
    bool success = check(!forced.success && !forced.frame && !forced.error_detail.empty(),
                         "capture_now reports the source failure");
    success &= check(sampler.stats().current_frame_id == 0, "A failed capture consumes no id");
    return success;
}

static bool test_setters_validate() {
    test_support::FakeFrameSource source;
    frame_sampler::FrameSampler sampler(source, test_config(5000));
    bool success = check(!sampler.set_delta_threshold(-1.0), "Negative delta threshold is rejected");
    success &= check(!sampler.set_delta_threshold(100.5), "Delta threshold above 100 is rejected");
    success &= check(sampler.set_delta_threshold(10.0), "Delta threshold 10 is accepted");
    success &= check(!sampler.set_keep_alive_ms(0), "Zero keep-alive is rejected");
    success &= check(sampler.keep_alive_ms() == 5000, "Rejected keep-alive leaves the old value");
    success &= check(sampler.set_keep_alive_ms(250) && sampler.keep_alive_ms() == 250, "Keep-alive 250 is accepted");
    return success;
}

static bool test_raised_threshold_drops_small_change() {
    test_support::FakeFrameSource source;
    FrameCollector collector;
    frame_sampler::FrameSampler sampler(source, test_config(5000));
    sampler.subscribe([&collector](const frames::FramePtr &frame) { collector.add(frame); });
    sampler.start();
    sampler.set_delta_threshold(10.0);

    source.push(white_image());
    test_support::wait_until([&]() { return collector.size() >= 1; }, 2000);
    source.push(five_percent_changed_image());
    test_support::wait_until([&]() { return sampler.stats().dropped_count >= 1; }, 2000);
    return check(collector.size() == 1, "A 5% change is dropped under a 10% threshold");
}

static bool test_stop_detaches_and_ignores_empty_frames() {
    test_support::FakeFrameSource source;
    frame_sampler::FrameSampler sampler(source, test_config(5000));
    sampler.start();
    sampler.ingest(frames::RawFrame());
    bool success = check(sampler.stats().captured_count == 0, "Empty captures are ignored");
    sampler.stop();
    success &= check(!sampler.is_running(), "Sampler reports stopped");
    success &= check(!source.push(white_image()), "Stopped sampler is detached from the source");

    frame_sampler::SubscriberToken token = sampler.subscribe([](const frames::FramePtr &) {});
    success &= check(sampler.unsubscribe(token) && !sampler.unsubscribe(token), "Subscriptions can be removed once");
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_changed_frame_is_forwarded();
    all_passed &= test_identical_frames_are_dropped();
    all_passed &= test_keep_alive_forwards_unchanged_frames();
    all_passed &= test_quiet_source_gets_forced_keep_alive();
    all_passed &= test_capture_now_leaves_baseline_alone();
    all_passed &= test_forced_frame_waits_for_pending_comparison();
    all_passed &= test_capture_now_failure();
    all_passed &= test_setters_validate();
    all_passed &= test_raised_threshold_drops_small_change();
    all_passed &= test_stop_detaches_and_ignores_empty_frames();
    return all_passed;
}

} // namespace test_frame_sampler
