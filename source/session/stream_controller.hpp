#ifndef FRAMESYNC_STREAM_CONTROLLER_HPP
#define FRAMESYNC_STREAM_CONTROLLER_HPP

// One browser streaming session: Chrome over CDP, the screencast frame source,
// the sampler feeding the frame buffer, and the input executor.
//
// At most one session is active per process (the CDP driver is a global).
// Public methods are thread-safe; start/stop/recover are serialized against
// each other, while actions and frame queries run against a snapshot of the
// current session and never block a concurrent stop for longer than their
// own bounded wait.

#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "browser/browser_action.hpp"
#include "browser/cdp/cdp_frame_source.hpp"
#include "browser/input_executor.hpp"
#include "frames/frame_buffer.hpp"
#include "frames/frame_sampler.hpp"
#include "session/stream_config.hpp"

namespace stream_controller {

using json = nlohmann::json;

// Waits used by start() and the navigate action.
constexpr int INITIAL_FRAME_TIMEOUT_MS = 5000;
constexpr int NAVIGATE_STABLE_DURATION_MS = 500;
constexpr int NAVIGATE_STABLE_TIMEOUT_MS = 5000;

struct StartResult {
    bool success = false;
    frames::FramePtr first_frame; // may be null if the page never painted
    std::string url;
    std::string message;
    std::string error_detail;
};

struct ControlResult {
    bool success = false;
    std::string message;
    std::string error_detail;
};

// Everything that lives exactly as long as one started session.
struct Session {
    stream_config::StreamConfig config;
    std::string url;
    cdp_frame_source::CdpFrameSource source;
    std::unique_ptr<frame_buffer::FrameBuffer> buffer;
    std::unique_ptr<frame_sampler::FrameSampler> sampler;
    std::unique_ptr<input_executor::InputExecutor> executor;
    frame_sampler::SubscriberToken buffer_subscription = 0;
    std::mutex streaming_mutex;
    bool streaming = false;
};

class StreamController {
public:
    explicit StreamController(const stream_config::StreamConfig &config);
    ~StreamController();

    StreamController(const StreamController &) = delete;
    StreamController &operator=(const StreamController &) = delete;

    // Launches Chrome and starts streaming; url may be empty (about:blank).
    // Fails if a session is already active.
    StartResult start(const std::string &url);
    StartResult start(const std::string &url, const stream_config::StreamConfig &session_config);

    // navigate is driven directly and waits for a stable frame; every other
    // action goes through FrameBuffer::register_action. Without an active
    // session the result is NoFrameAvailable with an error_detail.
    frame_buffer::FrameActionResult execute_action(const browser_action::BrowserAction &action);
    // Runs in order and stops after the first action that fails or is cancelled.
    std::vector<frame_buffer::FrameActionResult> execute_actions(const std::vector<browser_action::BrowserAction> &actions);

    // On-demand capture forwarded through the sampler as a forced change.
    frame_sampler::CaptureNowResult capture_screenshot();

    // Applies the hot-reloadable subset (delta_threshold_percent,
    // keep_alive_ms) to the running session. Other keys are stored for the
    // next start(). All-or-nothing.
    ControlResult update_config(const json &changes);

    ControlResult pause_streaming();
    ControlResult resume_streaming();

    // Idempotent. Cancels every waiter, stops timers and capture, closes Chrome.
    void stop();

    // stop() then start() at the last known URL.
    StartResult recover();

    bool is_active() const;
    json status_json() const;

    // Snapshot of the running session; null when none. Holding it keeps the
    // buffer alive across a concurrent stop(), whose clear() cancels waits.
    std::shared_ptr<Session> active_session() const;

    stream_config::StreamConfig config() const;

private:
    frame_buffer::FrameActionResult navigate(const std::shared_ptr<Session> &session,
                                             const browser_action::BrowserAction &action);
    StartResult start_locked(const std::string &url, const stream_config::StreamConfig &session_config);
    void stop_locked();

    mutable std::mutex state_mutex;
    stream_config::StreamConfig base_config;
    std::shared_ptr<Session> session;
    std::string last_url;

    // Serializes start/stop/recover.
    std::mutex lifecycle_mutex;
};

} // namespace stream_controller

#endif // FRAMESYNC_STREAM_CONTROLLER_HPP
