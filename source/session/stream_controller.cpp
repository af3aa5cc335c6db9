#include "session/stream_controller.hpp"
#include "browser/cdp/cdp_driver.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <set>

namespace stream_controller {

using browser_action::ActionType;
using browser_action::BrowserAction;
using frame_buffer::ActionOutcome;
using frame_buffer::FrameActionResult;

static const char ABOUT_BLANK[] = "about:blank";

StreamController::StreamController(const stream_config::StreamConfig &config) : base_config(config) {}

StreamController::~StreamController() {
    stop();
}

StartResult StreamController::start(const std::string &url) {
    return start(url, config());
}

StartResult StreamController::start(const std::string &url, const stream_config::StreamConfig &session_config) {
    std::lock_guard<std::mutex> lifecycle_lock(lifecycle_mutex);
    return start_locked(url, session_config);
}

StartResult StreamController::start_locked(const std::string &url, const stream_config::StreamConfig &session_config) {
    StartResult result;
    result.url = url.empty() ? ABOUT_BLANK : url;

    if (is_active()) {
        result.message = "Browser session already active. Use browser_stop first to start a new session.";
        result.error_detail = "session already active";
        return result;
    }
    std::vector<std::string> problems = stream_config::validate(session_config);
    if (!problems.empty()) {
        result.message = "Invalid stream configuration.";
        for (const std::string &problem : problems) {
            result.error_detail += problem + "; ";
        }
        return result;
    }

    // Ids and baselines restart with every session.
    std::shared_ptr<Session> new_session = std::make_shared<Session>();
    new_session->config = session_config;
    new_session->url = result.url;
    new_session->buffer = std::make_unique<frame_buffer::FrameBuffer>(stream_config::buffer_config(session_config));
    new_session->sampler = std::make_unique<frame_sampler::FrameSampler>(new_session->source,
                                                                         stream_config::sampler_config(session_config));
    new_session->executor = std::make_unique<input_executor::InputExecutor>(input_executor::cdp_input_backend());
    frame_buffer::FrameBuffer *buffer = new_session->buffer.get();
    new_session->buffer_subscription =
        new_session->sampler->subscribe([buffer](const frames::FramePtr &frame) { buffer->add_frame(frame); });

    debug_log::log("session: opening browser (" + std::to_string(session_config.viewport_width) + "x" +
                   std::to_string(session_config.viewport_height) +
                   (session_config.headless ? ", headless)" : ")"));
    browser_driver::DriverResult open_result = cdp_driver::open_browser(stream_config::browser_options(session_config));
    if (!open_result.success) {
        result.message = open_result.message.empty() ? "Failed to open browser." : open_result.message;
        result.error_detail = open_result.error_detail;
        return result;
    }

    new_session->sampler->start();
    browser_driver::DriverResult capture_result =
        new_session->source.start_capture(stream_config::screencast_options(session_config));
    if (!capture_result.success) {
        new_session->sampler->stop();
        cdp_driver::disconnect();
        result.message = "Failed to start the screencast.";
        result.error_detail = capture_result.error_detail;
        return result;
    }
    new_session->streaming = true;

    if (!url.empty()) {
        browser_driver::NavigateResult navigation = cdp_driver::navigate(url);
        if (!navigation.success) {
            new_session->sampler->stop();
            new_session->source.stop_capture();
            cdp_driver::disconnect();
            result.message = "Navigation to " + url + " failed.";
            result.error_detail = navigation.error_text;
            return result;
        }
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex);
        session = new_session;
        last_url = result.url;
    }

    // Chrome paints about:blank almost immediately; a real page gets a short
    // settle so the first frame shows it rather than the blank tab.
    frame_buffer::FrameWaitResult first;
    if (url.empty()) {
        first.frame = buffer->latest();
        if (!first.frame) {
            first = buffer->wait_for_next_frame(INITIAL_FRAME_TIMEOUT_MS);
        }
    } else {
        first = buffer->wait_for_stable_frame(NAVIGATE_STABLE_DURATION_MS, INITIAL_FRAME_TIMEOUT_MS);
    }
    result.first_frame = first.frame;
    if (!result.first_frame) {
        frame_sampler::CaptureNowResult capture = new_session->sampler->capture_now();
        if (capture.success) {
            result.first_frame = capture.frame;
        } else {
            debug_log::warn("session: no initial frame: " + capture.error_detail);
        }
    }

    result.success = true;
    result.message = "Browser started. Viewport: " + std::to_string(session_config.viewport_width) + "x" +
                     std::to_string(session_config.viewport_height) + ". URL: " + result.url;
    std::cerr << "[framesync] session started at " << result.url << std::endl;
    return result;
}

std::shared_ptr<Session> StreamController::active_session() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return session;
}

bool StreamController::is_active() const {
    return active_session() != nullptr;
}

stream_config::StreamConfig StreamController::config() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return base_config;
}

FrameActionResult StreamController::execute_action(const BrowserAction &action) {
    std::shared_ptr<Session> current = active_session();
    if (!current) {
        FrameActionResult result;
        result.action = action;
        result.outcome = ActionOutcome::NoFrameAvailable;
        result.error_detail = "no active browser session";
        return result;
    }
    if (action.type == ActionType::Navigate) {
        return navigate(current, action);
    }
    // The executor can outlive this call when it overruns max_wait_ms, so it holds the session.
    return current->buffer->register_action(
        action, [current](const BrowserAction &queued_action) { return current->executor->execute(queued_action); });
}

FrameActionResult StreamController::navigate(const std::shared_ptr<Session> &current, const BrowserAction &action) {
    FrameActionResult result;
    result.action = action;
    result.before_frame = current->buffer->latest();
    std::chrono::steady_clock::time_point issued_at = std::chrono::steady_clock::now();

    if (action.url.empty()) {
        result.outcome = ActionOutcome::ActionFailed;
        result.error_detail = "navigate requires a url";
        result.action_result.error_detail = result.error_detail;
        return result;
    }

    result.action_result = current->executor->execute(action);
    if (!result.action_result.success) {
        result.outcome = ActionOutcome::ActionFailed;
        result.error_detail = result.action_result.error_detail;
        return result;
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        current->url = action.url;
        last_url = action.url;
    }

    frame_buffer::FrameWaitResult settled =
        current->buffer->wait_for_stable_frame(NAVIGATE_STABLE_DURATION_MS, NAVIGATE_STABLE_TIMEOUT_MS);
    result.latency_ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                              issued_at).count();
    if (settled.status == frame_buffer::WaitStatus::Cancelled) {
        result.outcome = ActionOutcome::Cancelled;
        result.error_detail = settled.error_detail;
        return result;
    }
    if (!settled.frame) {
        result.outcome = ActionOutcome::NoFrameAvailable;
        result.error_detail = settled.error_detail;
        return result;
    }
    result.after_frame = settled.frame;
    result.outcome = settled.status == frame_buffer::WaitStatus::Ok ? ActionOutcome::ResolvedByFrame
                                                                    : ActionOutcome::ResolvedByTimeout;
    result.caused_change = !result.before_frame || result.before_frame->id != result.after_frame->id;
    return result;
}

std::vector<FrameActionResult> StreamController::execute_actions(const std::vector<BrowserAction> &actions) {
    std::vector<FrameActionResult> results;
    for (const BrowserAction &action : actions) {
        results.push_back(execute_action(action));
        ActionOutcome outcome = results.back().outcome;
        if (outcome == ActionOutcome::ActionFailed || outcome == ActionOutcome::Cancelled ||
            outcome == ActionOutcome::NoFrameAvailable) {
            break;
        }
    }
    return results;
}

frame_sampler::CaptureNowResult StreamController::capture_screenshot() {
    std::shared_ptr<Session> current = active_session();
    if (!current) {
        frame_sampler::CaptureNowResult result;
        result.error_detail = "no active browser session";
        return result;
    }
    return current->sampler->capture_now();
}

ControlResult StreamController::update_config(const json &changes) {
    ControlResult result;
    stream_config::StreamConfig updated = config();
    if (!stream_config::apply_json(changes, updated, result.error_detail)) {
        result.message = "Invalid configuration update.";
        return result;
    }
    std::vector<std::string> problems = stream_config::validate(updated);
    if (!problems.empty()) {
        result.message = "Invalid configuration update.";
        for (const std::string &problem : problems) {
            result.error_detail += problem + "; ";
        }
        return result;
    }

    static const std::set<std::string> HOT_KEYS = {"delta_threshold_percent", "keep_alive_ms"};
    std::vector<std::string> deferred_keys;
    for (auto entry = changes.begin(); entry != changes.end(); ++entry) {
        if (HOT_KEYS.count(entry.key()) == 0) {
            deferred_keys.push_back(entry.key());
        }
    }

    std::shared_ptr<Session> current;
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        base_config = updated;
        current = session;
    }

    result.success = true;
    result.message = "Configuration updated.";
    if (current) {
        // Both values were validated above, so the setters accept them.
        current->sampler->set_delta_threshold(updated.delta_threshold_percent);
        current->sampler->set_keep_alive_ms(updated.keep_alive_ms);
        {
            std::lock_guard<std::mutex> lock(state_mutex);
            current->config.delta_threshold_percent = updated.delta_threshold_percent;
            current->config.keep_alive_ms = updated.keep_alive_ms;
        }
        if (!deferred_keys.empty()) {
            std::string keys;
            for (const std::string &key : deferred_keys) {
                keys += (keys.empty() ? "" : ", ") + key;
            }
            result.message += " Applies to the next session: " + keys + ".";
        }
    }
    debug_log::log("session: config updated: " + changes.dump());
    return result;
}

ControlResult StreamController::pause_streaming() {
    ControlResult result;
    std::shared_ptr<Session> current = active_session();
    if (!current) {
        result.error_detail = "no active browser session";
        return result;
    }
    std::lock_guard<std::mutex> lock(current->streaming_mutex);
    if (current->streaming) {
        current->sampler->stop();
        current->source.stop_capture();
        current->streaming = false;
    }
    result.success = true;
    result.message = "Streaming paused.";
    return result;
}

ControlResult StreamController::resume_streaming() {
    ControlResult result;
    std::shared_ptr<Session> current = active_session();
    if (!current) {
        result.error_detail = "no active browser session";
        return result;
    }
    std::lock_guard<std::mutex> lock(current->streaming_mutex);
    if (!current->streaming) {
        current->sampler->start();
        browser_driver::DriverResult capture_result =
            current->source.start_capture(stream_config::screencast_options(current->config));
        if (!capture_result.success) {
            current->sampler->stop();
            result.error_detail = capture_result.error_detail;
            return result;
        }
        current->streaming = true;
    }
    result.success = true;
    result.message = "Streaming resumed.";
    return result;
}

void StreamController::stop() {
    std::lock_guard<std::mutex> lifecycle_lock(lifecycle_mutex);
    stop_locked();
}

void StreamController::stop_locked() {
    std::shared_ptr<Session> stopping;
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        stopping.swap(session);
    }
    if (!stopping) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(stopping->streaming_mutex);
        stopping->sampler->stop();
        stopping->source.stop_capture();
        stopping->streaming = false;
    }
    stopping->sampler->wait_idle();
    stopping->sampler->unsubscribe(stopping->buffer_subscription);
    stopping->buffer->clear();
    cdp_driver::disconnect();
    std::cerr << "[framesync] session stopped" << std::endl;
}

StartResult StreamController::recover() {
    std::lock_guard<std::mutex> lifecycle_lock(lifecycle_mutex);
    std::string url;
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        url = last_url;
    }
    if (is_active()) {
        browser_driver::PageInfoResult page = cdp_driver::get_page_info();
        if (page.success && !page.url.empty()) {
            url = page.url;
        }
    }
    debug_log::warn("session: recovering at " + (url.empty() ? std::string(ABOUT_BLANK) : url));
    stop_locked();
    return start_locked(url == ABOUT_BLANK ? "" : url, config());
}

json StreamController::status_json() const {
    json status;
    std::shared_ptr<Session> current = active_session();
    status["active"] = current != nullptr;
    if (!current) {
        status["streaming"] = false;
        status["config"] = stream_config::to_json(config());
        return status;
    }

    {
        std::lock_guard<std::mutex> lock(current->streaming_mutex);
        status["streaming"] = current->streaming;
    }
    status["screencast_running"] = current->source.is_capturing();
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        status["url"] = current->url;
        status["config"] = stream_config::to_json(current->config);
    }
    status["session_id"] = cdp_driver::current_session_id();
    int browser_process_id = cdp_driver::get_state().chrome_process_id;
    status["browser_process_id"] = browser_process_id;
    status["browser_process_running"] = platform::is_process_running(browser_process_id);

    frame_sampler::SamplerStats sampler_stats = current->sampler->stats();
    status["stream_stats"] = {
        {"captured_count", sampler_stats.captured_count},
        {"forwarded_count", sampler_stats.forwarded_count},
        {"dropped_count", sampler_stats.dropped_count},
        {"avg_forward_interval_ms", sampler_stats.avg_forward_interval_ms},
        {"current_frame_id", sampler_stats.current_frame_id}
    };

    frame_buffer::BufferStats buffer_stats = current->buffer->stats();
    status["buffer_stats"] = {
        {"buffered_count", buffer_stats.buffered_count},
        {"pending_correlation_count", buffer_stats.pending_correlation_count},
        {"oldest_age_ms", buffer_stats.oldest_age_ms},
        {"newest_age_ms", buffer_stats.newest_age_ms},
        {"oldest_frame_id", buffer_stats.oldest_frame_id},
        {"newest_frame_id", buffer_stats.newest_frame_id}
    };
    return status;
}

} // namespace stream_controller
