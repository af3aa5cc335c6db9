#ifndef FRAMESYNC_CDP_DRIVER_HPP
#define FRAMESYNC_CDP_DRIVER_HPP

// CDP (Chrome DevTools Protocol) driver.
// Manages the WebSocket connection to Chrome, Target/session routing,
// and provides high-level functions for screencast capture and input.
//
// libwebsockets is serviced on a dedicated thread started by connect().
// Outgoing messages are queued and written from LWS_CALLBACK_CLIENT_WRITEABLE;
// send_command() blocks the caller on a condition variable until the matching
// response arrives. Event handlers run on the service thread and must not call
// send_command() (post_command() is fine).

#include <nlohmann/json.hpp>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>

#include "browser/browser_driver_abi.hpp"

struct lws_context;
struct lws;

namespace cdp_driver {

using json = nlohmann::json;

// Receives the "params" object of a CDP event.
using EventHandler = std::function<void(const json &params)>;

// State of the CDP connection.
struct ConnectionState {
    std::atomic<bool> connected{false};
    std::atomic<bool> connection_failed{false};
    std::atomic<bool> shutting_down{false};
    struct lws_context *websocket_context = nullptr;
    struct lws *websocket_connection = nullptr;
    std::thread service_thread;

    // Chrome process info
    int chrome_process_id = -1;
    std::string user_data_directory;
    bool owns_user_data_directory = false;

    // CDP message ID counter (incremented for each request).
    std::atomic<int> next_message_id{1};

    // Current active target and session.
    std::string current_target_id;
    std::string current_session_id;
    std::mutex session_mutex;

    // Responses for commands a caller is blocked on (ids in awaited_message_ids).
    std::map<int, json> pending_responses;
    std::set<int> awaited_message_ids;
    std::mutex pending_mutex;
    std::condition_variable pending_condition;

    // Serialized commands waiting for the socket to become writeable.
    std::deque<std::string> outgoing_messages;
    std::mutex outgoing_mutex;

    // Buffer for incoming WebSocket fragments (service thread only).
    std::string receive_buffer;
    bool discarding_message = false; // skipping the rest of an oversized message

    // CDP method name -> handler.
    std::map<std::string, EventHandler> event_handlers;
    std::mutex handlers_mutex;
};

// Screencast frames are several hundred KiB of base64; messages beyond this
// are dropped instead of buffered.
constexpr size_t MAX_INCOMING_MESSAGE_BYTES = 64 * 1024 * 1024;

struct WebSocketEndpoint {
    std::string host;
    int port = -1;
    std::string path = "/";
};

// Splits "ws://host:port/path". False for another scheme, a missing or
// invalid port, or an empty host.
bool parse_websocket_url(const std::string &websocket_url, WebSocketEndpoint &out_endpoint);

// Initialize the CDP driver (reset global state). Call once at startup.
void initialize();

// Connect to Chrome via WebSocket at the given URL and start the service thread.
// Returns true on success.
bool connect(const std::string &websocket_url);

// Stop the service thread, close the socket, kill the Chrome we launched.
void disconnect();

bool is_connected();

// Send a CDP command and wait for the response (blocking, with timeout).
// If session_id is non-empty, the command is routed to that session.
// Returns the response JSON, or {"error": "..."} if timed out / failed.
json send_command(const std::string &method, const json &params,
                  const std::string &session_id = "", int timeout_milliseconds = 10000);

// Queue a command without waiting for its response. Returns false if not connected.
bool post_command(const std::string &method, const json &params, const std::string &session_id = "");

// True if the response is a transport error ("error" string) or a CDP error
// object ({"error": {"code", "message"}}); fills error_detail.
bool command_failed(const json &response, std::string &error_detail);

// Register (or replace, or with an empty handler remove) the handler for a CDP event.
void set_event_handler(const std::string &method, EventHandler handler);
void clear_event_handlers();

// --- High-level browser operations (using browser_driver_abi types) ---

// Open the browser: launch Chrome, connect via CDP, attach to a page target,
// enable the Page domain and apply the viewport.
browser_driver::DriverResult open_browser(const browser_driver::OpenBrowserOptions &options = {});

// Navigate the current tab to the given URL.
browser_driver::NavigateResult navigate(const std::string &url);

// Emulation.setDeviceMetricsOverride on the current tab.
browser_driver::DriverResult set_viewport(int width, int height);

// Page.startScreencast / Page.stopScreencast. Frames arrive as Page.screencastFrame events.
browser_driver::DriverResult start_screencast(const browser_driver::ScreencastOptions &options);
browser_driver::DriverResult stop_screencast();

// Fire-and-forget Page.screencastFrameAck; Chrome stops sending frames until acked.
void acknowledge_screencast_frame(int screencast_session_id);

// Capture a screenshot of the current tab. Returns base64 image data and mime type.
browser_driver::CaptureScreenshotResult capture_screenshot(const browser_driver::CaptureScreenshotOptions &options = {});

// Input domain.
browser_driver::DriverResult dispatch_mouse_event(const browser_driver::MouseEvent &event);
browser_driver::DriverResult dispatch_key_event(const browser_driver::KeyEvent &event);
browser_driver::DriverResult insert_text(const std::string &text);

// URL and title of the current tab.
browser_driver::PageInfoResult get_page_info();

// Session id of the attached tab (empty when not attached).
std::string current_session_id();

// Get the connection state (for introspection / testing).
ConnectionState &get_state();

} // namespace cdp_driver

#endif // FRAMESYNC_CDP_DRIVER_HPP
