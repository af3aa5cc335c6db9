#include "browser/cdp/cdp_driver.hpp"
#include "browser/cdp/cdp_chrome_launch.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <libwebsockets.h>
#include <iostream>
#include <cstring>
#include <chrono>
#include <stdexcept>
#include <vector>

namespace cdp_driver {

// Module-level connection state (not a class instance; global singleton).
static ConnectionState global_state;

static constexpr int CONNECT_TIMEOUT_MILLISECONDS = 20000;
static constexpr int INPUT_TIMEOUT_MILLISECONDS = 5000;
static constexpr int CHROME_EXIT_GRACE_MILLISECONDS = 3000;

// Forward declaration of the WebSocket callback.
static int websocket_callback(struct lws *websocket_instance, enum lws_callback_reasons reason,
                              void *user_data, void *incoming_data, size_t incoming_length);

// WebSocket protocol definition for libwebsockets.
static const struct lws_protocols websocket_protocols[] = {
    {
        "cdp-protocol",
        websocket_callback,
        0,     // per-session data size
        262144 // rx buffer size
    },
    {nullptr, nullptr, 0, 0} // sentinel
};

// --- Incoming message routing ---

static void dispatch_event(const json &message) {
    std::string method = message["method"].get<std::string>();

    // Page-level events carry the flattened session id; drop the ones for other targets.
    if (message.contains("sessionId") && message["sessionId"].is_string()) {
        std::string event_session_id = message["sessionId"].get<std::string>();
        if (event_session_id != current_session_id()) {
            return;
        }
    }

    EventHandler handler;
    {
        std::lock_guard<std::mutex> lock(global_state.handlers_mutex);
        auto handler_iterator = global_state.event_handlers.find(method);
        if (handler_iterator != global_state.event_handlers.end()) {
            handler = handler_iterator->second;
        }
    }
    if (!handler) {
        return;
    }

    static const json empty_params = json::object();
    const json &params = message.contains("params") ? message["params"] : empty_params;
    try {
        handler(params);
    } catch (const std::exception &exception) {
        debug_log::warn("CDP event handler for " + method + " threw: " + exception.what());
    }
}

static void handle_complete_message() {
    json message;
    try {
        message = json::parse(global_state.receive_buffer);
    } catch (const json::parse_error &parse_error) {
        std::cerr << "[framesync] Failed to parse CDP message: " << parse_error.what()
                  << ", buffer content: " << global_state.receive_buffer.substr(0, 200) << std::endl;
        global_state.receive_buffer.clear();
        return;
    }
    global_state.receive_buffer.clear();

    // Responses have an "id"; events have a "method" and no id.
    if (message.contains("id") && message["id"].is_number_integer()) {
        int message_id = message["id"].get<int>();
        std::lock_guard<std::mutex> lock(global_state.pending_mutex);
        if (global_state.awaited_message_ids.count(message_id) > 0) {
            global_state.pending_responses[message_id] = std::move(message);
            global_state.pending_condition.notify_all();
        }
        return;
    }
    if (message.contains("method") && message["method"].is_string()) {
        dispatch_event(message);
    }
}

static void write_next_message(struct lws *websocket_instance) {
    std::string serialized_message;
    bool more_queued = false;
    {
        std::lock_guard<std::mutex> lock(global_state.outgoing_mutex);
        if (global_state.outgoing_messages.empty()) {
            return;
        }
        serialized_message = std::move(global_state.outgoing_messages.front());
        global_state.outgoing_messages.pop_front();
        more_queued = !global_state.outgoing_messages.empty();
    }

    // libwebsockets requires LWS_PRE bytes of padding before the data.
    std::vector<unsigned char> send_buffer(LWS_PRE + serialized_message.size());
    memcpy(send_buffer.data() + LWS_PRE, serialized_message.data(), serialized_message.size());
    int bytes_written = lws_write(websocket_instance, send_buffer.data() + LWS_PRE,
                                  serialized_message.size(), LWS_WRITE_TEXT);
    if (bytes_written < static_cast<int>(serialized_message.size())) {
        std::cerr << "[framesync] CDP WebSocket write failed (" << bytes_written << " of "
                  << serialized_message.size() << " bytes)." << std::endl;
    }
    if (more_queued) {
        lws_callback_on_writable(websocket_instance);
    }
}

static void mark_disconnected() {
    global_state.connected = false;
    global_state.websocket_connection = nullptr;
    std::lock_guard<std::mutex> lock(global_state.pending_mutex);
    global_state.pending_condition.notify_all();
}

// --- WebSocket callback ---

static int websocket_callback(struct lws *websocket_instance, enum lws_callback_reasons reason,
                              void *user_data, void *incoming_data, size_t incoming_length) {
    (void)user_data;

    switch (reason) {
    case LWS_CALLBACK_CLIENT_ESTABLISHED: {
        {
            std::lock_guard<std::mutex> lock(global_state.pending_mutex);
            global_state.connected = true;
            global_state.pending_condition.notify_all();
        }
        debug_log::log("CDP WebSocket connected.");
        std::lock_guard<std::mutex> lock(global_state.outgoing_mutex);
        if (!global_state.outgoing_messages.empty()) {
            lws_callback_on_writable(websocket_instance);
        }
        break;
    }

    case LWS_CALLBACK_CLIENT_RECEIVE: {
        bool complete = lws_is_final_fragment(websocket_instance) &&
                        lws_remaining_packet_payload(websocket_instance) == 0;
        if (global_state.discarding_message) {
            global_state.discarding_message = !complete;
            break;
        }
        if (global_state.receive_buffer.size() + incoming_length > MAX_INCOMING_MESSAGE_BYTES) {
            debug_log::warn("dropping a CDP message larger than " + std::to_string(MAX_INCOMING_MESSAGE_BYTES) +
                            " bytes");
            global_state.receive_buffer.clear();
            global_state.receive_buffer.shrink_to_fit();
            global_state.discarding_message = !complete;
            break;
        }
        global_state.receive_buffer.append(static_cast<const char *>(incoming_data), incoming_length);
        if (complete) {
            handle_complete_message();
        }
        break;
    }

    case LWS_CALLBACK_CLIENT_WRITEABLE:
        write_next_message(websocket_instance);
        break;

    case LWS_CALLBACK_EVENT_WAIT_CANCELLED: {
        // Woken by lws_cancel_service() after a command was queued.
        if (global_state.websocket_connection != nullptr && global_state.connected) {
            std::lock_guard<std::mutex> lock(global_state.outgoing_mutex);
            if (!global_state.outgoing_messages.empty()) {
                lws_callback_on_writable(global_state.websocket_connection);
            }
        }
        break;
    }

    case LWS_CALLBACK_CLIENT_CONNECTION_ERROR: {
        const char *error_message = incoming_data ? static_cast<const char *>(incoming_data) : "unknown";
        std::cerr << "[framesync] CDP WebSocket connection error: " << error_message << std::endl;
        {
            std::lock_guard<std::mutex> lock(global_state.pending_mutex);
            global_state.connection_failed = true;
        }
        mark_disconnected();
        break;
    }

    case LWS_CALLBACK_CLIENT_CLOSED:
        if (!global_state.shutting_down) {
            std::cerr << "[framesync] CDP WebSocket closed." << std::endl;
        }
        mark_disconnected();
        break;

    default:
        break;
    }

    return 0;
}

static void service_loop() {
    debug_log::log("CDP service thread started.");
    while (!global_state.shutting_down) {
        lws_service(global_state.websocket_context, 50);
    }
    debug_log::log("CDP service thread finished.");
}

// Joins the service thread and destroys the lws context. Safe to call twice.
static void stop_service() {
    global_state.shutting_down = true;
    {
        std::lock_guard<std::mutex> lock(global_state.outgoing_mutex);
        if (global_state.websocket_context != nullptr) {
            lws_cancel_service(global_state.websocket_context);
        }
    }
    if (global_state.service_thread.joinable()) {
        global_state.service_thread.join();
    }
    struct lws_context *context_to_destroy = nullptr;
    {
        std::lock_guard<std::mutex> lock(global_state.outgoing_mutex);
        context_to_destroy = global_state.websocket_context;
        global_state.websocket_context = nullptr;
        global_state.outgoing_messages.clear();
    }
    if (context_to_destroy != nullptr) {
        lws_context_destroy(context_to_destroy);
        debug_log::log("CDP WebSocket context destroyed.");
    }
    mark_disconnected();
}

// --- Public functions ---

bool parse_websocket_url(const std::string &websocket_url, WebSocketEndpoint &out_endpoint) {
    static const std::string SCHEME = "ws://";
    if (websocket_url.compare(0, SCHEME.size(), SCHEME) != 0) {
        return false;
    }
    std::string rest = websocket_url.substr(SCHEME.size());
    size_t slash_position = rest.find('/');
    std::string authority = rest.substr(0, slash_position);
    WebSocketEndpoint endpoint;
    if (slash_position != std::string::npos) {
        endpoint.path = rest.substr(slash_position);
    }

    size_t colon_position = authority.rfind(':');
    if (colon_position == std::string::npos || colon_position == 0) {
        return false;
    }
    endpoint.host = authority.substr(0, colon_position);
    std::string port_text = authority.substr(colon_position + 1);
    try {
        size_t consumed = 0;
        endpoint.port = std::stoi(port_text, &consumed);
        if (consumed != port_text.size()) {
            return false;
        }
    } catch (const std::exception &exception) {
        debug_log::log("WebSocket URL port '" + port_text + "': " + exception.what());
        return false;
    }
    if (endpoint.port <= 0 || endpoint.port > 65535) {
        return false;
    }
    out_endpoint = endpoint;
    return true;
}

void initialize() {
    // Reset fields individually; mutexes and condition variables are not assignable.
    global_state.connected = false;
    global_state.connection_failed = false;
    global_state.shutting_down = false;
    global_state.websocket_context = nullptr;
    global_state.websocket_connection = nullptr;
    global_state.chrome_process_id = -1;
    global_state.user_data_directory.clear();
    global_state.owns_user_data_directory = false;
    global_state.next_message_id = 1;
    {
        std::lock_guard<std::mutex> lock(global_state.session_mutex);
        global_state.current_target_id.clear();
        global_state.current_session_id.clear();
    }
    {
        std::lock_guard<std::mutex> lock(global_state.pending_mutex);
        global_state.pending_responses.clear();
        global_state.awaited_message_ids.clear();
    }
    {
        std::lock_guard<std::mutex> lock(global_state.outgoing_mutex);
        global_state.outgoing_messages.clear();
    }
    global_state.receive_buffer.clear();
    global_state.discarding_message = false;
}

bool connect(const std::string &websocket_url) {
    std::cerr << "[framesync] Connecting to CDP WebSocket: " << websocket_url << std::endl;

    if (global_state.service_thread.joinable()) {
        debug_log::warn("connect() called while a connection is active; disconnecting first.");
        stop_service();
    }

    WebSocketEndpoint endpoint;
    if (!parse_websocket_url(websocket_url, endpoint)) {
        debug_log::error("not a ws://host:port/path URL: " + websocket_url);
        return false;
    }

    struct lws_context_creation_info context_info;
    memset(&context_info, 0, sizeof(context_info));
    context_info.port = CONTEXT_PORT_NO_LISTEN; // Client mode, no listening.
    context_info.protocols = websocket_protocols;
    context_info.gid = -1;
    context_info.uid = -1;

    global_state.shutting_down = false;
    global_state.connection_failed = false;
    global_state.connected = false;
    global_state.receive_buffer.clear();
    global_state.discarding_message = false;

    struct lws_context *websocket_context = lws_create_context(&context_info);
    if (websocket_context == nullptr) {
        std::cerr << "[framesync] Failed to create libwebsockets context." << std::endl;
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(global_state.outgoing_mutex);
        global_state.websocket_context = websocket_context;
    }

    struct lws_client_connect_info connect_info;
    memset(&connect_info, 0, sizeof(connect_info));
    connect_info.context = websocket_context;
    connect_info.address = endpoint.host.c_str();
    connect_info.port = endpoint.port;
    connect_info.path = endpoint.path.c_str();
    connect_info.host = endpoint.host.c_str();
    connect_info.origin = nullptr;
    connect_info.protocol = nullptr;

    debug_log::log("connect() host=" + endpoint.host + " port=" + std::to_string(endpoint.port) +
                   " path=" + endpoint.path);
    global_state.websocket_connection = lws_client_connect_via_info(&connect_info);
    if (global_state.websocket_connection == nullptr) {
        std::cerr << "[framesync] Failed to initiate CDP WebSocket connection." << std::endl;
        stop_service();
        return false;
    }

    global_state.service_thread = std::thread(service_loop);

    bool settled = false;
    {
        std::unique_lock<std::mutex> lock(global_state.pending_mutex);
        settled = global_state.pending_condition.wait_for(
            lock, std::chrono::milliseconds(CONNECT_TIMEOUT_MILLISECONDS),
            []() { return global_state.connected.load() || global_state.connection_failed.load(); });
    }

    if (!settled || !global_state.connected) {
        std::cerr << "[framesync] CDP WebSocket connection "
                  << (settled ? "failed (see error above)." : "timed out.") << std::endl;
        stop_service();
        return false;
    }
    return true;
}

void disconnect() {
    debug_log::log("disconnect() called: stopping WebSocket service, killing Chrome if we launched it.");
    stop_service();
    clear_event_handlers();

    {
        std::lock_guard<std::mutex> lock(global_state.pending_mutex);
        global_state.pending_responses.clear();
        global_state.awaited_message_ids.clear();
    }
    {
        std::lock_guard<std::mutex> lock(global_state.session_mutex);
        global_state.current_target_id.clear();
        global_state.current_session_id.clear();
    }

    if (global_state.chrome_process_id > 0) {
        debug_log::log("disconnect(): terminating Chrome pid=" + std::to_string(global_state.chrome_process_id));
        platform::terminate_process(global_state.chrome_process_id, CHROME_EXIT_GRACE_MILLISECONDS);
    }
    global_state.chrome_process_id = -1;

    if (global_state.owns_user_data_directory && !global_state.user_data_directory.empty()) {
        if (!platform::remove_directory(global_state.user_data_directory)) {
            debug_log::log("disconnect(): could not remove " + global_state.user_data_directory);
        }
    }
    global_state.user_data_directory.clear();
    global_state.owns_user_data_directory = false;
    debug_log::log("disconnect() finished.");
}

bool is_connected() {
    return global_state.connected;
}

static json build_command(int message_id, const std::string &method, const json &params,
                          const std::string &session_id) {
    json command;
    command["id"] = message_id;
    command["method"] = method;
    if (!params.is_null() && !params.empty()) {
        command["params"] = params;
    }
    // Session routing: if session_id is set, include it in the message.
    if (!session_id.empty()) {
        command["sessionId"] = session_id;
    }
    return command;
}

static bool enqueue_message(std::string serialized_message) {
    std::lock_guard<std::mutex> lock(global_state.outgoing_mutex);
    if (global_state.websocket_context == nullptr) {
        return false;
    }
    global_state.outgoing_messages.push_back(std::move(serialized_message));
    lws_cancel_service(global_state.websocket_context);
    return true;
}

json send_command(const std::string &method, const json &params,
                  const std::string &session_id, int timeout_milliseconds) {
    if (!global_state.connected) {
        json error_response;
        error_response["error"] = "Not connected to CDP";
        return error_response;
    }

    int message_id = global_state.next_message_id++;
    {
        std::lock_guard<std::mutex> lock(global_state.pending_mutex);
        global_state.awaited_message_ids.insert(message_id);
    }

    if (!enqueue_message(build_command(message_id, method, params, session_id).dump())) {
        std::lock_guard<std::mutex> lock(global_state.pending_mutex);
        global_state.awaited_message_ids.erase(message_id);
        json error_response;
        error_response["error"] = "Failed to queue CDP command: " + method;
        return error_response;
    }

    std::unique_lock<std::mutex> lock(global_state.pending_mutex);
    global_state.pending_condition.wait_for(
        lock, std::chrono::milliseconds(timeout_milliseconds), [message_id]() {
            return global_state.pending_responses.count(message_id) > 0 || !global_state.connected.load();
        });
    global_state.awaited_message_ids.erase(message_id);

    auto response_iterator = global_state.pending_responses.find(message_id);
    if (response_iterator != global_state.pending_responses.end()) {
        json response = std::move(response_iterator->second);
        global_state.pending_responses.erase(response_iterator);
        return response;
    }

    json error_response;
    if (!global_state.connected) {
        error_response["error"] = "CDP connection closed while waiting for response to method: " + method;
    } else {
        error_response["error"] = "Timed out waiting for CDP response to method: " + method;
    }
    error_response["message_id"] = message_id;
    return error_response;
}

bool post_command(const std::string &method, const json &params, const std::string &session_id) {
    if (!global_state.connected) {
        return false;
    }
    int message_id = global_state.next_message_id++;
    return enqueue_message(build_command(message_id, method, params, session_id).dump());
}

bool command_failed(const json &response, std::string &error_detail) {
    if (!response.contains("error")) {
        return false;
    }
    const json &error = response["error"];
    if (error.is_string()) {
        error_detail = error.get<std::string>();
    } else if (error.is_object() && error.contains("message") && error["message"].is_string()) {
        error_detail = error["message"].get<std::string>();
    } else {
        error_detail = error.dump();
    }
    return true;
}

void set_event_handler(const std::string &method, EventHandler handler) {
    std::lock_guard<std::mutex> lock(global_state.handlers_mutex);
    if (handler) {
        global_state.event_handlers[method] = std::move(handler);
    } else {
        global_state.event_handlers.erase(method);
    }
}

void clear_event_handlers() {
    std::lock_guard<std::mutex> lock(global_state.handlers_mutex);
    global_state.event_handlers.clear();
}

std::string current_session_id() {
    std::lock_guard<std::mutex> lock(global_state.session_mutex);
    return global_state.current_session_id;
}

static std::string current_target_id() {
    std::lock_guard<std::mutex> lock(global_state.session_mutex);
    return global_state.current_target_id;
}

// Fills result and returns false when there is no attached tab.
static bool require_session(browser_driver::DriverResult &result, std::string &session_id) {
    session_id = current_session_id();
    if (!global_state.connected || session_id.empty()) {
        result.success = false;
        result.error_detail = "No active browser session. Call open_browser first.";
        return false;
    }
    return true;
}

static browser_driver::DriverResult run_session_command(const std::string &method, const json &params,
                                                        int timeout_milliseconds = 10000) {
    browser_driver::DriverResult result;
    std::string session_id;
    if (!require_session(result, session_id)) {
        return result;
    }
    json response = send_command(method, params, session_id, timeout_milliseconds);
    std::string error_detail;
    if (command_failed(response, error_detail)) {
        result.success = false;
        result.error_detail = method + " failed: " + error_detail;
        return result;
    }
    result.success = true;
    return result;
}

// --- High-level browser operations ---

browser_driver::DriverResult open_browser(const browser_driver::OpenBrowserOptions &options) {
    browser_driver::DriverResult result;

    if (global_state.connected) {
        result.error_detail = "A browser is already open. Stop it first.";
        result.message = "Browser already open.";
        return result;
    }

    cdp_chrome_launch::ChromeLaunchResult launch_result = cdp_chrome_launch::launch_chrome(options);
    if (!launch_result.success) {
        result.error_detail = launch_result.error_message;
        result.message = "Failed to launch Chrome.";
        return result;
    }
    global_state.chrome_process_id = launch_result.process_id;
    global_state.user_data_directory = launch_result.user_data_directory;
    global_state.owns_user_data_directory = launch_result.owns_user_data_directory;

    debug_log::log("Connecting to CDP WebSocket...");
    if (!connect(launch_result.websocket_debugger_url)) {
        result.error_detail = "Could not establish WebSocket connection to: " + launch_result.websocket_debugger_url;
        result.message = "Failed to connect to Chrome CDP.";
        disconnect();
        return result;
    }

    json get_targets_response = send_command("Target.getTargets", json::object());
    std::string chosen_target_id;
    if (get_targets_response.contains("result") &&
        get_targets_response["result"].contains("targetInfos")) {
        for (const auto &target_info : get_targets_response["result"]["targetInfos"]) {
            if (target_info.contains("type") && target_info["type"] == "page") {
                chosen_target_id = target_info["targetId"].get<std::string>();
                break;
            }
        }
    }

    // If no page target exists, create a new one.
    if (chosen_target_id.empty()) {
        debug_log::log("open_browser: No page target found, creating one.");
        json create_params;
        create_params["url"] = "about:blank";
        json create_response = send_command("Target.createTarget", create_params);
        if (create_response.contains("result") && create_response["result"].contains("targetId")) {
            chosen_target_id = create_response["result"]["targetId"].get<std::string>();
        } else {
            result.error_detail = "Target.createTarget failed: " + create_response.dump();
            result.message = "Failed to create a new tab.";
            disconnect();
            return result;
        }
    }

    json attach_params;
    attach_params["targetId"] = chosen_target_id;
    attach_params["flatten"] = true;
    json attach_response = send_command("Target.attachToTarget", attach_params);
    if (!attach_response.contains("result") || !attach_response["result"].contains("sessionId")) {
        result.error_detail = "Target.attachToTarget failed: " + attach_response.dump();
        result.message = "Failed to attach to the browser tab.";
        disconnect();
        return result;
    }
    {
        std::lock_guard<std::mutex> lock(global_state.session_mutex);
        global_state.current_target_id = chosen_target_id;
        global_state.current_session_id = attach_response["result"]["sessionId"].get<std::string>();
    }
    debug_log::log("Attached to target id=" + chosen_target_id + " session=" + current_session_id());

    browser_driver::DriverResult page_enable = run_session_command("Page.enable", json::object());
    if (!page_enable.success) {
        result.error_detail = page_enable.error_detail;
        result.message = "Failed to enable the Page domain.";
        disconnect();
        return result;
    }

    browser_driver::DriverResult viewport = set_viewport(options.viewport_width, options.viewport_height);
    if (!viewport.success) {
        debug_log::warn("open_browser: " + viewport.error_detail);
    }

    result.success = true;
    result.message = "Browser opened and attached to a tab.";
    return result;
}

browser_driver::NavigateResult navigate(const std::string &url) {
    browser_driver::NavigateResult result;

    std::string session_id = current_session_id();
    if (!global_state.connected || session_id.empty()) {
        result.error_text = "No active browser session. Call open_browser first.";
        return result;
    }

    json navigate_params;
    navigate_params["url"] = url;
    json navigate_response = send_command("Page.navigate", navigate_params, session_id, 30000);

    std::string error_detail;
    if (command_failed(navigate_response, error_detail)) {
        result.error_text = error_detail;
        return result;
    }

    if (navigate_response.contains("result")) {
        const auto &nav_result = navigate_response["result"];
        if (nav_result.contains("frameId") && nav_result["frameId"].is_string()) {
            result.frame_id = nav_result["frameId"].get<std::string>();
        }
        if (nav_result.contains("errorText") && nav_result["errorText"].is_string()) {
            result.error_text = nav_result["errorText"].get<std::string>();
            return result;
        }
    }

    result.success = true;
    return result;
}

browser_driver::DriverResult set_viewport(int width, int height) {
    json metrics_params;
    metrics_params["width"] = width;
    metrics_params["height"] = height;
    metrics_params["deviceScaleFactor"] = 1;
    metrics_params["mobile"] = false;
    browser_driver::DriverResult result = run_session_command("Emulation.setDeviceMetricsOverride", metrics_params);
    if (result.success) {
        result.message = "Viewport set to " + std::to_string(width) + "x" + std::to_string(height) + ".";
    }
    return result;
}

browser_driver::DriverResult start_screencast(const browser_driver::ScreencastOptions &options) {
    json screencast_params;
    screencast_params["format"] = options.format;
    if (options.format == "jpeg") {
        screencast_params["quality"] = options.quality;
    }
    screencast_params["maxWidth"] = options.max_width;
    screencast_params["maxHeight"] = options.max_height;
    screencast_params["everyNthFrame"] = options.every_nth_frame;
    browser_driver::DriverResult result = run_session_command("Page.startScreencast", screencast_params);
    if (result.success) {
        result.message = "Screencast started.";
    }
    return result;
}

browser_driver::DriverResult stop_screencast() {
    browser_driver::DriverResult result = run_session_command("Page.stopScreencast", json::object());
    if (result.success) {
        result.message = "Screencast stopped.";
    }
    return result;
}

void acknowledge_screencast_frame(int screencast_session_id) {
    json ack_params;
    ack_params["sessionId"] = screencast_session_id;
    if (!post_command("Page.screencastFrameAck", ack_params, current_session_id())) {
        debug_log::log("acknowledge_screencast_frame: not connected, ack dropped.");
    }
}

browser_driver::CaptureScreenshotResult capture_screenshot(const browser_driver::CaptureScreenshotOptions &options) {
    browser_driver::CaptureScreenshotResult result;

    std::string session_id = current_session_id();
    if (!global_state.connected || session_id.empty()) {
        result.error_detail = "No active browser session. Call open_browser first.";
        return result;
    }

    json capture_params;
    capture_params["format"] = options.format;
    if (options.format == "jpeg") {
        capture_params["quality"] = options.quality;
    }
    capture_params["fromSurface"] = true;
    json capture_response = send_command("Page.captureScreenshot", capture_params, session_id);

    std::string error_detail;
    if (command_failed(capture_response, error_detail)) {
        result.error_detail = error_detail;
        return result;
    }

    if (capture_response.contains("result") && capture_response["result"].contains("data") &&
        capture_response["result"]["data"].is_string()) {
        result.success = true;
        result.image_base64 = capture_response["result"]["data"].get<std::string>();
        result.mime_type = options.format == "png" ? "image/png" : "image/jpeg";
        debug_log::log("capture_screenshot: captured " + std::to_string(result.image_base64.size()) + " bytes base64");
    } else {
        result.error_detail = "Page.captureScreenshot did not return image data.";
    }
    return result;
}

browser_driver::DriverResult dispatch_mouse_event(const browser_driver::MouseEvent &event) {
    json mouse_params;
    mouse_params["type"] = event.type;
    mouse_params["x"] = event.x;
    mouse_params["y"] = event.y;
    mouse_params["button"] = event.button;
    mouse_params["clickCount"] = event.click_count;
    mouse_params["modifiers"] = event.modifiers;
    if (event.type == "mouseWheel") {
        mouse_params["deltaX"] = event.delta_x;
        mouse_params["deltaY"] = event.delta_y;
    }
    return run_session_command("Input.dispatchMouseEvent", mouse_params, INPUT_TIMEOUT_MILLISECONDS);
}

browser_driver::DriverResult dispatch_key_event(const browser_driver::KeyEvent &event) {
    json key_params;
    key_params["type"] = event.type;
    key_params["modifiers"] = event.modifiers;
    if (!event.key.empty()) {
        key_params["key"] = event.key;
    }
    if (!event.code.empty()) {
        key_params["code"] = event.code;
    }
    if (!event.text.empty()) {
        key_params["text"] = event.text;
        key_params["unmodifiedText"] = event.text;
    }
    if (event.windows_virtual_key_code != 0) {
        key_params["windowsVirtualKeyCode"] = event.windows_virtual_key_code;
        key_params["nativeVirtualKeyCode"] = event.windows_virtual_key_code;
    }
    return run_session_command("Input.dispatchKeyEvent", key_params, INPUT_TIMEOUT_MILLISECONDS);
}

browser_driver::DriverResult insert_text(const std::string &text) {
    json text_params;
    text_params["text"] = text;
    return run_session_command("Input.insertText", text_params, INPUT_TIMEOUT_MILLISECONDS);
}

browser_driver::PageInfoResult get_page_info() {
    browser_driver::PageInfoResult result;
    std::string target_id = current_target_id();
    if (!global_state.connected || target_id.empty()) {
        result.error_detail = "No active browser session. Call open_browser first.";
        return result;
    }

    json info_params;
    info_params["targetId"] = target_id;
    json info_response = send_command("Target.getTargetInfo", info_params);
    std::string error_detail;
    if (command_failed(info_response, error_detail)) {
        result.error_detail = "Target.getTargetInfo failed: " + error_detail;
        return result;
    }
    if (!info_response.contains("result") || !info_response["result"].contains("targetInfo")) {
        result.error_detail = "Target.getTargetInfo returned unexpected response: " + info_response.dump();
        return result;
    }
    const json &target_info = info_response["result"]["targetInfo"];
    result.url = target_info.value("url", "");
    result.title = target_info.value("title", "");
    result.success = true;
    return result;
}

ConnectionState &get_state() {
    return global_state;
}

} // namespace cdp_driver
