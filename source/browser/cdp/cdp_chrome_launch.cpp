#include "browser/cdp/cdp_chrome_launch.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

namespace cdp_chrome_launch {

static const std::vector<std::string> INSTALL_LOCATIONS = {
    "/usr/bin/google-chrome",
    "/usr/bin/google-chrome-stable",
    "/opt/google/chrome/chrome",
    "/usr/bin/chromium",
    "/usr/bin/chromium-browser",
    "/snap/bin/chromium",
};

static const std::vector<std::string> PATH_NAMES = {
    "google-chrome",
    "google-chrome-stable",
    "chromium",
    "chromium-browser",
};

// Renderer throttling and occlusion tracking stall Page.screencastFrame, and
// first-run UI covers the page.
static const std::vector<std::string> STREAMING_FLAGS = {
    "--no-first-run",
    "--no-default-browser-check",
    "--disable-background-networking",
    "--disable-background-timer-throttling",
    "--disable-backgrounding-occluded-windows",
    "--disable-renderer-backgrounding",
    "--disable-ipc-flooding-protection",
    "--disable-component-update",
    "--disable-default-apps",
    "--disable-extensions",
    "--disable-hang-monitor",
    "--disable-infobars",
    "--disable-popup-blocking",
    "--disable-prompt-on-repost",
    "--disable-sync",
    "--metrics-recording-only",
};

static bool is_executable(const std::string &path) {
    std::error_code status_error;
    return std::filesystem::is_regular_file(path, status_error) && access(path.c_str(), X_OK) == 0;
}

std::string find_chrome_executable() {
    for (const auto &location : INSTALL_LOCATIONS) {
        if (is_executable(location)) {
            return location;
        }
    }
    const char *path_environment = std::getenv("PATH");
    if (path_environment == nullptr) {
        return "";
    }
    for (const auto &name : PATH_NAMES) {
        std::istringstream path_stream(path_environment);
        std::string directory;
        while (std::getline(path_stream, directory, ':')) {
            if (!directory.empty() && is_executable(directory + "/" + name)) {
                return directory + "/" + name;
            }
        }
    }
    return "";
}

ChromeCommandLine build_chrome_command_line(const std::string &user_data_directory, int port,
                                            const browser_driver::OpenBrowserOptions &options) {
    ChromeCommandLine command_line;
    command_line.executable_path = options.chrome_path.empty() ? find_chrome_executable() : options.chrome_path;

    std::vector<std::string> &arguments = command_line.arguments;
    arguments.push_back("--remote-debugging-port=" + std::to_string(port));
    arguments.push_back("--remote-allow-origins=*");
    arguments.push_back("--user-data-dir=" + user_data_directory);
    arguments.push_back("--window-size=" + std::to_string(options.viewport_width) + "," +
                        std::to_string(options.viewport_height));
    if (options.headless) {
        arguments.push_back("--headless=new");
    }
    if (getuid() == 0) {
        arguments.push_back("--no-sandbox");
    }
    arguments.insert(arguments.end(), STREAMING_FLAGS.begin(), STREAMING_FLAGS.end());
    arguments.push_back("about:blank");
    return command_line;
}

DevToolsEndpoint parse_devtools_active_port(const std::string &contents) {
    DevToolsEndpoint endpoint;
    std::istringstream line_stream(contents);
    std::string port_line;
    if (!std::getline(line_stream, port_line) || port_line.empty()) {
        return endpoint;
    }
    try {
        size_t consumed = 0;
        int port = std::stoi(port_line, &consumed);
        if (consumed == port_line.size() && port > 0 && port <= 65535) {
            endpoint.port = port;
        } else {
            debug_log::log("DevToolsActivePort: bad port line: " + port_line);
        }
    } catch (const std::invalid_argument &) {
        debug_log::log("DevToolsActivePort: first line is not a number: " + port_line);
    } catch (const std::out_of_range &) {
        debug_log::log("DevToolsActivePort: port out of range: " + port_line);
    }
    std::getline(line_stream, endpoint.browser_path);
    return endpoint;
}

std::string build_websocket_url(int port, const std::string &browser_path) {
    size_t first = browser_path.find_first_not_of('/');
    std::string path = first == std::string::npos ? "devtools/browser" : browser_path.substr(first);
    return "ws://127.0.0.1:" + std::to_string(port) + "/" + path;
}

static ChromeLaunchResult fail_launch(ChromeLaunchResult result, const std::string &error_message) {
    if (result.process_id > 0) {
        debug_log::log("launch_chrome: killing Chrome pid=" + std::to_string(result.process_id));
        platform::terminate_process(result.process_id, LAUNCH_FAILURE_GRACE_MS);
    }
    if (result.owns_user_data_directory && !platform::remove_directory(result.user_data_directory)) {
        debug_log::warn("could not remove profile directory " + result.user_data_directory);
    }
    result.success = false;
    result.process_id = -1;
    result.error_message = error_message;
    return result;
}

ChromeLaunchResult launch_chrome(const browser_driver::OpenBrowserOptions &options) {
    ChromeLaunchResult result;
    debug_log::log("Chrome launch starting (headless=" + std::string(options.headless ? "true" : "false") + ")");

    std::string error_message;
    if (options.user_data_directory.empty()) {
        if (!platform::make_temp_directory(PROFILE_DIRECTORY_PREFIX, result.user_data_directory, error_message)) {
            return fail_launch(result, "Could not create a profile directory: " + error_message);
        }
        result.owns_user_data_directory = true;
    } else {
        result.user_data_directory = options.user_data_directory;
        std::error_code directory_error;
        std::filesystem::create_directories(result.user_data_directory, directory_error);
        if (directory_error) {
            return fail_launch(result, "Could not create profile directory " + result.user_data_directory + ": " +
                                           directory_error.message());
        }
    }

    // A port file left by an earlier run would point at a dead browser.
    std::string port_file = result.user_data_directory + "/DevToolsActivePort";
    std::error_code remove_error;
    std::filesystem::remove(port_file, remove_error);

    ChromeCommandLine command_line = build_chrome_command_line(result.user_data_directory, 0, options);
    if (command_line.executable_path.empty()) {
        return fail_launch(result, "Could not find a Chrome executable. Install google-chrome or chromium, "
                                   "or set FRAMESYNC_CHROME_PATH.");
    }

    platform::SpawnResult spawn_result = platform::spawn_process(command_line.executable_path, command_line.arguments);
    if (!spawn_result.success) {
        return fail_launch(result, "Failed to spawn Chrome: " + spawn_result.error_message);
    }
    result.process_id = spawn_result.process_id;

    switch (platform::wait_for_file(port_file, PORT_FILE_TIMEOUT_MS, result.process_id)) {
    case platform::FileWaitOutcome::Ready:
        break;
    case platform::FileWaitOutcome::ProcessExited:
        result.process_id = -1;
        return fail_launch(result, "Chrome exited during startup (" + command_line.executable_path +
                                       "). Its stderr above has the reason.");
    case platform::FileWaitOutcome::TimedOut:
        return fail_launch(result, "Timed out waiting for " + port_file);
    }

    std::string contents;
    if (!platform::read_file_contents(port_file, contents)) {
        return fail_launch(result, "Could not read " + port_file);
    }
    DevToolsEndpoint endpoint = parse_devtools_active_port(contents);
    if (endpoint.port <= 0) {
        return fail_launch(result, "Failed to parse the debug port from " + port_file);
    }
    result.debug_port = endpoint.port;
    result.websocket_debugger_url = build_websocket_url(endpoint.port, endpoint.browser_path);
    debug_log::log("WebSocket URL: " + result.websocket_debugger_url);

    // The port file can appear slightly before the socket accepts connections.
    if (!platform::wait_for_tcp_port(endpoint.port, SOCKET_READY_TIMEOUT_MS)) {
        return fail_launch(result, "DevTools port " + std::to_string(endpoint.port) + " never accepted connections");
    }

    result.success = true;
    std::cerr << "[framesync] Chrome launched (pid=" << result.process_id << ", port=" << result.debug_port << ")"
              << std::endl;
    return result;
}

} // namespace cdp_chrome_launch
