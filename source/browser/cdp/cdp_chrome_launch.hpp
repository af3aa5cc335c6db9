#ifndef FRAMESYNC_CDP_CHROME_LAUNCH_HPP
#define FRAMESYNC_CDP_CHROME_LAUNCH_HPP

// Launches the Chrome instance a streaming session drives and discovers its
// DevTools endpoint through the DevToolsActivePort file.

#include <string>
#include <vector>

#include "browser/browser_driver_abi.hpp"

namespace cdp_chrome_launch {

struct ChromeLaunchResult {
    bool success = false;
    int process_id = -1;
    int debug_port = -1;
    std::string websocket_debugger_url;
    std::string user_data_directory;
    bool owns_user_data_directory = false; // created here, removed on disconnect
    std::string error_message;
};

// Profiles created for a session are mkdtemp'd under this prefix.
constexpr const char *PROFILE_DIRECTORY_PREFIX = "/tmp/framesync_chrome_profile_";

constexpr int PORT_FILE_TIMEOUT_MS = 15000;
constexpr int SOCKET_READY_TIMEOUT_MS = 3000;
constexpr int LAUNCH_FAILURE_GRACE_MS = 2000;

// Starts Chrome with remote debugging on an ephemeral port and waits until its
// DevTools socket accepts connections. On failure the process is killed and a
// profile created here is removed.
ChromeLaunchResult launch_chrome(const browser_driver::OpenBrowserOptions &options = {});

struct ChromeCommandLine {
    std::string executable_path;
    std::vector<std::string> arguments;
};
ChromeCommandLine build_chrome_command_line(const std::string &user_data_directory, int port,
                                            const browser_driver::OpenBrowserOptions &options = {});

// Well-known install locations first, then the usual names on PATH. Empty if none.
std::string find_chrome_executable();

// Contents of DevToolsActivePort: the port on the first line, the browser
// target path on the second.
struct DevToolsEndpoint {
    int port = -1;
    std::string browser_path;
};

// Parses file contents; port stays -1 when the first line is not a valid port.
DevToolsEndpoint parse_devtools_active_port(const std::string &contents);

// ws://127.0.0.1:<port>/<browser_path>, with the generic browser path as fallback.
std::string build_websocket_url(int port, const std::string &browser_path);

} // namespace cdp_chrome_launch

#endif // FRAMESYNC_CDP_CHROME_LAUNCH_HPP
