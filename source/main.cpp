// framesync: streams a Chrome viewport to an agent as sampled frames and
// synchronizes the agent's actions with the frames they cause.
// Entry point: stdio MCP server loop.
//
// Reads JSON-RPC 2.0 messages from stdin, dispatches them, writes responses to stdout.
// Logs go to stderr; the MCP stdio transport leaves it free for that.

#include <nlohmann/json.hpp>
#include <csignal>
#include <signal.h>
#include <cstdlib>
#include <iostream>
#include <string>

#include "browser/cdp/cdp_driver.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_stdio.hpp"
#include "session/stream_config.hpp"
#include "session/stream_controller.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

using json = nlohmann::json;

// Global flag for graceful shutdown.
static volatile std::sig_atomic_t shutdown_requested = 0;

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = 1;
}

int main() {
    std::cerr << "[framesync] framesync, build " << __DATE__ << " " << __TIME__ << std::endl;

    stream_config::ConfigLoadResult loaded = stream_config::load_config(
        [](const char *name) -> const char * { return std::getenv(name); });
    if (!loaded.success) {
        debug_log::error(loaded.error_detail);
        return 2;
    }

    // No SA_RESTART: a signal interrupts the blocking read on stdin.
    struct sigaction action = {};
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
    // Chrome going away mid-write must not kill the server.
    std::signal(SIGPIPE, SIG_IGN);

    cdp_driver::initialize();
    stream_controller::StreamController controller(loaded.config);
    tool_handlers::register_all_tools(controller);

    mcp_stdio::log_message("framesync started (config: " + loaded.source_description +
                           "). Waiting for MCP messages on stdin.");

    // Main message loop: read from stdin, dispatch, write to stdout.
    while (!shutdown_requested) {
        std::string raw_message = mcp_stdio::read_message();

        if (raw_message.empty()) {
            if (shutdown_requested) {
                break;
            }
            // EOF on stdin means the client disconnected.
            mcp_stdio::log_message("EOF on stdin. Shutting down.");
            break;
        }

        json response = mcp_dispatch::dispatch_text(raw_message);

        // Notifications and client responses get no answer.
        if (response.is_null()) {
            continue;
        }

        mcp_stdio::write_message(response.dump(-1, ' ', false, json::error_handler_t::replace));
    }

    debug_log::log("stopping session, the browser process will be killed if running");
    controller.stop();
    cdp_driver::disconnect();
    mcp_stdio::log_message("framesync shut down.");

    return 0;
}
