#ifndef FRAMESYNC_PLATFORM_ABI_HPP
#define FRAMESYNC_PLATFORM_ABI_HPP

// Platform abstraction for running the browser process.
// Each OS-specific implementation lives under platform/<os>/.

#include <string>
#include <vector>

namespace platform {

struct SpawnResult {
    bool success = false;
    int process_id = -1;
    std::string error_message;
};

// Starts the executable in a new process group (so the browser's helper
// processes can be signalled together). stdin and stdout go to /dev/null so the
// child can never write into the MCP stdio channel; stderr is inherited.
SpawnResult spawn_process(const std::string &executable_path, const std::vector<std::string> &arguments);

// False once the child has exited (it is reaped then) or for an unknown pid.
bool is_process_running(int process_id);

// SIGTERM to the child's process group, up to grace_milliseconds for the child
// to exit, then SIGKILL. Reaps the child.
bool terminate_process(int process_id, int grace_milliseconds);

enum class FileWaitOutcome {
    Ready,
    TimedOut,
    ProcessExited
};

// Polls until file_path exists and is non-empty. When watched_process_id is
// positive the wait ends early if that process exits.
FileWaitOutcome wait_for_file(const std::string &file_path, int timeout_milliseconds, int watched_process_id = -1);

// Polls until something accepts TCP connections on 127.0.0.1:port.
bool wait_for_tcp_port(int port, int timeout_milliseconds);

bool read_file_contents(const std::string &file_path, std::string &output_contents);

// mkdtemp(prefix + "XXXXXX"); the directory is private to the current user.
bool make_temp_directory(const std::string &prefix, std::string &out_path, std::string &error_message);

// Recursively removes a directory; false when anything could not be removed.
bool remove_directory(const std::string &directory_path);

} // namespace platform

#endif // FRAMESYNC_PLATFORM_ABI_HPP
