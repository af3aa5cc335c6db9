#include "platform/platform_abi.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <cstdlib>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <netinet/in.h>
#include <signal.h>
#include <spawn.h>
#include <sstream>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <system_error>
#include <thread>
#include <unistd.h>

#include "utils/debug_log.hpp"

extern char **environ;

namespace platform {

static const int POLL_INTERVAL_MS = 50;

SpawnResult spawn_process(const std::string &executable_path, const std::vector<std::string> &arguments) {
    SpawnResult result;

    std::vector<std::string> argv_strings;
    argv_strings.reserve(arguments.size() + 1);
    argv_strings.push_back(executable_path);
    argv_strings.insert(argv_strings.end(), arguments.begin(), arguments.end());
    std::vector<char *> argv_pointers;
    for (auto &argument_string : argv_strings) {
        argv_pointers.push_back(&argument_string[0]);
    }
    argv_pointers.push_back(nullptr);

    posix_spawn_file_actions_t file_actions;
    posix_spawn_file_actions_init(&file_actions);
    posix_spawn_file_actions_addopen(&file_actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_addopen(&file_actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);

    posix_spawnattr_t attributes;
    posix_spawnattr_init(&attributes);
    posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(&attributes, 0);

    pid_t child_pid = 0;
    int spawn_status = posix_spawn(&child_pid, executable_path.c_str(), &file_actions, &attributes,
                                   argv_pointers.data(), environ);
    posix_spawnattr_destroy(&attributes);
    posix_spawn_file_actions_destroy(&file_actions);

    if (spawn_status != 0) {
        result.error_message = "posix_spawn " + executable_path + " failed: " + std::strerror(spawn_status);
        return result;
    }
    result.success = true;
    result.process_id = static_cast<int>(child_pid);
    return result;
}

bool is_process_running(int process_id) {
    if (process_id <= 0) {
        return false;
    }
    int status = 0;
    pid_t waited = waitpid(static_cast<pid_t>(process_id), &status, WNOHANG);
    if (waited == 0) {
        return true;
    }
    if (waited < 0 && errno != ECHILD) {
        return kill(static_cast<pid_t>(process_id), 0) == 0;
    }
    return false;
}

bool terminate_process(int process_id, int grace_milliseconds) {
    if (process_id <= 0) {
        return false;
    }
    pid_t child_pid = static_cast<pid_t>(process_id);
    // The group id equals the child's pid (spawned with pgroup 0).
    if (kill(-child_pid, SIGTERM) != 0 && kill(child_pid, SIGTERM) != 0) {
        return false;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(grace_milliseconds);
    while (std::chrono::steady_clock::now() < deadline) {
        if (!is_process_running(process_id)) {
            kill(-child_pid, SIGKILL); // leftover helpers
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(POLL_INTERVAL_MS));
    }

    debug_log::warn("process " + std::to_string(process_id) + " ignored SIGTERM, sending SIGKILL");
    kill(-child_pid, SIGKILL);
    kill(child_pid, SIGKILL);
    int status = 0;
    waitpid(child_pid, &status, 0);
    return true;
}

FileWaitOutcome wait_for_file(const std::string &file_path, int timeout_milliseconds, int watched_process_id) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);
    while (true) {
        std::error_code size_error;
        // The writer may create the file before filling it.
        uintmax_t size = std::filesystem::file_size(file_path, size_error);
        if (!size_error && size > 0) {
            return FileWaitOutcome::Ready;
        }
        if (watched_process_id > 0 && !is_process_running(watched_process_id)) {
            return FileWaitOutcome::ProcessExited;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return FileWaitOutcome::TimedOut;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(POLL_INTERVAL_MS));
    }
}

static bool tcp_port_accepts(int port) {
    int socket_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (socket_fd < 0) {
        return false;
    }
    sockaddr_in address = {};
    address.sin_family = AF_INET;
    address.sin_port = htons(static_cast<uint16_t>(port));
    address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    bool connected = connect(socket_fd, reinterpret_cast<sockaddr *>(&address), sizeof(address)) == 0;
    close(socket_fd);
    return connected;
}

bool wait_for_tcp_port(int port, int timeout_milliseconds) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);
    while (!tcp_port_accepts(port)) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(POLL_INTERVAL_MS));
    }
    return true;
}

bool read_file_contents(const std::string &file_path, std::string &output_contents) {
    std::ifstream file_stream(file_path);
    if (!file_stream.is_open()) {
        return false;
    }
    std::ostringstream string_stream;
    string_stream << file_stream.rdbuf();
    output_contents = string_stream.str();
    return true;
}

bool make_temp_directory(const std::string &prefix, std::string &out_path, std::string &error_message) {
    std::vector<char> path_template(prefix.begin(), prefix.end());
    const char suffix[] = "XXXXXX";
    path_template.insert(path_template.end(), suffix, suffix + sizeof(suffix)); // includes the terminator
    if (mkdtemp(path_template.data()) == nullptr) {
        error_message = "mkdtemp " + prefix + "XXXXXX failed: " + std::strerror(errno);
        return false;
    }
    out_path = path_template.data();
    return true;
}

bool remove_directory(const std::string &directory_path) {
    std::error_code remove_error;
    std::filesystem::remove_all(directory_path, remove_error);
    return !remove_error;
}

} // namespace platform
