#include "platform/platform_abi.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <memory>
#include <mutex>
#include <poll.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <utility>

extern char **environ;

namespace platform {

// Output beyond this many bytes per stream is read and discarded so a chatty
// child cannot exhaust server memory.
static constexpr size_t kMaximumCapturedBytes = 8 * 1024 * 1024;

// Environment handed to every child: owned strings plus the envp array over them.
struct EnvironmentSnapshot {
    std::vector<std::string> entries;
    std::vector<char *> pointers;
};

static std::mutex environment_mutex;
static std::shared_ptr<const EnvironmentSnapshot> environment_snapshot;

static std::shared_ptr<const EnvironmentSnapshot> copy_environment() {
    auto snapshot = std::make_shared<EnvironmentSnapshot>();
    for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        snapshot->entries.emplace_back(*entry);
    }
    for (auto &entry : snapshot->entries) {
        snapshot->pointers.push_back(entry.data());
    }
    snapshot->pointers.push_back(nullptr);
    return snapshot;
}

void capture_environment() {
    std::shared_ptr<const EnvironmentSnapshot> snapshot = copy_environment();
    std::lock_guard<std::mutex> lock(environment_mutex);
    environment_snapshot = std::move(snapshot);
}

static std::shared_ptr<const EnvironmentSnapshot> child_environment() {
    std::lock_guard<std::mutex> lock(environment_mutex);
    if (!environment_snapshot) {
        environment_snapshot = copy_environment();
    }
    return environment_snapshot;
}

// PATH lookup against the captured environment. Names containing a slash are
// used as given (relative ones resolve in the child's working directory).
// Returns "" when no executable candidate exists.
static std::string resolve_executable(const std::string &program, const EnvironmentSnapshot &environment) {
    if (program.find('/') != std::string::npos) {
        return program;
    }
    std::string search_path = "/usr/local/bin:/usr/bin:/bin";
    for (const auto &entry : environment.entries) {
        if (entry.compare(0, 5, "PATH=") == 0) {
            search_path = entry.substr(5);
            break;
        }
    }
    size_t start = 0;
    while (start <= search_path.size()) {
        size_t colon = search_path.find(':', start);
        if (colon == std::string::npos) {
            colon = search_path.size();
        }
        std::string directory = search_path.substr(start, colon - start);
        std::string candidate = (directory.empty() ? std::string(".") : directory) + "/" + program;
        std::error_code filesystem_error;
        if (std::filesystem::is_regular_file(candidate, filesystem_error) && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        start = colon + 1;
    }
    return "";
}

static void close_descriptor(int &descriptor) {
    if (descriptor >= 0) {
        ::close(descriptor);
        descriptor = -1;
    }
}

static int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return -WTERMSIG(status);
    }
    return -1;
}

static long remaining_milliseconds(std::chrono::steady_clock::time_point deadline) {
    return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count());
}

// Kill the child's whole process group and reap the child itself.
static void kill_and_reap(pid_t child_pid) {
    ::kill(-child_pid, SIGKILL);
    ::kill(child_pid, SIGKILL);
    int status = 0;
    while (::waitpid(child_pid, &status, 0) < 0 && errno == EINTR) {
    }
}

ProcessResult run_process(const ProcessRequest &request) {
    ProcessResult result;

    if (request.arguments.empty()) {
        result.outcome = ProcessOutcome::kSpawnFailed;
        result.error_message = "empty command";
        return result;
    }

    if (!request.working_directory.empty()) {
        std::error_code filesystem_error;
        if (!std::filesystem::is_directory(request.working_directory, filesystem_error)) {
            result.outcome = ProcessOutcome::kWorkingDirectoryMissing;
            result.error_message = "Working directory not found: " + request.working_directory;
            return result;
        }
    }

    std::shared_ptr<const EnvironmentSnapshot> environment = child_environment();
    std::string executable_path = resolve_executable(request.arguments[0], *environment);
    if (executable_path.empty()) {
        result.outcome = ProcessOutcome::kExecutableNotFound;
        result.error_message = "Command not found: " + request.arguments[0];
        return result;
    }

    // Close-on-exec so that children spawned concurrently by other worker
    // threads never inherit our write ends (which would delay end-of-file).
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (::pipe2(stdout_pipe, O_CLOEXEC) != 0) {
        result.error_message = "pipe failed: " + std::string(strerror(errno));
        return result;
    }
    if (::pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        result.error_message = "pipe failed: " + std::string(strerror(errno));
        close_descriptor(stdout_pipe[0]);
        close_descriptor(stdout_pipe[1]);
        return result;
    }

    posix_spawn_file_actions_t file_actions;
    posix_spawn_file_actions_init(&file_actions);
    posix_spawn_file_actions_addopen(&file_actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&file_actions, stdout_pipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&file_actions, stderr_pipe[1], STDERR_FILENO);
    if (!request.working_directory.empty()) {
        posix_spawn_file_actions_addchdir_np(&file_actions, request.working_directory.c_str());
    }

    // Own process group (so a timeout can kill grandchildren too), empty signal
    // mask and default dispositions regardless of what the server installed.
    posix_spawnattr_t attributes;
    posix_spawnattr_init(&attributes);
    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    sigset_t default_signals;
    sigfillset(&default_signals);
    posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF);
    posix_spawnattr_setpgroup(&attributes, 0);
    posix_spawnattr_setsigmask(&attributes, &empty_mask);
    posix_spawnattr_setsigdefault(&attributes, &default_signals);

    // Build argv array: [program, arg1, arg2, ..., nullptr]
    std::vector<std::string> argv_strings = request.arguments;
    std::vector<char *> argv_pointers;
    for (auto &argument_string : argv_strings) {
        argv_pointers.push_back(argument_string.data());
    }
    argv_pointers.push_back(nullptr);

    pid_t child_pid = 0;
    int spawn_status = posix_spawn(&child_pid, executable_path.c_str(), &file_actions, &attributes,
                                   argv_pointers.data(), environment->pointers.data());

    posix_spawn_file_actions_destroy(&file_actions);
    posix_spawnattr_destroy(&attributes);
    close_descriptor(stdout_pipe[1]);
    close_descriptor(stderr_pipe[1]);

    if (spawn_status != 0) {
        close_descriptor(stdout_pipe[0]);
        close_descriptor(stderr_pipe[0]);
        result.outcome = (spawn_status == ENOENT || spawn_status == ENOTDIR)
                             ? ProcessOutcome::kExecutableNotFound
                             : ProcessOutcome::kSpawnFailed;
        result.error_message = strerror(spawn_status);
        return result;
    }

    result.process_id = static_cast<int>(child_pid);
    auto deadline = std::chrono::steady_clock::now() + request.timeout;

    // Drain both pipes until end-of-file on each or the deadline.
    pollfd descriptors[2];
    descriptors[0] = {stdout_pipe[0], POLLIN, 0};
    descriptors[1] = {stderr_pipe[0], POLLIN, 0};
    std::string *buffers[2] = {&result.stdout_bytes, &result.stderr_bytes};
    int open_count = 2;
    bool timed_out = false;

    while (open_count > 0) {
        long remaining = remaining_milliseconds(deadline);
        if (remaining <= 0) {
            timed_out = true;
            break;
        }

        int ready = ::poll(descriptors, 2, static_cast<int>(remaining));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.error_message = "poll failed: " + std::string(strerror(errno));
            break;
        }
        if (ready == 0) {
            timed_out = true;
            break;
        }

        char chunk[4096];
        for (int index = 0; index < 2; ++index) {
            if (descriptors[index].fd < 0 || (descriptors[index].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            ssize_t bytes_read = ::read(descriptors[index].fd, chunk, sizeof(chunk));
            if (bytes_read > 0) {
                std::string &buffer = *buffers[index];
                size_t room = kMaximumCapturedBytes > buffer.size() ? kMaximumCapturedBytes - buffer.size() : 0;
                buffer.append(chunk, std::min(room, static_cast<size_t>(bytes_read)));
            } else if (bytes_read == 0 || errno != EINTR) {
                close_descriptor(descriptors[index].fd);
                --open_count;
            }
        }
    }

    close_descriptor(descriptors[0].fd);
    close_descriptor(descriptors[1].fd);

    // The child may have closed its output early; keep honouring the deadline.
    int status = 0;
    bool reaped = false;
    while (!timed_out) {
        pid_t waited = ::waitpid(child_pid, &status, WNOHANG);
        if (waited == child_pid) {
            reaped = true;
            break;
        }
        if (waited < 0 && errno != EINTR) {
            result.error_message = "waitpid failed: " + std::string(strerror(errno));
            break;
        }
        if (remaining_milliseconds(deadline) <= 0) {
            timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (timed_out) {
        kill_and_reap(child_pid);
        result.outcome = ProcessOutcome::kTimedOut;
        return result;
    }

    if (!reaped) {
        kill_and_reap(child_pid);
        result.outcome = ProcessOutcome::kSpawnFailed;
        return result;
    }

    result.outcome = ProcessOutcome::kExited;
    result.return_code = decode_wait_status(status);
    return result;
}

bool process_exists(int process_id) {
    if (process_id <= 0) {
        return false;
    }
    return ::kill(static_cast<pid_t>(process_id), 0) == 0 || errno == EPERM;
}

} // namespace platform
