#ifndef TOOLGATE_PLATFORM_ABI_HPP
#define TOOLGATE_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <chrono>
#include <string>
#include <vector>

namespace platform {

// How a supervised child process ended. Exactly one outcome is reported per run.
enum class ProcessOutcome {
    kExited,                   // Ran to completion (normally or killed by a signal it received).
    kTimedOut,                 // Deadline passed; the process group was killed and reaped.
    kExecutableNotFound,       // argv[0] could not be resolved on PATH.
    kWorkingDirectoryMissing,  // The requested working directory does not exist.
    kSpawnFailed,              // Any other failure before the child started.
};

// Parameters of a supervised child process run.
struct ProcessRequest {
    // argv[0] is resolved through PATH; no shell is involved.
    std::vector<std::string> arguments;
    // Empty means the current working directory of the server.
    std::string working_directory;
    std::chrono::milliseconds timeout{30000};
};

// Result of a supervised child process run.
struct ProcessResult {
    ProcessOutcome outcome = ProcessOutcome::kSpawnFailed;
    int process_id = -1;
    // Exit status, or minus the signal number when the child died from a signal.
    int return_code = -1;
    // Raw bytes captured from the child's stdout / stderr.
    std::string stdout_bytes;
    std::string stderr_bytes;
    std::string error_message;
};

// Spawn the argument vector as a child in its own process group, capture its
// output, and wait until it exits or the timeout elapses. On timeout the whole
// process group is killed with SIGKILL and the child is reaped before returning,
// so no child outlives the call.
ProcessResult run_process(const ProcessRequest &request);

// Copy the process environment that children inherit. Called once at startup,
// before any request thread exists; run_process never reads environ itself, so
// later changes to the server's own environment do not race with spawning.
// run_process captures on first use if this was never called.
void capture_environment();

// True if a process with this id exists and has not been reaped.
bool process_exists(int process_id);

} // namespace platform

#endif // TOOLGATE_PLATFORM_ABI_HPP
