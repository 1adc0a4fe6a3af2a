#ifndef SUBDUB_PROCESS_RUNNER_H
#define SUBDUB_PROCESS_RUNNER_H

#include <chrono>
#include <string>
#include <vector>

namespace subdub {

struct ProcessResult {
    bool started = false;
    int spawnError = 0;  // errno from posix_spawnp when !started
    bool timedOut = false;
    bool exited = false;  // Normal exit (exitCode valid)
    int exitCode = -1;
    std::string output;  // Captured stdout (captureStdout only)

    bool succeeded() const {
        return started && !timedOut && exited && exitCode == 0;
    }
};

// Run args[0] (searched in PATH) with the given arguments and wait for it.
// The child is killed once `timeout` elapses; a zero timeout waits forever.
ProcessResult runProcess(const std::vector<std::string>& args, std::chrono::milliseconds timeout,
                         bool captureStdout = false);

}  // namespace subdub

#endif  // SUBDUB_PROCESS_RUNNER_H
