#include "core/process_runner.h"

#include "logging/logger.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace subdub {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(20);

void drainPipe(int fd, std::string& out) {
    char buffer[4096];
    while (true) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        break;
    }
}

}  // namespace

ProcessResult runProcess(const std::vector<std::string>& args, std::chrono::milliseconds timeout,
                         bool captureStdout) {
    ProcessResult result;
    if (args.empty()) {
        result.spawnError = EINVAL;
        return result;
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int pipeFds[2] = {-1, -1};
    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    if (captureStdout) {
        if (pipe(pipeFds) != 0) {
            result.spawnError = errno;
            posix_spawn_file_actions_destroy(&actions);
            return result;
        }
        posix_spawn_file_actions_adddup2(&actions, pipeFds[1], STDOUT_FILENO);
        posix_spawn_file_actions_addclose(&actions, pipeFds[0]);
        posix_spawn_file_actions_addclose(&actions, pipeFds[1]);
    }

    pid_t pid = -1;
    int rc = posix_spawnp(&pid, args[0].c_str(), &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    if (captureStdout) {
        close(pipeFds[1]);
    }
    if (rc != 0) {
        LOG_DEBUG("Failed to spawn {}: {} ({})", args[0], rc, std::strerror(rc));
        if (captureStdout) {
            close(pipeFds[0]);
        }
        result.spawnError = rc;
        return result;
    }
    result.started = true;

    if (captureStdout) {
        fcntl(pipeFds[0], F_SETFL, fcntl(pipeFds[0], F_GETFL) | O_NONBLOCK);
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    int status = 0;
    bool reaped = false;
    while (true) {
        if (captureStdout) {
            pollfd pfd{pipeFds[0], POLLIN, 0};
            if (poll(&pfd, 1, static_cast<int>(kPollInterval.count())) > 0) {
                drainPipe(pipeFds[0], result.output);
            }
        }

        pid_t ret = waitpid(pid, &status, WNOHANG);
        if (ret == pid) {
            reaped = true;
            break;
        }
        if (ret < 0 && errno != EINTR) {
            LOG_ERROR("waitpid failed for {}: {}", args[0], std::strerror(errno));
            break;
        }
        if (timeout.count() > 0 && std::chrono::steady_clock::now() >= deadline) {
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            result.timedOut = true;
            break;
        }
        if (!captureStdout) {
            std::this_thread::sleep_for(kPollInterval);
        }
    }

    if (captureStdout) {
        drainPipe(pipeFds[0], result.output);
        close(pipeFds[0]);
    }

    if (reaped && WIFEXITED(status)) {
        result.exited = true;
        result.exitCode = WEXITSTATUS(status);
    }
    return result;
}

}  // namespace subdub
