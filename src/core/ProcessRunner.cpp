/**
 * @file ProcessRunner.cpp
 * @brief fork/execvp subprocess runner
 */

#include "clamftp/ProcessRunner.h"
#include "clamftp/Debug.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace ClamFtp {

namespace {

/**
 * @brief Pipe whose ends are closed on scope exit
 */
struct Pipe {
    int fds[2] = {-1, -1};

    bool open() { return ::pipe2(fds, O_CLOEXEC) == 0; }

    void closeRead() {
        if (fds[0] >= 0) { ::close(fds[0]); fds[0] = -1; }
    }
    void closeWrite() {
        if (fds[1] >= 0) { ::close(fds[1]); fds[1] = -1; }
    }

    ~Pipe() {
        closeRead();
        closeWrite();
    }
};

int remainingMs(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

void decodeWaitStatus(int status, ProcessResult& result) {
    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.termSignal = WTERMSIG(status);
    }
}

}  // namespace

ProcessResult ProcessRunner::run(const std::vector<std::string>& argv,
                                 uint32_t timeoutSeconds,
                                 size_t maxOutputBytes)
{
    ProcessResult result;

    if (argv.empty() || argv[0].empty()) {
        result.errorMsg = "No command given";
        return result;
    }

    Pipe outPipe;
    Pipe errPipe;
    Pipe execPipe;  // Receives errno if execvp fails; closed by a successful exec
    if (!outPipe.open() || !errPipe.open() || !execPipe.open()) {
        result.errorMsg = std::string("pipe() failed: ") + std::strerror(errno);
        return result;
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        result.errorMsg = std::string("fork() failed: ") + std::strerror(errno);
        return result;
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on.
        // Own process group so a timeout also kills anything it spawned.
        ::setpgid(0, 0);
        ::dup2(outPipe.fds[1], STDOUT_FILENO);
        ::dup2(errPipe.fds[1], STDERR_FILENO);
        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
        }
        ::execvp(cargv[0], cargv.data());
        int err = errno;
        ssize_t ignored = ::write(execPipe.fds[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    outPipe.closeWrite();
    errPipe.closeWrite();
    execPipe.closeWrite();

    // Blocks until exec succeeds (EOF) or the child reports an exec failure
    int execErrno = 0;
    ssize_t n = 0;
    do {
        n = ::read(execPipe.fds[0], &execErrno, sizeof(execErrno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(execErrno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        result.errorMsg = "Cannot execute '" + argv[0] + "': " + std::strerror(execErrno);
        return result;
    }
    result.launched = true;

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeoutSeconds);

    pollfd fds[2];
    fds[0].fd = outPipe.fds[0];
    fds[0].events = POLLIN;
    fds[1].fd = errPipe.fds[0];
    fds[1].events = POLLIN;
    std::string* sinks[2] = {&result.stdoutText, &result.stderrText};
    int openStreams = 2;

    while (openStreams > 0) {
        int waitMs = remainingMs(deadline);
        if (waitMs == 0) {
            result.timedOut = true;
            break;
        }

        int ready = ::poll(fds, 2, waitMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.errorMsg = std::string("poll() failed: ") + std::strerror(errno);
            break;
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            char buffer[4096];
            ssize_t got = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (got > 0) {
                std::string& sink = *sinks[i];
                if (sink.size() < maxOutputBytes) {
                    sink.append(buffer, std::min(static_cast<size_t>(got), maxOutputBytes - sink.size()));
                }
            } else if (got == 0 || errno != EINTR) {
                fds[i].fd = -1;  // poll() ignores negative descriptors
                --openStreams;
            }
        }
    }

    // Output closed; the child may still be running (e.g. it closed its pipes)
    int status = 0;
    while (!result.timedOut) {
        pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            decodeWaitStatus(status, result);
            return result;
        }
        if (waited < 0 && errno != EINTR) {
            result.errorMsg = std::string("waitpid() failed: ") + std::strerror(errno);
            return result;
        }
        if (remainingMs(deadline) == 0) {
            result.timedOut = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    LOG_WARNING("'" << argv[0] << "' exceeded " << timeoutSeconds << "s, killing pid " << pid);
    if (::kill(-pid, SIGKILL) != 0 && ::kill(pid, SIGKILL) != 0 && errno != ESRCH) {
        LOG_ERROR("kill(SIGKILL) failed: " << std::strerror(errno));
    }
    ::waitpid(pid, &status, 0);
    return result;
}

}  // namespace ClamFtp
