#include "process/ForkRunner.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <memory>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/format.h>

using namespace sw::process;
using namespace sw::logging;
using namespace std::chrono;

std::string ProcessResult::diagnostics() const {
    if (!stderr_text.empty()) return stderr_text;
    if (!stdout_text.empty()) return stdout_text;
    return error;
}

namespace {

struct Pipe {
    int fds[2]{-1, -1};

    Pipe() {
        if (::pipe2(fds, O_CLOEXEC) == -1)
            throw std::runtime_error(fmt::format("pipe2 failed: {}", std::strerror(errno)));
    }

    ~Pipe() {
        closeRead();
        closeWrite();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    void closeRead() { if (fds[0] != -1) { ::close(fds[0]); fds[0] = -1; } }
    void closeWrite() { if (fds[1] != -1) { ::close(fds[1]); fds[1] = -1; } }
};

// Returns false on EOF or error
bool drain(const int fd, std::string& into) {
    std::array<char, 4096> buf{};
    const ssize_t n = ::read(fd, buf.data(), buf.size());
    if (n > 0) {
        into.append(buf.data(), static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) return true;
    return false;
}

int decodeStatus(const int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

}

ProcessResult ForkRunner::run(const Invocation& invocation) {
    ProcessResult result;
    const auto start = steady_clock::now();
    const auto deadline = start + invocation.timeout;

    // argv is built before fork so the child only calls async-signal-safe functions
    const std::string exe = invocation.executable.string();
    const std::string cwd = invocation.working_directory ? invocation.working_directory->string() : std::string{};
    std::vector<char*> argv;
    argv.reserve(invocation.args.size() + 2);
    argv.push_back(const_cast<char*>(exe.c_str()));
    for (const auto& a : invocation.args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    std::unique_ptr<Pipe> out, err;
    try {
        out = std::make_unique<Pipe>();
        err = std::make_unique<Pipe>();
    } catch (const std::exception& e) {
        result.error = e.what();
        return result;
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        result.error = fmt::format("fork failed: {}", std::strerror(errno));
        LogRegistry::host()->error("[ForkRunner] {}", result.error);
        return result;
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(out->fds[1], STDOUT_FILENO);
        ::dup2(err->fds[1], STDERR_FILENO);
        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) _exit(127);
        ::execv(exe.c_str(), argv.data());
        _exit(127); // exec failed
    }

    ::setpgid(pid, pid); // mirror the child call to close the race
    result.launched = true;
    out->closeWrite();
    err->closeWrite();

    bool outOpen = true, errOpen = true, killed = false;
    while (outOpen || errOpen) {
        const auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
        if (remaining.count() <= 0) {
            ::kill(-pid, SIGKILL);
            killed = true;
            break;
        }

        std::array<pollfd, 2> fds{};
        nfds_t n = 0;
        if (outOpen) fds[n++] = {out->fds[0], POLLIN, 0};
        if (errOpen) fds[n++] = {err->fds[0], POLLIN, 0};

        const int rc = ::poll(fds.data(), n, static_cast<int>(std::min<long long>(remaining.count(), 100)));
        if (rc < 0) {
            if (errno == EINTR) continue;
            ::kill(-pid, SIGKILL);
            killed = true;
            result.error = fmt::format("poll failed: {}", std::strerror(errno));
            break;
        }

        for (nfds_t i = 0; i < n; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            if (fds[i].fd == out->fds[0] && !drain(fds[i].fd, result.stdout_text)) outOpen = false;
            else if (fds[i].fd == err->fds[0] && !drain(fds[i].fd, result.stderr_text)) errOpen = false;
        }
    }

    // Pipes closed, the child may still be running until the deadline
    int status = 0;
    bool reaped = false;
    while (!killed) {
        const pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) { reaped = true; break; }
        if (w < 0 && errno != EINTR) {
            result.error = fmt::format("waitpid failed: {}", std::strerror(errno));
            break;
        }
        if (steady_clock::now() >= deadline) {
            ::kill(-pid, SIGKILL);
            killed = true;
            break;
        }
        std::this_thread::sleep_for(milliseconds(10));
    }

    if (killed) {
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        result.timed_out = result.error.empty();
        result.exit_code = -1;
        if (result.timed_out)
            LogRegistry::host()->warn("[ForkRunner] {} killed after {} ms", exe, invocation.timeout.count());
    } else if (reaped) {
        result.exit_code = decodeStatus(status);
    }

    result.elapsed = duration_cast<milliseconds>(steady_clock::now() - start);
    return result;
}
