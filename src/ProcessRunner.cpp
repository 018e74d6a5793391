/**
 * ProcessRunner.cpp - Run drush, ddev, lando and composer as child processes
 */

#include "dp/ProcessRunner.hpp"
#include "dp/Log.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sstream>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace dp {

namespace {

volatile std::sig_atomic_t g_cancel_requested = 0;

void onTerminationSignal(int) {
    g_cancel_requested = 1;
}

// Seconds between SIGTERM and SIGKILL
const int KILL_GRACE_SECONDS = 5;

// Captured output beyond this is dropped
const size_t MAX_CAPTURE = 1024 * 1024;

bool isExecutableFile(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

std::string joinArgv(const std::vector<std::string>& argv) {
    std::string joined;
    for (const auto& arg : argv) {
        if (!joined.empty()) joined += " ";
        joined += arg;
    }
    return joined;
}

// Drain whatever is readable; returns false once the write end is closed
bool drain(int fd, std::string& sink) {
    char buffer[4096];
    while (true) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            if (sink.size() < MAX_CAPTURE) {
                sink.append(buffer, static_cast<size_t>(n));
            }
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        // EAGAIN: nothing more for now
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

// SIGINT/SIGTERM feed the cancellation flag for the lifetime of the scope
class SignalScope {
public:
    SignalScope() {
        struct sigaction action;
        std::memset(&action, 0, sizeof(action));
        action.sa_handler = onTerminationSignal;
        sigemptyset(&action.sa_mask);
        ::sigaction(SIGINT, &action, &previous_int_);
        ::sigaction(SIGTERM, &action, &previous_term_);
    }

    ~SignalScope() {
        ::sigaction(SIGINT, &previous_int_, nullptr);
        ::sigaction(SIGTERM, &previous_term_, nullptr);
    }

    SignalScope(const SignalScope&) = delete;
    SignalScope& operator=(const SignalScope&) = delete;

private:
    struct sigaction previous_int_;
    struct sigaction previous_term_;
};

int decodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // anonymous namespace

std::string ProcessResult::diagnostic(size_t max_length) const {
    std::string text = err.find_first_not_of(" \t\r\n") != std::string::npos ? err : out;

    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    text = text.substr(start, end - start + 1);

    if (text.size() > max_length) {
        text = "..." + text.substr(text.size() - max_length);
    }
    return text;
}

bool SystemProcessRunner::which(const std::string& executable) const {
    if (executable.empty()) {
        return false;
    }
    if (executable.find('/') != std::string::npos) {
        return isExecutableFile(executable);
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) {
        return false;
    }

    std::istringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        if (isExecutableFile(dir + "/" + executable)) {
            return true;
        }
    }
    return false;
}

ProcessResult SystemProcessRunner::run(const std::vector<std::string>& argv,
                                       const std::string& cwd,
                                       int timeout_seconds) {
    ProcessResult result;

    if (g_cancel_requested) {
        result.cancelled = true;
        result.err = "cancelled before start";
        return result;
    }

    if (argv.empty() || !which(argv[0])) {
        result.not_found = true;
        result.exit_code = 127;
        result.err = (argv.empty() ? std::string("<empty>") : argv[0]) + ": command not found";
        return result;
    }

    int out_pipe[2];
    int err_pipe[2];
    if (::pipe(out_pipe) != 0) {
        result.err = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }
    if (::pipe(err_pipe) != 0) {
        result.err = std::string("pipe failed: ") + std::strerror(errno);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        return result;
    }

    log::debug("process", "run: " + joinArgv(argv) + (cwd.empty() ? "" : " (in " + cwd + ")"));

    SignalScope signals;
    pid_t pid = ::fork();
    if (pid < 0) {
        result.err = std::string("fork failed: ") + std::strerror(errno);
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) {
            ::close(fd);
        }
        return result;
    }

    if (pid == 0) {
        // Child
        ::setpgid(0, 0);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);

        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }

        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            std::string msg = "cannot enter " + cwd + ": " + std::strerror(errno) + "\n";
            ssize_t ignored = ::write(STDERR_FILENO, msg.data(), msg.size());
            (void)ignored;
            ::_exit(126);
        }

        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& arg : argv) {
            args.push_back(const_cast<char*>(arg.c_str()));
        }
        args.push_back(nullptr);

        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    // Parent
    ::setpgid(pid, pid);
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    ::fcntl(out_pipe[0], F_SETFL, ::fcntl(out_pipe[0], F_GETFL) | O_NONBLOCK);
    ::fcntl(err_pipe[0], F_SETFL, ::fcntl(err_pipe[0], F_GETFL) | O_NONBLOCK);

    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + std::chrono::seconds(timeout_seconds > 0 ? timeout_seconds : 1);
    Clock::time_point kill_at{};
    bool terminating = false;
    bool out_open = true;
    bool err_open = true;
    bool reaped = false;
    int status = 0;

    while (!reaped) {
        struct pollfd fds[2];
        nfds_t count = 0;
        if (out_open) fds[count++] = {out_pipe[0], POLLIN, 0};
        if (err_open) fds[count++] = {err_pipe[0], POLLIN, 0};

        if (count > 0) {
            int ready = ::poll(fds, count, 200);
            if (ready < 0 && errno != EINTR) {
                log::warn("process", std::string("poll failed: ") + std::strerror(errno));
            }
            if (out_open) out_open = drain(out_pipe[0], result.out);
            if (err_open) err_open = drain(err_pipe[0], result.err);
        } else {
            ::usleep(100 * 1000);
        }

        pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            reaped = true;
            break;
        }

        auto now = Clock::now();
        if (!terminating && (now >= deadline || g_cancel_requested)) {
            if (g_cancel_requested) {
                result.cancelled = true;
                log::warn("process", "cancelling: " + argv[0]);
            } else {
                result.timed_out = true;
                log::warn("process", argv[0] + " timed out after " + std::to_string(timeout_seconds) + "s");
            }
            ::kill(-pid, SIGTERM);
            terminating = true;
            kill_at = now + std::chrono::seconds(KILL_GRACE_SECONDS);
        } else if (terminating && now >= kill_at) {
            ::kill(-pid, SIGKILL);
            ::waitpid(pid, &status, 0);
            reaped = true;
        }
    }

    // Anything still buffered after exit
    if (out_open) drain(out_pipe[0], result.out);
    if (err_open) drain(err_pipe[0], result.err);
    ::close(out_pipe[0]);
    ::close(err_pipe[0]);

    result.exit_code = decodeStatus(status);
    log::debug("process", argv[0] + " exited with " + std::to_string(result.exit_code));
    return result;
}

bool cancellationRequested() {
    return g_cancel_requested != 0;
}

void requestCancellation() {
    g_cancel_requested = 1;
}

void resetCancellation() {
    g_cancel_requested = 0;
}

} // namespace dp
