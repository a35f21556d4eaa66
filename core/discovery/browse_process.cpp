#include "discovery/browse_process.hpp"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <cstring>
#include <thread>

#include "logging/logger.hpp"

namespace ascot {
namespace discovery {

BrowseProcess::BrowseProcess(const std::vector<std::string> &argv)
    : argv_(argv), pid_(-1), stdout_read_fd_(-1) {}

BrowseProcess::~BrowseProcess() { shutdown(); }

bool BrowseProcess::spawn() {
    if (argv_.empty()) {
        error_ = "Empty browse command";
        return false;
    }

    int stdout_pipe[2];
    if (pipe(stdout_pipe) < 0) {
        error_ = "Failed to create stdout pipe: " + std::string(strerror(errno));
        return false;
    }

    // Closed by a successful exec; carries errno when exec fails
    int exec_pipe[2];
    if (pipe2(exec_pipe, O_CLOEXEC) < 0) {
        error_ = "Failed to create exec status pipe: " + std::string(strerror(errno));
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        return false;
    }

    std::vector<char *> argv;
    for (const auto &arg : argv_) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_ = fork();
    if (pid_ < 0) {
        error_ = "Fork failed: " + std::string(strerror(errno));
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        close(exec_pipe[0]);
        close(exec_pipe[1]);
        pid_ = -1;
        return false;
    }

    if (pid_ == 0) {
        // Child: only async-signal-safe calls from here on
        close(exec_pipe[0]);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);

        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }

        execvp(argv[0], argv.data());

        int exec_errno = errno;
        ssize_t ignored = write(exec_pipe[1], &exec_errno, sizeof(exec_errno));
        static_cast<void>(ignored);
        _exit(127);
    }

    close(stdout_pipe[1]);
    close(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close(exec_pipe[0]);

    if (n > 0) {
        error_ = "Failed to execute '" + argv_[0] + "': " + std::string(strerror(exec_errno));
        close(stdout_pipe[0]);
        wait_for_exit(500);
        return false;
    }

    stdout_read_fd_ = stdout_pipe[0];
    buffer_.clear();
    eof_ = false;

    LOG_INFO("[Discovery] Spawned '" << argv_[0] << "' (PID=" << pid_ << ")");
    return true;
}

bool BrowseProcess::is_running() const {
    if (pid_ <= 0) return false;
    return kill(pid_, 0) == 0;
}

void BrowseProcess::shutdown() {
    if (pid_ > 0) {
        kill(pid_, SIGTERM);
        if (!wait_for_exit(1000)) {
            LOG_WARN("[Discovery] Browse process " << pid_ << " ignored SIGTERM, killing");
            kill(pid_, SIGKILL);
            wait_for_exit(500);
        }
    }
    close_pipe();
}

void BrowseProcess::close_pipe() {
    if (stdout_read_fd_ >= 0) {
        close(stdout_read_fd_);
        stdout_read_fd_ = -1;
    }
}

bool BrowseProcess::take_line(std::string &line) {
    auto pos = buffer_.find('\n');
    if (pos == std::string::npos) {
        return false;
    }
    line = buffer_.substr(0, pos);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    buffer_.erase(0, pos + 1);
    return true;
}

BrowseProcess::ReadResult BrowseProcess::read_line(std::string &line, int timeout_ms) {
    error_.clear();
    if (take_line(line)) {
        return ReadResult::LINE;
    }
    if (eof_ || stdout_read_fd_ < 0) {
        error_ = "Browse process output closed";
        return ReadResult::CLOSED;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (true) {
        auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
        if (remaining < 0) remaining = 0;

        struct pollfd pfd;
        pfd.fd = stdout_read_fd_;
        pfd.events = POLLIN;
        int result = ::poll(&pfd, 1, static_cast<int>(remaining));
        if (result < 0) {
            if (errno == EINTR) continue;
            error_ = "poll failed: " + std::string(strerror(errno));
            return ReadResult::ERROR;
        }
        if (result == 0) {
            return ReadResult::TIMEOUT;
        }

        char chunk[4096];
        ssize_t n = read(stdout_read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            error_ = "Read failed: " + std::string(strerror(errno));
            return ReadResult::ERROR;
        }
        if (n == 0) {
            eof_ = true;
            // Hand out a trailing partial line before reporting EOF
            if (!buffer_.empty()) {
                line = buffer_;
                buffer_.clear();
                return ReadResult::LINE;
            }
            error_ = "Browse process exited";
            return ReadResult::CLOSED;
        }

        buffer_.append(chunk, static_cast<size_t>(n));
        if (take_line(line)) {
            return ReadResult::LINE;
        }
        if (buffer_.size() > kMaxLineLength) {
            error_ = "Browse output line exceeds " + std::to_string(kMaxLineLength) + " bytes";
            return ReadResult::ERROR;
        }
    }
}

bool BrowseProcess::wait_for_exit(int timeout_ms) {
    if (pid_ <= 0) {
        return true;
    }

    auto start = std::chrono::steady_clock::now();
    while (true) {
        int status;
        pid_t result = waitpid(pid_, &status, WNOHANG);
        if (result == pid_) {
            pid_ = -1;
            return true;
        }
        if (result == -1) {
            if (errno == ECHILD) {
                pid_ = -1;
                return true;
            }
            if (errno == EINTR) {
                continue;
            }
            return false;
        }

        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() >= timeout_ms) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

}  // namespace discovery
}  // namespace ascot
