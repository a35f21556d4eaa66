#pragma once

#include <sys/types.h>

#include <string>
#include <vector>

namespace ascot {
namespace discovery {

// BrowseProcess runs a long-lived browse command as a child process and
// reads its stdout line by line.
// - stdin is /dev/null, stdout is a pipe, stderr is discarded
// - exec failures are reported synchronously by spawn()
// - shutdown: SIGTERM -> wait -> SIGKILL
class BrowseProcess {
public:
    enum class ReadResult { LINE, TIMEOUT, CLOSED, ERROR };

    explicit BrowseProcess(const std::vector<std::string> &argv);
    ~BrowseProcess();

    BrowseProcess(const BrowseProcess &) = delete;
    BrowseProcess &operator=(const BrowseProcess &) = delete;

    bool spawn();
    bool is_running() const;
    void shutdown();

    // Read one complete line (without the newline), waiting up to timeout_ms
    ReadResult read_line(std::string &line, int timeout_ms);

    pid_t pid() const { return pid_; }
    const std::string &last_error() const { return error_; }

private:
    static constexpr size_t kMaxLineLength = 64 * 1024;

    bool take_line(std::string &line);
    bool wait_for_exit(int timeout_ms);
    void close_pipe();

    std::vector<std::string> argv_;
    std::string error_;
    std::string buffer_;
    bool eof_ = false;

    pid_t pid_;
    int stdout_read_fd_;
};

}  // namespace discovery
}  // namespace ascot
