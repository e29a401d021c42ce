#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

namespace listui::util {

// A spawned external program with stdout and stderr merged into one pipe.
// The destructor kills and reaps a child that is still running.
class ChildProcess {
public:
    enum class ReadStatus { Line, Timeout, Eof };

    // Returns nullopt when fork or pipe fails. An exec failure shows up as exit status 127.
    static std::optional<ChildProcess> spawn(const std::vector<std::string>& argv);

    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ~ChildProcess();

    // Reads one line (without the newline). '\r' also ends a line.
    ReadStatus read_line(std::string& line, std::chrono::milliseconds timeout);

    // Signal the child's whole process group.
    void terminate();   // SIGTERM
    void kill();        // SIGKILL

    // Blocks until the child exits. Returns the exit code, or 128 + signal number.
    int wait();

    [[nodiscard]] pid_t pid() const { return pid_; }
    [[nodiscard]] bool running() const { return pid_ > 0 && !exit_status_; }

private:
    ChildProcess(pid_t pid, int read_fd) : pid_(pid), read_fd_(read_fd) {}
    void release();
    void signal_group(int sig);

    pid_t pid_ = -1;
    int read_fd_ = -1;
    std::string buffer_;
    bool eof_ = false;
    std::optional<int> exit_status_;
};

}  // namespace listui::util
