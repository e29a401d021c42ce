#include "util/ChildProcess.hpp"
#include "util/Logger.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace listui::util {

std::optional<ChildProcess> ChildProcess::spawn(const std::vector<std::string>& argv) {
    if (argv.empty()) return std::nullopt;

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) < 0) {
        Logger::error("ChildProcess: pipe failed: " + std::string(strerror(errno)));
        return std::nullopt;
    }

    // Build argv before forking; only async-signal-safe calls after fork()
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) {
        args.push_back(const_cast<char*>(a.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        Logger::error("ChildProcess: fork failed: " + std::string(strerror(errno)));
        close(fds[0]);
        close(fds[1]);
        return std::nullopt;
    }

    if (pid == 0) {
        // Own process group so signals do not reach the player
        setpgid(0, 0);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
        }
        dup2(fds[1], STDOUT_FILENO);
        dup2(fds[1], STDERR_FILENO);
        execvp(args[0], args.data());
        _exit(127);
    }

    // Also set from the parent so the group exists before the first signal
    setpgid(pid, pid);
    close(fds[1]);
    Logger::debug("ChildProcess: Spawned " + argv[0] + " (pid " + std::to_string(pid) + ")");
    return ChildProcess(pid, fds[0]);
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(other.pid_), read_fd_(other.read_fd_), buffer_(std::move(other.buffer_)),
      eof_(other.eof_), exit_status_(other.exit_status_) {
    other.pid_ = -1;
    other.read_fd_ = -1;
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        release();
        pid_ = other.pid_;
        read_fd_ = other.read_fd_;
        buffer_ = std::move(other.buffer_);
        eof_ = other.eof_;
        exit_status_ = other.exit_status_;
        other.pid_ = -1;
        other.read_fd_ = -1;
    }
    return *this;
}

ChildProcess::~ChildProcess() {
    release();
}

void ChildProcess::release() {
    if (running()) {
        kill();
        wait();
    }
    if (read_fd_ >= 0) {
        close(read_fd_);
        read_fd_ = -1;
    }
}

ChildProcess::ReadStatus ChildProcess::read_line(std::string& line, std::chrono::milliseconds timeout) {
    auto take_line = [&]() -> bool {
        auto pos = buffer_.find_first_of("\r\n");
        if (pos == std::string::npos) return false;
        line = buffer_.substr(0, pos);
        buffer_.erase(0, pos + 1);
        return true;
    };

    if (take_line()) return ReadStatus::Line;
    if (eof_ || read_fd_ < 0) {
        if (!buffer_.empty()) {
            line = std::move(buffer_);
            buffer_.clear();
            return ReadStatus::Line;
        }
        return ReadStatus::Eof;
    }

    struct pollfd pfd = {read_fd_, POLLIN, 0};
    int ret = poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ret == 0 || (ret < 0 && errno == EINTR)) {
        return ReadStatus::Timeout;
    }
    if (ret < 0) {
        Logger::error("ChildProcess: poll failed: " + std::string(strerror(errno)));
        eof_ = true;
        return read_line(line, timeout);
    }

    char chunk[4096];
    ssize_t n;
    do {
        n = read(read_fd_, chunk, sizeof(chunk));
    } while (n < 0 && errno == EINTR);

    if (n <= 0) {
        eof_ = true;
    } else {
        buffer_.append(chunk, static_cast<size_t>(n));
    }

    if (take_line()) return ReadStatus::Line;
    if (eof_) return read_line(line, timeout);
    return ReadStatus::Timeout;
}

void ChildProcess::terminate() {
    if (running()) {
        Logger::debug("ChildProcess: SIGTERM to pid " + std::to_string(pid_));
        signal_group(SIGTERM);
    }
}

void ChildProcess::kill() {
    if (running()) {
        Logger::debug("ChildProcess: SIGKILL to pid " + std::to_string(pid_));
        signal_group(SIGKILL);
    }
}

void ChildProcess::signal_group(int sig) {
    // Helpers the program started (yt-dlp runs ffmpeg) share its group
    if (::kill(-pid_, sig) < 0) {
        ::kill(pid_, sig);
    }
}

int ChildProcess::wait() {
    if (exit_status_) return *exit_status_;
    if (pid_ <= 0) return -1;

    int status = 0;
    pid_t result;
    do {
        result = waitpid(pid_, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result < 0) {
        Logger::error("ChildProcess: waitpid failed: " + std::string(strerror(errno)));
        exit_status_ = -1;
    } else if (WIFEXITED(status)) {
        exit_status_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_status_ = 128 + WTERMSIG(status);
    } else {
        exit_status_ = -1;
    }
    return *exit_status_;
}

}  // namespace listui::util
