#include "ui/Terminal.hpp"
#include "util/Logger.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <poll.h>
#include <stdexcept>
#include <sys/ioctl.h>
#include <unistd.h>

namespace listui::ui {

using util::Logger;

namespace {

// Set from the signal handler only; ioctl is never called there
volatile std::sig_atomic_t g_resize_pending = 0;

void sigwinch_handler(int) {
    g_resize_pending = 1;
}

// Reads one byte, retrying on EINTR. Returns false when nothing is available.
bool read_byte(char& c) {
    ssize_t n;
    do {
        n = read(STDIN_FILENO, &c, 1);
    } while (n < 0 && errno == EINTR);

    if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
        Logger::debug(std::format("Terminal: read() failed: {}", std::strerror(errno)));
    }
    return n == 1;
}

InputEvent key(std::string name, int code = 0) {
    return {InputEvent::Type::KeyPress, code, std::move(name)};
}

}  // namespace

Terminal& Terminal::instance() {
    static Terminal instance;
    return instance;
}

Terminal::~Terminal() {
    shutdown();
}

void Terminal::init() {
    if (initialized_) return;

    if (tcgetattr(STDIN_FILENO, &original_termios_) != 0) {
        throw std::runtime_error(std::string("stdin is not a terminal: ") + std::strerror(errno));
    }

    ::termios raw = original_termios_;
    raw.c_lflag &= ~(ECHO | ICANON | ISIG);
    raw.c_iflag &= ~(IXON | ICRNL);  // Disable flow control and CR->NL
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw);

    original_flags_ = fcntl(STDIN_FILENO, F_GETFL, 0);
    fcntl(STDIN_FILENO, F_SETFL, original_flags_ | O_NONBLOCK);

    std::signal(SIGWINCH, sigwinch_handler);

    running_ = true;
    writer_thread_ = std::thread(&Terminal::writer_loop, this);

    write_raw("\033[?1049h");  // Enter alternate screen buffer
    write_raw("\033[?25l");    // Hide cursor
    initialized_ = true;
    Logger::info("Terminal: Initialized");
}

void Terminal::shutdown() {
    if (!initialized_) return;

    write_raw("\033[0m\033[?25h");  // Reset style, show cursor
    write_raw("\033[?1049l");       // Exit alternate screen buffer

    // The writer drains the queue before exiting
    running_ = false;
    queue_cv_.notify_all();
    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }

    fcntl(STDIN_FILENO, F_SETFL, original_flags_);
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &original_termios_);
    std::signal(SIGWINCH, SIG_DFL);
    initialized_ = false;
    Logger::info("Terminal: Restored");
}

bool Terminal::is_initialized() const {
    return initialized_;
}

void Terminal::writer_loop() {
    while (true) {
        std::string chunk;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !write_queue_.empty() || !running_; });

            if (write_queue_.empty()) {
                if (!running_) break;
                continue;
            }
            chunk = std::move(write_queue_.front());
            write_queue_.pop_front();
        }

        size_t written = 0;
        while (written < chunk.size()) {
            ssize_t n = write(STDOUT_FILENO, chunk.data() + written, chunk.size() - written);
            if (n > 0) {
                written += static_cast<size_t>(n);
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                // stdout may share the non-blocking flag with stdin
                struct pollfd pfd = {STDOUT_FILENO, POLLOUT, 0};
                poll(&pfd, 1, 100);
                continue;
            }
            Logger::error(std::format("Terminal: Dropping {} bytes: {}", chunk.size() - written,
                                      std::strerror(errno)));
            break;
        }
    }
}

void Terminal::write_raw(const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        write_queue_.push_back(text);
    }
    queue_cv_.notify_one();
}

void Terminal::clear_screen() {
    write_raw("\033[0m\033[2J\033[H");
}

void Terminal::print(int x, int y, const std::string& text) {
    // Cursor move and text in one chunk
    write_raw(std::format("\033[{};{}H{}", y + 1, x + 1, text));
}

InputEvent Terminal::read_input() {
    if (g_resize_pending) {
        g_resize_pending = 0;
        return {InputEvent::Type::Resize, 0, "resize"};
    }

    char c;
    if (!read_byte(c)) return {};

    if (c == '\033') {
        char seq[2];
        if (read_byte(seq[0]) && (seq[0] == '[' || seq[0] == 'O') && read_byte(seq[1])) {
            switch (seq[1]) {
                case 'A': return key("up");
                case 'B': return key("down");
                case 'C': return key("right");
                case 'D': return key("left");
            }
            // Drain the rest of an unknown CSI sequence (e.g. "\033[3~")
            char rest = seq[1];
            while ((rest < '@' || rest > '~') && read_byte(rest)) {}
            return {};
        }
        return key("escape", 27);
    }

    if (c == '\n' || c == '\r') return key("enter");
    if (c == 127 || c == 8) return key("backspace");
    if (c == '\t') return key("tab");
    if (c == 3) return key("ctrl-c", 3);

    auto lead = static_cast<unsigned char>(c);
    std::string text(1, c);
    int extra = (lead & 0xE0) == 0xC0 ? 1 : (lead & 0xF0) == 0xE0 ? 2 : (lead & 0xF8) == 0xF0 ? 3 : 0;
    for (int i = 0; i < extra; ++i) {
        char next;
        if (!read_byte(next)) break;
        text += next;
    }
    return {InputEvent::Type::KeyPress, lead, text};
}

int Terminal::get_terminal_width() const {
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) != 0 || w.ws_col == 0) return 80;
    return w.ws_col;
}

int Terminal::get_terminal_height() const {
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) != 0 || w.ws_row == 0) return 24;
    return w.ws_row;
}

}  // namespace listui::ui
