#pragma once

#include "ui/InputEvent.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <termios.h>

namespace listui::ui {

// Raw-mode terminal with an alternate screen. Output is queued and written by
// a background thread so that a slow terminal never stalls the foreground loop.
class Terminal {
public:
    static Terminal& instance();

    void init();
    void shutdown();
    bool is_initialized() const;

    void clear_screen();
    void print(int x, int y, const std::string& text);

    // Enqueue raw data for asynchronous writing to stdout
    void write_raw(const std::string& text);

    // Non-blocking. Returns an event of Type::None when nothing is pending.
    InputEvent read_input();
    int get_terminal_width() const;
    int get_terminal_height() const;

private:
    Terminal() = default;
    ~Terminal();

    void writer_loop();

    bool initialized_ = false;

    std::thread writer_thread_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::string> write_queue_;
    std::atomic<bool> running_{false};

    ::termios original_termios_{};
    int original_flags_ = 0;
};

}  // namespace listui::ui
