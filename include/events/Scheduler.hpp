#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <string>

namespace listui::events {

// Runs named tasks from the foreground loop. Repeating tasks fire every
// `interval`; one-shot tasks fire once after `delay` and are removed.
class Scheduler {
public:
    using Task = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    void schedule(const std::string& name, std::chrono::milliseconds interval, Task task);
    void schedule_once(const std::string& name, std::chrono::milliseconds delay, Task task);
    void unschedule(const std::string& name);
    bool is_scheduled(const std::string& name) const { return tasks_.count(name) > 0; }
    void process(Clock::time_point now = Clock::now());

private:
    struct ScheduledTask {
        Task task;
        std::chrono::milliseconds interval;
        Clock::time_point last_run;
        bool repeat = true;
    };

    std::map<std::string, ScheduledTask> tasks_;
};

}  // namespace listui::events
