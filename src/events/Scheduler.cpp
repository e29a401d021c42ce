#include "events/Scheduler.hpp"
#include "util/Logger.hpp"
#include <vector>

namespace listui::events {

void Scheduler::schedule(const std::string& name, std::chrono::milliseconds interval, Task task) {
    listui::util::Logger::debug("Scheduler: Scheduling task " + name);

    tasks_[name] = {std::move(task), interval, Clock::now(), true};
}

void Scheduler::schedule_once(const std::string& name, std::chrono::milliseconds delay, Task task) {
    tasks_[name] = {std::move(task), delay, Clock::now(), false};
}

void Scheduler::unschedule(const std::string& name) {
    tasks_.erase(name);
}

void Scheduler::process(Clock::time_point now) {
    // Tasks may reschedule or unschedule, so collect first
    std::vector<std::string> due;
    for (auto& [name, task] : tasks_) {
        if (now - task.last_run >= task.interval) {
            due.push_back(name);
        }
    }

    for (const auto& name : due) {
        auto it = tasks_.find(name);
        if (it == tasks_.end()) continue;

        Task task = it->second.task;
        if (it->second.repeat) {
            it->second.last_run = now;
        } else {
            tasks_.erase(it);
        }
        task();
    }
}

}  // namespace listui::events
