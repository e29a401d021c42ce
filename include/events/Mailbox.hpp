#pragma once

#include <mutex>
#include <vector>

namespace listui::events {

// Multi-producer queue drained by the foreground thread.
// Background tasks never touch session state; they post here instead.
template <typename Message>
class Mailbox {
public:
    void post(Message message) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.push_back(std::move(message));
    }

    std::vector<Message> drain() {
        std::vector<Message> out;
        std::lock_guard<std::mutex> lock(mutex_);
        out.swap(pending_);
        return out;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.empty();
    }

private:
    mutable std::mutex mutex_;
    std::vector<Message> pending_;
};

}  // namespace listui::events
