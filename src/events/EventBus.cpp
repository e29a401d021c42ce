#include "events/EventBus.hpp"
#include "util/Logger.hpp"
#include <algorithm>

namespace listui::events {

EventBus::SubscriptionId EventBus::subscribe(Event::Type type, Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    subscribers_[type].push_back({id, std::move(handler)});
    listui::util::Logger::debug("EventBus: Subscription " + std::to_string(id) + " added");
    return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [type, subs] : subscribers_) {
        subs.erase(std::remove_if(subs.begin(), subs.end(),
                                  [id](const Subscription& s) { return s.id == id; }),
                   subs.end());
    }
}

void EventBus::publish(const Event& event) {
    // Copy handlers to avoid holding lock during execution
    std::vector<Handler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.find(event.type);
        if (it != subscribers_.end()) {
            for (const auto& sub : it->second) {
                handlers.push_back(sub.handler);
            }
        }
    }

    for (const auto& handler : handlers) {
        handler(event);
    }
}

}  // namespace listui::events
