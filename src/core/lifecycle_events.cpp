#include "lifecycle_events.hpp"
#include <algorithm>

namespace roomcast {

ObserverId LifecycleEventBus::subscribe(LifecycleObserver observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    ObserverId id = next_id_++;
    auto next = std::make_shared<ObserverList>(*observers_);
    next->emplace_back(id, std::move(observer));
    observers_ = std::move(next);
    return id;
}

bool LifecycleEventBus::unsubscribe(ObserverId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(observers_->begin(), observers_->end(),
        [id](const auto& entry) { return entry.first == id; });
    if (it == observers_->end()) return false;
    auto next = std::make_shared<ObserverList>();
    next->reserve(observers_->size() - 1);
    for (const auto& entry : *observers_) {
        if (entry.first != id) next->push_back(entry);
    }
    observers_ = std::move(next);
    return true;
}

size_t LifecycleEventBus::observer_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return observers_->size();
}

void LifecycleEventBus::publish(const std::vector<LifecycleEvent>& events) const {
    if (events.empty()) return;
    std::shared_ptr<const ObserverList> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot = observers_;
    }
    for (const auto& ev : events) {
        for (const auto& entry : *snapshot) {
            if (entry.second) entry.second(ev);
        }
    }
}

} // namespace roomcast
