#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "types.hpp"

namespace roomcast {

enum class LifecycleEventType {
    CREATE_ROOM,
    JOIN_ROOM,
    LEAVE_ROOM,
    DELETE_ROOM
};

inline const char* to_string(LifecycleEventType type) {
    switch (type) {
        case LifecycleEventType::CREATE_ROOM: return "create-room";
        case LifecycleEventType::JOIN_ROOM:   return "join-room";
        case LifecycleEventType::LEAVE_ROOM:  return "leave-room";
        case LifecycleEventType::DELETE_ROOM: return "delete-room";
    }
    return "unknown";
}

struct LifecycleEvent {
    LifecycleEventType type;
    Room room;
    SocketId socket_id;  // empty for CREATE_ROOM / DELETE_ROOM

    bool operator==(const LifecycleEvent& other) const {
        return type == other.type && room == other.room && socket_id == other.socket_id;
    }
};

using LifecycleObserver = std::function<void(const LifecycleEvent&)>;
using ObserverId = uint64_t;

/**
 * Ordered list of lifecycle observers.
 *
 * publish() delivers each event to every observer, in subscription order,
 * before moving on to the next event. Observers run on the publishing thread
 * and outside the bus lock, so they may subscribe, unsubscribe or call back
 * into the registry. An exception thrown by an observer stops delivery and
 * reaches the publisher's caller unchanged.
 */
class LifecycleEventBus {
public:
    ObserverId subscribe(LifecycleObserver observer);
    bool unsubscribe(ObserverId id);
    size_t observer_count() const;

    void publish(const std::vector<LifecycleEvent>& events) const;

private:
    using ObserverList = std::vector<std::pair<ObserverId, LifecycleObserver>>;

    // Replaced wholesale on subscribe/unsubscribe; publish() only takes a reference.
    mutable std::mutex mutex_;
    std::shared_ptr<const ObserverList> observers_{std::make_shared<const ObserverList>()};
    ObserverId next_id_{1};
};

} // namespace roomcast
