#pragma once

#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "types.hpp"
#include "lifecycle_events.hpp"

namespace roomcast {

/**
 * Bidirectional room <-> socket index.
 *
 * rooms_ and sids_ always mirror each other: s is in rooms_[r] exactly when
 * r is in sids_[s]. A room entry exists only while it has members. A socket
 * entry exists from its first join (or register_socket) until remove_socket.
 *
 * Every mutation updates both maps under one exclusive lock, then publishes
 * the resulting lifecycle events after the lock is released but before the
 * call returns.
 */
class MembershipRegistry {
public:
    MembershipRegistry() = default;
    MembershipRegistry(const MembershipRegistry&) = delete;
    MembershipRegistry& operator=(const MembershipRegistry&) = delete;

    // Create an empty socket entry. No events.
    void register_socket(const SocketId& id);

    // Add a socket to each room, in the order given. Idempotent.
    void join(const SocketId& id, const std::vector<Room>& rooms);

    // Remove one (room, socket) edge; deletes the room when it empties.
    void leave(const SocketId& id, const Room& room);

    // Leave every room, then drop the socket entry. No-op for unknown sockets.
    void remove_socket(const SocketId& id);

    // std::nullopt when the socket was never registered (or was removed).
    std::optional<RoomSet> rooms_of(const SocketId& id) const;

    std::vector<SocketId> members(const Room& room) const;
    bool has_room(const Room& room) const;
    bool has_socket(const SocketId& id) const;
    bool is_member(const SocketId& id, const Room& room) const;
    size_t room_count() const;
    size_t socket_count() const;
    std::vector<Room> room_names() const;
    std::vector<SocketId> socket_ids() const;

    ObserverId subscribe(LifecycleObserver observer) { return events_.subscribe(std::move(observer)); }
    bool unsubscribe(ObserverId id) { return events_.unsubscribe(id); }

    /**
     * Run fn(rooms, sids) with shared access to both indices. fn must not
     * call back into the registry.
     */
    template <typename Fn>
    auto read(Fn&& fn) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return fn(static_cast<const RoomIndex&>(rooms_), static_cast<const SocketIndex&>(sids_));
    }

private:
    void leave_locked(const SocketId& id, const Room& room, std::vector<LifecycleEvent>& out);

    mutable std::shared_mutex mutex_;
    RoomIndex rooms_;
    SocketIndex sids_;
    LifecycleEventBus events_;
};

} // namespace roomcast
