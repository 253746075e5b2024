#include "membership_registry.hpp"
#include <mutex>
#include <spdlog/spdlog.h>

namespace roomcast {

void MembershipRegistry::register_socket(const SocketId& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    sids_.try_emplace(id);
}

void MembershipRegistry::join(const SocketId& id, const std::vector<Room>& rooms) {
    std::vector<LifecycleEvent> events;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto& joined = sids_[id];
        for (const auto& room : rooms) {
            joined.insert(room);

            auto it = rooms_.find(room);
            if (it == rooms_.end()) {
                it = rooms_.emplace(room, SocketIdSet{}).first;
                spdlog::debug("room {} created", room);
                events.push_back({LifecycleEventType::CREATE_ROOM, room, {}});
            }
            if (it->second.insert(id).second) {
                events.push_back({LifecycleEventType::JOIN_ROOM, room, id});
            }
        }
    }
    events_.publish(events);
}

void MembershipRegistry::leave(const SocketId& id, const Room& room) {
    std::vector<LifecycleEvent> events;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto sit = sids_.find(id);
        if (sit != sids_.end()) {
            sit->second.erase(room);
        }
        leave_locked(id, room, events);
    }
    events_.publish(events);
}

void MembershipRegistry::remove_socket(const SocketId& id) {
    std::vector<LifecycleEvent> events;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto sit = sids_.find(id);
        if (sit == sids_.end()) return;

        for (const auto& room : sit->second) {
            leave_locked(id, room, events);
        }
        sids_.erase(sit);
    }
    events_.publish(events);
}

void MembershipRegistry::leave_locked(const SocketId& id, const Room& room,
                                      std::vector<LifecycleEvent>& out) {
    auto it = rooms_.find(room);
    if (it == rooms_.end()) return;

    if (it->second.erase(id) > 0) {
        out.push_back({LifecycleEventType::LEAVE_ROOM, room, id});
    }
    if (it->second.empty()) {
        rooms_.erase(it);
        spdlog::debug("room {} deleted", room);
        out.push_back({LifecycleEventType::DELETE_ROOM, room, {}});
    }
}

std::optional<RoomSet> MembershipRegistry::rooms_of(const SocketId& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = sids_.find(id);
    if (it == sids_.end()) return std::nullopt;
    return it->second;
}

std::vector<SocketId> MembershipRegistry::members(const Room& room) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<SocketId> out;
    auto it = rooms_.find(room);
    if (it == rooms_.end()) return out;
    out.assign(it->second.begin(), it->second.end());
    return out;
}

bool MembershipRegistry::has_room(const Room& room) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return rooms_.count(room) > 0;
}

bool MembershipRegistry::has_socket(const SocketId& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sids_.count(id) > 0;
}

bool MembershipRegistry::is_member(const SocketId& id, const Room& room) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = rooms_.find(room);
    return it != rooms_.end() && it->second.count(id) > 0;
}

size_t MembershipRegistry::room_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return rooms_.size();
}

size_t MembershipRegistry::socket_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sids_.size();
}

std::vector<Room> MembershipRegistry::room_names() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Room> out;
    out.reserve(rooms_.size());
    for (const auto& kv : rooms_) out.push_back(kv.first);
    return out;
}

std::vector<SocketId> MembershipRegistry::socket_ids() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<SocketId> out;
    out.reserve(sids_.size());
    for (const auto& kv : sids_) out.push_back(kv.first);
    return out;
}

} // namespace roomcast
