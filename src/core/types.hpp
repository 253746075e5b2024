#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace roomcast {

using SocketId = std::string;
using Room = std::string;

using RoomSet = std::unordered_set<Room>;
using SocketIdSet = std::unordered_set<SocketId>;

// room -> members, socket -> joined rooms
using RoomIndex = std::unordered_map<Room, SocketIdSet>;
using SocketIndex = std::unordered_map<SocketId, RoomSet>;

/**
 * Delivery hints attached to a broadcast.
 * local and broadcast are never interpreted here; they are handed to the
 * transport untouched.
 */
struct BroadcastFlags {
    bool is_volatile{false};
    bool compress{true};
    bool local{false};
    bool broadcast{false};
    bool binary{false};
};

/**
 * Who should receive a broadcast.
 *
 * rooms:  OR across rooms; empty means every registered socket.
 * except: members of any of these rooms are dropped.
 * merge:  when non-empty, a candidate must also be in every one of these rooms.
 */
struct BroadcastOptions {
    std::vector<Room> rooms;
    RoomSet except;
    RoomSet merge;
    BroadcastFlags flags;
};

} // namespace roomcast
