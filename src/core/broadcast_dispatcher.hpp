#pragma once

#include <functional>
#include <optional>
#include <memory>
#include <string>
#include <vector>
#include "types.hpp"
#include "transport.hpp"
#include "membership_registry.hpp"
#include "target_resolver.hpp"

namespace roomcast {

/**
 * Resolves broadcast requests against the registry and acts on every live
 * target through the transport.
 *
 * Targets are resolved into an id snapshot first; socket calls then run
 * without any registry lock held, so a socket may join, leave or disconnect
 * from inside its callback. Ids the lookup no longer knows are skipped.
 * Actions are applied socket by socket with no rollback. If an action
 * throws (a failed send, or a lifecycle observer raising during a bulk
 * join/leave/disconnect), the remaining targets are still processed and the
 * first exception is rethrown to the caller afterwards.
 */
class BroadcastDispatcher {
public:
    using SocketCallback = std::function<void(const SocketPtr&)>;

    BroadcastDispatcher(std::string nsp_name,
                        std::shared_ptr<MembershipRegistry> registry,
                        std::shared_ptr<SocketLookup> lookup,
                        std::shared_ptr<PacketEncoder> encoder);
    virtual ~BroadcastDispatcher() = default;

    // Hooks for subclasses that keep external state (e.g. a replication link).
    virtual void init() {}
    virtual void close() {}

    /**
     * Stamp the namespace name into the packet, encode it once and send the
     * frames to every target. Returns the number of sockets reached.
     * Delivery is fire-and-forget: send() results are not awaited.
     */
    size_t broadcast(Packet packet, const BroadcastOptions& opts);

    // Live socket ids in any of rooms (all live sockets when rooms is empty).
    SocketIdSet sockets(const std::vector<Room>& rooms) const;

    std::vector<SocketPtr> fetch_sockets(const BroadcastOptions& opts) const;
    size_t add_sockets(const BroadcastOptions& opts, const std::vector<Room>& rooms);
    size_t del_sockets(const BroadcastOptions& opts, const std::vector<Room>& rooms);
    size_t disconnect_sockets(const BroadcastOptions& opts, bool close);

    std::optional<RoomSet> socket_rooms(const SocketId& id) const { return registry_->rooms_of(id); }

    const std::string& nsp_name() const { return nsp_name_; }

    static PacketOptions packet_options(const BroadcastFlags& flags);

protected:
    size_t apply(const BroadcastOptions& opts, const SocketCallback& cb) const;

    std::string nsp_name_;
    std::shared_ptr<MembershipRegistry> registry_;
    std::shared_ptr<SocketLookup> lookup_;
    std::shared_ptr<PacketEncoder> encoder_;
    TargetResolver resolver_;
};

} // namespace roomcast
