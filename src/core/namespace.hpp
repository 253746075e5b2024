#pragma once

#include <functional>
#include <memory>
#include <string>
#include "membership_registry.hpp"
#include "socket_table.hpp"
#include "broadcast_dispatcher.hpp"
#include "json_packet_encoder.hpp"

namespace roomcast {

/**
 * Named scope owning one registry, one socket table and one dispatcher.
 *
 * connect() makes a socket reachable: it enters the socket table and the
 * registry, and (with join_own_room) joins a room named after its own id so
 * that single sockets can be targeted or excluded by room.
 *
 * The dispatcher comes from an AdapterFactory so a subclass can be plugged
 * in per namespace; its init() runs on construction and close() on
 * destruction.
 */
class Namespace {
public:
    using AdapterFactory = std::function<std::unique_ptr<BroadcastDispatcher>(
        std::string nsp_name,
        std::shared_ptr<MembershipRegistry> registry,
        std::shared_ptr<SocketLookup> lookup,
        std::shared_ptr<PacketEncoder> encoder)>;

    static std::unique_ptr<BroadcastDispatcher> default_adapter(std::string nsp_name,
                                                                std::shared_ptr<MembershipRegistry> registry,
                                                                std::shared_ptr<SocketLookup> lookup,
                                                                std::shared_ptr<PacketEncoder> encoder);

    explicit Namespace(std::string name,
                       std::shared_ptr<PacketEncoder> encoder = std::make_shared<JsonPacketEncoder>(),
                       bool join_own_room = true,
                       AdapterFactory make_adapter = &Namespace::default_adapter);
    ~Namespace();
    Namespace(const Namespace&) = delete;
    Namespace& operator=(const Namespace&) = delete;

    bool connect(SocketPtr socket);
    void disconnect(const SocketId& id);

    const std::string& name() const { return name_; }
    MembershipRegistry& registry() { return *registry_; }
    const MembershipRegistry& registry() const { return *registry_; }
    SocketTable& sockets() { return *sockets_; }
    BroadcastDispatcher& adapter() { return *adapter_; }

private:
    std::string name_;
    bool join_own_room_;
    std::shared_ptr<MembershipRegistry> registry_;
    std::shared_ptr<SocketTable> sockets_;
    std::unique_ptr<BroadcastDispatcher> adapter_;
};

} // namespace roomcast
