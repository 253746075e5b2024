#pragma once

#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "types.hpp"

namespace roomcast {

using Packet = nlohmann::json;
using EncodedPacket = std::string;

/**
 * Per-delivery options handed to SocketHandle::send().
 */
struct PacketOptions {
    bool pre_encoded{true};
    bool is_volatile{false};
    bool compress{true};
    bool local{false};
    bool broadcast{false};
    bool binary{false};
};

/**
 * A live connection as seen by the dispatcher. Implemented by the transport.
 */
class SocketHandle {
public:
    virtual ~SocketHandle() = default;

    virtual const SocketId& id() const = 0;
    virtual void send(const std::vector<EncodedPacket>& packets, const PacketOptions& opts) = 0;
    virtual void join(const std::vector<Room>& rooms) = 0;
    virtual void leave(const Room& room) = 0;
    virtual void disconnect(bool close) = 0;
};

using SocketPtr = std::shared_ptr<SocketHandle>;

/**
 * Maps a socket id to its live connection; nullptr once the connection is gone.
 */
class SocketLookup {
public:
    virtual ~SocketLookup() = default;
    virtual SocketPtr find_socket(const SocketId& id) const = 0;
};

/**
 * Turns an application packet into transport frames. Called once per broadcast.
 */
class PacketEncoder {
public:
    virtual ~PacketEncoder() = default;
    virtual std::vector<EncodedPacket> encode(const Packet& packet) const = 0;
};

} // namespace roomcast
