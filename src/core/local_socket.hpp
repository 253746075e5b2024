#pragma once

#include <mutex>
#include <vector>
#include "transport.hpp"

namespace roomcast {

class Namespace;

struct Delivery {
    std::vector<EncodedPacket> frames;
    PacketOptions opts;
};

/**
 * In-process SocketHandle that keeps what it receives. Membership changes are
 * forwarded to its namespace, as a real connection would do on request.
 */
class LocalSocket : public SocketHandle {
public:
    LocalSocket(SocketId id, Namespace& nsp);

    const SocketId& id() const override { return id_; }
    void send(const std::vector<EncodedPacket>& packets, const PacketOptions& opts) override;
    void join(const std::vector<Room>& rooms) override;
    void leave(const Room& room) override;
    void disconnect(bool close) override;

    std::vector<Delivery> deliveries() const;
    bool connected() const;
    bool closed() const;

private:
    SocketId id_;
    Namespace& nsp_;
    mutable std::mutex mutex_;
    std::vector<Delivery> inbox_;
    bool connected_{true};
    bool closed_{false};
};

} // namespace roomcast
