#include "local_socket.hpp"
#include "namespace.hpp"
#include <spdlog/spdlog.h>

namespace roomcast {

LocalSocket::LocalSocket(SocketId id, Namespace& nsp)
    : id_(std::move(id)), nsp_(nsp) {}

void LocalSocket::send(const std::vector<EncodedPacket>& packets, const PacketOptions& opts) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_) return;
    inbox_.push_back({packets, opts});
    spdlog::trace("socket {} received {} frame(s)", id_, packets.size());
}

void LocalSocket::join(const std::vector<Room>& rooms) {
    nsp_.registry().join(id_, rooms);
}

void LocalSocket::leave(const Room& room) {
    nsp_.registry().leave(id_, room);
}

void LocalSocket::disconnect(bool close) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connected_) return;
        connected_ = false;
        closed_ = close;
    }
    nsp_.disconnect(id_);
}

std::vector<Delivery> LocalSocket::deliveries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inbox_;
}

bool LocalSocket::connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
}

bool LocalSocket::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

} // namespace roomcast
