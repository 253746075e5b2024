#include "socket_table.hpp"

namespace roomcast {

bool SocketTable::add(SocketPtr socket) {
    if (!socket) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    const SocketId id = socket->id();
    return sockets_.emplace(id, std::move(socket)).second;
}

bool SocketTable::remove(const SocketId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return sockets_.erase(id) > 0;
}

SocketPtr SocketTable::find_socket(const SocketId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sockets_.find(id);
    if (it == sockets_.end()) return nullptr;
    return it->second;
}

size_t SocketTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sockets_.size();
}

std::vector<SocketId> SocketTable::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SocketId> out;
    out.reserve(sockets_.size());
    for (const auto& kv : sockets_) out.push_back(kv.first);
    return out;
}

} // namespace roomcast
