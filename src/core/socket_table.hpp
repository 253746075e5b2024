#pragma once

#include <mutex>
#include <unordered_map>
#include <vector>
#include "transport.hpp"

namespace roomcast {

/**
 * In-process SocketLookup: live connections keyed by id.
 */
class SocketTable : public SocketLookup {
public:
    // Returns false if a socket with the same id is already present.
    bool add(SocketPtr socket);
    bool remove(const SocketId& id);

    SocketPtr find_socket(const SocketId& id) const override;
    size_t size() const;
    std::vector<SocketId> ids() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<SocketId, SocketPtr> sockets_;
};

} // namespace roomcast
