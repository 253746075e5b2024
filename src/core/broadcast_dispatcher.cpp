#include "broadcast_dispatcher.hpp"
#include <exception>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace roomcast {

BroadcastDispatcher::BroadcastDispatcher(std::string nsp_name,
                                         std::shared_ptr<MembershipRegistry> registry,
                                         std::shared_ptr<SocketLookup> lookup,
                                         std::shared_ptr<PacketEncoder> encoder)
    : nsp_name_(std::move(nsp_name)),
      registry_(std::move(registry)),
      lookup_(std::move(lookup)),
      encoder_(std::move(encoder)),
      resolver_(registry_) {
    if (!registry_ || !lookup_ || !encoder_) {
        throw std::invalid_argument("BroadcastDispatcher requires registry, lookup and encoder");
    }
}

PacketOptions BroadcastDispatcher::packet_options(const BroadcastFlags& flags) {
    PacketOptions opts;
    opts.pre_encoded = true;
    opts.is_volatile = flags.is_volatile;
    opts.compress = flags.compress;
    opts.local = flags.local;
    opts.broadcast = flags.broadcast;
    opts.binary = flags.binary;
    return opts;
}

size_t BroadcastDispatcher::apply(const BroadcastOptions& opts, const SocketCallback& cb) const {
    const auto ids = resolver_.resolve(opts);
    size_t reached = 0;
    std::exception_ptr first_error;
    for (const auto& id : ids) {
        auto socket = lookup_->find_socket(id);
        if (!socket) {
            spdlog::trace("[{}] socket {} is registered but not connected, skipping", nsp_name_, id);
            continue;
        }
        ++reached;
        try {
            cb(socket);
        } catch (const std::exception& e) {
            spdlog::warn("[{}] action on socket {} failed: {}", nsp_name_, id, e.what());
            if (!first_error) first_error = std::current_exception();
        }
    }
    // Every target got its turn; now surface the first failure to the caller.
    if (first_error) std::rethrow_exception(first_error);
    return reached;
}

size_t BroadcastDispatcher::broadcast(Packet packet, const BroadcastOptions& opts) {
    if (packet.is_object()) {
        packet["nsp"] = nsp_name_;
    }
    const auto frames = encoder_->encode(packet);
    const auto packet_opts = packet_options(opts.flags);

    size_t reached = apply(opts, [&](const SocketPtr& socket) {
        socket->send(frames, packet_opts);
    });
    spdlog::debug("[{}] broadcast to {} rooms reached {} sockets", nsp_name_, opts.rooms.size(), reached);
    return reached;
}

SocketIdSet BroadcastDispatcher::sockets(const std::vector<Room>& rooms) const {
    SocketIdSet out;
    BroadcastOptions opts;
    opts.rooms = rooms;
    apply(opts, [&out](const SocketPtr& socket) {
        out.insert(socket->id());
    });
    return out;
}

std::vector<SocketPtr> BroadcastDispatcher::fetch_sockets(const BroadcastOptions& opts) const {
    std::vector<SocketPtr> out;
    apply(opts, [&out](const SocketPtr& socket) {
        out.push_back(socket);
    });
    return out;
}

size_t BroadcastDispatcher::add_sockets(const BroadcastOptions& opts, const std::vector<Room>& rooms) {
    return apply(opts, [&rooms](const SocketPtr& socket) {
        socket->join(rooms);
    });
}

size_t BroadcastDispatcher::del_sockets(const BroadcastOptions& opts, const std::vector<Room>& rooms) {
    return apply(opts, [&rooms](const SocketPtr& socket) {
        for (const auto& room : rooms) {
            socket->leave(room);
        }
    });
}

size_t BroadcastDispatcher::disconnect_sockets(const BroadcastOptions& opts, bool close) {
    size_t n = apply(opts, [close](const SocketPtr& socket) {
        socket->disconnect(close);
    });
    spdlog::debug("[{}] disconnected {} sockets (close={})", nsp_name_, n, close);
    return n;
}

} // namespace roomcast
