#include "namespace.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace roomcast {

std::unique_ptr<BroadcastDispatcher> Namespace::default_adapter(std::string nsp_name,
                                                                std::shared_ptr<MembershipRegistry> registry,
                                                                std::shared_ptr<SocketLookup> lookup,
                                                                std::shared_ptr<PacketEncoder> encoder) {
    return std::make_unique<BroadcastDispatcher>(std::move(nsp_name), std::move(registry),
                                                 std::move(lookup), std::move(encoder));
}

Namespace::Namespace(std::string name, std::shared_ptr<PacketEncoder> encoder, bool join_own_room,
                     AdapterFactory make_adapter)
    : name_(std::move(name)),
      join_own_room_(join_own_room),
      registry_(std::make_shared<MembershipRegistry>()),
      sockets_(std::make_shared<SocketTable>()) {
    if (!make_adapter) make_adapter = &Namespace::default_adapter;
    adapter_ = make_adapter(name_, registry_, sockets_, std::move(encoder));
    if (!adapter_) {
        throw std::invalid_argument("adapter factory for namespace " + name_ + " returned null");
    }
    adapter_->init();
}

Namespace::~Namespace() {
    adapter_->close();
}

bool Namespace::connect(SocketPtr socket) {
    if (!socket) return false;
    const SocketId id = socket->id();
    if (!sockets_->add(std::move(socket))) {
        spdlog::warn("[{}] socket {} already connected", name_, id);
        return false;
    }
    if (join_own_room_) {
        registry_->join(id, {id});
    } else {
        registry_->register_socket(id);
    }
    spdlog::debug("[{}] socket {} connected", name_, id);
    return true;
}

void Namespace::disconnect(const SocketId& id) {
    registry_->remove_socket(id);
    if (sockets_->remove(id)) {
        spdlog::debug("[{}] socket {} disconnected", name_, id);
    }
}

} // namespace roomcast
