#include "target_resolver.hpp"

namespace roomcast {

TargetResolver::TargetResolver(std::shared_ptr<const MembershipRegistry> registry)
    : registry_(std::move(registry)) {}

SocketIdSet TargetResolver::compute_except_sids(const RoomIndex& rooms, const RoomSet& except) {
    SocketIdSet out;
    for (const auto& room : except) {
        auto it = rooms.find(room);
        if (it == rooms.end()) continue;
        out.insert(it->second.begin(), it->second.end());
    }
    return out;
}

bool TargetResolver::member_of_all(const RoomIndex& rooms, const RoomSet& merge, const SocketId& id) {
    for (const auto& room : merge) {
        auto it = rooms.find(room);
        if (it == rooms.end()) return false;
        if (it->second.count(id) == 0) return false;
    }
    return true;
}

std::vector<SocketId> TargetResolver::resolve(const BroadcastOptions& opts) const {
    return registry_->read([&opts](const RoomIndex& rooms, const SocketIndex& sids) {
        std::vector<SocketId> out;
        const SocketIdSet except = compute_except_sids(rooms, opts.except);

        if (opts.rooms.empty()) {
            // Everyone registered in this registry.
            out.reserve(sids.size());
            for (const auto& kv : sids) {
                if (except.count(kv.first)) continue;
                out.push_back(kv.first);
            }
            return out;
        }

        SocketIdSet seen;
        for (const auto& room : opts.rooms) {
            auto it = rooms.find(room);
            if (it == rooms.end()) continue;

            for (const auto& id : it->second) {
                if (except.count(id) || seen.count(id)) continue;
                if (!opts.merge.empty() && !member_of_all(rooms, opts.merge, id)) continue;
                seen.insert(id);
                out.push_back(id);
            }
        }
        return out;
    });
}

} // namespace roomcast
