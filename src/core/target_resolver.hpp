#pragma once

#include <memory>
#include <vector>
#include "types.hpp"
#include "membership_registry.hpp"

namespace roomcast {

/**
 * Computes the socket ids a broadcast request targets.
 *
 * The result is a snapshot taken under one shared lock of the registry, in
 * discovery order (rooms in request order, then each room's members), with
 * every socket at most once. Whether an id still maps to a live connection is
 * the dispatcher's concern.
 */
class TargetResolver {
public:
    explicit TargetResolver(std::shared_ptr<const MembershipRegistry> registry);

    std::vector<SocketId> resolve(const BroadcastOptions& opts) const;

    // Union of the members of every room in except; unknown rooms add nothing.
    static SocketIdSet compute_except_sids(const RoomIndex& rooms, const RoomSet& except);

    // True when id is a member of every room in merge. A merge room that does
    // not exist has no members, so it fails every id. An empty merge set is
    // satisfied trivially.
    static bool member_of_all(const RoomIndex& rooms, const RoomSet& merge, const SocketId& id);

private:
    std::shared_ptr<const MembershipRegistry> registry_;
};

} // namespace roomcast
