#include <gtest/gtest.h>
#include <algorithm>
#include <random>
#include <stdexcept>
#include "../src/core/membership_registry.hpp"

using namespace roomcast;

namespace {

struct EventLog {
    std::vector<LifecycleEvent> events;
    LifecycleObserver observer() {
        return [this](const LifecycleEvent& ev) { events.push_back(ev); };
    }
};

LifecycleEvent created(const Room& r) { return {LifecycleEventType::CREATE_ROOM, r, {}}; }
LifecycleEvent joined(const Room& r, const SocketId& s) { return {LifecycleEventType::JOIN_ROOM, r, s}; }
LifecycleEvent left(const Room& r, const SocketId& s) { return {LifecycleEventType::LEAVE_ROOM, r, s}; }
LifecycleEvent deleted(const Room& r) { return {LifecycleEventType::DELETE_ROOM, r, {}}; }

// Checks s in rooms[r] <=> r in sids[s] and that no empty room survives.
void expect_consistent(const MembershipRegistry& reg) {
    reg.read([](const RoomIndex& rooms, const SocketIndex& sids) {
        for (const auto& kv : rooms) {
            EXPECT_FALSE(kv.second.empty()) << "empty room " << kv.first;
            for (const auto& id : kv.second) {
                auto it = sids.find(id);
                ASSERT_NE(it, sids.end()) << id << " missing from socket index";
                EXPECT_EQ(it->second.count(kv.first), 1u) << id << " / " << kv.first;
            }
        }
        for (const auto& kv : sids) {
            for (const auto& room : kv.second) {
                auto it = rooms.find(room);
                ASSERT_NE(it, rooms.end()) << room << " missing from room index";
                EXPECT_EQ(it->second.count(kv.first), 1u) << kv.first << " / " << room;
            }
        }
    });
}

} // namespace

TEST(MembershipRegistryTest, JoinNewRoomEmitsCreateBeforeJoin) {
    MembershipRegistry reg;
    EventLog log;
    reg.subscribe(log.observer());

    reg.join("s1", {"r1"});

    std::vector<LifecycleEvent> expected{created("r1"), joined("r1", "s1")};
    EXPECT_EQ(log.events, expected);
    EXPECT_TRUE(reg.is_member("s1", "r1"));
}

TEST(MembershipRegistryTest, JoinIsIdempotent) {
    MembershipRegistry reg;
    EventLog log;
    reg.subscribe(log.observer());

    reg.join("s1", {"r1"});
    reg.join("s1", {"r1"});

    EXPECT_EQ(log.events.size(), 2u);
    EXPECT_EQ(reg.members("r1").size(), 1u);
    EXPECT_EQ(reg.rooms_of("s1")->size(), 1u);
}

TEST(MembershipRegistryTest, JoinManyRoomsKeepsPerRoomOrder) {
    MembershipRegistry reg;
    reg.join("s0", {"r2"});
    EventLog log;
    reg.subscribe(log.observer());

    reg.join("s1", {"r1", "r2", "r3"});

    std::vector<LifecycleEvent> expected{
        created("r1"), joined("r1", "s1"),
        joined("r2", "s1"),
        created("r3"), joined("r3", "s1")};
    EXPECT_EQ(log.events, expected);
}

TEST(MembershipRegistryTest, JoinWithNoRoomsRegistersSocket) {
    MembershipRegistry reg;
    reg.join("s1", {});
    auto rooms = reg.rooms_of("s1");
    ASSERT_TRUE(rooms.has_value());
    EXPECT_TRUE(rooms->empty());
    EXPECT_EQ(reg.room_count(), 0u);
}

TEST(MembershipRegistryTest, LastLeaveDeletesRoom) {
    MembershipRegistry reg;
    reg.join("s1", {"r1"});
    reg.join("s2", {"r1"});
    EventLog log;
    reg.subscribe(log.observer());

    reg.leave("s1", "r1");
    EXPECT_TRUE(reg.has_room("r1"));
    reg.leave("s2", "r1");

    std::vector<LifecycleEvent> expected{left("r1", "s1"), left("r1", "s2"), deleted("r1")};
    EXPECT_EQ(log.events, expected);
    EXPECT_FALSE(reg.has_room("r1"));
    // The socket entries survive with no rooms.
    ASSERT_TRUE(reg.rooms_of("s1").has_value());
    EXPECT_TRUE(reg.rooms_of("s1")->empty());
}

TEST(MembershipRegistryTest, LeaveWhenNotMemberIsNoop) {
    MembershipRegistry reg;
    reg.join("s1", {"r1"});
    EventLog log;
    reg.subscribe(log.observer());

    reg.leave("s2", "r1");
    reg.leave("s1", "nowhere");
    reg.leave("ghost", "nowhere");

    EXPECT_TRUE(log.events.empty());
    EXPECT_TRUE(reg.is_member("s1", "r1"));
    EXPECT_FALSE(reg.has_socket("ghost"));
}

TEST(MembershipRegistryTest, RemoveSocketLeavesEveryRoom) {
    MembershipRegistry reg;
    reg.join("s1", {"r1", "r2"});
    reg.join("s2", {"r2"});
    EventLog log;
    reg.subscribe(log.observer());

    reg.remove_socket("s1");

    EXPECT_FALSE(reg.rooms_of("s1").has_value());
    EXPECT_FALSE(reg.has_room("r1"));
    EXPECT_TRUE(reg.has_room("r2"));
    EXPECT_EQ(reg.members("r2"), std::vector<SocketId>{"s2"});

    // r1 cascade: leave then delete, adjacent; r2: leave only.
    ASSERT_EQ(log.events.size(), 3u);
    auto it = std::find(log.events.begin(), log.events.end(), left("r1", "s1"));
    ASSERT_NE(it, log.events.end());
    ASSERT_NE(it + 1, log.events.end());
    EXPECT_EQ(*(it + 1), deleted("r1"));
    EXPECT_NE(std::find(log.events.begin(), log.events.end(), left("r2", "s1")), log.events.end());
    expect_consistent(reg);
}

TEST(MembershipRegistryTest, RemoveUnknownSocketEmitsNothing) {
    MembershipRegistry reg;
    reg.join("s1", {"r1"});
    EventLog log;
    reg.subscribe(log.observer());

    reg.remove_socket("ghost");

    EXPECT_TRUE(log.events.empty());
    EXPECT_EQ(reg.socket_count(), 1u);
}

TEST(MembershipRegistryTest, RoomsOfDistinguishesUnknownFromEmpty) {
    MembershipRegistry reg;
    reg.register_socket("s1");

    EXPECT_FALSE(reg.rooms_of("ghost").has_value());
    auto rooms = reg.rooms_of("s1");
    ASSERT_TRUE(rooms.has_value());
    EXPECT_TRUE(rooms->empty());

    reg.remove_socket("s1");
    EXPECT_FALSE(reg.rooms_of("s1").has_value());
}

TEST(MembershipRegistryTest, RegisterSocketKeepsExistingRooms) {
    MembershipRegistry reg;
    reg.join("s1", {"r1"});
    reg.register_socket("s1");
    EXPECT_EQ(reg.rooms_of("s1")->count("r1"), 1u);
}

TEST(MembershipRegistryTest, InvariantHoldsAfterRandomOperations) {
    MembershipRegistry reg;
    std::mt19937 rng(42);
    std::uniform_int_distribution<int> op_dist(0, 9);
    std::uniform_int_distribution<int> sock_dist(0, 15);
    std::uniform_int_distribution<int> room_dist(0, 7);

    size_t joins = 0, leaves = 0;
    reg.subscribe([&](const LifecycleEvent& ev) {
        if (ev.type == LifecycleEventType::JOIN_ROOM) ++joins;
        if (ev.type == LifecycleEventType::LEAVE_ROOM) ++leaves;
    });

    for (int i = 0; i < 2000; ++i) {
        SocketId s = "s" + std::to_string(sock_dist(rng));
        Room r = "r" + std::to_string(room_dist(rng));
        int op = op_dist(rng);
        if (op < 5) {
            reg.join(s, {r, "r" + std::to_string(room_dist(rng))});
        } else if (op < 9) {
            reg.leave(s, r);
        } else {
            reg.remove_socket(s);
        }
    }
    expect_consistent(reg);

    size_t edges = 0;
    for (const auto& room : reg.room_names()) edges += reg.members(room).size();
    EXPECT_EQ(joins - leaves, edges);
}

TEST(MembershipRegistryTest, ObserverExceptionReachesCallerAfterCommit) {
    MembershipRegistry reg;
    reg.subscribe([](const LifecycleEvent& ev) {
        if (ev.type == LifecycleEventType::JOIN_ROOM) throw std::runtime_error("observer failed");
    });

    EXPECT_THROW(reg.join("s1", {"r1"}), std::runtime_error);
    EXPECT_TRUE(reg.is_member("s1", "r1"));
    expect_consistent(reg);
}

TEST(MembershipRegistryTest, ObserverMayReadRegistry) {
    MembershipRegistry reg;
    bool seen_member = false;
    reg.subscribe([&](const LifecycleEvent& ev) {
        if (ev.type == LifecycleEventType::JOIN_ROOM) {
            seen_member = reg.is_member(ev.socket_id, ev.room);
        }
    });
    reg.join("s1", {"r1"});
    EXPECT_TRUE(seen_member);
}

TEST(MembershipRegistryTest, UnsubscribedObserverIsNotCalled) {
    MembershipRegistry reg;
    EventLog log;
    auto id = reg.subscribe(log.observer());
    EXPECT_TRUE(reg.unsubscribe(id));
    EXPECT_FALSE(reg.unsubscribe(id));

    reg.join("s1", {"r1"});
    EXPECT_TRUE(log.events.empty());
}
