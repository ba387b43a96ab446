#include <gtest/gtest.h>
#include <memory>
#include "StatusBroadcaster.h"
#include "fakes.h"

class StatusBroadcasterTest : public ::testing::Test {
protected:
    StatusBroadcasterTest()
        : clock(10000)
        , shared(stateLock, SpeedTable({13, 4, 1}, 1), false, TriggerMode::WIRED)
        , clients(clientLock)
        , broadcaster(shared, clients, clock, describeStatus)
    {
    }

    FakeClock clock;
    HostLock stateLock;
    HostLock clientLock;
    SharedState shared;
    ClientRegistry clients;
    StatusBroadcaster broadcaster;
};

TEST_F(StatusBroadcasterTest, SnapshotUsesTableSpeedWhenParamsHaveNone) {
    StatusSnapshot snap = broadcaster.snapshot();
    EXPECT_EQ(snap.message, "Ready");
    EXPECT_EQ(snap.mode, OperationMode::IDLE);
    EXPECT_EQ(snap.speed, 4u);
    EXPECT_EQ(snap.triggerMode, TriggerMode::WIRED);
}

TEST_F(StatusBroadcasterTest, BroadcastReachesEveryListener) {
    auto a = std::make_shared<RecordingListener>();
    auto b = std::make_shared<RecordingListener>();
    clients.add(a);
    clients.add(b);

    EXPECT_EQ(broadcaster.broadcast(), 2u);
    ASSERT_EQ(a->payloads.size(), 1u);
    EXPECT_EQ(a->payloads[0], "Ready|IDLE|4|WIRED");
    EXPECT_EQ(b->payloads, a->payloads);
}

TEST_F(StatusBroadcasterTest, FailedListenerIsDroppedOthersStillReceive) {
    auto good = std::make_shared<RecordingListener>();
    auto gone = std::make_shared<RecordingListener>();
    gone->connected = false;
    clients.add(gone);
    clients.add(good);

    EXPECT_EQ(broadcaster.broadcast(), 1u);
    EXPECT_EQ(clients.size(), 1u);
    EXPECT_EQ(good->payloads.size(), 1u);

    broadcaster.broadcast();
    EXPECT_EQ(gone->payloads.size(), 1u);
    EXPECT_EQ(good->payloads.size(), 2u);
}

TEST_F(StatusBroadcasterTest, BroadcastReflectsStateChanges) {
    auto listener = std::make_shared<RecordingListener>();
    clients.add(listener);
    {
        SharedState::Access access = shared.lock();
        OperationParams params;
        params.hasSpeed = true;
        params.speed = 13;
        access.state().install(OperationMode::SPIN, params);
        access.state().triggerMode = TriggerMode::IR;
        access.state().message = "Spinning (speed: 13ms/step)";
    }

    broadcaster.broadcast();
    ASSERT_EQ(listener->payloads.size(), 1u);
    EXPECT_EQ(listener->payloads[0], "Spinning (speed: 13ms/step)|SPIN|13|IR");
}

TEST_F(StatusBroadcasterTest, HeartbeatOnlyWhenIdleAndQuiet) {
    auto listener = std::make_shared<RecordingListener>();
    clients.add(listener);

    EXPECT_FALSE(broadcaster.heartbeat(OperationMode::IDLE));
    clock.advance(StatusBroadcaster::HEARTBEAT_MS);
    EXPECT_FALSE(broadcaster.heartbeat(OperationMode::IDLE));

    clock.advance(1);
    EXPECT_FALSE(broadcaster.heartbeat(OperationMode::SPIN));
    EXPECT_TRUE(broadcaster.heartbeat(OperationMode::IDLE));
    EXPECT_EQ(listener->payloads.size(), 1u);
    EXPECT_EQ(broadcaster.lastBroadcastAt(), clock.nowMs());

    EXPECT_FALSE(broadcaster.heartbeat(OperationMode::IDLE));
}

TEST_F(StatusBroadcasterTest, BroadcastResetsHeartbeatTimer) {
    clock.advance(4000);
    broadcaster.broadcast();
    clock.advance(4000);
    EXPECT_FALSE(broadcaster.heartbeat(OperationMode::IDLE));
}

TEST(ClientRegistryTest, RemoveByIdentity) {
    HostLock lock;
    ClientRegistry clients(lock);
    auto a = std::make_shared<RecordingListener>();
    auto b = std::make_shared<RecordingListener>();
    clients.add(a);
    clients.add(b);
    clients.add(nullptr);
    EXPECT_EQ(clients.size(), 2u);

    clients.remove(a.get());
    std::vector<std::shared_ptr<StatusListener>> left = clients.listeners();
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0].get(), b.get());

    clients.compact();
    EXPECT_EQ(clients.size(), 1u);
}

TEST(ClientRegistryTest, EveryAccessReleasesTheLock) {
    HostLock lock;
    ClientRegistry clients(lock);
    clients.add(std::make_shared<RecordingListener>());
    clients.listeners();
    clients.compact();

    EXPECT_EQ(lock.acquisitions, 3);
    EXPECT_FALSE(lock.held);
}
