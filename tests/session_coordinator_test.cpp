#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>
#include "errors.h"
#include "session/session_coordinator.h"
#include "session/track_sweeper.h"

using namespace zc;

namespace {

TrackSample sample(const std::string& cameraId, int trackId, float x, float y, int64_t timestamp) {
    TrackSample s;
    s.cameraId = cameraId;
    s.trackId = trackId;
    s.position = Point(x, y);
    s.timestamp = timestamp;
    return s;
}

std::vector<Notification> drain(const SubscriptionPtr& subscription) {
    std::vector<Notification> out;
    Notification n;
    while (subscription->tryPop(n)) {
        out.push_back(n);
    }
    return out;
}

} // namespace

class SessionCoordinatorTest : public ::testing::Test {
protected:
    CoordinatorOptions options;
    std::unique_ptr<SessionCoordinator> coordinator;

    void SetUp() override {
        options.trackIdleTimeoutMs = 3000;
        coordinator = std::make_unique<SessionCoordinator>(options);
        coordinator->registerCamera("camera1");
        coordinator->registerCamera("camera2");
    }
};

TEST_F(SessionCoordinatorTest, FirstRegisteredCameraIsActive) {
    EXPECT_EQ(coordinator->activeCamera(), "camera1");
    EXPECT_FALSE(coordinator->registerCamera("camera1"));

    CameraListing listing = coordinator->listCameras();
    EXPECT_EQ(listing.cameras, (std::vector<std::string>{"camera1", "camera2"}));
    EXPECT_EQ(listing.activeCamera, "camera1");
}

TEST_F(SessionCoordinatorTest, SubscribeDeliversInitialData) {
    coordinator->defineZone("camera1", "zone1", Point(0, 0), Point(100, 100));

    auto subscription = coordinator->subscribe();
    auto received = drain(subscription);
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].kind, NotificationKind::INITIAL_DATA);
    EXPECT_EQ(received[0].cameraId, "camera1");
    ASSERT_TRUE(received[0].snapshot);
    EXPECT_EQ(received[0].snapshot->zones.count("zone1"), 1u);
    EXPECT_EQ(received[0].cameras.size(), 2u);
    EXPECT_EQ(coordinator->subscriberCount(), 1u);

    coordinator->unsubscribe(subscription);
    EXPECT_EQ(coordinator->subscriberCount(), 0u);
    EXPECT_TRUE(subscription->isClosed());
}

TEST_F(SessionCoordinatorTest, SubscribeToUnknownCameraThrows) {
    EXPECT_THROW(coordinator->subscribe("camera9"), UnknownEntityError);
    EXPECT_EQ(coordinator->subscriberCount(), 0u);
}

TEST_F(SessionCoordinatorTest, MutationsAreBroadcast) {
    auto first = coordinator->subscribe();
    auto second = coordinator->subscribe();
    drain(first);
    drain(second);

    MutationResult result = coordinator->defineZone("camera1", "zone1", Point(0, 0), Point(100, 100));
    ASSERT_TRUE(result.success);
    ASSERT_TRUE(result.snapshot);
    EXPECT_EQ(result.snapshot->zones.size(), 1u);

    coordinator->defineLine("camera1", "line1", Point(0, 100), Point(200, 100));
    coordinator->resetZone("camera1", "zone1");
    coordinator->resetLine("camera1", "line1");
    coordinator->deleteLine("camera1", "line1");
    coordinator->deleteZone("camera1", "zone1");

    for (const auto& subscription : {first, second}) {
        auto received = drain(subscription);
        ASSERT_EQ(received.size(), 6u);
        EXPECT_EQ(received[0].kind, NotificationKind::ZONE_UPDATED);
        EXPECT_EQ(received[0].entityName, "zone1");
        EXPECT_EQ(received[1].kind, NotificationKind::LINE_UPDATED);
        EXPECT_EQ(received[2].kind, NotificationKind::COUNT_RESET);
        EXPECT_EQ(received[3].kind, NotificationKind::LINE_COUNT_RESET);
        EXPECT_EQ(received[4].kind, NotificationKind::LINE_DELETED);
        EXPECT_EQ(received[5].kind, NotificationKind::ZONE_DELETED);
        for (size_t i = 1; i < received.size(); ++i) {
            EXPECT_GT(received[i].sequence, received[i - 1].sequence);
        }
    }
}

TEST_F(SessionCoordinatorTest, FailedMutationNotifiesOnlyRequester) {
    auto requester = coordinator->subscribe();
    auto bystander = coordinator->subscribe();
    drain(requester);
    drain(bystander);

    MutationResult result = coordinator->defineZone("camera1", "zone1", Point(50, 50), Point(10, 10), requester);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.code, ErrorCode::VALIDATION);

    auto received = drain(requester);
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].kind, NotificationKind::ERROR);
    EXPECT_EQ(received[0].errorCode, ErrorCode::VALIDATION);
    EXPECT_FALSE(received[0].message.empty());
    EXPECT_TRUE(drain(bystander).empty());
}

TEST_F(SessionCoordinatorTest, UnknownCameraErrors) {
    MutationResult defined = coordinator->defineZone("camera9", "zone1", Point(0, 0), Point(10, 10));
    EXPECT_EQ(defined.code, ErrorCode::VALIDATION);

    MutationResult reset = coordinator->resetZone("camera9", "zone1");
    EXPECT_EQ(reset.code, ErrorCode::UNKNOWN_ENTITY);

    MutationResult missingZone = coordinator->resetZone("camera1", "zone1");
    EXPECT_EQ(missingZone.code, ErrorCode::UNKNOWN_ENTITY);

    EXPECT_THROW(coordinator->setActiveCamera("camera9"), UnknownEntityError);
    EXPECT_THROW(coordinator->snapshot("camera9"), UnknownEntityError);
    EXPECT_THROW(coordinator->zoneSnapshot("camera1", "zone1"), UnknownEntityError);
}

TEST_F(SessionCoordinatorTest, IngestRoutesToActiveCameraByDefault) {
    coordinator->defineZone("camera2", "zone1", Point(0, 0), Point(100, 100));
    coordinator->setActiveCamera("camera2");

    IngestResult result = coordinator->ingest(sample("", 5, 50, 50, 1));
    EXPECT_TRUE(result.accepted);
    EXPECT_EQ(result.cameraId, "camera2");
    EXPECT_EQ(result.events, 1u);
    EXPECT_EQ(coordinator->zoneSnapshot("camera2", "zone1").inCount, 1);
}

TEST_F(SessionCoordinatorTest, IngestDropsBadSamples) {
    IngestResult unknown = coordinator->ingest(sample("camera9", 5, 50, 50, 1));
    EXPECT_FALSE(unknown.accepted);
    EXPECT_FALSE(unknown.message.empty());

    IngestResult outside = coordinator->ingest(sample("camera1", 5, 5000, 50, 1));
    EXPECT_FALSE(outside.accepted);
}

TEST_F(SessionCoordinatorTest, UpdateCountsOnlyWhenSomethingChanged) {
    coordinator->defineZone("camera1", "zone1", Point(0, 0), Point(100, 100));
    auto subscription = coordinator->subscribe();
    drain(subscription);

    coordinator->ingest(sample("camera1", 5, 500, 500, 1));
    EXPECT_TRUE(drain(subscription).empty());

    coordinator->ingest(sample("camera1", 5, 50, 50, 2));
    auto received = drain(subscription);
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].kind, NotificationKind::UPDATE_COUNTS);
    EXPECT_EQ(received[0].snapshot->zones.at("zone1").inCount, 1);
}

TEST_F(SessionCoordinatorTest, ViewedCameraFiltersNotifications) {
    auto viewer = coordinator->subscribe("camera2");
    auto received = drain(viewer);
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].cameraId, "camera2");

    coordinator->defineZone("camera1", "zone1", Point(0, 0), Point(100, 100));
    EXPECT_TRUE(drain(viewer).empty());

    coordinator->defineZone("camera2", "zone1", Point(0, 0), Point(100, 100));
    received = drain(viewer);
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].cameraId, "camera2");

    // Camera switches reach everyone
    coordinator->setActiveCamera("camera2");
    received = drain(viewer);
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].kind, NotificationKind::CAMERA_CHANGED);
    EXPECT_EQ(received[0].activeCamera, "camera2");
}

TEST_F(SessionCoordinatorTest, SetViewedCameraSendsCurrentData) {
    auto subscription = coordinator->subscribe();
    drain(subscription);

    coordinator->setViewedCamera(subscription, "camera2");
    EXPECT_EQ(subscription->getViewedCamera(), "camera2");
    auto received = drain(subscription);
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].kind, NotificationKind::CURRENT_DATA);
    EXPECT_EQ(received[0].cameraId, "camera2");

    EXPECT_THROW(coordinator->setViewedCamera(subscription, "camera9"), UnknownEntityError);
    EXPECT_EQ(subscription->getViewedCamera(), "camera2");

    EXPECT_FALSE(coordinator->sendCurrentData(subscription, "camera9"));
    received = drain(subscription);
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].kind, NotificationKind::ERROR);
    EXPECT_EQ(received[0].errorCode, ErrorCode::UNKNOWN_ENTITY);
}

TEST_F(SessionCoordinatorTest, EvictionBroadcastsOccupancyChange) {
    coordinator->defineZone("camera1", "zone1", Point(0, 0), Point(100, 100));
    coordinator->ingest(sample("camera1", 5, 50, 50, 1000));

    auto subscription = coordinator->subscribe();
    drain(subscription);

    EXPECT_EQ(coordinator->evictIdleTracks(2000), 0u);
    EXPECT_TRUE(drain(subscription).empty());

    EXPECT_EQ(coordinator->evictIdleTracks(10000), 1u);
    auto received = drain(subscription);
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].kind, NotificationKind::UPDATE_COUNTS);
    EXPECT_TRUE(received[0].snapshot->zones.at("zone1").insideIds.empty());
}

TEST(TrackSweeperTest, EvictsTracksThatStopReporting) {
    CoordinatorOptions options;
    options.trackIdleTimeoutMs = 20;
    SessionCoordinator coordinator(options);
    coordinator.registerCamera("camera1");
    coordinator.defineZone("camera1", "zone1", Point(0, 0), Point(100, 100));
    coordinator.ingest(sample("camera1", 5, 50, 50, 0));

    TrackSweeper sweeper(coordinator, std::chrono::milliseconds(10));
    sweeper.start();
    EXPECT_TRUE(sweeper.isRunning());

    bool emptied = false;
    for (int i = 0; i < 200 && !emptied; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        emptied = coordinator.zoneSnapshot("camera1", "zone1").insideIds.empty();
    }

    sweeper.shutdown();
    EXPECT_FALSE(sweeper.isRunning());
    EXPECT_TRUE(emptied);
}

TEST(SubscriptionTest, DropsOldestWhenFull) {
    Subscription subscription(1, 2);
    for (uint64_t i = 1; i <= 4; ++i) {
        Notification n;
        n.sequence = i;
        EXPECT_TRUE(subscription.push(n));
    }

    EXPECT_EQ(subscription.pending(), 2u);
    EXPECT_EQ(subscription.droppedCount(), 2u);

    Notification out;
    ASSERT_TRUE(subscription.tryPop(out));
    EXPECT_EQ(out.sequence, 3u);

    subscription.close();
    EXPECT_FALSE(subscription.push(Notification()));
    EXPECT_FALSE(subscription.waitPop(out, std::chrono::milliseconds(10)));
}

TEST(SubscriptionTest, ReadyCallbackFiresOnPush) {
    Subscription subscription(1, 4);
    int calls = 0;
    subscription.setReadyCallback([&calls] { calls++; });

    subscription.push(Notification());
    subscription.push(Notification());
    EXPECT_EQ(calls, 2);
}

TEST_F(SessionCoordinatorTest, SnapshotsStayConsistentUnderConcurrentIngest) {
    coordinator->defineZone("camera1", "zone1", Point(0, 0), Point(100, 100));
    coordinator->defineZone("camera2", "zone1", Point(0, 0), Point(100, 100));

    std::atomic<bool> stop(false);
    std::atomic<int> inconsistent(0);

    std::thread reader([&] {
        while (!stop) {
            CameraSnapshot snap = coordinator->snapshot("camera1");
            const ZoneSnapshot& zone = snap.zones.at("zone1");
            int inside = static_cast<int>(zone.insideIds.size());
            if (zone.inCount - zone.outCount != inside) {
                inconsistent++;
            }
        }
    });

    std::vector<std::thread> writers;
    for (int w = 0; w < 2; ++w) {
        const std::string cameraId = w == 0 ? "camera1" : "camera2";
        writers.emplace_back([this, cameraId] {
            for (int i = 0; i < 500; ++i) {
                float x = (i % 2 == 0) ? 50.0f : 500.0f;
                coordinator->ingest(sample(cameraId, i % 7, x, 50, i));
            }
        });
    }

    for (auto& writer : writers) {
        writer.join();
    }
    stop = true;
    reader.join();

    EXPECT_EQ(inconsistent.load(), 0);

    ZoneSnapshot zone = coordinator->zoneSnapshot("camera2", "zone1");
    EXPECT_EQ(zone.inCount - zone.outCount, static_cast<int>(zone.insideIds.size()));
}

TEST(SubscriptionTest, SequenceGapsCountDroppedNotifications) {
    Subscription subscription(1, 3);
    for (int i = 0; i < 3; ++i) {
        subscription.push(Notification());
    }

    Notification out;
    ASSERT_TRUE(subscription.tryPop(out));
    EXPECT_EQ(out.sequence, 1u);
    ASSERT_TRUE(subscription.tryPop(out));
    EXPECT_EQ(out.sequence, 2u);
    uint64_t last = out.sequence;

    for (int i = 0; i < 6; ++i) {
        subscription.push(Notification());
    }
    EXPECT_EQ(subscription.droppedCount(), 4u);

    ASSERT_TRUE(subscription.tryPop(out));
    EXPECT_EQ(out.sequence - last - 1, subscription.droppedCount());
    last = out.sequence;
    while (subscription.tryPop(out)) {
        EXPECT_EQ(out.sequence, last + 1);
        last = out.sequence;
    }
    EXPECT_EQ(last, 9u);
}

TEST_F(SessionCoordinatorTest, ApplyMutationBroadcastsGivenKind) {
    auto first = coordinator->subscribe();
    auto second = coordinator->subscribe();
    drain(first);
    drain(second);

    MutationResult result = coordinator->applyMutation("camera1", NotificationKind::ZONE_UPDATED, "dock",
        [](CameraState& state) { state.defineZone("dock", Point(10, 10), Point(60, 60)); });
    ASSERT_TRUE(result.success);
    ASSERT_TRUE(result.snapshot);
    EXPECT_EQ(result.snapshot->zones.count("dock"), 1u);

    for (const auto& subscription : {first, second}) {
        auto received = drain(subscription);
        ASSERT_EQ(received.size(), 1u);
        EXPECT_EQ(received[0].kind, NotificationKind::ZONE_UPDATED);
        EXPECT_EQ(received[0].cameraId, "camera1");
        EXPECT_EQ(received[0].entityName, "dock");
        ASSERT_TRUE(received[0].snapshot);
        EXPECT_EQ(received[0].snapshot->version, result.snapshot->version);
    }
}

TEST_F(SessionCoordinatorTest, ApplyMutationRejectionLeavesStateAlone) {
    coordinator->defineZone("camera1", "zone1", Point(0, 0), Point(100, 100));
    CameraSnapshot before = coordinator->snapshot("camera1");

    auto requester = coordinator->subscribe();
    auto bystander = coordinator->subscribe();
    drain(requester);
    drain(bystander);

    MutationResult result = coordinator->applyMutation("camera1", NotificationKind::ZONE_UPDATED, "zone1",
        [](CameraState&) { throw ValidationError("Zone 'zone1' is locked"); }, requester);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.code, ErrorCode::VALIDATION);
    EXPECT_EQ(result.message, "Zone 'zone1' is locked");
    EXPECT_FALSE(result.snapshot);

    auto received = drain(requester);
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].kind, NotificationKind::ERROR);
    EXPECT_EQ(received[0].errorCode, ErrorCode::VALIDATION);
    EXPECT_TRUE(drain(bystander).empty());

    CameraSnapshot after = coordinator->snapshot("camera1");
    EXPECT_EQ(after.version, before.version);
    ASSERT_EQ(after.zones.size(), 1u);
    EXPECT_EQ(after.zones.at("zone1").bottomRight.x, 100.0f);
}

TEST_F(SessionCoordinatorTest, OperatorEditsInterleaveWithIngestOnOneCamera) {
    const Point nearTopLeft(0, 0);
    const Point nearBottomRight(100, 100);
    const Point farTopLeft(200, 200);
    const Point farBottomRight(400, 400);
    coordinator->defineZone("camera1", "zone1", nearTopLeft, nearBottomRight);

    auto viewer = coordinator->subscribe("camera1");
    drain(viewer);

    std::atomic<bool> stop(false);
    std::atomic<int> versionWentBack(0);
    std::atomic<int> unknownGeometry(0);
    std::atomic<int> failedEdits(0);

    std::thread reader([&] {
        uint64_t lastVersion = 0;
        while (!stop) {
            CameraSnapshot snap = coordinator->snapshot("camera1");
            if (snap.version < lastVersion) {
                versionWentBack++;
            }
            lastVersion = snap.version;

            const ZoneSnapshot& zone = snap.zones.at("zone1");
            bool isNear = zone.topLeft.x == nearTopLeft.x && zone.topLeft.y == nearTopLeft.y &&
                          zone.bottomRight.x == nearBottomRight.x && zone.bottomRight.y == nearBottomRight.y;
            bool isFar = zone.topLeft.x == farTopLeft.x && zone.topLeft.y == farTopLeft.y &&
                         zone.bottomRight.x == farBottomRight.x && zone.bottomRight.y == farBottomRight.y;
            if (!isNear && !isFar) {
                unknownGeometry++;
            }
        }
    });

    std::thread editor([&] {
        for (int i = 0; i < 200; ++i) {
            bool near = i % 2 == 0;
            MutationResult defined = coordinator->defineZone("camera1", "zone1",
                                                             near ? nearTopLeft : farTopLeft,
                                                             near ? nearBottomRight : farBottomRight);
            MutationResult reset = coordinator->resetZone("camera1", "zone1");
            MutationResult line = coordinator->defineLine("camera1", "line1",
                                                          Point(0, 150.0f + i % 50), Point(500, 150.0f + i % 50));
            if (!defined.success || !reset.success || !line.success) {
                failedEdits++;
            }
        }
    });

    std::vector<std::thread> writers;
    for (int w = 0; w < 3; ++w) {
        writers.emplace_back([this, w] {
            for (int i = 0; i < 400; ++i) {
                float position = (i % 3 == 0) ? 50.0f : ((i % 3 == 1) ? 300.0f : 700.0f);
                coordinator->ingest(sample("camera1", w * 10 + i % 5, position, position, i));
            }
        });
    }

    for (auto& writer : writers) {
        writer.join();
    }
    editor.join();
    stop = true;
    reader.join();

    EXPECT_EQ(versionWentBack.load(), 0);
    EXPECT_EQ(unknownGeometry.load(), 0);
    EXPECT_EQ(failedEdits.load(), 0);

    auto received = drain(viewer);
    ASSERT_FALSE(received.empty());
    for (size_t i = 1; i < received.size(); ++i) {
        EXPECT_GT(received[i].sequence, received[i - 1].sequence);
        ASSERT_TRUE(received[i].snapshot);
        ASSERT_TRUE(received[i - 1].snapshot);
        EXPECT_GT(received[i].snapshot->version, received[i - 1].snapshot->version);
    }

    ZoneSnapshot zone = coordinator->zoneSnapshot("camera1", "zone1");
    EXPECT_TRUE(std::is_sorted(zone.insideIds.begin(), zone.insideIds.end()));
}
