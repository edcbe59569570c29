#include "connection_arbiter.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace nmeascout;
using namespace nmeascout::test;
using std::chrono::milliseconds;

namespace
{

struct ArbiterFixture : public ::testing::Test {
    std::shared_ptr<MemoryProfileStore> store = std::make_shared<MemoryProfileStore>();
    std::shared_ptr<FakeEnumerator> serial = std::make_shared<FakeEnumerator>(TransportCategory::Serial);
    std::unique_ptr<DetectionOrchestrator> orchestrator;

    void start()
    {
        DetectionConfig config;
        config.detectionTimeout = milliseconds(5000);
        orchestrator = std::make_unique<DetectionOrchestrator>(
            config, std::vector<std::shared_ptr<TransportEnumerator>>{serial}, store);
    }

    std::shared_ptr<ScriptedDevice> device(const std::string &id,
                                           DetectionOutcome outcome = DetectionOutcome::confirmed(4800))
    {
        return std::make_shared<ScriptedDevice>(id, TransportCategory::Serial, store, outcome);
    }

    // Runs one session without anyone waiting for a stream, so channels end up closed.
    void detect()
    {
        orchestrator->beginDetection();
        ASSERT_TRUE(orchestrator->waitForDetection(milliseconds(5000)));
    }

    void TearDown() override { orchestrator.reset(); }
};

} // namespace

TEST_F(ArbiterFixture, NothingFoundIsNull)
{
    start();
    ConnectionArbiter arbiter(*orchestrator);
    EXPECT_EQ(arbiter.acquireConnection(), nullptr);
    EXPECT_FALSE(orchestrator->isStreamNeeded());
}

TEST_F(ArbiterFixture, DetectsWhenNothingIsConfirmed)
{
    auto d = device("/dev/ttyUSB0");
    serial->devices = {d};
    start();
    ConnectionArbiter arbiter(*orchestrator);

    auto acquired = arbiter.acquireConnection();

    ASSERT_NE(acquired, nullptr);
    EXPECT_EQ(acquired->identity(), "/dev/ttyUSB0");
    EXPECT_TRUE(acquired->isOpen());
    EXPECT_EQ(d->attempts(), 1);
    EXPECT_FALSE(orchestrator->isStreamNeeded());
}

TEST_F(ArbiterFixture, RankPassPrefersAnAlreadyOpenDevice)
{
    store->write("/dev/ttyUSB1", makeProfile(1, 3));  // ranks below ttyUSB0
    auto best = device("/dev/ttyUSB0");
    auto other = device("/dev/ttyUSB1");
    serial->devices = {best, other};
    start();
    detect();
    ASSERT_EQ(orchestrator->bestDevice(), best);

    other->open();
    int bestOpens = best->opens();

    ConnectionArbiter arbiter(*orchestrator);
    EXPECT_EQ(arbiter.acquireConnection(), other);
    EXPECT_EQ(best->opens(), bestOpens);
}

TEST_F(ArbiterFixture, ConnectPassSkipsDisallowedDevices)
{
    store->write("/dev/ttyUSB1", makeProfile(1, 3));  // ranks below ttyUSB0
    auto best = device("/dev/ttyUSB0");
    auto other = device("/dev/ttyUSB1");
    serial->devices = {best, other};
    start();
    detect();
    ASSERT_FALSE(best->isOpen());

    best->setAllowConnections(false);
    ConnectionArbiter arbiter(*orchestrator);

    EXPECT_EQ(arbiter.acquireConnection(), other);
    EXPECT_TRUE(other->isOpen());
    EXPECT_FALSE(best->isOpen());
}

TEST_F(ArbiterFixture, ConnectPassFallsBackToTheNextDevice)
{
    store->write("/dev/ttyUSB1", makeProfile(1, 3));  // ranks below ttyUSB0
    auto best = device("/dev/ttyUSB0");
    auto other = device("/dev/ttyUSB1");
    serial->devices = {best, other};
    start();
    detect();

    best->setFailOpens(1);
    ConnectionArbiter arbiter(*orchestrator);

    EXPECT_EQ(arbiter.acquireConnection(), other);
    EXPECT_FALSE(best->isOpen());
    EXPECT_EQ(best->rebuilds(), 1);
    EXPECT_EQ(other->rebuilds(), 0);
}

TEST_F(ArbiterFixture, RecoveryPassDetectsAgainAndConnects)
{
    auto d = device("/dev/ttyUSB0");
    serial->devices = {d};
    start();
    detect();
    ASSERT_EQ(d->attempts(), 1);

    // Gone for the first connect pass only.
    d->setFailOpens(1);
    ConnectionArbiter arbiter(*orchestrator);

    EXPECT_EQ(arbiter.acquireConnection(), d);
    EXPECT_EQ(d->attempts(), 2);
    EXPECT_TRUE(d->isOpen());
}

TEST_F(ArbiterFixture, UnreachableDevicesRaiseTheLastError)
{
    auto d = device("/dev/ttyUSB0");
    serial->devices = {d};
    start();
    detect();

    d->setOpenError(ErrorKind::PermissionDenied);
    ConnectionArbiter arbiter(*orchestrator);

    try
    {
        arbiter.acquireConnection();
        FAIL() << "expected DeviceError";
    }
    catch (const DeviceError &ex)
    {
        EXPECT_EQ(ex.kind(), ErrorKind::PermissionDenied);
        EXPECT_EQ(ex.identity(), "/dev/ttyUSB0");
    }
    EXPECT_EQ(d->attempts(), 1);  // re-detection failed at open, before sniffing
    EXPECT_FALSE(orchestrator->isDeviceDetected());
    EXPECT_FALSE(orchestrator->isStreamNeeded());
}

TEST_F(ArbiterFixture, FinishedCallerLeavesAnotherCallersStreamClaim)
{
    auto d = device("/dev/ttyUSB0");
    serial->devices = {d};
    start();

    orchestrator->claimStream();  // a second caller still waiting for its connection
    ConnectionArbiter arbiter(*orchestrator);
    ASSERT_EQ(arbiter.acquireConnection(), d);
    EXPECT_TRUE(orchestrator->isStreamNeeded());

    orchestrator->releaseStream();
    EXPECT_FALSE(orchestrator->isStreamNeeded());
}
