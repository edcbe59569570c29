#include "serial_device.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace nmeascout;
using namespace nmeascout::test;

namespace
{

class ThrowingStore : public ProfileStore {
public:
    std::optional<ReliabilityProfile> read(const std::string &) override { return std::nullopt; }
    void write(const std::string &, const ReliabilityProfile &) override { throw std::runtime_error("disk full"); }
    void remove(const std::string &) override { throw std::runtime_error("disk full"); }
};

class FakeHost : public DeviceHost {
public:
    bool isCategoryAllowed(TransportCategory category) const override
    {
        return category != TransportCategory::Bluetooth || allowBluetooth;
    }
    bool isRadioAvailable(TransportCategory) const override { return radioOn; }
    bool isStreamNeeded() const override { return streamNeeded; }
    void onAttemptStarted(const std::shared_ptr<Device> &) override { ++started; }
    void onAttemptFailed(const std::shared_ptr<Device> &, const DeviceError &error) override
    {
        ++failed;
        lastKind = error.kind();
    }
    void onConfirmed(const std::shared_ptr<Device> &) override { ++confirmed; }

    bool allowBluetooth = true;
    bool radioOn = true;
    bool streamNeeded = false;
    std::atomic<int> started{0};
    std::atomic<int> failed{0};
    std::atomic<int> confirmed{0};
    ErrorKind lastKind = ErrorKind::TransportError;
};

SnifferSettings fastSettings()
{
    SnifferSettings s;
    s.readTimeoutMs = 40;
    return s;
}

struct DeviceFixture : public ::testing::Test {
    std::shared_ptr<MemoryProfileStore> store = std::make_shared<MemoryProfileStore>();
    std::shared_ptr<FakeChannelState> state = std::make_shared<FakeChannelState>();

    std::shared_ptr<SerialDevice> makeDevice(const std::string &path = "/dev/ttyUSB0")
    {
        auto s = state;
        auto device = std::make_shared<SerialDevice>(
            path, store, [s, path]() { return std::make_unique<FakeChannel>(s, path); });
        device->setSnifferSettings(fastSettings());
        return device;
    }
};

} // namespace

TEST_F(DeviceFixture, NewDeviceStoresAnEmptyProfile)
{
    auto device = makeDevice("/dev/ttyUSB3");
    auto stored = store->read("/dev/ttyUSB3");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->successCount, 0u);
    EXPECT_EQ(stored->failCount, 0u);
    EXPECT_EQ(state->opens, 0);
}

TEST_F(DeviceFixture, CreationKeepsAnExistingProfile)
{
    store->write("/dev/ttyUSB0", makeProfile(2, 1));
    auto device = makeDevice();
    EXPECT_EQ(store->read("/dev/ttyUSB0")->successCount, 2u);
    EXPECT_EQ(device->profile().failCount, 1u);
}

TEST_F(DeviceFixture, ExhaustedFailureBudgetIsExcludedWithoutIo)
{
    store->write("/dev/ttyUSB0", makeProfile(0, 100));
    auto device = makeDevice();

    DetectionOutcome outcome = device->detectProtocol();

    EXPECT_EQ(outcome.kind, DetectionOutcome::Kind::Excluded);
    EXPECT_NE(outcome.reason.find("100 times"), std::string::npos);
    EXPECT_EQ(state->opens, 0);
    EXPECT_EQ(state->readCount(), 0);
    EXPECT_EQ(device->profile().failCount, 100u);
    EXPECT_EQ(device->state(), DeviceState::Idle);
}

TEST_F(DeviceFixture, OneSuccessLiftsTheFailureBudget)
{
    store->write("/dev/ttyUSB0", makeProfile(1, 150));
    auto device = makeDevice();
    EXPECT_EQ(device->detectProtocol().kind, DetectionOutcome::Kind::Confirmed);
}

TEST_F(DeviceFixture, DisallowedDeviceIsExcluded)
{
    auto device = makeDevice();
    device->setAllowConnections(false);
    DetectionOutcome outcome = device->detectProtocol();
    EXPECT_EQ(outcome.kind, DetectionOutcome::Kind::Excluded);
    EXPECT_EQ(outcome.errorKind, ErrorKind::PolicyExcluded);
    EXPECT_EQ(state->opens, 0);
}

TEST_F(DeviceFixture, ConfirmationRecordsBaudAndPersists)
{
    auto device = makeDevice();

    DetectionOutcome outcome = device->detectProtocol();

    ASSERT_EQ(outcome.kind, DetectionOutcome::Kind::Confirmed);
    EXPECT_EQ(outcome.baud, 9600);
    EXPECT_EQ(device->state(), DeviceState::Confirmed);
    EXPECT_TRUE(device->isConfirmed());
    EXPECT_FALSE(device->isOpen());  // nobody needs the stream

    auto stored = store->read("/dev/ttyUSB0");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->successCount, 1u);
    EXPECT_EQ(stored->failCount, 0u);
    EXPECT_EQ(stored->lastSuccessBaud, 9600);
    EXPECT_TRUE(stored->lastDetectedAt.has_value());
}

TEST_F(DeviceFixture, NextRunStartsAtTheLastSuccessfulRate)
{
    makeDevice()->detectProtocol();
    state->bauds.clear();

    // A fresh object for the same port, as after a restart.
    auto device = makeDevice();
    DetectionOutcome outcome = device->detectProtocol();

    ASSERT_EQ(outcome.kind, DetectionOutcome::Kind::Confirmed);
    EXPECT_EQ(state->baudHistory(), std::vector<int>{9600});
    EXPECT_EQ(device->profile().successCount, 2u);
}

TEST_F(DeviceFixture, RejectionCountsAsFailure)
{
    state->mode = FakeMode::Silent;
    auto device = makeDevice();

    DetectionOutcome outcome = device->detectProtocol();

    EXPECT_EQ(outcome.kind, DetectionOutcome::Kind::Rejected);
    EXPECT_EQ(device->state(), DeviceState::Rejected);
    EXPECT_EQ(device->profile().failCount, 1u);
    EXPECT_FALSE(device->isConfirmed());
}

TEST_F(DeviceFixture, OpenFailureKeepsItsKind)
{
    state->openError = ErrorKind::PermissionDenied;
    auto device = makeDevice();
    FakeHost host;
    device->attach(&host);

    DetectionOutcome outcome = device->detectProtocol();

    EXPECT_EQ(outcome.kind, DetectionOutcome::Kind::TransportError);
    EXPECT_EQ(outcome.errorKind, ErrorKind::PermissionDenied);
    EXPECT_EQ(device->profile().failCount, 1u);
    EXPECT_EQ(host.started.load(), 1);
    EXPECT_EQ(host.failed.load(), 1);
    EXPECT_EQ(host.lastKind, ErrorKind::PermissionDenied);
    device->attach(nullptr);
}

TEST_F(DeviceFixture, CancelStopsAPendingReadAndIsNotCounted)
{
    state->mode = FakeMode::Silent;
    auto device = makeDevice();
    SnifferSettings slow;
    slow.readTimeoutMs = 5000;
    device->setSnifferSettings(slow);

    auto signal = device->beginDetection();
    ASSERT_TRUE(waitUntil([&]() { return device->state() == DeviceState::Sniffing; }));
    device->cancelDetection();

    ASSERT_TRUE(signal->waitFor(std::chrono::seconds(2)));
    EXPECT_FALSE(device->isDetectionInProgress());
    EXPECT_EQ(device->state(), DeviceState::Idle);
    EXPECT_EQ(device->profile().failCount, 0u);
    EXPECT_FALSE(device->isOpen());
}

TEST_F(DeviceFixture, SecondBeginReturnsTheRunningSignal)
{
    state->mode = FakeMode::Silent;
    auto device = makeDevice();

    auto first = device->beginDetection();
    auto second = device->beginDetection();
    EXPECT_EQ(first, second);
    EXPECT_EQ(device->detectProtocol().kind, DetectionOutcome::Kind::Excluded);

    device->cancelDetection();
    EXPECT_TRUE(first->waitFor(std::chrono::seconds(2)));
}

TEST_F(DeviceFixture, ConfirmedChannelStaysOpenWhileStreamIsNeeded)
{
    auto device = makeDevice();
    FakeHost host;
    host.streamNeeded = true;
    device->attach(&host);

    ASSERT_EQ(device->detectProtocol().kind, DetectionOutcome::Kind::Confirmed);
    EXPECT_TRUE(device->isOpen());
    EXPECT_NE(device->channel(), nullptr);
    EXPECT_EQ(host.confirmed.load(), 1);

    device->close();
    EXPECT_FALSE(device->isOpen());
    device->attach(nullptr);
}

TEST_F(DeviceFixture, ResetRebuildsTheChannel)
{
    auto device = makeDevice();
    EXPECT_EQ(state->builds, 1);
    device->reset();
    EXPECT_EQ(state->builds, 2);
    EXPECT_EQ(device->detectProtocol().kind, DetectionOutcome::Kind::Confirmed);
}

TEST_F(DeviceFixture, UndetectDropsStoredRecordButKeepsCounts)
{
    auto device = makeDevice();
    ASSERT_EQ(device->detectProtocol().kind, DetectionOutcome::Kind::Confirmed);

    device->undetect();

    EXPECT_FALSE(device->isConfirmed());
    EXPECT_FALSE(store->read("/dev/ttyUSB0").has_value());
    EXPECT_EQ(device->profile().successCount, 1u);
    EXPECT_FALSE(device->profile().lastSuccessBaud.has_value());
}

TEST_F(DeviceFixture, StoreFailureDoesNotFailDetection)
{
    auto s = state;
    auto device = std::make_shared<SerialDevice>("/dev/ttyUSB0", std::make_shared<ThrowingStore>(), [s]() {
        return std::make_unique<FakeChannel>(s);
    });
    device->setSnifferSettings(fastSettings());

    EXPECT_EQ(device->detectProtocol().kind, DetectionOutcome::Kind::Confirmed);
    EXPECT_EQ(device->profile().successCount, 1u);
    EXPECT_NO_THROW(device->undetect());
}

TEST_F(DeviceFixture, OpenUsesLastRateAndStampsConnection)
{
    auto device = makeDevice();
    ASSERT_EQ(device->detectProtocol().kind, DetectionOutcome::Kind::Confirmed);
    state->bauds.clear();

    device->open();

    EXPECT_TRUE(device->isOpen());
    EXPECT_EQ(state->baudHistory(), std::vector<int>{9600});
    EXPECT_TRUE(device->profile().lastConnectedAt.has_value());
    device->close();
}

TEST_F(DeviceFixture, OpenFailureThrowsDeviceError)
{
    state->openError = ErrorKind::TransportUnavailable;
    auto device = makeDevice();
    try
    {
        device->open();
        FAIL() << "open() should throw";
    }
    catch (const DeviceError &ex)
    {
        EXPECT_EQ(ex.kind(), ErrorKind::TransportUnavailable);
    }
    EXPECT_FALSE(device->isOpen());
}

TEST_F(DeviceFixture, BluetoothBridgedPortsCountAsBluetooth)
{
    auto wired = makeDevice("/dev/ttyUSB0");
    EXPECT_EQ(wired->policyCategory(), TransportCategory::Serial);
    wired->setName("Bluetooth GPS Bridge");
    EXPECT_EQ(wired->policyCategory(), TransportCategory::Bluetooth);
    EXPECT_EQ(makeDevice("/dev/rfcomm2")->policyCategory(), TransportCategory::Bluetooth);
}

TEST_F(DeviceFixture, HostGatesBluetoothByCategoryAndRadio)
{
    auto s = state;
    auto device = std::make_shared<BluetoothVirtualDevice>("00:11:22:33:44:55", "/dev/rfcomm0", store, [s]() {
        return std::make_unique<FakeChannel>(s, "/dev/rfcomm0");
    });
    device->setSnifferSettings(fastSettings());
    FakeHost host;
    device->attach(&host);

    host.allowBluetooth = false;
    DetectionOutcome outcome = device->detectProtocol();
    EXPECT_EQ(outcome.kind, DetectionOutcome::Kind::Excluded);
    EXPECT_NE(outcome.reason.find("currently excluded"), std::string::npos);

    host.allowBluetooth = true;
    host.radioOn = false;
    outcome = device->detectProtocol();
    EXPECT_EQ(outcome.kind, DetectionOutcome::Kind::Excluded);
    EXPECT_NE(outcome.reason.find("turned off"), std::string::npos);
    EXPECT_EQ(state->opens, 0);

    host.radioOn = true;
    EXPECT_EQ(device->detectProtocol().kind, DetectionOutcome::Kind::Confirmed);
    EXPECT_EQ(device->identity(), "00:11:22:33:44:55");
    device->attach(nullptr);
}
