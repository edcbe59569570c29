#include "connection_arbiter.hpp"
#include "log.hpp"

namespace nmeascout
{

namespace
{

// Confirmed devices keep their channel open while any of these is alive.
class StreamNeededScope {
public:
    explicit StreamNeededScope(DetectionOrchestrator &orchestrator) : orchestrator_(orchestrator)
    {
        orchestrator_.claimStream();
    }
    ~StreamNeededScope() { orchestrator_.releaseStream(); }

    StreamNeededScope(const StreamNeededScope &) = delete;
    StreamNeededScope &operator=(const StreamNeededScope &) = delete;

private:
    DetectionOrchestrator &orchestrator_;
};

} // namespace

ConnectionArbiter::ConnectionArbiter(DetectionOrchestrator &orchestrator) : orchestrator_(orchestrator) {}

std::shared_ptr<Device> ConnectionArbiter::rankPass() const
{
    for (const auto &device : orchestrator_.confirmedDevices())
    {
        if (device->isOpen() && !device->isDetectionInProgress())
            return device;
    }
    return nullptr;
}

std::shared_ptr<Device> ConnectionArbiter::connectPass(std::optional<DeviceError> &lastError)
{
    for (const auto &device : orchestrator_.confirmedDevices())
    {
        if (!device->allowConnections())
            continue;
        try
        {
            device->open();
            log::ok("[ARBITER] Connected to " + device->name());
            return device;
        }
        catch (const DeviceError &ex)
        {
            log::warn("[ARBITER] " + device->name() + ": " + ex.what());
            lastError = ex;
            // Drop the handle; the next open starts from a fresh channel.
            device->reset();
        }
    }
    return nullptr;
}

std::shared_ptr<Device> ConnectionArbiter::acquireConnection()
{
    StreamNeededScope streamNeeded(orchestrator_);

    if (!orchestrator_.isDeviceDetected())
    {
        orchestrator_.beginDetection();
        if (!orchestrator_.waitForDevice())
        {
            log::info("[ARBITER] No device found");
            return nullptr;
        }
    }

    if (auto device = rankPass())
        return device;

    std::optional<DeviceError> lastError;
    if (auto device = connectPass(lastError))
        return device;

    log::info("[ARBITER] No confirmed device could be opened, detecting again");
    orchestrator_.beginDetection();
    orchestrator_.waitForDetection();
    if (auto device = connectPass(lastError))
        return device;

    if (lastError)
        throw *lastError;
    return nullptr;
}

} // namespace nmeascout
