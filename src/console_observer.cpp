#include "console_observer.hpp"
#include "device.hpp"
#include "log.hpp"

namespace nmeascout
{

void ConsoleObserver::onDetectionStarted()
{
    log::info("[DETECT] Detection started");
}

void ConsoleObserver::onAttemptStarted(const std::shared_ptr<Device> &device)
{
    log::debug("[DETECT] Testing " + device->name() + " (" + categoryName(device->category()) + ")");
}

void ConsoleObserver::onAttemptFailed(const std::shared_ptr<Device> &device, const DeviceError &error)
{
    // Policy exclusions are routine; only report them when asked.
    if (error.kind() == ErrorKind::PolicyExcluded)
        log::debug("[DETECT] Skipped " + device->name() + ": " + error.what());
    else
        log::info("[DETECT] " + device->name() + " failed (" + errorKindName(error.kind()) + "): " + error.what());
}

void ConsoleObserver::onDeviceConfirmed(const std::shared_ptr<Device> &device)
{
    auto p = device->profile();
    std::string baud = p.lastSuccessBaud ? " @ " + std::to_string(*p.lastSuccessBaud) + " baud" : "";
    log::ok("[DETECT] " + device->name() + baud);
}

void ConsoleObserver::onDeviceDiscovered(const std::shared_ptr<Device> &device)
{
    log::info("[DETECT] Discovered " + device->name());
}

void ConsoleObserver::onDetectionCanceled()
{
    log::info("[DETECT] Detection canceled");
}

void ConsoleObserver::onDetectionCompleted()
{
    log::info("[DETECT] Detection completed");
}

} // namespace nmeascout
