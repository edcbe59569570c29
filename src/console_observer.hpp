#pragma once
#include "detection_observer.hpp"

namespace nmeascout
{

// Prints detection events as "[DETECT] ..." console lines.
class ConsoleObserver : public DetectionObserver {
public:
    void onDetectionStarted() override;
    void onAttemptStarted(const std::shared_ptr<Device> &device) override;
    void onAttemptFailed(const std::shared_ptr<Device> &device, const DeviceError &error) override;
    void onDeviceConfirmed(const std::shared_ptr<Device> &device) override;
    void onDeviceDiscovered(const std::shared_ptr<Device> &device) override;
    void onDetectionCanceled() override;
    void onDetectionCompleted() override;
};

} // namespace nmeascout
