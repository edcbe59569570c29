#pragma once
#include "detection_error.hpp"
#include <memory>

namespace nmeascout
{

class Device;

// ==================== Detection Observer ====================
// Session and per-device events. Callbacks run on orchestration or device
// threads; implementations must be thread-safe and must not block for long.
class DetectionObserver {
public:
    virtual ~DetectionObserver() = default;

    virtual void onDetectionStarted() {}
    virtual void onAttemptStarted(const std::shared_ptr<Device> &) {}
    virtual void onAttemptFailed(const std::shared_ptr<Device> &, const DeviceError &) {}
    virtual void onDeviceConfirmed(const std::shared_ptr<Device> &) {}
    virtual void onDeviceDiscovered(const std::shared_ptr<Device> &) {}
    virtual void onDetectionCanceled() {}
    virtual void onDetectionCompleted() {}
};

} // namespace nmeascout
