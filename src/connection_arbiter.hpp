#pragma once
#include "detection_orchestrator.hpp"
#include "device.hpp"
#include <memory>
#include <optional>
#include <vector>

namespace nmeascout
{

// ==================== Connection Arbiter ====================
// Hands out one open connection from the ranked confirmed devices,
// re-running detection when none of them can be opened.
class ConnectionArbiter {
public:
    explicit ConnectionArbiter(DetectionOrchestrator &orchestrator);

    // Best open device, or nullptr when nothing was ever found.
    // Throws the last DeviceError when devices exist but none could be opened.
    std::shared_ptr<Device> acquireConnection();

private:
    DetectionOrchestrator &orchestrator_;

    std::shared_ptr<Device> rankPass() const;
    std::shared_ptr<Device> connectPass(std::optional<DeviceError> &lastError);
};

} // namespace nmeascout
