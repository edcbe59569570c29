#pragma once
#include "device.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <vector>

namespace nmeascout
{

// ==================== Transport Enumerator ====================
// Platform source of candidate devices for one transport category.
class TransportEnumerator {
public:
    using FoundCallback = std::function<void(const std::shared_ptr<Device> &)>;

    virtual ~TransportEnumerator() = default;

    virtual TransportCategory category() const = 0;

    // Devices the platform already knows about (present ports, paired radios).
    virtual std::vector<std::shared_ptr<Device>> listCandidates() = 0;

    // Radio powered / daemon reachable.
    virtual bool isAvailable() const { return true; }

    virtual bool supportsDiscovery() const { return false; }
    // Blocks until discovery ends or `cancel` is raised; reports each find.
    virtual void discover(const FoundCallback &onFound, const std::atomic<bool> &cancel)
    {
        (void)onFound;
        (void)cancel;
    }

    // Exhaustive serial scan: device for port number n, nullptr when unsupported.
    virtual std::shared_ptr<Device> createForPortNumber(int n)
    {
        (void)n;
        return nullptr;
    }
};

} // namespace nmeascout
