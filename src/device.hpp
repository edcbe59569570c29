#pragma once
#include "completion_signal.hpp"
#include "detection_error.hpp"
#include "detection_outcome.hpp"
#include "reliability_profile.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace nmeascout
{

// ==================== Transport Category ====================
enum class TransportCategory {
    Serial,       // Wired tty (USB, ACM, on-board UART)
    Bluetooth,    // RFCOMM virtual serial port
    Multiplexer   // Platform daemon sharing one receiver (gpsd)
};

const char *categoryName(TransportCategory category);

// ==================== Device State ====================
enum class DeviceState {
    Idle,
    Opening,
    Sniffing,
    Confirmed,
    Rejected,
    Canceling
};

const char *deviceStateName(DeviceState state);

class Device;

// ==================== Device Host ====================
// Whoever coordinates detection (the orchestrator). All callbacks arrive on the
// device's detection thread.
class DeviceHost {
public:
    virtual ~DeviceHost() = default;

    virtual bool isCategoryAllowed(TransportCategory category) const = 0;
    virtual bool isRadioAvailable(TransportCategory category) const = 0;
    // True while a caller is waiting to be handed an open connection.
    virtual bool isStreamNeeded() const = 0;

    virtual void onAttemptStarted(const std::shared_ptr<Device> &device) = 0;
    virtual void onAttemptFailed(const std::shared_ptr<Device> &device, const DeviceError &error) = 0;
    virtual void onConfirmed(const std::shared_ptr<Device> &device) = 0;
};

// ==================== Device ====================
// One candidate transport and its detection lifecycle:
//   Idle -> Opening -> Sniffing -> Confirmed | Rejected, Canceling from Opening/Sniffing.
// Devices with equal identity are the same device.
class Device : public std::enable_shared_from_this<Device> {
public:
    Device(const std::string &identity, TransportCategory category, std::shared_ptr<ProfileStore> store);
    virtual ~Device();

    Device(const Device &) = delete;
    Device &operator=(const Device &) = delete;

    const std::string &identity() const { return identity_; }
    TransportCategory category() const { return category_; }
    // Category used for allow/deny policy; a serial port bridged over Bluetooth reports Bluetooth.
    virtual TransportCategory policyCategory() const { return category_; }

    std::string name() const;
    void setName(const std::string &friendlyName);

    bool allowConnections() const;
    void setAllowConnections(bool allow);

    int maximumAllowedFailures() const;
    void setMaximumAllowedFailures(int failures);

    DeviceState state() const;
    bool isDetectionInProgress() const;
    bool isConfirmed() const;
    bool isOpen() const { return channelOpen_.load(); }
    ReliabilityProfile profile() const;

    // nullptr detaches; returns once no host callback is in flight.
    void attach(DeviceHost *host);

    // Starts an attempt on a dedicated thread and returns its completion signal.
    // While an attempt is running this returns the running attempt's signal.
    // The device must be owned by a std::shared_ptr.
    std::shared_ptr<CompletionSignal> beginDetection();

    // Synchronous attempt on the calling thread.
    DetectionOutcome detectProtocol();

    // Cooperative: flags the attempt and wakes any pending read. The detection
    // thread closes the channel and exits; wait on the completion signal.
    void cancelDetection();

    bool waitForDetection(std::chrono::milliseconds timeout);
    // Blocks until the running attempt has left Opening (or finished).
    bool waitUntilOpened(std::chrono::milliseconds timeout);

    // Closes and rebuilds the channel with the same configuration.
    void reset();
    // Forgets the cached confirmation and deletes the stored profile record.
    void undetect();

    // Connection use (arbiter). open() throws DeviceError.
    void open();
    void close();

protected:
    // Variant hooks. Channel hooks run with the channel lock held.
    virtual void openChannel() = 0;
    virtual void closeChannel() = 0;
    virtual void interruptChannel() = 0;
    virtual void rebuildChannel() = 0;
    virtual DetectionOutcome sniff(const std::atomic<bool> &cancel) = 0;
    virtual void prepareForConnection() {}

    std::optional<int> lastSuccessBaud() const;

    // Concrete destructors call this first so a running attempt never sees a
    // half-destroyed object.
    void shutdownDetection();

private:
    const std::string identity_;
    const TransportCategory category_;
    std::shared_ptr<ProfileStore> store_;

    mutable std::mutex mutex_;             // state, profile, flags
    std::condition_variable stateCv_;
    ReliabilityProfile profile_;
    DeviceState state_;
    bool allowConnections_;
    bool confirmed_;
    bool detecting_;
    int maximumAllowedFailures_;
    std::shared_ptr<CompletionSignal> signal_;
    std::mutex threadMutex_;               // hand-over of the worker thread
    std::thread thread_;
    std::atomic<bool> cancel_;

    std::mutex channelMutex_;              // open/close/reset vs. detection
    std::atomic<bool> channelOpen_;

    std::mutex hostMutex_;
    DeviceHost *host_;

    bool beginAttempt(std::shared_ptr<CompletionSignal> &signal);
    void finishAttempt(const DetectionOutcome &outcome, const std::shared_ptr<CompletionSignal> &signal);
    DetectionOutcome runAttempt();
    std::optional<DetectionOutcome> checkPolicy();  // nullopt when the attempt may proceed
    void recordOutcome(const DetectionOutcome &outcome);
    void persist();
    void setState(DeviceState state);
    bool hostNeedsStream();

    void notifyAttemptStarted();
    void notifyAttemptFailed(const DetectionOutcome &outcome);
    void notifyConfirmed();
};

} // namespace nmeascout
