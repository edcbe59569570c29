#pragma once
#include "completion_signal.hpp"
#include "detection_config.hpp"
#include "detection_observer.hpp"
#include "device.hpp"
#include "reliability_profile.hpp"
#include "transport_enumerator.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace nmeascout
{

// ==================== Session Phase ====================
enum class SessionPhase {
    Idle,
    Starting,
    Running,
    Completed,
    Canceled
};

const char *sessionPhaseName(SessionPhase phase);

// ==================== Detection Orchestrator ====================
// Runs one detection session at a time over every candidate the enumerators
// report, keeps the ranked set of confirmed devices, and enforces the session
// deadline. All public methods are thread-safe.
class DetectionOrchestrator : public DeviceHost {
public:
    DetectionOrchestrator(const DetectionConfig &config,
                          std::vector<std::shared_ptr<TransportEnumerator>> enumerators,
                          std::shared_ptr<ProfileStore> store);
    ~DetectionOrchestrator() override;

    DetectionOrchestrator(const DetectionOrchestrator &) = delete;
    DetectionOrchestrator &operator=(const DetectionOrchestrator &) = delete;

    DetectionConfig config() const;
    // Validates first (std::invalid_argument). A running session keeps the
    // configuration it started with, except for the category gates.
    void setConfig(const DetectionConfig &config);

    void addObserver(const std::shared_ptr<DetectionObserver> &observer);
    void removeObserver(const std::shared_ptr<DetectionObserver> &observer);

    // Starts a session in the background. Returns false (and does nothing)
    // while a session is already starting or running.
    bool beginDetection();

    // Cancels the running session and blocks until it is Canceled. From the
    // orchestration thread or inside a device callback it only requests.
    // No-op when no session is running.
    void cancelDetection();

    // True once the session is terminal (or none is running).
    bool waitForDetection();
    bool waitForDetection(std::chrono::milliseconds timeout);

    // True as soon as a confirmed device exists; false on timeout or when the
    // session ends with none.
    bool waitForDevice();
    bool waitForDevice(std::chrono::milliseconds timeout);

    bool isDetectionInProgress() const;
    SessionPhase phase() const;

    bool isDeviceDetected() const;
    // Ranked best-first.
    std::vector<std::shared_ptr<Device>> confirmedDevices() const;
    std::shared_ptr<Device> bestDevice() const;
    std::vector<std::shared_ptr<Device>> knownDevices() const;

    // Insert-if-absent then re-rank. Returns false when the only-first policy
    // refuses a second device.
    bool registerConfirmed(const std::shared_ptr<Device> &device);

    // Clears the confirmed set and every device's cached confirmation.
    // A running session keeps running.
    void undetect();

    // Evicts every known device and deletes its stored profile.
    // Refused (false) while a session is running.
    bool forgetKnownDevices();

    // One claim per caller waiting to be handed an open connection.
    void claimStream() { ++streamClaims_; }
    void releaseStream() { --streamClaims_; }

    // DeviceHost
    bool isCategoryAllowed(TransportCategory category) const override;
    bool isRadioAvailable(TransportCategory category) const override;
    bool isStreamNeeded() const override { return streamClaims_.load() > 0; }
    void onAttemptStarted(const std::shared_ptr<Device> &device) override;
    void onAttemptFailed(const std::shared_ptr<Device> &device, const DeviceError &error) override;
    void onConfirmed(const std::shared_ptr<Device> &device) override;

private:
    struct RankedDevice {
        std::shared_ptr<Device> device;
        uint64_t order;
    };

    const std::vector<std::shared_ptr<TransportEnumerator>> enumerators_;
    std::shared_ptr<ProfileStore> store_;

    // One mutex for config, device sets, outstanding signals and phase.
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    DetectionConfig config_;
    std::vector<std::shared_ptr<Device>> known_;
    std::vector<RankedDevice> confirmed_;
    uint64_t nextOrder_;
    std::vector<std::shared_ptr<CompletionSignal>> outstanding_;
    SessionPhase phase_;
    uint64_t generation_;
    bool shuttingDown_;

    std::atomic<bool> cancelRequested_;
    std::atomic<int> streamClaims_;

    std::mutex lifecycleMutex_;  // begin / destroy
    std::thread sessionThread_;
    std::thread watchdogThread_;
    std::thread::id sessionThreadId_;  // guarded by mutex_

    std::mutex observerMutex_;
    std::vector<std::shared_ptr<DetectionObserver>> observers_;

    void runSession(DetectionConfig cfg);
    void runWatchdog(uint64_t generation, std::chrono::milliseconds timeout);
    bool requestCancel();

    bool mergeDevice(const std::shared_ptr<Device> &device, const DetectionConfig &cfg);
    void mergeCandidates(const DetectionConfig &cfg);
    std::vector<std::shared_ptr<Device>> launchCategory(TransportCategory category);
    void launch(const std::shared_ptr<Device> &device);
    void runExhaustiveScan(const DetectionConfig &cfg);
    void runDiscovery(const DetectionConfig &cfg);
    bool waitSignals(const std::vector<std::shared_ptr<CompletionSignal>> &signals);
    std::vector<std::shared_ptr<CompletionSignal>> outstandingSignals() const;
    void finishCanceled(const DetectionConfig &cfg);

    void rankLocked();
    bool inProgressLocked() const { return phase_ == SessionPhase::Starting || phase_ == SessionPhase::Running; }
    bool onOwnThread() const;

    template <typename Fn>
    void emit(Fn fn);
};

} // namespace nmeascout
