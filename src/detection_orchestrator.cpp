#include "detection_orchestrator.hpp"
#include "log.hpp"
#include <algorithm>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <unistd.h>

namespace nmeascout
{

namespace
{

// Wired devices get this long to leave Opening before Bluetooth starts.
const std::chrono::milliseconds kWiredOpenWait(5000);
const std::chrono::milliseconds kSignalPoll(50);

// Depth of DeviceHost callbacks on this thread; cancelDetection() must not block there.
thread_local int callbackDepth = 0;

struct CallbackScope {
    CallbackScope() { ++callbackDepth; }
    ~CallbackScope() { --callbackDepth; }
};

struct RankKey {
    double ratio;
    std::optional<Timestamp> lastDetectedAt;
    unsigned failCount;
    uint64_t order;
};

// Best first: success ratio (never tested last), most recent success, fewest failures, first registered.
bool rankedBefore(const RankKey &a, const RankKey &b)
{
    if (a.ratio != b.ratio)
        return a.ratio > b.ratio;
    if (a.lastDetectedAt != b.lastDetectedAt)
    {
        if (!a.lastDetectedAt)
            return false;
        if (!b.lastDetectedAt)
            return true;
        return *a.lastDetectedAt > *b.lastDetectedAt;
    }
    if (a.failCount != b.failCount)
        return a.failCount < b.failCount;
    return a.order < b.order;
}

void reap(std::thread &t)
{
    if (!t.joinable())
        return;
    if (t.get_id() == std::this_thread::get_id())
        t.detach();
    else
        t.join();
}

void lowerThreadPriority()
{
    // Linux applies nice values per thread.
    pid_t tid = static_cast<pid_t>(::syscall(SYS_gettid));
    if (::setpriority(PRIO_PROCESS, static_cast<id_t>(tid), 10) != 0)
        log::debug("[DETECT] could not lower orchestration thread priority");
}

} // namespace

const char *sessionPhaseName(SessionPhase phase)
{
    switch (phase)
    {
    case SessionPhase::Idle: return "idle";
    case SessionPhase::Starting: return "starting";
    case SessionPhase::Running: return "running";
    case SessionPhase::Completed: return "completed";
    case SessionPhase::Canceled: return "canceled";
    }
    return "unknown";
}

DetectionOrchestrator::DetectionOrchestrator(const DetectionConfig &config,
                                             std::vector<std::shared_ptr<TransportEnumerator>> enumerators,
                                             std::shared_ptr<ProfileStore> store)
    : enumerators_(std::move(enumerators)), store_(std::move(store)), config_(config), nextOrder_(0),
      phase_(SessionPhase::Idle), generation_(0), shuttingDown_(false), cancelRequested_(false),
      streamClaims_(0)
{
    config_.validate();
}

DetectionOrchestrator::~DetectionOrchestrator()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shuttingDown_ = true;
    }
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    requestCancel();
    cv_.notify_all();
    reap(sessionThread_);
    reap(watchdogThread_);

    // Waits out any callback still running on a device thread.
    for (const auto &device : knownDevices())
        device->attach(nullptr);
}

// ==================== Configuration & observers ====================

DetectionConfig DetectionOrchestrator::config() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

void DetectionOrchestrator::setConfig(const DetectionConfig &config)
{
    config.validate();
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
}

void DetectionOrchestrator::addObserver(const std::shared_ptr<DetectionObserver> &observer)
{
    if (!observer)
        return;
    std::lock_guard<std::mutex> lock(observerMutex_);
    if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end())
        observers_.push_back(observer);
}

void DetectionOrchestrator::removeObserver(const std::shared_ptr<DetectionObserver> &observer)
{
    std::lock_guard<std::mutex> lock(observerMutex_);
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

template <typename Fn>
void DetectionOrchestrator::emit(Fn fn)
{
    std::vector<std::shared_ptr<DetectionObserver>> copy;
    {
        std::lock_guard<std::mutex> lock(observerMutex_);
        copy = observers_;
    }
    for (const auto &observer : copy)
    {
        try
        {
            fn(*observer);
        }
        catch (const std::exception &ex)
        {
            log::warn(std::string("detection observer threw: ") + ex.what());
        }
    }
}

// ==================== Session control ====================

bool DetectionOrchestrator::beginDetection()
{
    std::thread previousSession;
    std::thread previousWatchdog;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (inProgressLocked() || shuttingDown_)
            return false;
    }
    {
        std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
        DetectionConfig cfg;
        uint64_t generation;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (inProgressLocked() || shuttingDown_)
                return false;
            phase_ = SessionPhase::Starting;
            outstanding_.clear();
            generation = ++generation_;
            cfg = config_;
            cancelRequested_.store(false);
        }
        cv_.notify_all();

        previousSession = std::move(sessionThread_);
        previousWatchdog = std::move(watchdogThread_);
        sessionThread_ = std::thread(&DetectionOrchestrator::runSession, this, cfg);
        watchdogThread_ = std::thread(&DetectionOrchestrator::runWatchdog, this, generation, cfg.detectionTimeout);
    }
    // Both already saw their session end and are about to return.
    reap(previousSession);
    reap(previousWatchdog);
    return true;
}

bool DetectionOrchestrator::requestCancel()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!inProgressLocked())
            return false;
    }
    cancelRequested_.store(true);
    cv_.notify_all();
    return true;
}

bool DetectionOrchestrator::onOwnThread() const
{
    if (callbackDepth > 0)
        return true;
    std::lock_guard<std::mutex> lock(mutex_);
    return sessionThreadId_ == std::this_thread::get_id();
}

void DetectionOrchestrator::cancelDetection()
{
    if (!requestCancel())
        return;
    if (onOwnThread())
        return;

    std::chrono::milliseconds bound;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bound = config_.cancelAcknowledgeTimeout * 2;
    }
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, bound, [this]() { return !inProgressLocked(); }))
        log::warn("[DETECT] detection session did not stop within " + std::to_string(bound.count()) + " ms");
}

bool DetectionOrchestrator::waitForDetection()
{
    return waitForDetection(config().detectionTimeout);
}

bool DetectionOrchestrator::waitForDetection(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return !inProgressLocked(); });
}

bool DetectionOrchestrator::waitForDevice()
{
    return waitForDevice(config().detectionTimeout);
}

bool DetectionOrchestrator::waitForDevice(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this]() { return !confirmed_.empty() || !inProgressLocked(); });
    return !confirmed_.empty();
}

bool DetectionOrchestrator::isDetectionInProgress() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return inProgressLocked();
}

SessionPhase DetectionOrchestrator::phase() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return phase_;
}

// ==================== Device sets ====================

bool DetectionOrchestrator::isDeviceDetected() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return !confirmed_.empty();
}

std::vector<std::shared_ptr<Device>> DetectionOrchestrator::confirmedDevices() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Device>> devices;
    devices.reserve(confirmed_.size());
    for (const auto &entry : confirmed_)
        devices.push_back(entry.device);
    return devices;
}

std::shared_ptr<Device> DetectionOrchestrator::bestDevice() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return confirmed_.empty() ? nullptr : confirmed_.front().device;
}

std::vector<std::shared_ptr<Device>> DetectionOrchestrator::knownDevices() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return known_;
}

void DetectionOrchestrator::rankLocked()
{
    // Snapshot the keys first so a profile changing mid-sort cannot break ordering.
    std::vector<std::pair<RankKey, RankedDevice>> keyed;
    keyed.reserve(confirmed_.size());
    for (const auto &entry : confirmed_)
    {
        ReliabilityProfile p = entry.device->profile();
        keyed.push_back({RankKey{p.successRatio(), p.lastDetectedAt, p.failCount, entry.order}, entry});
    }
    std::stable_sort(keyed.begin(), keyed.end(),
                     [](const std::pair<RankKey, RankedDevice> &a, const std::pair<RankKey, RankedDevice> &b) {
                         return rankedBefore(a.first, b.first);
                     });
    confirmed_.clear();
    for (auto &k : keyed)
        confirmed_.push_back(std::move(k.second));
}

bool DetectionOrchestrator::registerConfirmed(const std::shared_ptr<Device> &device)
{
    if (!device)
        return false;

    bool stopAfterThis = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto same = [&device](const RankedDevice &e) { return e.device->identity() == device->identity(); };
        if (std::find_if(confirmed_.begin(), confirmed_.end(), same) != confirmed_.end())
        {
            rankLocked();
            return true;
        }
        if (config_.onlyFirstDeviceDetected && !confirmed_.empty())
        {
            log::debug("[DETECT] " + device->name() + " ignored, a device is already confirmed");
            return false;
        }
        confirmed_.push_back(RankedDevice{device, nextOrder_++});
        rankLocked();

        auto known = std::find_if(known_.begin(), known_.end(), [&device](const std::shared_ptr<Device> &d) {
            return d->identity() == device->identity();
        });
        if (known == known_.end())
            known_.push_back(device);

        stopAfterThis = config_.onlyFirstDeviceDetected;
    }
    cv_.notify_all();

    emit([&device](DetectionObserver &o) { o.onDeviceConfirmed(device); });
    if (stopAfterThis)
        requestCancel();
    return true;
}

void DetectionOrchestrator::undetect()
{
    std::vector<std::shared_ptr<Device>> devices;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        confirmed_.clear();
        devices = known_;
    }
    for (const auto &device : devices)
        device->undetect();
}

bool DetectionOrchestrator::forgetKnownDevices()
{
    std::vector<std::shared_ptr<Device>> devices;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (inProgressLocked())
            return false;
        confirmed_.clear();
        devices.swap(known_);
    }
    for (const auto &device : devices)
    {
        device->attach(nullptr);
        try
        {
            store_->remove(device->identity());
        }
        catch (const std::exception &ex)
        {
            log::warn("could not remove reliability profile for " + device->identity() + ": " + ex.what());
        }
    }
    log::info("[DETECT] Forgot " + std::to_string(devices.size()) + " known device(s)");
    return true;
}

// ==================== DeviceHost ====================

bool DetectionOrchestrator::isCategoryAllowed(TransportCategory category) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    switch (category)
    {
    case TransportCategory::Serial: return config_.allowSerial;
    case TransportCategory::Bluetooth: return config_.allowBluetooth;
    case TransportCategory::Multiplexer: return config_.allowMultiplexer;
    }
    return false;
}

bool DetectionOrchestrator::isRadioAvailable(TransportCategory category) const
{
    bool sawEnumerator = false;
    for (const auto &enumerator : enumerators_)
    {
        if (enumerator->category() != category)
            continue;
        sawEnumerator = true;
        if (enumerator->isAvailable())
            return true;
    }
    return !sawEnumerator;
}

void DetectionOrchestrator::onAttemptStarted(const std::shared_ptr<Device> &device)
{
    CallbackScope scope;
    emit([&device](DetectionObserver &o) { o.onAttemptStarted(device); });
}

void DetectionOrchestrator::onAttemptFailed(const std::shared_ptr<Device> &device, const DeviceError &error)
{
    CallbackScope scope;
    // A device that failed a real sniff is no longer confirmed; a policy skip says nothing.
    if (error.kind() != ErrorKind::PolicyExcluded)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        confirmed_.erase(std::remove_if(confirmed_.begin(), confirmed_.end(),
                                        [&device](const RankedDevice &e) {
                                            return e.device->identity() == device->identity();
                                        }),
                         confirmed_.end());
    }
    emit([&device, &error](DetectionObserver &o) { o.onAttemptFailed(device, error); });
}

void DetectionOrchestrator::onConfirmed(const std::shared_ptr<Device> &device)
{
    CallbackScope scope;
    registerConfirmed(device);
}

// ==================== Session ====================

bool DetectionOrchestrator::mergeDevice(const std::shared_ptr<Device> &device, const DetectionConfig &cfg)
{
    if (!device)
        return false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &known : known_)
        {
            if (known->identity() == device->identity())
                return false;
        }
        known_.push_back(device);
    }
    device->setMaximumAllowedFailures(cfg.maximumAllowedFailures);
    device->attach(this);
    return true;
}

void DetectionOrchestrator::mergeCandidates(const DetectionConfig &cfg)
{
    for (const auto &enumerator : enumerators_)
    {
        try
        {
            for (const auto &device : enumerator->listCandidates())
                mergeDevice(device, cfg);
        }
        catch (const std::exception &ex)
        {
            log::warn(std::string("[DETECT] ") + categoryName(enumerator->category()) +
                      " enumeration failed: " + ex.what());
        }
    }

    // Devices kept from earlier sessions pick up the current failure budget.
    for (const auto &device : knownDevices())
    {
        device->setMaximumAllowedFailures(cfg.maximumAllowedFailures);
        device->attach(this);
    }
}

void DetectionOrchestrator::launch(const std::shared_ptr<Device> &device)
{
    try
    {
        auto signal = device->beginDetection();
        std::lock_guard<std::mutex> lock(mutex_);
        outstanding_.push_back(signal);
    }
    catch (const std::exception &ex)
    {
        log::warn("[DETECT] could not start detection on " + device->identity() + ": " + ex.what());
    }
}

std::vector<std::shared_ptr<Device>> DetectionOrchestrator::launchCategory(TransportCategory category)
{
    std::vector<std::shared_ptr<Device>> launched;
    for (const auto &device : knownDevices())
    {
        if (cancelRequested_.load())
            break;
        if (device->category() != category)
            continue;
        launch(device);
        launched.push_back(device);
    }
    return launched;
}

void DetectionOrchestrator::runExhaustiveScan(const DetectionConfig &cfg)
{
    for (int n = 0; n < cfg.maxSerialPortNumber && !cancelRequested_.load(); ++n)
    {
        for (const auto &enumerator : enumerators_)
        {
            if (enumerator->category() != TransportCategory::Serial)
                continue;
            std::shared_ptr<Device> device;
            try
            {
                device = enumerator->createForPortNumber(n);
            }
            catch (const std::exception &ex)
            {
                log::warn("[DETECT] exhaustive scan of port " + std::to_string(n) + " failed: " + ex.what());
            }
            if (mergeDevice(device, cfg))
                launch(device);
        }
    }
}

void DetectionOrchestrator::runDiscovery(const DetectionConfig &cfg)
{
    for (const auto &enumerator : enumerators_)
    {
        if (cancelRequested_.load())
            return;
        if (!enumerator->supportsDiscovery() || !isCategoryAllowed(enumerator->category()))
            continue;
        if (!enumerator->isAvailable())
            continue;
        try
        {
            enumerator->discover(
                [this, &cfg](const std::shared_ptr<Device> &device) {
                    if (!mergeDevice(device, cfg))
                        return;
                    emit([&device](DetectionObserver &o) { o.onDeviceDiscovered(device); });
                    launch(device);
                },
                cancelRequested_);
        }
        catch (const std::exception &ex)
        {
            log::warn(std::string("[DETECT] ") + categoryName(enumerator->category()) +
                      " discovery failed: " + ex.what());
        }
    }
}

std::vector<std::shared_ptr<CompletionSignal>> DetectionOrchestrator::outstandingSignals() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return outstanding_;
}

bool DetectionOrchestrator::waitSignals(const std::vector<std::shared_ptr<CompletionSignal>> &signals)
{
    for (const auto &signal : signals)
    {
        while (!signal->waitFor(kSignalPoll))
        {
            if (cancelRequested_.load())
                return false;
        }
    }
    return !cancelRequested_.load();
}

void DetectionOrchestrator::finishCanceled(const DetectionConfig &cfg)
{
    for (const auto &device : knownDevices())
        device->cancelDetection();

    auto deadline = std::chrono::steady_clock::now() + cfg.cancelAcknowledgeTimeout;
    size_t stuck = 0;
    for (const auto &signal : outstandingSignals())
    {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (!signal->waitFor(std::max(left, std::chrono::milliseconds(0))))
            ++stuck;
    }
    if (stuck > 0)
        log::warn("[DETECT] " + std::to_string(stuck) + " device(s) did not acknowledge cancellation");

    // Observers hear about the end before waiters are released.
    emit([](DetectionObserver &o) { o.onDetectionCanceled(); });
    {
        std::lock_guard<std::mutex> lock(mutex_);
        phase_ = SessionPhase::Canceled;
        sessionThreadId_ = std::thread::id();
    }
    cv_.notify_all();
}

void DetectionOrchestrator::runSession(DetectionConfig cfg)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessionThreadId_ = std::this_thread::get_id();
        phase_ = SessionPhase::Running;
    }
    cv_.notify_all();
    lowerThreadPriority();

    emit([](DetectionObserver &o) { o.onDetectionStarted(); });
    mergeCandidates(cfg);

    // Multiplexers already own the receiver; try them before touching the ports.
    if (cfg.allowMultiplexer && !cancelRequested_.load())
    {
        launchCategory(TransportCategory::Multiplexer);
        waitSignals(outstandingSignals());
    }

    std::vector<std::shared_ptr<Device>> wired;
    if (cfg.allowSerial && !cancelRequested_.load())
    {
        wired = launchCategory(TransportCategory::Serial);
        if (cfg.allowExhaustiveSerialScan)
            runExhaustiveScan(cfg);
    }

    // Some stacks serialize radio I/O behind tty opens.
    if (cfg.allowBluetooth && !cancelRequested_.load())
    {
        auto deadline = std::chrono::steady_clock::now() + kWiredOpenWait;
        for (const auto &device : wired)
        {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0 || cancelRequested_.load())
                break;
            device->waitUntilOpened(left);
        }
        if (isRadioAvailable(TransportCategory::Bluetooth))
            launchCategory(TransportCategory::Bluetooth);
        else
            log::info("[DETECT] Bluetooth is turned off, skipping Bluetooth devices");
    }

    if (!cancelRequested_.load())
        runDiscovery(cfg);

    // Discovery may have added signals; keep waiting until the list stops growing.
    size_t waited = 0;
    while (!cancelRequested_.load())
    {
        auto signals = outstandingSignals();
        if (waited == signals.size())
            break;
        waitSignals(signals);
        waited = signals.size();
    }

    if (cancelRequested_.load())
    {
        finishCanceled(cfg);
        return;
    }

    log::debug("[DETECT] session finished with " + std::to_string(confirmedDevices().size()) + " confirmed device(s)");
    emit([](DetectionObserver &o) { o.onDetectionCompleted(); });
    {
        std::lock_guard<std::mutex> lock(mutex_);
        phase_ = SessionPhase::Completed;
        sessionThreadId_ = std::thread::id();
    }
    cv_.notify_all();
}

void DetectionOrchestrator::runWatchdog(uint64_t generation, std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    bool ended = cv_.wait_for(lock, timeout, [this, generation]() {
        return shuttingDown_ || generation_ != generation || !inProgressLocked() || cancelRequested_.load();
    });
    if (ended)
        return;
    lock.unlock();
    log::warn("[DETECT] detection exceeded " + std::to_string(timeout.count()) + " ms, canceling");
    requestCancel();
}

} // namespace nmeascout
