#include "device.hpp"
#include "log.hpp"

namespace nmeascout
{

const char *categoryName(TransportCategory category)
{
    switch (category)
    {
    case TransportCategory::Serial: return "serial";
    case TransportCategory::Bluetooth: return "Bluetooth";
    case TransportCategory::Multiplexer: return "multiplexer";
    }
    return "unknown";
}

const char *deviceStateName(DeviceState state)
{
    switch (state)
    {
    case DeviceState::Idle: return "idle";
    case DeviceState::Opening: return "opening";
    case DeviceState::Sniffing: return "sniffing";
    case DeviceState::Confirmed: return "confirmed";
    case DeviceState::Rejected: return "rejected";
    case DeviceState::Canceling: return "canceling";
    }
    return "unknown";
}

Device::Device(const std::string &identity, TransportCategory category, std::shared_ptr<ProfileStore> store)
    : identity_(identity), category_(category), store_(std::move(store)),
      state_(DeviceState::Idle), allowConnections_(true), confirmed_(false), detecting_(false),
      maximumAllowedFailures_(100), cancel_(false), channelOpen_(false), host_(nullptr)
{
    if (!store_)
        store_ = std::make_shared<MemoryProfileStore>();
    try
    {
        auto cached = store_->read(identity_);
        if (cached)
            profile_ = *cached;
        else
            store_->write(identity_, profile_);
    }
    catch (const std::exception &ex)
    {
        log::warn("could not load reliability profile for " + identity_ + ": " + ex.what());
    }
}

Device::~Device()
{
    // Derived destructors already canceled; only the thread is left to reap.
    std::lock_guard<std::mutex> lock(threadMutex_);
    if (!thread_.joinable())
        return;
    if (thread_.get_id() == std::this_thread::get_id())
        thread_.detach();
    else
        thread_.join();
}

void Device::shutdownDetection()
{
    cancelDetection();
    std::lock_guard<std::mutex> lock(threadMutex_);
    if (!thread_.joinable())
        return;
    // The worker may hold the last reference and be running this destructor.
    if (thread_.get_id() == std::this_thread::get_id())
        thread_.detach();
    else
        thread_.join();
}

// ==================== Attributes ====================

std::string Device::name() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return profile_.friendlyName.empty() ? identity_ : profile_.friendlyName;
}

void Device::setName(const std::string &friendlyName)
{
    std::lock_guard<std::mutex> lock(mutex_);
    profile_.friendlyName = friendlyName;
}

bool Device::allowConnections() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return allowConnections_;
}

void Device::setAllowConnections(bool allow)
{
    std::lock_guard<std::mutex> lock(mutex_);
    allowConnections_ = allow;
}

int Device::maximumAllowedFailures() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return maximumAllowedFailures_;
}

void Device::setMaximumAllowedFailures(int failures)
{
    std::lock_guard<std::mutex> lock(mutex_);
    maximumAllowedFailures_ = failures;
}

DeviceState Device::state() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool Device::isDetectionInProgress() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return detecting_;
}

bool Device::isConfirmed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return confirmed_;
}

ReliabilityProfile Device::profile() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return profile_;
}

std::optional<int> Device::lastSuccessBaud() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return profile_.lastSuccessBaud;
}

void Device::attach(DeviceHost *host)
{
    std::lock_guard<std::mutex> lock(hostMutex_);
    host_ = host;
}

void Device::setState(DeviceState state)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Cancellation wins over forward progress.
        if (state_ == DeviceState::Canceling && (state == DeviceState::Opening || state == DeviceState::Sniffing))
            return;
        state_ = state;
    }
    stateCv_.notify_all();
}

// ==================== Detection ====================

bool Device::beginAttempt(std::shared_ptr<CompletionSignal> &signal)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (detecting_)
        {
            signal = signal_;
            return false;
        }
        detecting_ = true;
        cancel_.store(false);
        signal_ = std::make_shared<CompletionSignal>();
        state_ = DeviceState::Opening;
        signal = signal_;
    }
    stateCv_.notify_all();
    return true;
}

std::shared_ptr<CompletionSignal> Device::beginDetection()
{
    auto self = shared_from_this();
    std::shared_ptr<CompletionSignal> signal;
    if (!beginAttempt(signal))
        return signal;

    std::lock_guard<std::mutex> lock(threadMutex_);
    if (thread_.joinable())
    {
        // The previous attempt already finished; reap it.
        if (thread_.get_id() == std::this_thread::get_id())
            thread_.detach();
        else
            thread_.join();
    }
    thread_ = std::thread([self, signal]() {
        DetectionOutcome outcome;
        try
        {
            outcome = self->runAttempt();
        }
        catch (const std::exception &ex)
        {
            outcome = DetectionOutcome::transportError(self->name() + ": " + ex.what());
        }
        self->finishAttempt(outcome, signal);
    });
    return signal;
}

DetectionOutcome Device::detectProtocol()
{
    std::shared_ptr<CompletionSignal> signal;
    if (!beginAttempt(signal))
        return DetectionOutcome::excluded(name() + " is already being tested");

    DetectionOutcome outcome;
    try
    {
        outcome = runAttempt();
    }
    catch (const std::exception &ex)
    {
        outcome = DetectionOutcome::transportError(name() + ": " + ex.what());
    }
    finishAttempt(outcome, signal);
    return outcome;
}

std::optional<DetectionOutcome> Device::checkPolicy()
{
    bool allow;
    int maxFailures;
    ReliabilityProfile p;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        allow = allowConnections_;
        maxFailures = maximumAllowedFailures_;
        p = profile_;
    }
    const std::string label = p.friendlyName.empty() ? identity_ : p.friendlyName;

    if (!allow)
        return DetectionOutcome::excluded(label + " is excluded from testing");

    TransportCategory pc = policyCategory();
    {
        std::lock_guard<std::mutex> lock(hostMutex_);
        if (host_ != nullptr)
        {
            if (!host_->isCategoryAllowed(pc))
                return DetectionOutcome::excluded(label + " will not be tested because " + categoryName(pc) +
                                                  " devices are currently excluded");
            if (pc == TransportCategory::Bluetooth && !host_->isRadioAvailable(pc))
                return DetectionOutcome::excluded(label + " will not be tested because Bluetooth is turned off");
        }
    }

    if (p.successCount == 0 && p.failCount >= static_cast<unsigned>(maxFailures))
        return DetectionOutcome::excluded(label + " will not be tested because it has failed detection " +
                                          std::to_string(p.failCount) + " times with no success");

    return std::nullopt;
}

DetectionOutcome Device::runAttempt()
{
    notifyAttemptStarted();

    auto excluded = checkPolicy();
    if (excluded)
        return *excluded;

    if (cancel_.load())
        return DetectionOutcome::canceled(name() + " detection was canceled");

    std::lock_guard<std::mutex> channelLock(channelMutex_);
    if (!channelOpen_.load())
    {
        try
        {
            openChannel();
            channelOpen_.store(true);
        }
        catch (const DeviceError &ex)
        {
            if (cancel_.load())
                return DetectionOutcome::canceled(name() + " detection was canceled while opening");
            return DetectionOutcome::transportError(name() + " could not be opened: " + ex.what(), ex.kind());
        }
    }

    DetectionOutcome outcome;
    if (cancel_.load())
    {
        outcome = DetectionOutcome::canceled(name() + " detection was canceled");
    }
    else
    {
        setState(DeviceState::Sniffing);
        outcome = sniff(cancel_);
    }

    // A confirmed channel stays open when someone is waiting to use it.
    bool keepOpen = outcome.isConfirmed() && !cancel_.load() && hostNeedsStream();
    if (!keepOpen)
    {
        closeChannel();
        channelOpen_.store(false);
    }
    return outcome;
}

void Device::finishAttempt(const DetectionOutcome &outcome, const std::shared_ptr<CompletionSignal> &signal)
{
    recordOutcome(outcome);

    if (outcome.kind != DetectionOutcome::Kind::Excluded && outcome.kind != DetectionOutcome::Kind::Canceled)
        persist();

    if (outcome.isConfirmed())
    {
        log::debug("[DETECT] " + name() + " confirmed at " + std::to_string(outcome.baud) + " baud");
        notifyConfirmed();
    }
    else if (outcome.kind != DetectionOutcome::Kind::Canceled)
    {
        log::debug("[DETECT] " + name() + " " + outcomeKindName(outcome.kind) + ": " + outcome.reason);
        notifyAttemptFailed(outcome);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        detecting_ = false;
        cancel_.store(false);
    }
    stateCv_.notify_all();
    signal->set();
}

void Device::recordOutcome(const DetectionOutcome &outcome)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        switch (outcome.kind)
        {
        case DetectionOutcome::Kind::Confirmed:
            ++profile_.successCount;
            profile_.lastDetectedAt = std::chrono::system_clock::now();
            if (outcome.baud > 0)
                profile_.lastSuccessBaud = outcome.baud;
            confirmed_ = true;
            state_ = DeviceState::Confirmed;
            break;
        case DetectionOutcome::Kind::Rejected:
        case DetectionOutcome::Kind::TransportError:
            ++profile_.failCount;
            confirmed_ = false;
            state_ = DeviceState::Rejected;
            break;
        case DetectionOutcome::Kind::Excluded:
        case DetectionOutcome::Kind::Canceled:
            state_ = DeviceState::Idle;
            break;
        }
    }
    stateCv_.notify_all();
}

void Device::persist()
{
    ReliabilityProfile snapshot = profile();
    try
    {
        store_->write(identity_, snapshot);
    }
    catch (const std::exception &ex)
    {
        log::warn("could not save reliability profile for " + identity_ + ": " + ex.what());
    }
}

void Device::cancelDetection()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!detecting_)
            return;
        cancel_.store(true);
        state_ = DeviceState::Canceling;
    }
    stateCv_.notify_all();
    interruptChannel();
}

bool Device::waitForDetection(std::chrono::milliseconds timeout)
{
    std::shared_ptr<CompletionSignal> signal;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!detecting_ || !signal_)
            return true;
        signal = signal_;
    }
    return signal->waitFor(timeout);
}

bool Device::waitUntilOpened(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    return stateCv_.wait_for(lock, timeout, [this]() {
        return !detecting_ || state_ != DeviceState::Opening;
    });
}

// ==================== Channel use ====================

void Device::reset()
{
    std::lock_guard<std::mutex> channelLock(channelMutex_);
    closeChannel();
    channelOpen_.store(false);
    rebuildChannel();
}

void Device::undetect()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        confirmed_ = false;
        profile_.lastSuccessBaud.reset();
        if (!detecting_)
            state_ = DeviceState::Idle;
    }
    try
    {
        store_->remove(identity_);
    }
    catch (const std::exception &ex)
    {
        log::warn("could not remove reliability profile for " + identity_ + ": " + ex.what());
    }
}

void Device::open()
{
    {
        std::lock_guard<std::mutex> channelLock(channelMutex_);
        if (!channelOpen_.load())
        {
            prepareForConnection();
            openChannel();
            channelOpen_.store(true);
        }
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        profile_.lastConnectedAt = std::chrono::system_clock::now();
    }
    persist();
}

void Device::close()
{
    std::lock_guard<std::mutex> channelLock(channelMutex_);
    if (channelOpen_.load())
        closeChannel();
    channelOpen_.store(false);
}

// ==================== Host notifications ====================

bool Device::hostNeedsStream()
{
    std::lock_guard<std::mutex> lock(hostMutex_);
    return host_ != nullptr && host_->isStreamNeeded();
}

void Device::notifyAttemptStarted()
{
    auto self = weak_from_this().lock();
    if (!self)
        return;
    std::lock_guard<std::mutex> lock(hostMutex_);
    if (host_ != nullptr)
        host_->onAttemptStarted(self);
}

void Device::notifyAttemptFailed(const DetectionOutcome &outcome)
{
    auto self = weak_from_this().lock();
    if (!self)
        return;
    DeviceError error(outcome.errorKind, identity_, outcome.reason);
    std::lock_guard<std::mutex> lock(hostMutex_);
    if (host_ != nullptr)
        host_->onAttemptFailed(self, error);
}

void Device::notifyConfirmed()
{
    auto self = weak_from_this().lock();
    if (!self)
        return;
    std::lock_guard<std::mutex> lock(hostMutex_);
    if (host_ != nullptr)
        host_->onConfirmed(self);
}

} // namespace nmeascout
