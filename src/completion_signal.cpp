#include "completion_signal.hpp"

namespace nmeascout
{

void CompletionSignal::set()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        set_ = true;
    }
    cv_.notify_all();
}

bool CompletionSignal::waitFor(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return set_; });
}

} // namespace nmeascout
