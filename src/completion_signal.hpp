#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace nmeascout
{

// Manual-reset event: once set, every waiter (present and future) passes.
class CompletionSignal {
public:
    CompletionSignal() : set_(false) {}

    void set();
    // Returns true if the signal was set within the timeout.
    bool waitFor(std::chrono::milliseconds timeout);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool set_;
};

} // namespace nmeascout
