#include "log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace nmeascout
{
namespace log
{
static std::atomic<bool> gVerbose{false};
static std::mutex gConsoleMutex;

void setVerbose(bool enabled)
{
    gVerbose.store(enabled);
}

void info(const std::string &line)
{
    std::lock_guard<std::mutex> lock(gConsoleMutex);
    std::cout << line << "\n";
}

void ok(const std::string &line)
{
    std::lock_guard<std::mutex> lock(gConsoleMutex);
    std::cout << "✓ " << line << "\n";
}

void debug(const std::string &line)
{
    if (!gVerbose.load())
        return;
    std::lock_guard<std::mutex> lock(gConsoleMutex);
    std::cout << "  · " << line << "\n";
}

void warn(const std::string &line)
{
    std::lock_guard<std::mutex> lock(gConsoleMutex);
    std::cerr << "WARN: " << line << "\n";
}

void error(const std::string &line)
{
    std::lock_guard<std::mutex> lock(gConsoleMutex);
    std::cerr << "ERROR: " << line << "\n";
}
} // namespace log
} // namespace nmeascout
