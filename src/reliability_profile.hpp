#pragma once
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace nmeascout
{

using Timestamp = std::chrono::system_clock::time_point;

// ==================== Reliability Profile ====================
// Per-device detection history used for ordering and for picking the first baud rate.
struct ReliabilityProfile {
    unsigned successCount;
    unsigned failCount;
    std::optional<int> lastSuccessBaud;
    std::optional<Timestamp> lastDetectedAt;
    std::optional<Timestamp> lastConnectedAt;
    std::string friendlyName;

    ReliabilityProfile() : successCount(0), failCount(0) {}

    unsigned totalAttempts() const { return successCount + failCount; }

    // successCount / total, or -1.0 when the device was never tested (ranks last).
    double successRatio() const
    {
        unsigned total = totalAttempts();
        if (total == 0)
            return -1.0;
        return static_cast<double>(successCount) / static_cast<double>(total);
    }
};

// ==================== Profile Store ====================
// Durable key-value home for profiles, keyed by device identity.
class ProfileStore {
public:
    virtual ~ProfileStore() = default;

    virtual std::optional<ReliabilityProfile> read(const std::string &identity) = 0;
    // May throw on I/O failure; callers treat persistence as best-effort.
    virtual void write(const std::string &identity, const ReliabilityProfile &profile) = 0;
    virtual void remove(const std::string &identity) = 0;
};

class MemoryProfileStore : public ProfileStore {
public:
    std::optional<ReliabilityProfile> read(const std::string &identity) override;
    void write(const std::string &identity, const ReliabilityProfile &profile) override;
    void remove(const std::string &identity) override;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, ReliabilityProfile> profiles_;
};

// YAML file through cv::FileStorage. The whole file is rewritten on each change
// (temp file then rename) so a crash never leaves a truncated store behind.
class YamlProfileStore : public ProfileStore {
public:
    explicit YamlProfileStore(const std::string &path);

    std::optional<ReliabilityProfile> read(const std::string &identity) override;
    void write(const std::string &identity, const ReliabilityProfile &profile) override;
    void remove(const std::string &identity) override;

    const std::string &path() const { return path_; }

private:
    std::string path_;
    std::mutex mutex_;
    std::map<std::string, ReliabilityProfile> profiles_;

    void load();
    void flush();  // caller holds mutex_
};

} // namespace nmeascout
