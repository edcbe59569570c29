#include "reliability_profile.hpp"
#include "log.hpp"
#include <cstdio>
#include <opencv2/core.hpp>
#include <stdexcept>

namespace nmeascout
{

// ==================== MemoryProfileStore ====================

std::optional<ReliabilityProfile> MemoryProfileStore::read(const std::string &identity)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = profiles_.find(identity);
    if (it == profiles_.end())
        return std::nullopt;
    return it->second;
}

void MemoryProfileStore::write(const std::string &identity, const ReliabilityProfile &profile)
{
    std::lock_guard<std::mutex> lock(mutex_);
    profiles_[identity] = profile;
}

void MemoryProfileStore::remove(const std::string &identity)
{
    std::lock_guard<std::mutex> lock(mutex_);
    profiles_.erase(identity);
}

size_t MemoryProfileStore::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return profiles_.size();
}

// ==================== YamlProfileStore ====================

static double toEpochSeconds(const Timestamp &t)
{
    return std::chrono::duration<double>(t.time_since_epoch()).count();
}

static Timestamp fromEpochSeconds(double seconds)
{
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::duration<double>(seconds)));
}

YamlProfileStore::YamlProfileStore(const std::string &path) : path_(path)
{
    load();
}

void YamlProfileStore::load()
{
    try
    {
        cv::FileStorage fs(path_, cv::FileStorage::READ);
        if (!fs.isOpened())
            return;
        cv::FileNode devices = fs["devices"];
        if (devices.type() != cv::FileNode::SEQ)
            return;
        for (cv::FileNodeIterator it = devices.begin(); it != devices.end(); ++it)
        {
            cv::FileNode node = *it;
            std::string identity;
            node["identity"] >> identity;
            if (identity.empty())
                continue;

            ReliabilityProfile p;
            int success = 0, fail = 0, baud = 0;
            double detected = 0.0, connected = 0.0;
            node["friendly_name"] >> p.friendlyName;
            node["success_count"] >> success;
            node["fail_count"] >> fail;
            node["last_success_baud"] >> baud;
            node["last_detected_at"] >> detected;
            node["last_connected_at"] >> connected;
            p.successCount = success > 0 ? static_cast<unsigned>(success) : 0;
            p.failCount = fail > 0 ? static_cast<unsigned>(fail) : 0;
            if (baud > 0)
                p.lastSuccessBaud = baud;
            if (detected > 0.0)
                p.lastDetectedAt = fromEpochSeconds(detected);
            if (connected > 0.0)
                p.lastConnectedAt = fromEpochSeconds(connected);
            profiles_[identity] = p;
        }
        log::debug("[PROFILE] loaded " + std::to_string(profiles_.size()) + " entries from " + path_);
    }
    catch (const cv::Exception &ex)
    {
        log::warn("profile store " + path_ + " is unreadable, starting empty (" + ex.what() + ")");
        profiles_.clear();
    }
}

void YamlProfileStore::flush()
{
    // Write to temp then rename atomically
    std::string tmpPath = path_ + ".tmp.yml";
    try
    {
        cv::FileStorage fs(tmpPath, cv::FileStorage::WRITE | cv::FileStorage::FORMAT_YAML);
        if (!fs.isOpened())
            throw std::runtime_error("cannot open " + tmpPath + " for writing");
        fs << "devices" << "[";
        for (const auto &kv : profiles_)
        {
            const ReliabilityProfile &p = kv.second;
            fs << "{";
            fs << "identity" << kv.first;
            fs << "friendly_name" << p.friendlyName;
            fs << "success_count" << static_cast<int>(p.successCount);
            fs << "fail_count" << static_cast<int>(p.failCount);
            fs << "last_success_baud" << p.lastSuccessBaud.value_or(0);
            fs << "last_detected_at" << (p.lastDetectedAt ? toEpochSeconds(*p.lastDetectedAt) : 0.0);
            fs << "last_connected_at" << (p.lastConnectedAt ? toEpochSeconds(*p.lastConnectedAt) : 0.0);
            fs << "}";
        }
        fs << "]";
        fs.release();
    }
    catch (const cv::Exception &ex)
    {
        throw std::runtime_error("cannot write profile store " + tmpPath + ": " + ex.what());
    }
    if (std::rename(tmpPath.c_str(), path_.c_str()) != 0)
        throw std::runtime_error("cannot replace profile store " + path_);
}

std::optional<ReliabilityProfile> YamlProfileStore::read(const std::string &identity)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = profiles_.find(identity);
    if (it == profiles_.end())
        return std::nullopt;
    return it->second;
}

void YamlProfileStore::write(const std::string &identity, const ReliabilityProfile &profile)
{
    std::lock_guard<std::mutex> lock(mutex_);
    profiles_[identity] = profile;
    flush();
}

void YamlProfileStore::remove(const std::string &identity)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (profiles_.erase(identity) == 0)
        return;
    flush();
}

} // namespace nmeascout
