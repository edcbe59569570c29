#pragma once
#include "protocol_sniffer.hpp"
#include "reliability_profile.hpp"
#include "transport_enumerator.hpp"
#include <memory>
#include <string>

namespace nmeascout
{

// ==================== Wired serial ====================
// /dev/ttyUSB*, /dev/ttyACM* and ttyS* ports backed by real hardware.
// Friendly names come from the /dev/serial/by-id symlinks.
class LinuxSerialEnumerator : public TransportEnumerator {
public:
    LinuxSerialEnumerator(std::shared_ptr<ProfileStore> store, const SnifferSettings &settings,
                          const std::string &exhaustivePrefix = "/dev/ttyS",
                          const std::string &devRoot = "/dev", const std::string &sysRoot = "/sys");

    TransportCategory category() const override { return TransportCategory::Serial; }
    std::vector<std::shared_ptr<Device>> listCandidates() override;
    std::shared_ptr<Device> createForPortNumber(int n) override;

private:
    std::shared_ptr<ProfileStore> store_;
    SnifferSettings settings_;
    std::string exhaustivePrefix_;
    std::string devRoot_;
    std::string sysRoot_;

    std::shared_ptr<Device> makeDevice(const std::string &path, const std::string &friendlyName) const;
};

// ==================== Bluetooth RFCOMM ====================
// Receivers bound with `rfcomm bind`; the kernel exposes the peer address in sysfs.
class RfcommEnumerator : public TransportEnumerator {
public:
    RfcommEnumerator(std::shared_ptr<ProfileStore> store, const SnifferSettings &settings,
                     const std::string &devRoot = "/dev", const std::string &sysRoot = "/sys");

    TransportCategory category() const override { return TransportCategory::Bluetooth; }
    std::vector<std::shared_ptr<Device>> listCandidates() override;
    // An adapter is present and not rfkill-blocked.
    bool isAvailable() const override;

private:
    std::shared_ptr<ProfileStore> store_;
    SnifferSettings settings_;
    std::string devRoot_;
    std::string sysRoot_;
};

// ==================== gpsd ====================
class GpsdEnumerator : public TransportEnumerator {
public:
    GpsdEnumerator(std::shared_ptr<ProfileStore> store, const SnifferSettings &settings, const std::string &address);

    TransportCategory category() const override { return TransportCategory::Multiplexer; }
    std::vector<std::shared_ptr<Device>> listCandidates() override;

private:
    std::shared_ptr<ProfileStore> store_;
    SnifferSettings settings_;
    std::string address_;
};

} // namespace nmeascout
