#pragma once
#include "byte_channel.hpp"
#include "device.hpp"
#include "protocol_sniffer.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace nmeascout
{

using ChannelFactory = std::function<std::unique_ptr<ByteChannel>()>;

// ==================== Serial Device ====================
// A tty that may stream NMEA sentences at an unknown baud rate.
class SerialDevice : public Device {
public:
    SerialDevice(const std::string &portPath, std::shared_ptr<ProfileStore> store, int defaultBaud = 4800);
    // Channel built by `factory` (tests, alternative transports).
    SerialDevice(const std::string &portPath, std::shared_ptr<ProfileStore> store, ChannelFactory factory);
    ~SerialDevice() override;

    const std::string &portPath() const { return portPath_; }

    TransportCategory policyCategory() const override;

    void setSnifferSettings(const SnifferSettings &settings);
    SnifferSettings snifferSettings() const;

    // Open channel for the caller that acquired this device; nullptr when closed.
    std::shared_ptr<ByteChannel> channel() const;

protected:
    SerialDevice(const std::string &identity, const std::string &portPath, TransportCategory category,
                 std::shared_ptr<ProfileStore> store, ChannelFactory factory);

    void openChannel() override;
    void closeChannel() override;
    void interruptChannel() override;
    void rebuildChannel() override;
    DetectionOutcome sniff(const std::atomic<bool> &cancel) override;
    void prepareForConnection() override;

private:
    std::string portPath_;
    ChannelFactory factory_;
    std::shared_ptr<ByteChannel> channel_;  // std::atomic_load/atomic_store; interrupt comes from other threads

    mutable std::mutex settingsMutex_;
    SnifferSettings settings_;

    std::shared_ptr<ByteChannel> currentChannel() const { return std::atomic_load(&channel_); }
};

// ==================== Bluetooth Virtual Device ====================
// Paired Bluetooth receiver reached through its bound RFCOMM tty.
// Identity is the hardware address so rebinding to another rfcomm index keeps the profile.
class BluetoothVirtualDevice : public SerialDevice {
public:
    BluetoothVirtualDevice(const std::string &address, const std::string &rfcommPath,
                           std::shared_ptr<ProfileStore> store);
    BluetoothVirtualDevice(const std::string &address, const std::string &rfcommPath,
                           std::shared_ptr<ProfileStore> store, ChannelFactory factory);
    ~BluetoothVirtualDevice() override;

    const std::string &address() const { return identity(); }

    TransportCategory policyCategory() const override { return TransportCategory::Bluetooth; }
};

} // namespace nmeascout
