#include "serial_device.hpp"
#include "serial_transport.hpp"
#include <algorithm>
#include <cctype>

namespace nmeascout
{

static ChannelFactory ttyFactory(const std::string &portPath, int baud)
{
    return [portPath, baud]() { return std::make_unique<SerialTransport>(portPath, baud); };
}

static std::string lowercase(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

SerialDevice::SerialDevice(const std::string &portPath, std::shared_ptr<ProfileStore> store, int defaultBaud)
    : SerialDevice(portPath, portPath, TransportCategory::Serial, std::move(store), ttyFactory(portPath, defaultBaud))
{
}

SerialDevice::SerialDevice(const std::string &portPath, std::shared_ptr<ProfileStore> store, ChannelFactory factory)
    : SerialDevice(portPath, portPath, TransportCategory::Serial, std::move(store), std::move(factory))
{
}

SerialDevice::SerialDevice(const std::string &identity, const std::string &portPath, TransportCategory category,
                           std::shared_ptr<ProfileStore> store, ChannelFactory factory)
    : Device(identity, category, std::move(store)), portPath_(portPath), factory_(std::move(factory))
{
    std::atomic_store(&channel_, std::shared_ptr<ByteChannel>(factory_()));
}

SerialDevice::~SerialDevice()
{
    shutdownDetection();
}

TransportCategory SerialDevice::policyCategory() const
{
    // rfcomm ttys and USB dongles announcing themselves as Bluetooth bridges
    if (lowercase(name()).find("bluetooth") != std::string::npos ||
        portPath_.find("rfcomm") != std::string::npos)
        return TransportCategory::Bluetooth;
    return category();
}

void SerialDevice::setSnifferSettings(const SnifferSettings &settings)
{
    std::lock_guard<std::mutex> lock(settingsMutex_);
    settings_ = settings;
}

SnifferSettings SerialDevice::snifferSettings() const
{
    std::lock_guard<std::mutex> lock(settingsMutex_);
    return settings_;
}

std::shared_ptr<ByteChannel> SerialDevice::channel() const
{
    auto ch = currentChannel();
    if (!isOpen() || !ch)
        return nullptr;
    return ch;
}

void SerialDevice::openChannel()
{
    auto ch = currentChannel();
    if (!ch)
        throw DeviceError(ErrorKind::TransportUnavailable, identity(), portPath_ + ": no channel");
    ch->open();
}

void SerialDevice::closeChannel()
{
    auto ch = currentChannel();
    if (ch)
        ch->close();
}

void SerialDevice::interruptChannel()
{
    auto ch = currentChannel();
    if (ch)
        ch->interrupt();
}

void SerialDevice::rebuildChannel()
{
    std::atomic_store(&channel_, std::shared_ptr<ByteChannel>(factory_()));
}

DetectionOutcome SerialDevice::sniff(const std::atomic<bool> &cancel)
{
    auto ch = currentChannel();
    if (!ch)
        return DetectionOutcome::transportError(name() + ": no channel");
    ProtocolSniffer sniffer(snifferSettings());
    return sniffer.sniff(*ch, lastSuccessBaud(), cancel, name());
}

void SerialDevice::prepareForConnection()
{
    auto ch = currentChannel();
    auto baud = lastSuccessBaud();
    if (ch && baud)
        ch->setBaudRate(*baud);
}

// ==================== Bluetooth ====================

BluetoothVirtualDevice::BluetoothVirtualDevice(const std::string &address, const std::string &rfcommPath,
                                               std::shared_ptr<ProfileStore> store)
    : SerialDevice(address, rfcommPath, TransportCategory::Bluetooth, std::move(store), ttyFactory(rfcommPath, 115200))
{
}

BluetoothVirtualDevice::BluetoothVirtualDevice(const std::string &address, const std::string &rfcommPath,
                                               std::shared_ptr<ProfileStore> store, ChannelFactory factory)
    : SerialDevice(address, rfcommPath, TransportCategory::Bluetooth, std::move(store), std::move(factory))
{
}

BluetoothVirtualDevice::~BluetoothVirtualDevice()
{
    shutdownDetection();
}

} // namespace nmeascout
