#include "multiplexer_device.hpp"
#include "log.hpp"
#include "socket_channel.hpp"
#include <stdexcept>

namespace nmeascout
{

static const char *kGpsdWatch = "?WATCH={\"enable\":true,\"nmea\":true}\n";

static PlatformMultiplexerDevice::Factory socketFactory(const std::string &address)
{
    std::string host;
    int port = 0;
    if (!SocketChannel::splitAddress(address, host, port))
        throw std::invalid_argument("multiplexer address must be host:port, got '" + address + "'");
    return [host, port]() { return std::make_unique<SocketChannel>(host, port); };
}

PlatformMultiplexerDevice::PlatformMultiplexerDevice(const std::string &address, std::shared_ptr<ProfileStore> store)
    : PlatformMultiplexerDevice(address, std::move(store), socketFactory(address))
{
}

PlatformMultiplexerDevice::PlatformMultiplexerDevice(const std::string &address, std::shared_ptr<ProfileStore> store,
                                                     Factory factory)
    : Device(address, TransportCategory::Multiplexer, std::move(store)),
      factory_(std::move(factory)), watchCommand_(kGpsdWatch)
{
    std::atomic_store(&channel_, std::shared_ptr<ByteChannel>(factory_()));
}

PlatformMultiplexerDevice::~PlatformMultiplexerDevice()
{
    shutdownDetection();
}

std::shared_ptr<ByteChannel> PlatformMultiplexerDevice::channel() const
{
    auto ch = std::atomic_load(&channel_);
    if (!isOpen() || !ch)
        return nullptr;
    return ch;
}

void PlatformMultiplexerDevice::sendWatch(ByteChannel &channel)
{
    if (watchCommand_.empty())
        return;
    if (!channel.write(watchCommand_.data(), watchCommand_.size()))
        log::debug("[DETECT] " + identity() + ": watch command not accepted");
}

void PlatformMultiplexerDevice::openChannel()
{
    auto ch = std::atomic_load(&channel_);
    if (!ch)
        throw DeviceError(ErrorKind::TransportUnavailable, identity(), identity() + ": no channel");
    ch->open();
    sendWatch(*ch);
}

void PlatformMultiplexerDevice::closeChannel()
{
    auto ch = std::atomic_load(&channel_);
    if (ch)
        ch->close();
}

void PlatformMultiplexerDevice::interruptChannel()
{
    auto ch = std::atomic_load(&channel_);
    if (ch)
        ch->interrupt();
}

void PlatformMultiplexerDevice::rebuildChannel()
{
    std::atomic_store(&channel_, std::shared_ptr<ByteChannel>(factory_()));
}

DetectionOutcome PlatformMultiplexerDevice::sniff(const std::atomic<bool> &cancel)
{
    auto ch = std::atomic_load(&channel_);
    if (!ch)
        return DetectionOutcome::transportError(name() + ": no channel");
    ProtocolSniffer sniffer(settings_);
    return sniffer.confirmSentences(*ch, cancel, name());
}

} // namespace nmeascout
