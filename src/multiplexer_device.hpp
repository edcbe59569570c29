#pragma once
#include "byte_channel.hpp"
#include "device.hpp"
#include "protocol_sniffer.hpp"
#include <functional>
#include <memory>
#include <string>

namespace nmeascout
{

// ==================== Platform Multiplexer Device ====================
// A daemon (gpsd) that shares one receiver between clients. It already speaks at
// a fixed rate, so detection only asks for the raw stream and checks sentences.
class PlatformMultiplexerDevice : public Device {
public:
    using Factory = std::function<std::unique_ptr<ByteChannel>()>;

    // `address` is "host:port"; throws std::invalid_argument when malformed.
    PlatformMultiplexerDevice(const std::string &address, std::shared_ptr<ProfileStore> store);
    PlatformMultiplexerDevice(const std::string &address, std::shared_ptr<ProfileStore> store, Factory factory);
    ~PlatformMultiplexerDevice() override;

    // Sent once the stream is open; empty sends nothing.
    void setWatchCommand(const std::string &command) { watchCommand_ = command; }
    const std::string &watchCommand() const { return watchCommand_; }

    void setSnifferSettings(const SnifferSettings &settings) { settings_ = settings; }

    std::shared_ptr<ByteChannel> channel() const;

protected:
    void openChannel() override;
    void closeChannel() override;
    void interruptChannel() override;
    void rebuildChannel() override;
    DetectionOutcome sniff(const std::atomic<bool> &cancel) override;

private:
    Factory factory_;
    std::shared_ptr<ByteChannel> channel_;
    std::string watchCommand_;
    SnifferSettings settings_;

    void sendWatch(ByteChannel &channel);
};

} // namespace nmeascout
