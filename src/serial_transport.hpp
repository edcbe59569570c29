#pragma once
#include "byte_channel.hpp"
#include <atomic>
#include <string>

namespace nmeascout
{

// POSIX serial transport (USB, on-board UART or Bluetooth RFCOMM).
// Open with a device path like /dev/ttyUSB0, /dev/ttyACM0, or /dev/rfcomm0
class SerialTransport : public ByteChannel {
public:
    SerialTransport(const std::string &devicePath, int baudRate);
    ~SerialTransport() override;

    void open() override;
    void close() override;
    bool isOpen() const override;

    bool setBaudRate(int baud) override;
    int baudRate() const override { return baud_; }
    void discardInput() override;

    ReadResult read(uint8_t *buffer, size_t size, int timeoutMs) override;
    bool write(const void *data, size_t len) override;

    void interrupt() override;

    const std::string &path() const override { return devicePath_; }

private:
    std::string devicePath_;
    int baud_;
    int fd_;
    int wakePipe_[2];
    std::atomic<bool> interrupted_;

    bool configurePort(int baudRate);
    void drainWakePipe();
};

} // namespace nmeascout
