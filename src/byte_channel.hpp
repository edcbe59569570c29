#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace nmeascout
{

enum class ReadStatus {
    Ok,           // at least one byte read
    Timeout,      // nothing arrived before the timeout
    Interrupted,  // interrupt() was called
    Error         // channel is closed or the read failed
};

struct ReadResult {
    ReadStatus status;
    size_t bytes;

    ReadResult() : status(ReadStatus::Timeout), bytes(0) {}
    ReadResult(ReadStatus s, size_t n) : status(s), bytes(n) {}
};

// ==================== Byte Channel ====================
// Capability a device needs from its transport. One implementation per platform
// channel type (termios tty, TCP socket, test doubles).
class ByteChannel {
public:
    virtual ~ByteChannel() = default;

    // Throws DeviceError (TransportUnavailable / PermissionDenied).
    virtual void open() = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    // Returns false if the channel rejects the rate.
    virtual bool setBaudRate(int baud) = 0;
    virtual int baudRate() const = 0;
    virtual void discardInput() = 0;

    virtual ReadResult read(uint8_t *buffer, size_t size, int timeoutMs) = 0;
    virtual bool write(const void *data, size_t len) = 0;

    // Thread-safe. Wakes a pending read(), which returns Interrupted; later reads
    // also return Interrupted until the channel is reopened.
    virtual void interrupt() = 0;

    virtual const std::string &path() const = 0;
};

} // namespace nmeascout
