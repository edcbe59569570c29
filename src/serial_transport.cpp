#include "serial_transport.hpp"
#include "detection_error.hpp"
#include "log.hpp"
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <string.h>
#include <termios.h>
#include <unistd.h>

namespace nmeascout
{

static bool baudToFlag(int baud, speed_t &flag)
{
    switch (baud)
    {
    case 1200: flag = B1200; return true;
    case 2400: flag = B2400; return true;
    case 4800: flag = B4800; return true;
    case 9600: flag = B9600; return true;
    case 19200: flag = B19200; return true;
    case 38400: flag = B38400; return true;
    case 57600: flag = B57600; return true;
    case 115200: flag = B115200; return true;
    case 230400: flag = B230400; return true;
    default: return false;
    }
}

SerialTransport::SerialTransport(const std::string &devicePath, int baudRate)
    : devicePath_(devicePath), baud_(baudRate), fd_(-1), interrupted_(false)
{
    wakePipe_[0] = -1;
    wakePipe_[1] = -1;
    if (::pipe2(wakePipe_, O_NONBLOCK | O_CLOEXEC) != 0)
    {
        log::warn("pipe2 failed for " + devicePath_ + ": " + strerror(errno) + " (cancel falls back to read timeout)");
        wakePipe_[0] = -1;
        wakePipe_[1] = -1;
    }
}

SerialTransport::~SerialTransport()
{
    close();
    if (wakePipe_[0] >= 0)
        ::close(wakePipe_[0]);
    if (wakePipe_[1] >= 0)
        ::close(wakePipe_[1]);
}

bool SerialTransport::configurePort(int baudRate)
{
    speed_t sp;
    if (!baudToFlag(baudRate, sp))
    {
        log::debug(devicePath_ + ": unsupported baud rate " + std::to_string(baudRate));
        return false;
    }

    struct termios tio;
    if (tcgetattr(fd_, &tio) != 0)
    {
        log::debug(devicePath_ + ": tcgetattr failed: " + strerror(errno));
        return false;
    }

    cfmakeraw(&tio);
    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_cflag &= ~CSTOPB;
    tio.c_cflag &= ~CRTSCTS; // no HW flow
    tio.c_iflag = 0;
    tio.c_oflag = 0;
    tio.c_lflag = 0;
    tio.c_cc[VMIN] = 0;   // non-blocking read, poll() does the waiting
    tio.c_cc[VTIME] = 0;

    cfsetispeed(&tio, sp);
    cfsetospeed(&tio, sp);

    if (tcsetattr(fd_, TCSANOW, &tio) != 0)
    {
        log::debug(devicePath_ + ": tcsetattr failed: " + strerror(errno));
        return false;
    }
    return true;
}

void SerialTransport::open()
{
    close();
    drainWakePipe();
    interrupted_.store(false);

    fd_ = ::open(devicePath_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
    if (fd_ < 0)
    {
        int err = errno;
        ErrorKind kind = (err == EACCES || err == EPERM) ? ErrorKind::PermissionDenied
                                                         : ErrorKind::TransportUnavailable;
        throw DeviceError(kind, devicePath_, "open(" + devicePath_ + ") failed: " + strerror(err));
    }
    if (!configurePort(baud_))
    {
        close();
        throw DeviceError(ErrorKind::TransportUnavailable, devicePath_,
                          devicePath_ + " rejected " + std::to_string(baud_) + ",8,N,1");
    }
}

void SerialTransport::close()
{
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
    }
}

bool SerialTransport::isOpen() const
{
    return fd_ >= 0;
}

bool SerialTransport::setBaudRate(int baud)
{
    if (fd_ < 0)
    {
        baud_ = baud;
        return true;
    }
    if (!configurePort(baud))
        return false;
    baud_ = baud;
    return true;
}

void SerialTransport::discardInput()
{
    if (fd_ >= 0)
        tcflush(fd_, TCIFLUSH);
}

ReadResult SerialTransport::read(uint8_t *buffer, size_t size, int timeoutMs)
{
    if (interrupted_.load())
        return ReadResult(ReadStatus::Interrupted, 0);
    if (fd_ < 0)
        return ReadResult(ReadStatus::Error, 0);

    struct pollfd fds[2];
    fds[0].fd = fd_;
    fds[0].events = POLLIN;
    fds[0].revents = 0;
    fds[1].fd = wakePipe_[0];
    fds[1].events = POLLIN;
    fds[1].revents = 0;
    nfds_t count = wakePipe_[0] >= 0 ? 2 : 1;

    int rc;
    do
    {
        rc = ::poll(fds, count, timeoutMs);
    } while (rc < 0 && errno == EINTR);

    if (rc < 0)
        return ReadResult(ReadStatus::Error, 0);
    if (interrupted_.load() || (count == 2 && (fds[1].revents & POLLIN)))
        return ReadResult(ReadStatus::Interrupted, 0);
    if (rc == 0)
        return ReadResult(ReadStatus::Timeout, 0);
    if (fds[0].revents & (POLLERR | POLLHUP | POLLNVAL))
        return ReadResult(ReadStatus::Error, 0);

    ssize_t n = ::read(fd_, buffer, size);
    if (n > 0)
        return ReadResult(ReadStatus::Ok, static_cast<size_t>(n));
    if (n == 0 || errno == EAGAIN || errno == EWOULDBLOCK)
        return ReadResult(ReadStatus::Timeout, 0);
    return ReadResult(ReadStatus::Error, 0);
}

bool SerialTransport::write(const void *data, size_t len)
{
    if (fd_ < 0) return false;
    if (data == nullptr || len == 0) return false;
    ssize_t n = ::write(fd_, data, len);
    return n == (ssize_t)len;
}

void SerialTransport::interrupt()
{
    interrupted_.store(true);
    if (wakePipe_[1] >= 0)
    {
        char b = 1;
        ssize_t n = ::write(wakePipe_[1], &b, 1);
        (void)n; // pipe full means a wakeup is already pending
    }
}

void SerialTransport::drainWakePipe()
{
    if (wakePipe_[0] < 0)
        return;
    char buf[16];
    while (::read(wakePipe_[0], buf, sizeof(buf)) > 0)
    {
    }
}

} // namespace nmeascout
