#include "socket_channel.hpp"
#include "detection_error.hpp"
#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <string.h>
#include <sys/socket.h>
#include <unistd.h>

namespace nmeascout
{

SocketChannel::SocketChannel(const std::string &host, int port, int connectTimeoutMs)
    : host_(host), port_(port), address_(host + ":" + std::to_string(port)), connectTimeoutMs_(connectTimeoutMs),
      fd_(-1), interrupted_(false)
{
    wakePipe_[0] = -1;
    wakePipe_[1] = -1;
    if (::pipe2(wakePipe_, O_NONBLOCK | O_CLOEXEC) != 0)
    {
        wakePipe_[0] = -1;
        wakePipe_[1] = -1;
    }
}

SocketChannel::~SocketChannel()
{
    close();
    if (wakePipe_[0] >= 0)
        ::close(wakePipe_[0]);
    if (wakePipe_[1] >= 0)
        ::close(wakePipe_[1]);
}

bool SocketChannel::splitAddress(const std::string &address, std::string &host, int &port)
{
    auto pos = address.rfind(':');
    if (pos == std::string::npos || pos == 0 || pos + 1 >= address.size())
        return false;
    std::string portText = address.substr(pos + 1);
    if (portText.size() > 5)
        return false;
    for (char c : portText)
    {
        if (c < '0' || c > '9')
            return false;
    }
    host = address.substr(0, pos);
    port = std::stoi(portText);
    return port > 0 && port < 65536;
}

// 0 when connected, -1 when interrupted, otherwise the errno that ended the attempt.
int SocketChannel::waitConnected(int fd, int timeoutMs)
{
    struct pollfd fds[2];
    fds[0].fd = fd;
    fds[0].events = POLLOUT;
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
        return errno;
    if (interrupted_.load() || (count == 2 && (fds[1].revents & POLLIN)))
        return -1;
    if (rc == 0)
        return ETIMEDOUT;

    int err = 0;
    socklen_t len = sizeof(err);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) != 0)
        return errno;
    return err;
}

void SocketChannel::open()
{
    close();
    if (wakePipe_[0] >= 0)
    {
        char buf[16];
        while (::read(wakePipe_[0], buf, sizeof(buf)) > 0)
        {
        }
    }
    interrupted_.store(false);

    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo *res = nullptr;
    int rc = ::getaddrinfo(host_.c_str(), std::to_string(port_).c_str(), &hints, &res);
    if (rc != 0)
        throw DeviceError(ErrorKind::TransportUnavailable, address_,
                          "cannot resolve " + address_ + ": " + gai_strerror(rc));

    int lastErr = ECONNREFUSED;
    bool interrupted = false;
    for (struct addrinfo *ai = res; ai != nullptr && !interrupted; ai = ai->ai_next)
    {
        // Non-blocking connect so interrupt() and the timeout can end it.
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC | SOCK_NONBLOCK, ai->ai_protocol);
        if (fd < 0)
        {
            lastErr = errno;
            continue;
        }
        int err = 0;
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) != 0)
            err = errno == EINPROGRESS ? waitConnected(fd, connectTimeoutMs_) : errno;
        if (err == 0)
        {
            int flags = ::fcntl(fd, F_GETFL);
            if (flags >= 0 && ::fcntl(fd, F_SETFL, flags & ~O_NONBLOCK) == 0)
            {
                fd_ = fd;
                break;
            }
            err = errno;
        }
        if (err < 0)
            interrupted = true;
        else
            lastErr = err;
        ::close(fd);
    }
    ::freeaddrinfo(res);

    if (interrupted)
        throw DeviceError(ErrorKind::TransportError, address_, "connect(" + address_ + ") was interrupted");
    if (fd_ < 0)
    {
        ErrorKind kind = (lastErr == EACCES || lastErr == EPERM) ? ErrorKind::PermissionDenied
                                                                 : ErrorKind::TransportUnavailable;
        throw DeviceError(kind, address_, "connect(" + address_ + ") failed: " + strerror(lastErr));
    }
}

void SocketChannel::close()
{
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
    }
}

void SocketChannel::discardInput()
{
    if (fd_ < 0)
        return;
    uint8_t buf[256];
    while (::recv(fd_, buf, sizeof(buf), MSG_DONTWAIT) > 0)
    {
    }
}

ReadResult SocketChannel::read(uint8_t *buffer, size_t size, int timeoutMs)
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

    ssize_t n = ::recv(fd_, buffer, size, 0);
    if (n > 0)
        return ReadResult(ReadStatus::Ok, static_cast<size_t>(n));
    // Orderly shutdown or hard error: the daemon went away.
    return ReadResult(ReadStatus::Error, 0);
}

bool SocketChannel::write(const void *data, size_t len)
{
    if (fd_ < 0 || data == nullptr || len == 0)
        return false;
    ssize_t n = ::send(fd_, data, len, MSG_NOSIGNAL);
    return n == (ssize_t)len;
}

void SocketChannel::interrupt()
{
    interrupted_.store(true);
    if (wakePipe_[1] >= 0)
    {
        char b = 1;
        ssize_t n = ::write(wakePipe_[1], &b, 1);
        (void)n;
    }
}

} // namespace nmeascout
